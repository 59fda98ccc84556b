#pragma once
//
// Swing pivots
//
// A bar is a pivot high (low) when its high (low) is strictly above (below)
// the high (low) of every other bar within +/- window bars.  Bars closer
// than `window` to either end of the series are never pivots.
//

#include <epoch_ta/core/bar.h>
#include <epoch_ta/core/constants.h>

namespace epoch_ta::price_action {

struct Pivot {
  size_t index{};
  double price{};
  epoch_core::PivotType type{epoch_core::PivotType::High};
};

[[nodiscard]] std::vector<Pivot>
FindPivots(BarList const &bars, int64_t window = kDefaultPivotWindow);

[[nodiscard]] std::vector<Pivot> FilterPivots(std::vector<Pivot> const &pivots,
                                              epoch_core::PivotType type);

// Least-squares slope of price over bar index; 0 for fewer than two points
// or a degenerate x spread.
[[nodiscard]] double RegressionSlope(std::vector<Pivot> const &points);

} // namespace epoch_ta::price_action
