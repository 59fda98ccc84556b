#pragma once
//
// OHLCV bar model shared by every analytics component.
//
// RawBar is what a data provider hands us (any numeric field may be
// missing); Bar is the normalized, validated form.  Indicator outputs are
// parallel arrays aligned index-for-index with the bars they came from,
// where std::nullopt marks "not yet available" (e.g. warm-up).
//

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace epoch_ta {

struct RawBar {
  std::string date;
  std::optional<double> open;
  std::optional<double> high;
  std::optional<double> low;
  std::optional<double> close;
  std::optional<double> volume;
};

struct Bar {
  std::string date;
  double open{};
  double high{};
  double low{};
  double close{};
  double volume{};

  bool operator==(const Bar &) const = default;
};

using BarList = std::vector<Bar>;
using IndicatorValue = std::optional<double>;
using IndicatorSeries = std::vector<IndicatorValue>;

// Close prices in bar order.
std::vector<double> Closes(BarList const &bars);

// Most recent defined value of a series, nullopt when nothing is defined.
IndicatorValue LastValue(IndicatorSeries const &series);

// Element-wise `a - b`, defined only where both sides are defined.
IndicatorSeries Subtract(IndicatorSeries const &a, IndicatorSeries const &b);

// Copy of `series` with undefined entries replaced by `fill`.
std::vector<double> FillUndefined(IndicatorSeries const &series, double fill);

// Copy of `values` undefined wherever `mask` is undefined.
IndicatorSeries MaskLike(IndicatorSeries const &values,
                         IndicatorSeries const &mask);

// Promote a plain numeric series to an all-defined indicator series.
IndicatorSeries ToIndicatorSeries(std::vector<double> const &values);

} // namespace epoch_ta
