#pragma once
//
// Support and resistance levels from clustered swing pivots.
//

#include <epoch_ta/core/bar.h>
#include <epoch_ta/price_action/pivots.h>

namespace epoch_ta::price_action {

struct PriceLevel {
  double level{};
  size_t touches{};
};

struct SupportResistance {
  std::vector<PriceLevel> supports;
  std::vector<PriceLevel> resistances;
};

constexpr size_t kMinLevelBars = 20;
constexpr double kLevelTolerance = 0.015;
constexpr size_t kMaxLevels = 3;

// Groups pivot prices (ascending) into clusters; a price joins the cluster
// whose running mean is nearest and within `tolerance`, else starts one.
[[nodiscard]] std::vector<PriceLevel>
ClusterPivots(std::vector<Pivot> const &pivots, double tolerance);

/**
 * Up to three supports (low-pivot clusters below the last close) and three
 * resistances (high-pivot clusters above it), each ranked by touch count.
 * Ties prefer the level nearer to price.  Tolerance is 1.5% of the close.
 */
[[nodiscard]] SupportResistance DetectSupportResistance(BarList const &bars);

// Level closest to `reference`; first one on ties.
[[nodiscard]] std::optional<double>
NearestLevel(std::vector<PriceLevel> const &levels,
             std::optional<double> reference);

// (target - reference) / reference * 100; undefined for a zero reference.
[[nodiscard]] std::optional<double> PctDistance(std::optional<double> reference,
                                                std::optional<double> target);

} // namespace epoch_ta::price_action
