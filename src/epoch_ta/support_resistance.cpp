#include <epoch_ta/price_action/support_resistance.h>

#include <algorithm>
#include <cmath>

namespace epoch_ta::price_action {

namespace {
struct Cluster {
  double sum{};
  size_t touches{};

  [[nodiscard]] double Mean() const {
    return sum / static_cast<double>(touches);
  }
};
} // namespace

std::vector<PriceLevel> ClusterPivots(std::vector<Pivot> const &pivots,
                                      double tolerance) {
  std::vector<double> prices;
  prices.reserve(pivots.size());
  for (auto const &pivot : pivots) {
    prices.push_back(pivot.price);
  }
  std::ranges::sort(prices);

  std::vector<Cluster> clusters;
  for (const double price : prices) {
    Cluster *nearest = nullptr;
    double bestDistance = 0.0;
    for (auto &cluster : clusters) {
      const double distance = std::abs(cluster.Mean() - price);
      if (distance <= tolerance && (!nearest || distance < bestDistance)) {
        nearest = &cluster;
        bestDistance = distance;
      }
    }

    if (nearest) {
      nearest->sum += price;
      ++nearest->touches;
    } else {
      clusters.push_back(Cluster{price, 1});
    }
  }

  std::vector<PriceLevel> levels;
  levels.reserve(clusters.size());
  for (auto const &cluster : clusters) {
    levels.push_back(PriceLevel{cluster.Mean(), cluster.touches});
  }
  return levels;
}

SupportResistance DetectSupportResistance(BarList const &bars) {
  SupportResistance result;
  if (bars.size() < kMinLevelBars) {
    return result;
  }

  const double currentPrice = bars.back().close;
  const double tolerance = currentPrice * kLevelTolerance;
  const auto pivots = FindPivots(bars, kDefaultPivotWindow);

  for (auto const &level :
       ClusterPivots(FilterPivots(pivots, epoch_core::PivotType::Low), tolerance)) {
    if (level.level < currentPrice) {
      result.supports.push_back(level);
    }
  }
  for (auto const &level :
       ClusterPivots(FilterPivots(pivots, epoch_core::PivotType::High), tolerance)) {
    if (level.level > currentPrice) {
      result.resistances.push_back(level);
    }
  }

  std::ranges::stable_sort(result.supports, [](auto const &a, auto const &b) {
    return a.touches != b.touches ? a.touches > b.touches : a.level > b.level;
  });
  std::ranges::stable_sort(result.resistances, [](auto const &a, auto const &b) {
    return a.touches != b.touches ? a.touches > b.touches : a.level < b.level;
  });

  if (result.supports.size() > kMaxLevels) {
    result.supports.resize(kMaxLevels);
  }
  if (result.resistances.size() > kMaxLevels) {
    result.resistances.resize(kMaxLevels);
  }
  return result;
}

std::optional<double> NearestLevel(std::vector<PriceLevel> const &levels,
                                   std::optional<double> reference) {
  if (levels.empty() || !reference) {
    return std::nullopt;
  }

  double best = levels.front().level;
  double minDistance = std::abs(*reference - best);
  for (auto const &item : levels) {
    const double distance = std::abs(*reference - item.level);
    if (distance < minDistance) {
      minDistance = distance;
      best = item.level;
    }
  }
  return best;
}

std::optional<double> PctDistance(std::optional<double> reference,
                                  std::optional<double> target) {
  if (!reference || !target || *reference == 0.0) {
    return std::nullopt;
  }
  return (*target - *reference) / *reference * 100.0;
}

} // namespace epoch_ta::price_action
