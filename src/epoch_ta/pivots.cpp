#include <epoch_ta/price_action/pivots.h>

#include <algorithm>
#include <iterator>

namespace epoch_ta::price_action {

std::vector<Pivot> FindPivots(BarList const &bars, int64_t window) {
  std::vector<Pivot> out;
  if (window <= 0) {
    return out;
  }

  const auto w = static_cast<size_t>(window);
  for (size_t i = w; i + w < bars.size(); ++i) {
    const auto &current = bars[i];
    bool isHigh = true;
    bool isLow = true;
    for (size_t j = i - w; j <= i + w; ++j) {
      if (j == i) {
        continue;
      }
      if (bars[j].high >= current.high) {
        isHigh = false;
      }
      if (bars[j].low <= current.low) {
        isLow = false;
      }
    }

    if (isHigh) {
      out.push_back({i, current.high, epoch_core::PivotType::High});
    }
    if (isLow) {
      out.push_back({i, current.low, epoch_core::PivotType::Low});
    }
  }
  return out;
}

std::vector<Pivot> FilterPivots(std::vector<Pivot> const &pivots,
                                epoch_core::PivotType type) {
  std::vector<Pivot> out;
  std::ranges::copy_if(pivots, std::back_inserter(out),
                       [type](Pivot const &p) { return p.type == type; });
  return out;
}

double RegressionSlope(std::vector<Pivot> const &points) {
  if (points.size() < 2) {
    return 0.0;
  }

  const auto n = static_cast<double>(points.size());
  double sumX = 0.0;
  double sumY = 0.0;
  double sumXY = 0.0;
  double sumXX = 0.0;
  for (auto const &point : points) {
    const auto x = static_cast<double>(point.index);
    sumX += x;
    sumY += point.price;
    sumXY += x * point.price;
    sumXX += x * x;
  }

  const double denominator = n * sumXX - sumX * sumX;
  if (denominator == 0.0) {
    return 0.0;
  }
  return (n * sumXY - sumX * sumY) / denominator;
}

} // namespace epoch_ta::price_action
