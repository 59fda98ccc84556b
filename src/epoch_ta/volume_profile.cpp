#include <epoch_ta/transforms/volume_profile.h>

#include <algorithm>
#include <cmath>

namespace epoch_ta::transform {

VolumeProfileResult VolumeProfile(BarList const &bars, int64_t binCount) {
  VolumeProfileResult result;
  if (bars.empty() || binCount < 1) {
    return result;
  }

  double minPrice = bars.front().low;
  double maxPrice = bars.front().high;
  double totalVolume = 0.0;
  for (auto const &bar : bars) {
    minPrice = std::min(minPrice, bar.low);
    maxPrice = std::max(maxPrice, bar.high);
    totalVolume += bar.volume;
  }

  if (minPrice == maxPrice) {
    result.bins.push_back(VolumeProfileBin{.from = minPrice,
                                           .to = maxPrice,
                                           .mid = minPrice,
                                           .volume = totalVolume,
                                           .percent = 100.0});
    result.point_of_control = minPrice;
    return result;
  }

  const auto n = static_cast<size_t>(binCount);
  const double width = (maxPrice - minPrice) / static_cast<double>(n);
  std::vector<double> volumes(n, 0.0);
  for (auto const &bar : bars) {
    const double position = std::floor((bar.close - minPrice) / width);
    const auto bin = static_cast<size_t>(
        std::clamp(position, 0.0, static_cast<double>(n - 1)));
    volumes[bin] += bar.volume;
  }

  result.bins.reserve(n);
  size_t pocIndex = 0;
  for (size_t i = 0; i < n; ++i) {
    const double from = minPrice + static_cast<double>(i) * width;
    const double to = from + width;
    result.bins.push_back(VolumeProfileBin{
        .from = from,
        .to = to,
        .mid = (from + to) / 2.0,
        .volume = volumes[i],
        .percent = totalVolume == 0.0 ? 0.0 : volumes[i] / totalVolume * 100.0});
    if (volumes[i] > volumes[pocIndex]) {
      pocIndex = i;
    }
  }
  result.point_of_control = result.bins[pocIndex].mid;
  return result;
}

} // namespace epoch_ta::transform
