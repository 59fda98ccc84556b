#pragma once
//
// Volume-by-price histogram
//
// Fixed bins spanning [min low, max high] of the whole series.  A bar's
// entire volume goes to the bin containing its close.
//

#include <epoch_ta/core/bar.h>
#include <epoch_ta/core/constants.h>

namespace epoch_ta::transform {

struct VolumeProfileBin {
  double from{};
  double to{};
  double mid{};
  double volume{};
  double percent{};
};

struct VolumeProfileResult {
  std::vector<VolumeProfileBin> bins;
  // Mid price of the highest-volume bin (first one on ties).
  std::optional<double> point_of_control;
};

[[nodiscard]] VolumeProfileResult
VolumeProfile(BarList const &bars, int64_t binCount = defaults::kVolumeProfileBins);

} // namespace epoch_ta::transform
