#pragma once
//
// Moving averages and rolling dispersion.
//
// All functions return a series aligned with `values`.  A period of 1 or
// less is treated as the identity transform.
//

#include <epoch_ta/core/bar.h>
#include <epoch_ta/core/constants.h>

#include <cstdint>

namespace epoch_ta::transform {

// Trailing arithmetic mean; undefined until `period` values are available.
[[nodiscard]] IndicatorSeries SMA(std::vector<double> const &values,
                                  int64_t period);

/**
 * Exponential moving average.
 *
 * Seeded at index period-1 with the simple average of the first `period`
 * values, then ema[i] = (v[i] - ema[i-1]) * 2/(period+1) + ema[i-1].
 * The seed is summed exactly like SMA, so EMA[p-1] == SMA[p-1].
 */
[[nodiscard]] IndicatorSeries EMA(std::vector<double> const &values,
                                  int64_t period);

// Linearly weighted mean with weights 1..period (newest weighted highest).
[[nodiscard]] IndicatorSeries WMA(std::vector<double> const &values,
                                  int64_t period);

// Population standard deviation around the trailing SMA.
[[nodiscard]] IndicatorSeries RollingStdDev(std::vector<double> const &values,
                                            int64_t period);

struct BollingerBands {
  IndicatorSeries middle;
  IndicatorSeries upper;
  IndicatorSeries lower;
};

[[nodiscard]] BollingerBands
Bollinger(std::vector<double> const &values,
          int64_t period = defaults::kBollingerPeriod,
          double stdMult = defaults::kBollingerStdMult);

} // namespace epoch_ta::transform
