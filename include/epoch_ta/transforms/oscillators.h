#pragma once
//
// Momentum oscillators: RSI, MACD and Stochastic.
//

#include <epoch_ta/core/bar.h>
#include <epoch_ta/core/constants.h>

#include <cstdint>

namespace epoch_ta::transform {

/**
 * Relative Strength Index with Wilder smoothing.
 *
 * The first `period` deltas seed the average gain/loss; later values use
 * avg = (avg * (period - 1) + current) / period.  Undefined for indices
 * below `period`.  A zero average loss yields exactly 100; a window with no
 * price movement at all (both averages zero) stays undefined.
 */
[[nodiscard]] IndicatorSeries RSI(std::vector<double> const &values,
                                  int64_t period = defaults::kRsiPeriod);

struct MacdResult {
  IndicatorSeries macd;
  IndicatorSeries signal;
  IndicatorSeries histogram;
};

// Signal line is the EMA of the zero-filled MACD line, masked back to the
// MACD line's defined range.
[[nodiscard]] MacdResult MACD(std::vector<double> const &values,
                              int64_t fast = defaults::kMacdFast,
                              int64_t slow = defaults::kMacdSlow,
                              int64_t signal = defaults::kMacdSignal);

struct StochasticResult {
  IndicatorSeries k;
  IndicatorSeries d;
};

// Raw %K is 50 when the window's high-low range is zero.
[[nodiscard]] StochasticResult
Stochastic(BarList const &bars, int64_t period = defaults::kStochasticPeriod,
           int64_t smoothK = defaults::kStochasticSmoothK,
           int64_t smoothD = defaults::kStochasticSmoothD);

} // namespace epoch_ta::transform
