#pragma once
//
// Trend indicators: ADX/DMI, VWAP, Ichimoku and ATR.
//

#include <epoch_ta/core/bar.h>
#include <epoch_ta/core/constants.h>

#include <cstdint>

namespace epoch_ta::transform {

struct AdxResult {
  IndicatorSeries adx;
  IndicatorSeries plus_di;
  IndicatorSeries minus_di;
};

/**
 * Average Directional Index with the +DI/-DI lines.
 *
 * True range and directional movement are smoothed with Wilder's running
 * total (s = s - s/period + x).  DI lines start at index `period`, ADX at
 * 2*period-1 (mean of the first `period` DX values), then Wilder-smoothed.
 * Needs at least 2*period+1 bars; otherwise every series is undefined.
 */
[[nodiscard]] AdxResult ADX(BarList const &bars,
                            int64_t period = defaults::kAdxPeriod);

// Cumulative VWAP from the first bar of the supplied window.
[[nodiscard]] IndicatorSeries VWAP(BarList const &bars);

struct IchimokuResult {
  IndicatorSeries tenkan;
  IndicatorSeries kijun;
  IndicatorSeries senkou_a;
  IndicatorSeries senkou_b;
  IndicatorSeries chikou;
};

struct IchimokuOptions {
  int64_t tenkan = defaults::kIchimokuTenkan;
  int64_t kijun = defaults::kIchimokuKijun;
  int64_t senkou_b = defaults::kIchimokuSenkouB;
  int64_t displacement = defaults::kIchimokuDisplacement;
};

// Senkou spans computed at bar i are stored at i + displacement; the
// chikou span stores close[i] at i - displacement.
[[nodiscard]] IchimokuResult Ichimoku(BarList const &bars,
                                      IchimokuOptions const &options = {});

[[nodiscard]] double TrueRange(Bar const &current, Bar const &previous);

// Simple mean of the last `period` true ranges; nullopt when there are not
// more than `period` bars.
[[nodiscard]] IndicatorValue AverageTrueRange(BarList const &bars,
                                              int64_t period = defaults::kAtrPeriod);

} // namespace epoch_ta::transform
