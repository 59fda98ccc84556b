#include <epoch_ta/transforms/oscillators.h>
#include <epoch_ta/transforms/moving_averages.h>
#include "tulip_kernel.h"

#include <algorithm>

namespace epoch_ta::transform {

IndicatorSeries RSI(std::vector<double> const &values, int64_t period) {
  if (period <= 0) {
    return IndicatorSeries(values.size());
  }
  // ti_rsi reports 100 * gain / (gain + loss); a window with neither is NaN
  // and comes back undefined
  auto [out] = tulip::Run<1>("rsi", ti_rsi_start, ti_rsi, values,
                             std::array<TI_REAL, 1>{static_cast<TI_REAL>(period)});
  return out;
}

MacdResult MACD(std::vector<double> const &values, int64_t fast, int64_t slow,
                int64_t signal) {
  MacdResult result;
  result.macd = Subtract(EMA(values, fast), EMA(values, slow));

  const auto signalLine = EMA(FillUndefined(result.macd, 0.0), signal);
  result.signal = MaskLike(signalLine, result.macd);
  result.histogram = Subtract(result.macd, result.signal);
  return result;
}

StochasticResult Stochastic(BarList const &bars, int64_t period,
                            int64_t smoothK, int64_t smoothD) {
  IndicatorSeries rawK(bars.size());
  const auto p = static_cast<size_t>(std::max<int64_t>(period, 1));

  for (size_t i = p - 1; i < bars.size(); ++i) {
    double highestHigh = bars[i + 1 - p].high;
    double lowestLow = bars[i + 1 - p].low;
    for (size_t j = i + 2 - p; j <= i; ++j) {
      highestHigh = std::max(highestHigh, bars[j].high);
      lowestLow = std::min(lowestLow, bars[j].low);
    }

    if (highestHigh == lowestLow) {
      rawK[i] = 50.0;
      continue;
    }
    rawK[i] = (bars[i].close - lowestLow) / (highestHigh - lowestLow) * 100.0;
  }

  StochasticResult result;
  result.k = MaskLike(SMA(FillUndefined(rawK, 0.0), smoothK), rawK);
  result.d = MaskLike(SMA(FillUndefined(result.k, 0.0), smoothD), result.k);
  return result;
}

} // namespace epoch_ta::transform
