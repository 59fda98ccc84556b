#include <epoch_ta/transforms/trend.h>

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace epoch_ta::transform {

double TrueRange(Bar const &current, Bar const &previous) {
  return std::max({current.high - current.low,
                   std::abs(current.high - previous.close),
                   std::abs(current.low - previous.close)});
}

AdxResult ADX(BarList const &bars, int64_t period) {
  const size_t n = bars.size();
  AdxResult result{.adx = IndicatorSeries(n),
                   .plus_di = IndicatorSeries(n),
                   .minus_di = IndicatorSeries(n)};
  if (period <= 0 || n < static_cast<size_t>(period) * 2 + 1) {
    SPDLOG_DEBUG("ADX({}): {} bars is not enough history", period, n);
    return result;
  }

  const auto p = static_cast<size_t>(period);
  const auto pd = static_cast<double>(period);
  std::vector<double> tr(n, 0.0);
  std::vector<double> plusDM(n, 0.0);
  std::vector<double> minusDM(n, 0.0);

  for (size_t i = 1; i < n; ++i) {
    const double highDiff = bars[i].high - bars[i - 1].high;
    const double lowDiff = bars[i - 1].low - bars[i].low;
    tr[i] = TrueRange(bars[i], bars[i - 1]);
    plusDM[i] = (highDiff > lowDiff && highDiff > 0.0) ? highDiff : 0.0;
    minusDM[i] = (lowDiff > highDiff && lowDiff > 0.0) ? lowDiff : 0.0;
  }

  double trSmooth = 0.0;
  double plusSmooth = 0.0;
  double minusSmooth = 0.0;
  for (size_t i = 1; i <= p; ++i) {
    trSmooth += tr[i];
    plusSmooth += plusDM[i];
    minusSmooth += minusDM[i];
  }

  std::vector<double> dx(n, 0.0);
  for (size_t i = p; i < n; ++i) {
    if (i > p) {
      trSmooth = trSmooth - trSmooth / pd + tr[i];
      plusSmooth = plusSmooth - plusSmooth / pd + plusDM[i];
      minusSmooth = minusSmooth - minusSmooth / pd + minusDM[i];
    }

    const double plusDI = trSmooth == 0.0 ? 0.0 : 100.0 * plusSmooth / trSmooth;
    const double minusDI =
        trSmooth == 0.0 ? 0.0 : 100.0 * minusSmooth / trSmooth;
    const double diSum = plusDI + minusDI;

    result.plus_di[i] = plusDI;
    result.minus_di[i] = minusDI;
    dx[i] = diSum == 0.0 ? 0.0 : 100.0 * std::abs(plusDI - minusDI) / diSum;
  }

  double seed = 0.0;
  for (size_t i = p; i < 2 * p; ++i) {
    seed += dx[i];
  }
  double adx = seed / pd;
  result.adx[2 * p - 1] = adx;
  for (size_t i = 2 * p; i < n; ++i) {
    adx = (adx * (pd - 1.0) + dx[i]) / pd;
    result.adx[i] = adx;
  }
  return result;
}

IndicatorSeries VWAP(BarList const &bars) {
  IndicatorSeries out(bars.size());
  double cumulativePV = 0.0;
  double cumulativeVolume = 0.0;

  for (size_t i = 0; i < bars.size(); ++i) {
    const auto &bar = bars[i];
    const double typicalPrice = (bar.high + bar.low + bar.close) / 3.0;
    cumulativePV += typicalPrice * bar.volume;
    cumulativeVolume += bar.volume;
    if (cumulativeVolume != 0.0) {
      out[i] = cumulativePV / cumulativeVolume;
    }
  }
  return out;
}

namespace {
// Midpoint of the highest high and lowest low over the trailing window.
IndicatorValue PeriodMid(BarList const &bars, size_t index, int64_t period) {
  if (period <= 0 || index + 1 < static_cast<size_t>(period)) {
    return std::nullopt;
  }
  const size_t start = index + 1 - static_cast<size_t>(period);
  double high = bars[start].high;
  double low = bars[start].low;
  for (size_t j = start + 1; j <= index; ++j) {
    high = std::max(high, bars[j].high);
    low = std::min(low, bars[j].low);
  }
  return (high + low) / 2.0;
}
} // namespace

IchimokuResult Ichimoku(BarList const &bars, IchimokuOptions const &options) {
  const size_t n = bars.size();
  IchimokuResult result{.tenkan = IndicatorSeries(n),
                        .kijun = IndicatorSeries(n),
                        .senkou_a = IndicatorSeries(n),
                        .senkou_b = IndicatorSeries(n),
                        .chikou = IndicatorSeries(n)};
  const auto shift = static_cast<size_t>(std::max<int64_t>(options.displacement, 0));

  for (size_t i = 0; i < n; ++i) {
    const auto tenkan = PeriodMid(bars, i, options.tenkan);
    const auto kijun = PeriodMid(bars, i, options.kijun);
    result.tenkan[i] = tenkan;
    result.kijun[i] = kijun;

    if (i + shift < n) {
      if (tenkan && kijun) {
        result.senkou_a[i + shift] = (*tenkan + *kijun) / 2.0;
      }
      result.senkou_b[i + shift] = PeriodMid(bars, i, options.senkou_b);
    }

    if (i >= shift) {
      result.chikou[i - shift] = bars[i].close;
    }
  }
  return result;
}

IndicatorValue AverageTrueRange(BarList const &bars, int64_t period) {
  if (period <= 0 || bars.size() <= static_cast<size_t>(period)) {
    return std::nullopt;
  }

  const auto p = static_cast<size_t>(period);
  double sum = 0.0;
  for (size_t i = bars.size() - p; i < bars.size(); ++i) {
    sum += TrueRange(bars[i], bars[i - 1]);
  }
  return sum / static_cast<double>(p);
}

} // namespace epoch_ta::transform
