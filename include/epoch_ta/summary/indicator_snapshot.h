#pragma once
//
// Indicator snapshot: the overlay series a price chart draws plus the latest
// defined value of every indicator, computed with one set of periods.
//

#include <epoch_ta/core/bar.h>
#include <epoch_ta/core/constants.h>

namespace epoch_ta::summary {

struct IndicatorSettings {
  int64_t sma_period = defaults::kMaPeriod;
  int64_t ema_period = defaults::kMaPeriod;
  int64_t wma_period = defaults::kMaPeriod;
  int64_t rsi_period = defaults::kRsiPeriod;
  int64_t adx_period = defaults::kAdxPeriod;
  int64_t macd_fast = defaults::kMacdFast;
  int64_t macd_slow = defaults::kMacdSlow;
  int64_t macd_signal = defaults::kMacdSignal;
  int64_t bollinger_period = defaults::kBollingerPeriod;
  double bollinger_std_mult = defaults::kBollingerStdMult;
  int64_t stochastic_period = defaults::kStochasticPeriod;
  int64_t stochastic_smooth_k = defaults::kStochasticSmoothK;
  int64_t stochastic_smooth_d = defaults::kStochasticSmoothD;
};

struct OverlaySeries {
  IndicatorSeries sma;
  IndicatorSeries ema;
  IndicatorSeries wma;
  IndicatorSeries bollinger_upper;
  IndicatorSeries bollinger_middle;
  IndicatorSeries bollinger_lower;
  IndicatorSeries vwap;
};

struct LatestIndicators {
  std::optional<double> sma;
  std::optional<double> ema;
  std::optional<double> wma;
  std::optional<double> macd;
  std::optional<double> macd_signal;
  std::optional<double> macd_histogram;
  std::optional<double> rsi;
  std::optional<double> bollinger_upper;
  std::optional<double> bollinger_middle;
  std::optional<double> bollinger_lower;
  std::optional<double> stochastic_k;
  std::optional<double> stochastic_d;
  std::optional<double> adx;
  std::optional<double> plus_di;
  std::optional<double> minus_di;
  std::optional<double> vwap;
  std::optional<double> ichimoku_tenkan;
  std::optional<double> ichimoku_kijun;
  std::optional<double> ichimoku_senkou_a;
  std::optional<double> ichimoku_senkou_b;
};

struct IndicatorSnapshot {
  OverlaySeries series;
  LatestIndicators latest;
};

[[nodiscard]] IndicatorSnapshot
BuildIndicatorSnapshot(BarList const &bars, IndicatorSettings const &settings = {});

} // namespace epoch_ta::summary
