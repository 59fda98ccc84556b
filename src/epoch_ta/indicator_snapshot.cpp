#include <epoch_ta/summary/indicator_snapshot.h>
#include <epoch_ta/transforms/moving_averages.h>
#include <epoch_ta/transforms/oscillators.h>
#include <epoch_ta/transforms/trend.h>

namespace epoch_ta::summary {

IndicatorSnapshot BuildIndicatorSnapshot(BarList const &bars,
                                         IndicatorSettings const &settings) {
  using namespace epoch_ta::transform;
  const auto closes = Closes(bars);

  const auto bands =
      Bollinger(closes, settings.bollinger_period, settings.bollinger_std_mult);
  IndicatorSnapshot snapshot{
      .series = OverlaySeries{.sma = SMA(closes, settings.sma_period),
                              .ema = EMA(closes, settings.ema_period),
                              .wma = WMA(closes, settings.wma_period),
                              .bollinger_upper = bands.upper,
                              .bollinger_middle = bands.middle,
                              .bollinger_lower = bands.lower,
                              .vwap = VWAP(bars)}};

  const auto macd = MACD(closes, settings.macd_fast, settings.macd_slow,
                         settings.macd_signal);
  const auto stochastic =
      Stochastic(bars, settings.stochastic_period, settings.stochastic_smooth_k,
                 settings.stochastic_smooth_d);
  const auto adx = ADX(bars, settings.adx_period);
  const auto ichimoku = Ichimoku(bars);

  auto &latest = snapshot.latest;
  auto const &series = snapshot.series;
  latest.sma = LastValue(series.sma);
  latest.ema = LastValue(series.ema);
  latest.wma = LastValue(series.wma);
  latest.macd = LastValue(macd.macd);
  latest.macd_signal = LastValue(macd.signal);
  latest.macd_histogram = LastValue(macd.histogram);
  latest.rsi = LastValue(RSI(closes, settings.rsi_period));
  latest.bollinger_upper = LastValue(series.bollinger_upper);
  latest.bollinger_middle = LastValue(series.bollinger_middle);
  latest.bollinger_lower = LastValue(series.bollinger_lower);
  latest.stochastic_k = LastValue(stochastic.k);
  latest.stochastic_d = LastValue(stochastic.d);
  latest.adx = LastValue(adx.adx);
  latest.plus_di = LastValue(adx.plus_di);
  latest.minus_di = LastValue(adx.minus_di);
  latest.vwap = LastValue(series.vwap);
  latest.ichimoku_tenkan = LastValue(ichimoku.tenkan);
  latest.ichimoku_kijun = LastValue(ichimoku.kijun);
  latest.ichimoku_senkou_a = LastValue(ichimoku.senkou_a);
  latest.ichimoku_senkou_b = LastValue(ichimoku.senkou_b);
  return snapshot;
}

} // namespace epoch_ta::summary
