#include <epoch_ta/summary/timeframe_summary.h>
#include <epoch_ta/transforms/moving_averages.h>
#include <epoch_ta/transforms/oscillators.h>

namespace epoch_ta::summary {

epoch_core::SignalDirection SignalFromScore(int score) {
  if (score >= 3) {
    return epoch_core::SignalDirection::Bullish;
  }
  if (score <= 1) {
    return epoch_core::SignalDirection::Bearish;
  }
  return epoch_core::SignalDirection::Neutral;
}

TimeframeSignal SummarizeTimeframe(std::string timeframe, BarList const &bars) {
  TimeframeSignal result{.timeframe = std::move(timeframe)};
  if (bars.empty()) {
    return result;
  }

  const auto closes = Closes(bars);
  const auto macd = transform::MACD(closes, defaults::kMacdFast,
                                    defaults::kMacdSlow, defaults::kMacdSignal);

  const double close = closes.back();
  result.close = close;
  result.sma20 = LastValue(transform::SMA(closes, defaults::kMaPeriod));
  result.ema20 = LastValue(transform::EMA(closes, defaults::kMaPeriod));
  result.rsi14 = LastValue(transform::RSI(closes, defaults::kRsiPeriod));
  result.macd = LastValue(macd.macd);
  result.macd_signal = LastValue(macd.signal);

  if (result.sma20 && close > *result.sma20) {
    ++result.score;
  }
  if (result.ema20 && close > *result.ema20) {
    ++result.score;
  }
  if (result.rsi14 && *result.rsi14 > kRsiBullishThreshold) {
    ++result.score;
  }
  if (result.macd && result.macd_signal && *result.macd > *result.macd_signal) {
    ++result.score;
  }

  result.signal = SignalFromScore(result.score);
  return result;
}

std::vector<TimeframeSignal>
SummarizeTimeframes(std::vector<TimeframeInput> const &inputs) {
  std::vector<TimeframeSignal> out;
  out.reserve(inputs.size());
  for (auto const &input : inputs) {
    out.push_back(SummarizeTimeframe(input.timeframe, input.bars));
  }
  return out;
}

} // namespace epoch_ta::summary
