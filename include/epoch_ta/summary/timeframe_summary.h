#pragma once
//
// Multi-timeframe summary
//
// Scores one timeframe's series on four trend checks and labels it.
// Callers run it once per timeframe and tabulate the rows.
//

#include <epoch_ta/core/bar.h>
#include <epoch_ta/core/constants.h>

#include <string>

namespace epoch_ta::summary {

struct TimeframeSignal {
  std::string timeframe;
  epoch_core::SignalDirection signal{epoch_core::SignalDirection::Neutral};
  int score{};
  std::optional<double> close;
  std::optional<double> sma20;
  std::optional<double> ema20;
  std::optional<double> rsi14;
  std::optional<double> macd;
  std::optional<double> macd_signal;
};

struct TimeframeInput {
  std::string timeframe;
  BarList bars;
};

constexpr double kRsiBullishThreshold = 55.0;

/**
 * +1 each for close > SMA20, close > EMA20, RSI14 > 55 and MACD > signal,
 * using the latest defined value of each indicator.  Score >= 3 is
 * Bullish, <= 1 Bearish, otherwise Neutral.
 */
[[nodiscard]] TimeframeSignal SummarizeTimeframe(std::string timeframe,
                                                 BarList const &bars);

[[nodiscard]] epoch_core::SignalDirection SignalFromScore(int score);

[[nodiscard]] std::vector<TimeframeSignal>
SummarizeTimeframes(std::vector<TimeframeInput> const &inputs);

} // namespace epoch_ta::summary
