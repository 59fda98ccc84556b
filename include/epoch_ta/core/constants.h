#pragma once
//
// Shared enums and defaults for the analytics engine.
//
#include <epoch_core/enum_wrapper.h>

#include <cstdint>

CREATE_ENUM(SignalDirection, Bullish, Bearish, Neutral);
CREATE_ENUM(PivotType, High, Low);
CREATE_ENUM(ResampleRule, daily, weekly, monthly);
CREATE_ENUM(ChartType, none, heikin_ashi, renko);

namespace epoch_ta {

// Trading days per year, used to annualize backtest returns.
constexpr double kTradingDaysPerYear = 252.0;

constexpr int64_t kDefaultPivotWindow = 3;

namespace defaults {
constexpr int64_t kMaPeriod = 20;
constexpr int64_t kRsiPeriod = 14;
constexpr int64_t kMacdFast = 12;
constexpr int64_t kMacdSlow = 26;
constexpr int64_t kMacdSignal = 9;
constexpr int64_t kBollingerPeriod = 20;
constexpr double kBollingerStdMult = 2.0;
constexpr int64_t kStochasticPeriod = 14;
constexpr int64_t kStochasticSmoothK = 3;
constexpr int64_t kStochasticSmoothD = 3;
constexpr int64_t kAdxPeriod = 14;
constexpr int64_t kAtrPeriod = 14;
constexpr int64_t kIchimokuTenkan = 9;
constexpr int64_t kIchimokuKijun = 26;
constexpr int64_t kIchimokuSenkouB = 52;
constexpr int64_t kIchimokuDisplacement = 26;
constexpr int64_t kVolumeProfileBins = 12;
constexpr int64_t kBacktestFast = 20;
constexpr int64_t kBacktestSlow = 50;
constexpr double kInitialCapital = 100000.0;
} // namespace defaults

} // namespace epoch_ta
