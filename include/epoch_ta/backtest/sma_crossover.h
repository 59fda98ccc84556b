#pragma once
//
// SMA crossover backtester
//
// Long-only, all-in / all-out simulation: a bullish fast/slow SMA cross buys
// with all cash at the bar's close, a bearish cross sells everything.  No
// fees, slippage, partial sizing or shorting.  Any position still open at
// the last bar is closed at the final close and recorded as a trade.
//

#include <epoch_ta/core/bar.h>
#include <epoch_ta/core/constants.h>

#include <string>

namespace epoch_ta::backtest {

struct BacktestTrade {
  std::string entry_date;
  std::string exit_date;
  double entry_price{};
  double exit_price{};
  double return_percent{};

  bool operator==(const BacktestTrade &) const = default;
};

struct EquityPoint {
  std::string date;
  double equity{};

  bool operator==(const EquityPoint &) const = default;
};

struct BacktestResult {
  double initial_capital{};
  double final_capital{};
  double total_return_percent{};
  double cagr_percent{};
  double max_drawdown_percent{};
  size_t trades_count{};
  double win_rate_percent{};
  std::vector<BacktestTrade> trades;
  std::vector<EquityPoint> equity_curve;
};

struct BacktestOptions {
  int64_t fast_period = defaults::kBacktestFast;
  int64_t slow_period = defaults::kBacktestSlow;
  double initial_capital = defaults::kInitialCapital;
};

class SmaCrossoverBacktester {
public:
  explicit SmaCrossoverBacktester(BacktestOptions options = {})
      : m_options(options) {}

  [[nodiscard]] BacktestResult Run(BarList const &bars) const;

  // Simulation over precomputed moving averages aligned with `bars`.
  [[nodiscard]] BacktestResult Run(BarList const &bars,
                                   IndicatorSeries const &fast,
                                   IndicatorSeries const &slow) const;

  [[nodiscard]] BacktestOptions const &GetOptions() const { return m_options; }

private:
  BacktestOptions m_options;
};

// Largest peak-to-trough decline of the curve in percent, with the running
// peak starting at `initialCapital`.
[[nodiscard]] double MaxDrawdownPercent(std::vector<EquityPoint> const &curve,
                                        double initialCapital);

// Compound annual growth in percent over `barCount` daily bars.
[[nodiscard]] double CagrPercent(double initialCapital, double finalCapital,
                                 size_t barCount);

} // namespace epoch_ta::backtest
