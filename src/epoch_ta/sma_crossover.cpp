#include <epoch_ta/backtest/sma_crossover.h>
#include <epoch_ta/transforms/moving_averages.h>

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace epoch_ta::backtest {

namespace {
struct OpenTrade {
  std::string date;
  double price{};
};

BacktestTrade CloseTrade(OpenTrade const &open, Bar const &exit) {
  return BacktestTrade{
      .entry_date = open.date,
      .exit_date = exit.date,
      .entry_price = open.price,
      .exit_price = exit.close,
      .return_percent = (exit.close - open.price) / open.price * 100.0};
}
} // namespace

BacktestResult SmaCrossoverBacktester::Run(BarList const &bars) const {
  const auto closes = Closes(bars);
  return Run(bars, transform::SMA(closes, m_options.fast_period),
             transform::SMA(closes, m_options.slow_period));
}

BacktestResult SmaCrossoverBacktester::Run(BarList const &bars,
                                           IndicatorSeries const &fast,
                                           IndicatorSeries const &slow) const {
  BacktestResult result;
  result.initial_capital = m_options.initial_capital;

  double cash = m_options.initial_capital;
  double shares = 0.0;
  std::optional<OpenTrade> openTrade;

  const size_t n = std::min({bars.size(), fast.size(), slow.size()});
  for (size_t i = 1; i < n; ++i) {
    const auto &bar = bars[i];
    const double price = bar.close;

    if (fast[i] && slow[i]) {
      // An undefined previous pair (warm-up) counts as parity, so the first
      // comparable bar can itself be a cross.
      const bool prevDefined = fast[i - 1] && slow[i - 1];
      const double fPrev = prevDefined ? *fast[i - 1] : 0.0;
      const double sPrev = prevDefined ? *slow[i - 1] : 0.0;
      const double fNow = *fast[i];
      const double sNow = *slow[i];

      const bool bullishCross = fPrev <= sPrev && fNow > sNow;
      const bool bearishCross = fPrev >= sPrev && fNow < sNow;

      if (bullishCross && shares == 0.0) {
        shares = cash / price;
        cash = 0.0;
        openTrade = OpenTrade{bar.date, price};
      } else if (bearishCross && shares > 0.0) {
        cash = shares * price;
        shares = 0.0;
        if (openTrade) {
          result.trades.push_back(CloseTrade(*openTrade, bar));
          openTrade.reset();
        }
      }
    }

    result.equity_curve.push_back(
        EquityPoint{bar.date, shares > 0.0 ? shares * price : cash});
  }

  if (shares > 0.0) {
    const auto &last = bars[n - 1];
    cash = shares * last.close;
    shares = 0.0;
    if (openTrade) {
      result.trades.push_back(CloseTrade(*openTrade, last));
    }
  }

  result.final_capital = cash;
  result.total_return_percent =
      (cash - m_options.initial_capital) / m_options.initial_capital * 100.0;
  result.cagr_percent = CagrPercent(m_options.initial_capital, cash, n);
  result.max_drawdown_percent =
      MaxDrawdownPercent(result.equity_curve, m_options.initial_capital);
  result.trades_count = result.trades.size();

  const auto wins = std::ranges::count_if(
      result.trades, [](auto const &trade) { return trade.return_percent > 0.0; });
  result.win_rate_percent =
      result.trades.empty()
          ? 0.0
          : static_cast<double>(wins) / static_cast<double>(result.trades.size()) *
                100.0;

  SPDLOG_DEBUG("SmaCrossover({}/{}): {} bars, {} trades, return {:.2f}%",
               m_options.fast_period, m_options.slow_period, n,
               result.trades_count, result.total_return_percent);
  return result;
}

double MaxDrawdownPercent(std::vector<EquityPoint> const &curve,
                          double initialCapital) {
  double peak = initialCapital;
  double maxDrawdown = 0.0;
  for (auto const &point : curve) {
    peak = std::max(peak, point.equity);
    const double drawdown =
        peak == 0.0 ? 0.0 : (peak - point.equity) / peak * 100.0;
    maxDrawdown = std::max(maxDrawdown, drawdown);
  }
  return maxDrawdown;
}

double CagrPercent(double initialCapital, double finalCapital,
                   size_t barCount) {
  if (initialCapital <= 0.0) {
    return 0.0;
  }
  const double elapsed = barCount > 0 ? static_cast<double>(barCount - 1) : 0.0;
  const double years =
      std::max(elapsed / kTradingDaysPerYear, 1.0 / kTradingDaysPerYear);
  return (std::pow(finalCapital / initialCapital, 1.0 / years) - 1.0) * 100.0;
}

} // namespace epoch_ta::backtest
