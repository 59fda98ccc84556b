//
// Unit tests for the SMA crossover backtester
//

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <epoch_ta/backtest/sma_crossover.h>
#include "common/bar_fixtures.h"

using namespace epoch_ta;
using namespace epoch_ta::backtest;
using Catch::Approx;

namespace {
// 100..130 up by one, then down by two for 29 bars.
BarList RiseAndFall() {
    auto closes = test::Linear(31, 100.0, 1.0);
    for (double close = 128.0; close >= 72.0; close -= 2.0) {
        closes.push_back(close);
    }
    return test::MakeBars(closes);
}

// RiseAndFall followed by a recovery of `recovery` bars: 74, 76, 78, ...
// With 3/5 averages the recovery crosses bullish on its third bar (index 62).
BarList RiseFallRise(size_t recovery) {
    auto bars = RiseAndFall();
    std::vector<double> closes;
    for (auto const& bar : bars) {
        closes.push_back(bar.close);
    }
    for (size_t k = 0; k < recovery; ++k) {
        closes.push_back(74.0 + 2.0 * static_cast<double>(k));
    }
    return test::MakeBars(closes);
}
} // namespace

TEST_CASE("SmaCrossoverBacktester - round trip", "[backtest]") {
    const auto bars = RiseAndFall();
    SmaCrossoverBacktester backtester{{.fast_period = 3, .slow_period = 5, .initial_capital = 10000.0}};
    auto result = backtester.Run(bars);

    REQUIRE(result.trades_count == 1);
    auto const& trade = result.trades.front();
    REQUIRE(trade.entry_date == bars[4].date);
    REQUIRE(trade.entry_price == 104.0);
    REQUIRE(trade.exit_date == bars[32].date);
    REQUIRE(trade.exit_price == 126.0);
    REQUIRE(trade.return_percent == Approx(22.0 / 104.0 * 100.0));

    REQUIRE(result.initial_capital == 10000.0);
    REQUIRE(result.final_capital == Approx(10000.0 * 126.0 / 104.0));
    REQUIRE(result.total_return_percent == Approx(22.0 / 104.0 * 100.0));
    REQUIRE(result.win_rate_percent == Approx(100.0));
    REQUIRE(result.max_drawdown_percent == Approx(4.0 / 130.0 * 100.0));

    SECTION("One equity point per bar from the second") {
        REQUIRE(result.equity_curve.size() == bars.size() - 1);
        REQUIRE(result.equity_curve.front().date == bars[1].date);
        REQUIRE(result.equity_curve.front().equity == 10000.0);
        REQUIRE(result.equity_curve.back().equity == Approx(result.final_capital));
    }
}

TEST_CASE("SmaCrossoverBacktester - open position is force closed", "[backtest]") {
    const auto bars = test::MakeBars(test::Linear(60, 100.0, 1.0));
    SmaCrossoverBacktester backtester{{.fast_period = 5, .slow_period = 10}};
    auto result = backtester.Run(bars);

    REQUIRE(result.trades.size() == 1);
    REQUIRE(result.trades[0].entry_date == bars[9].date);
    REQUIRE(result.trades[0].exit_date == bars.back().date);
    REQUIRE(result.trades[0].exit_price == 159.0);
    REQUIRE(result.trades[0].return_percent > 0.0);
    REQUIRE(result.final_capital == Approx(100000.0 * 159.0 / 109.0));
    REQUIRE(result.max_drawdown_percent == 0.0);
}

TEST_CASE("SmaCrossoverBacktester - crossover exit then forced close", "[backtest]") {
    const auto bars = RiseFallRise(11);
    SmaCrossoverBacktester backtester{{.fast_period = 3, .slow_period = 5, .initial_capital = 10000.0}};
    auto result = backtester.Run(bars);

    REQUIRE(result.trades_count == 2);

    auto const& closed = result.trades[0];
    REQUIRE(closed.exit_date == bars[32].date);
    REQUIRE(closed.exit_price == 126.0);

    auto const& forced = result.trades[1];
    REQUIRE(forced.entry_date == bars[62].date);
    REQUIRE(forced.entry_price == 78.0);
    REQUIRE(forced.exit_date == bars.back().date);
    REQUIRE(forced.exit_price == 94.0);

    REQUIRE(result.final_capital == Approx(10000.0 * 126.0 / 104.0 * 94.0 / 78.0));
    REQUIRE(result.win_rate_percent == Approx(100.0));
    REQUIRE(result.equity_curve.back().equity == Approx(result.final_capital));
}

TEST_CASE("SmaCrossoverBacktester - a position left open adds exactly one trade", "[backtest]") {
    SmaCrossoverBacktester backtester{{.fast_period = 3, .slow_period = 5, .initial_capital = 10000.0}};

    // the full series crosses on its last bar, the shorter one never re-enters
    const auto full = RiseFallRise(3);
    auto truncated = full;
    truncated.pop_back();

    auto withCross = backtester.Run(full);
    auto withoutCross = backtester.Run(truncated);

    REQUIRE(withoutCross.trades_count == 1);
    REQUIRE(withCross.trades_count == withoutCross.trades_count + 1);
    REQUIRE(withCross.trades.front() == withoutCross.trades.front());

    auto const& forced = withCross.trades.back();
    REQUIRE(forced.entry_date == full.back().date);
    REQUIRE(forced.exit_date == full.back().date);
    REQUIRE(forced.return_percent == 0.0);
    REQUIRE(withCross.final_capital == Approx(withoutCross.final_capital));
}

TEST_CASE("SmaCrossoverBacktester - default averages can enter on the first slow value", "[backtest]") {
    const auto bars = test::MakeBars(test::Linear(60, 100.0, 1.0));
    SmaCrossoverBacktester backtester;
    auto result = backtester.Run(bars);

    REQUIRE(result.trades.size() == 1);
    REQUIRE(result.trades[0].entry_date == bars[49].date);
    REQUIRE(result.trades[0].entry_price == 149.0);
    REQUIRE(result.trades[0].exit_date == bars.back().date);
}

TEST_CASE("SmaCrossoverBacktester is deterministic", "[backtest]") {
    const auto bars = test::MakeBars(test::Sine(300, 100.0, 15.0, 40.0));
    SmaCrossoverBacktester backtester{{.fast_period = 5, .slow_period = 20}};

    auto first = backtester.Run(bars);
    auto second = backtester.Run(bars);
    REQUIRE(first.trades_count > 1);
    REQUIRE(first.trades == second.trades);
    REQUIRE(first.equity_curve == second.equity_curve);
    REQUIRE(first.final_capital == second.final_capital);
}

TEST_CASE("SmaCrossoverBacktester without signals", "[backtest]") {
    SmaCrossoverBacktester backtester;
    REQUIRE(backtester.GetOptions().fast_period == 20);
    REQUIRE(backtester.GetOptions().slow_period == 50);

    SECTION("History shorter than the slow average") {
        auto result = backtester.Run(test::MakeBars(test::Linear(40, 100.0, 1.0)));
        REQUIRE(result.trades.empty());
        REQUIRE(result.final_capital == 100000.0);
        REQUIRE(result.total_return_percent == 0.0);
        REQUIRE(result.cagr_percent == Approx(0.0));
        REQUIRE(result.win_rate_percent == 0.0);
    }

    SECTION("Empty history") {
        auto result = backtester.Run({});
        REQUIRE(result.trades.empty());
        REQUIRE(result.equity_curve.empty());
        REQUIRE(result.final_capital == 100000.0);
    }
}

TEST_CASE("Backtest ratios", "[backtest]") {
    SECTION("MaxDrawdownPercent tracks the running peak") {
        std::vector<EquityPoint> curve{{"a", 110.0}, {"b", 99.0}, {"c", 120.0}, {"d", 60.0}};
        REQUIRE(MaxDrawdownPercent(curve, 100.0) == Approx(50.0));
        REQUIRE(MaxDrawdownPercent({}, 100.0) == 0.0);
    }

    SECTION("CagrPercent annualizes over trading days") {
        REQUIRE(CagrPercent(100.0, 200.0, 253) == Approx(100.0));
        REQUIRE(CagrPercent(100.0, 100.0, 10) == Approx(0.0));
        REQUIRE(CagrPercent(100.0, 121.0, 505) == Approx(10.0));
    }
}
