//
// Unit tests for the YAML analysis profile
//

#include <catch2/catch_test_macros.hpp>
#include <yaml-cpp/yaml.h>

#include <epoch_ta/core/analysis_config.h>

using namespace epoch_ta;

TEST_CASE("AnalysisConfig defaults", "[config]") {
    AnalysisConfig config;
    REQUIRE(config.log_level == "info");
    REQUIRE(config.indicators.sma_period == 20);
    REQUIRE(config.indicators.macd_fast == 12);
    REQUIRE(config.indicators.macd_slow == 26);
    REQUIRE(config.volume_profile_bins == 12);
    REQUIRE(config.backtest.fast_period == 20);
    REQUIRE(config.backtest.slow_period == 50);
    REQUIRE(config.backtest.initial_capital == 100000.0);
    REQUIRE_FALSE(config.renko_brick_size.has_value());
    REQUIRE(config.timeframes.size() == 5);
    REQUIRE(config.timeframes.front().label == "1MO");
    REQUIRE(config.timeframes.back().resample == epoch_core::ResampleRule::weekly);
    REQUIRE_NOTHROW(config.Validate());
}

TEST_CASE("LoadAnalysisConfigFromString", "[config]") {
    SECTION("Empty document keeps every default") {
        auto config = LoadAnalysisConfigFromString("");
        REQUIRE(config.indicators.rsi_period == 14);
        REQUIRE(config.timeframes.size() == 5);
    }

    SECTION("Nested keys override defaults") {
        auto config = LoadAnalysisConfigFromString(R"(
logging: { level: debug }
indicators:
  sma_period: 10
  macd: { fast: 8, slow: 21, signal: 5 }
  bollinger: { period: 15, std_mult: 2.5 }
  stochastic: { smooth_k: 1 }
renko: { brick_size: 1.5 }
volume_profile: { bins: 24 }
backtest: { fast_period: 5, slow_period: 10, initial_capital: 5000 }
timeframes:
  - { label: 1MO, lookback: 21 }
  - { label: 2Y, lookback: 104, resample: weekly }
)");
        REQUIRE(config.log_level == "debug");
        REQUIRE(config.indicators.sma_period == 10);
        REQUIRE(config.indicators.ema_period == 20);
        REQUIRE(config.indicators.macd_fast == 8);
        REQUIRE(config.indicators.macd_slow == 21);
        REQUIRE(config.indicators.macd_signal == 5);
        REQUIRE(config.indicators.bollinger_period == 15);
        REQUIRE(config.indicators.bollinger_std_mult == 2.5);
        REQUIRE(config.indicators.stochastic_period == 14);
        REQUIRE(config.indicators.stochastic_smooth_k == 1);
        REQUIRE(config.renko_brick_size == 1.5);
        REQUIRE(config.volume_profile_bins == 24);
        REQUIRE(config.backtest.fast_period == 5);
        REQUIRE(config.backtest.slow_period == 10);
        REQUIRE(config.backtest.initial_capital == 5000.0);

        REQUIRE(config.timeframes.size() == 2);
        REQUIRE(config.timeframes[0].resample == epoch_core::ResampleRule::daily);
        REQUIRE(config.timeframes[1].label == "2Y");
        REQUIRE(config.timeframes[1].lookback == 104);
        REQUIRE(config.timeframes[1].resample == epoch_core::ResampleRule::weekly);
    }
}

TEST_CASE("LoadAnalysisConfig reads the shipped profile", "[config]") {
    auto config = LoadAnalysisConfig(std::filesystem::path{EPOCH_TA_CONFIG_DIR} / "analysis_profile.yaml");
    REQUIRE(config.log_level == "info");
    REQUIRE_FALSE(config.renko_brick_size.has_value());
    REQUIRE(config.timeframes.back().label == "5Y");
    REQUIRE(config.timeframes.back().resample == epoch_core::ResampleRule::weekly);

    const auto defaults = AnalysisConfig::DefaultTimeframes();
    REQUIRE(config.timeframes.size() == defaults.size());
    for (size_t i = 0; i < defaults.size(); ++i) {
        INFO("timeframe " << defaults[i].label);
        REQUIRE(config.timeframes[i].label == defaults[i].label);
        REQUIRE(config.timeframes[i].lookback == defaults[i].lookback);
        REQUIRE(config.timeframes[i].resample == defaults[i].resample);
    }

    REQUIRE_THROWS(LoadAnalysisConfig(std::filesystem::path{EPOCH_TA_CONFIG_DIR} / "missing.yaml"));
}

TEST_CASE("AnalysisConfig validation rejects bad profiles", "[config]") {
    SECTION("Unknown log level") {
        REQUIRE_THROWS(LoadAnalysisConfigFromString("logging: { level: loud }"));
    }

    SECTION("Non-positive indicator period") {
        REQUIRE_THROWS(LoadAnalysisConfigFromString("indicators: { rsi_period: 0 }"));
    }

    SECTION("MACD fast must be below slow") {
        REQUIRE_THROWS(LoadAnalysisConfigFromString("indicators: { macd: { fast: 26, slow: 12 } }"));
    }

    SECTION("Bollinger multiplier must be positive") {
        REQUIRE_THROWS(LoadAnalysisConfigFromString("indicators: { bollinger: { std_mult: 0 } }"));
    }

    SECTION("Renko brick must be positive") {
        REQUIRE_THROWS(LoadAnalysisConfigFromString("renko: { brick_size: -1 }"));
    }

    SECTION("Volume profile needs at least one bin") {
        REQUIRE_THROWS(LoadAnalysisConfigFromString("volume_profile: { bins: 0 }"));
    }

    SECTION("Backtest periods") {
        REQUIRE_THROWS(LoadAnalysisConfigFromString("backtest: { fast_period: 1 }"));
        REQUIRE_THROWS(LoadAnalysisConfigFromString("backtest: { slow_period: 2 }"));
        REQUIRE_THROWS(LoadAnalysisConfigFromString("backtest: { initial_capital: 0 }"));
    }

    SECTION("Timeframe entries") {
        REQUIRE_THROWS(LoadAnalysisConfigFromString("timeframes: [ { label: '', lookback: 5 } ]"));
        REQUIRE_THROWS(LoadAnalysisConfigFromString("timeframes: [ { label: 1W, lookback: 0 } ]"));
        REQUIRE_THROWS(LoadAnalysisConfigFromString("timeframes: [ { label: 1W, lookback: 5, resample: hourly } ]"));
        REQUIRE_THROWS(LoadAnalysisConfigFromString("timeframes: [ 21 ]"));
    }
}
