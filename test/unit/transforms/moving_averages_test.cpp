//
// Unit tests for SMA, EMA, WMA and Bollinger Bands
//

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <epoch_ta/transforms/moving_averages.h>
#include "common/bar_fixtures.h"

using namespace epoch_ta;
using namespace epoch_ta::transform;
using Catch::Approx;

TEST_CASE("Moving averages keep input length", "[moving_averages][alignment]") {
    auto length = GENERATE(0, 1, 5, 40);
    auto values = test::Sine(static_cast<size_t>(length), 100.0, 5.0, 12.0);

    REQUIRE(SMA(values, 10).size() == values.size());
    REQUIRE(EMA(values, 10).size() == values.size());
    REQUIRE(WMA(values, 10).size() == values.size());
    REQUIRE(RollingStdDev(values, 10).size() == values.size());

    auto bands = Bollinger(values);
    REQUIRE(bands.middle.size() == values.size());
    REQUIRE(bands.upper.size() == values.size());
    REQUIRE(bands.lower.size() == values.size());
}

TEST_CASE("SMA warm-up", "[moving_averages][sma]") {
    auto period = GENERATE(2, 3, 7, 20);
    auto values = test::Sine(30, 50.0, 3.0, 9.0);
    auto sma = SMA(values, period);

    for (size_t i = 0; i < sma.size(); ++i) {
        if (i + 1 < static_cast<size_t>(period)) {
            REQUIRE_FALSE(sma[i].has_value());
        } else {
            REQUIRE(sma[i].has_value());
            REQUIRE(std::isfinite(*sma[i]));
        }
    }
}

TEST_CASE("SMA values", "[moving_averages][sma]") {
    auto sma = SMA({1.0, 2.0, 3.0, 4.0, 5.0}, 3);
    REQUIRE(sma[2] == Approx(2.0));
    REQUIRE(sma[3] == Approx(3.0));
    REQUIRE(sma[4] == Approx(4.0));

    SECTION("Period of one or less is the identity") {
        REQUIRE(SMA({1.0, 2.0}, 1) == IndicatorSeries{1.0, 2.0});
        REQUIRE(SMA({1.0, 2.0}, 0) == IndicatorSeries{1.0, 2.0});
    }

    SECTION("Period longer than the series") {
        REQUIRE(test::CountDefined(SMA({1.0, 2.0}, 5)) == 0);
    }
}

TEST_CASE("EMA is seeded with the simple average", "[moving_averages][ema]") {
    auto period = GENERATE(2, 5, 12, 26);
    auto values = test::Sine(60, 75.0, 8.0, 17.0);

    auto ema = EMA(values, period);
    auto sma = SMA(values, period);
    auto seed = static_cast<size_t>(period - 1);

    REQUIRE(ema[seed].has_value());
    REQUIRE(*ema[seed] == *sma[seed]);
    for (size_t i = 0; i < seed; ++i) {
        REQUIRE_FALSE(ema[i].has_value());
    }
}

TEST_CASE("EMA recursion", "[moving_averages][ema]") {
    auto ema = EMA({2.0, 4.0, 6.0, 8.0}, 3);
    // seed 4, multiplier 0.5
    REQUIRE(ema[2] == Approx(4.0));
    REQUIRE(ema[3] == Approx(6.0));

    REQUIRE(test::CountDefined(EMA({1.0, 2.0}, 3)) == 0);
}

TEST_CASE("WMA weights recent values more", "[moving_averages][wma]") {
    auto wma = WMA({1.0, 2.0, 3.0}, 3);
    REQUIRE_FALSE(wma[1].has_value());
    REQUIRE(wma[2] == Approx((1.0 + 4.0 + 9.0) / 6.0));
}

TEST_CASE("Bollinger Bands", "[moving_averages][bollinger]") {
    SECTION("Flat series collapses the bands") {
        auto bands = Bollinger(test::Constant(25, 10.0), 20, 2.0);
        REQUIRE_FALSE(bands.upper[18].has_value());
        REQUIRE(bands.middle[24] == Approx(10.0));
        REQUIRE(bands.upper[24] == Approx(10.0));
        REQUIRE(bands.lower[24] == Approx(10.0));
    }

    SECTION("Population standard deviation") {
        auto bands = Bollinger({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}, 8, 2.0);
        REQUIRE(bands.middle[7] == Approx(5.0));
        REQUIRE(bands.upper[7] == Approx(9.0));
        REQUIRE(bands.lower[7] == Approx(1.0));
    }

    SECTION("Upper stays above lower") {
        auto bands = Bollinger(test::Sine(80, 100.0, 10.0, 13.0));
        for (size_t i = 19; i < 80; ++i) {
            REQUIRE(*bands.upper[i] >= *bands.middle[i]);
            REQUIRE(*bands.middle[i] >= *bands.lower[i]);
        }
    }
}

TEST_CASE("Rolling standard deviation", "[moving_averages][stddev]") {
    SECTION("Population deviation around the mean") {
        auto deviation = RollingStdDev({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}, 8);
        REQUIRE_FALSE(deviation[6].has_value());
        REQUIRE(deviation[7] == Approx(2.0));
    }

    SECTION("Flat window is exactly zero") {
        auto value = GENERATE(10.0, 100.1, 3.3);
        auto deviation = RollingStdDev(test::Constant(30, value), 20);
        for (size_t i = 19; i < 30; ++i) {
            REQUIRE(deviation[i].has_value());
            REQUIRE(*deviation[i] >= 0.0);
            REQUIRE(*deviation[i] == Approx(0.0).margin(1e-4));
        }
    }

    SECTION("Period of one or less has no spread") {
        REQUIRE(RollingStdDev({1.0, 5.0}, 1) == IndicatorSeries{0.0, 0.0});
    }
}

TEST_CASE("WMA warm-up and rolling window", "[moving_averages][wma]") {
    auto wma = WMA({4.0, 1.0, 2.0, 3.0}, 3);
    REQUIRE(test::CountDefined(wma) == 2);
    REQUIRE(wma[3] == Approx((1.0 + 4.0 + 9.0) / 6.0));
    REQUIRE(WMA({1.0, 2.0}, 1) == IndicatorSeries{1.0, 2.0});
}

TEST_CASE("Bollinger Bands with a non-finite deviation keep collapsed bands",
          "[moving_averages][bollinger]") {
    auto value = GENERATE(100.1, 0.3, 7.7);
    auto bands = Bollinger(test::Constant(40, value), 20, 2.0);
    for (size_t i = 19; i < 40; ++i) {
        REQUIRE(bands.upper[i].has_value());
        REQUIRE(bands.lower[i].has_value());
        REQUIRE(*bands.upper[i] == Approx(value).margin(1e-4));
        REQUIRE(*bands.lower[i] == Approx(value).margin(1e-4));
    }

    SECTION("Period of one or less collapses onto the input") {
        auto single = Bollinger({3.0, 4.0}, 1, 2.0);
        REQUIRE(single.upper == IndicatorSeries{3.0, 4.0});
        REQUIRE(single.lower == IndicatorSeries{3.0, 4.0});
    }
}
