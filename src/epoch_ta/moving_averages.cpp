#include <epoch_ta/transforms/moving_averages.h>
#include "tulip_kernel.h"

#include <utility>

namespace epoch_ta::transform {

namespace {
// Sum of values[end - period + 1 .. end] in ascending index order, the order
// ti_sma accumulates its first window in.
double WindowSum(std::vector<double> const &values, size_t end, size_t period) {
  double sum = 0.0;
  for (size_t j = end + 1 - period; j <= end; ++j) {
    sum += values[j];
  }
  return sum;
}
} // namespace

IndicatorSeries SMA(std::vector<double> const &values, int64_t period) {
  if (period <= 1) {
    return ToIndicatorSeries(values);
  }
  auto [out] = tulip::Run<1>("sma", ti_sma_start, ti_sma, values,
                             std::array<TI_REAL, 1>{static_cast<TI_REAL>(period)});
  return out;
}

IndicatorSeries EMA(std::vector<double> const &values, int64_t period) {
  if (period <= 1) {
    return ToIndicatorSeries(values);
  }

  const auto p = static_cast<size_t>(period);
  IndicatorSeries out(values.size());
  if (values.size() < p) {
    return out;
  }

  const double multiplier = 2.0 / (static_cast<double>(period) + 1.0);
  double prev = WindowSum(values, p - 1, p) * (1.0 / static_cast<double>(p));
  out[p - 1] = prev;
  for (size_t i = p; i < values.size(); ++i) {
    prev = (values[i] - prev) * multiplier + prev;
    out[i] = prev;
  }
  return out;
}

IndicatorSeries WMA(std::vector<double> const &values, int64_t period) {
  if (period <= 1) {
    return ToIndicatorSeries(values);
  }
  auto [out] = tulip::Run<1>("wma", ti_wma_start, ti_wma, values,
                             std::array<TI_REAL, 1>{static_cast<TI_REAL>(period)});
  return out;
}

IndicatorSeries RollingStdDev(std::vector<double> const &values,
                              int64_t period) {
  if (period <= 1) {
    return IndicatorSeries(values.size(), 0.0);
  }
  auto [out] =
      tulip::Run<1>("stddev", ti_stddev_start, ti_stddev, values,
                    std::array<TI_REAL, 1>{static_cast<TI_REAL>(period)});
  // ti_stddev leaves a variance that rounds below zero unrooted
  for (auto &value : out) {
    if (value && *value < 0.0) {
      value = 0.0;
    }
  }
  return out;
}

BollingerBands Bollinger(std::vector<double> const &values, int64_t period,
                         double stdMult) {
  if (period <= 1) {
    return BollingerBands{.middle = ToIndicatorSeries(values),
                          .upper = ToIndicatorSeries(values),
                          .lower = ToIndicatorSeries(values)};
  }

  auto [lower, middle, upper] = tulip::Run<3>(
      "bbands", ti_bbands_start, ti_bbands, values,
      std::array<TI_REAL, 2>{static_cast<TI_REAL>(period), stdMult});

  // A flat window can leave sqrt of a tiny negative variance as NaN
  for (size_t i = 0; i < values.size(); ++i) {
    if (middle[i] && !upper[i]) {
      upper[i] = middle[i];
      lower[i] = middle[i];
    }
  }
  return BollingerBands{.middle = std::move(middle),
                        .upper = std::move(upper),
                        .lower = std::move(lower)};
}

} // namespace epoch_ta::transform
