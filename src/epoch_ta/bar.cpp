#include <epoch_ta/core/bar.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace epoch_ta {

std::vector<double> Closes(BarList const &bars) {
  std::vector<double> closes;
  closes.reserve(bars.size());
  std::ranges::transform(bars, std::back_inserter(closes),
                         [](Bar const &bar) { return bar.close; });
  return closes;
}

IndicatorValue LastValue(IndicatorSeries const &series) {
  for (auto it = series.rbegin(); it != series.rend(); ++it) {
    if (*it && std::isfinite(**it)) {
      return *it;
    }
  }
  return std::nullopt;
}

IndicatorSeries Subtract(IndicatorSeries const &a, IndicatorSeries const &b) {
  const size_t n = std::min(a.size(), b.size());
  IndicatorSeries out(a.size());
  for (size_t i = 0; i < n; ++i) {
    if (a[i] && b[i]) {
      out[i] = *a[i] - *b[i];
    }
  }
  return out;
}

std::vector<double> FillUndefined(IndicatorSeries const &series, double fill) {
  std::vector<double> out;
  out.reserve(series.size());
  for (auto const &value : series) {
    out.push_back(value.value_or(fill));
  }
  return out;
}

IndicatorSeries MaskLike(IndicatorSeries const &values,
                         IndicatorSeries const &mask) {
  IndicatorSeries out(values.size());
  for (size_t i = 0; i < values.size() && i < mask.size(); ++i) {
    if (mask[i]) {
      out[i] = values[i];
    }
  }
  return out;
}

IndicatorSeries ToIndicatorSeries(std::vector<double> const &values) {
  return IndicatorSeries(values.begin(), values.end());
}

} // namespace epoch_ta
