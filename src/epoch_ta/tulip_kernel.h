#pragma once
//
// Adapter from Tulip Indicators' array kernels to aligned IndicatorSeries.
//

#include <epoch_ta/core/bar.h>

#include <epoch_core/macros.h>
#include <indicators.h>

#include <array>
#include <cmath>
#include <vector>

namespace epoch_ta::transform::tulip {

/**
 * Runs a single-input Tulip indicator over `values`.
 *
 * Tulip writes `size - start` values per output; each output is left-padded
 * back to `values.size()` with undefined entries.  NaN results (Tulip's 0/0)
 * become undefined as well.
 */
template <size_t NumOutputs, size_t NumOptions>
std::array<IndicatorSeries, NumOutputs>
Run(char const *name, ti_indicator_start_function start,
    ti_indicator_function indicator, std::vector<double> const &values,
    std::array<TI_REAL, NumOptions> const &options) {
  std::array<IndicatorSeries, NumOutputs> result;
  for (auto &series : result) {
    series.resize(values.size());
  }

  const int offset = start(options.data());
  AssertFromFormat(offset >= 0, "ti_{} rejected its options", name);
  if (values.size() <= static_cast<size_t>(offset)) {
    return result;
  }

  const size_t produced = values.size() - static_cast<size_t>(offset);
  std::array<std::vector<TI_REAL>, NumOutputs> buffers;
  std::array<TI_REAL *, NumOutputs> outputs{};
  for (size_t k = 0; k < NumOutputs; ++k) {
    buffers[k].resize(produced);
    outputs[k] = buffers[k].data();
  }

  TI_REAL const *inputs[] = {values.data()};
  const int status = indicator(static_cast<int>(values.size()), inputs,
                               options.data(), outputs.data());
  AssertFromFormat(status == TI_OKAY, "ti_{} failed with status {}", name,
                   status);

  for (size_t k = 0; k < NumOutputs; ++k) {
    for (size_t i = 0; i < produced; ++i) {
      if (!std::isnan(buffers[k][i])) {
        result[k][static_cast<size_t>(offset) + i] = buffers[k][i];
      }
    }
  }
  return result;
}

} // namespace epoch_ta::transform::tulip
