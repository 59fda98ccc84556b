#pragma once
//
// Bar resampler
//
// Aggregates a normalized daily series into coarser bars: open = first,
// high = max, low = min, close = last, volume = sum.  The output bar keeps
// the date of the last bar in its group.
//

#include <epoch_ta/core/bar.h>
#include <epoch_ta/core/constants.h>

#include <chrono>
#include <optional>
#include <string>

namespace epoch_ta::data {

// Parses the leading YYYY-MM-DD of an ISO-8601 date or timestamp.
std::optional<std::chrono::year_month_day> ParseIsoDate(std::string const &date);

// Group key of `date` under `rule`, nullopt when the date cannot be parsed.
std::optional<std::string> GroupKey(std::string const &date,
                                    epoch_core::ResampleRule rule);

[[nodiscard]] BarList ResampleBars(BarList const &bars,
                                   epoch_core::ResampleRule rule);

// The trailing `lookback` bars (all of them when shorter).
[[nodiscard]] BarList TailBars(BarList const &bars, size_t lookback);

} // namespace epoch_ta::data
