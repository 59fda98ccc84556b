#include <epoch_ta/data/normalizer.h>

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace epoch_ta::data {

namespace {
std::optional<double> PositivePrice(std::optional<double> const &value) {
  if (!value || !std::isfinite(*value) || *value <= 0.0) {
    return std::nullopt;
  }
  return value;
}
} // namespace

BarList NormalizeHistory(std::vector<RawBar> const &history) {
  BarList bars;
  bars.reserve(history.size());

  size_t dropped = 0;
  for (auto const &row : history) {
    const auto close = PositivePrice(row.close);
    if (!close || row.date.empty()) {
      ++dropped;
      continue;
    }

    double volume = row.volume.value_or(0.0);
    if (!std::isfinite(volume) || volume < 0.0) {
      volume = 0.0;
    }

    bars.push_back(Bar{.date = row.date,
                       .open = PositivePrice(row.open).value_or(*close),
                       .high = PositivePrice(row.high).value_or(*close),
                       .low = PositivePrice(row.low).value_or(*close),
                       .close = *close,
                       .volume = volume});
  }

  std::ranges::stable_sort(
      bars, [](Bar const &a, Bar const &b) { return a.date < b.date; });

  // stable_sort keeps input order inside a run of equal dates, so the last
  // element of each run is the provider's latest row for that date.
  BarList out;
  out.reserve(bars.size());
  for (auto &bar : bars) {
    if (!out.empty() && out.back().date == bar.date) {
      out.back() = std::move(bar);
    } else {
      out.push_back(std::move(bar));
    }
  }

  const size_t collapsed = bars.size() - out.size();
  if (dropped > 0 || collapsed > 0) {
    SPDLOG_DEBUG("NormalizeHistory: {} rows in, {} dropped, {} duplicate "
                 "dates collapsed, {} bars out",
                 history.size(), dropped, collapsed, out.size());
  }
  return out;
}

} // namespace epoch_ta::data
