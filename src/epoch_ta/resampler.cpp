#include <epoch_ta/data/resampler.h>

#include <algorithm>
#include <charconv>
#include <format>
#include <spdlog/spdlog.h>

namespace epoch_ta::data {

namespace {
template <typename T>
bool ParseField(std::string const &text, size_t pos, size_t len, T &out) {
  const char *first = text.data() + pos;
  const char *last = first + len;
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

std::string FormatDate(std::chrono::year_month_day const &ymd) {
  return std::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                     static_cast<unsigned>(ymd.month()),
                     static_cast<unsigned>(ymd.day()));
}
} // namespace

std::optional<std::chrono::year_month_day>
ParseIsoDate(std::string const &date) {
  if (date.size() < 10 || date[4] != '-' || date[7] != '-') {
    return std::nullopt;
  }

  int year{};
  unsigned month{};
  unsigned day{};
  if (!ParseField(date, 0, 4, year) || !ParseField(date, 5, 2, month) ||
      !ParseField(date, 8, 2, day)) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year},
                                        std::chrono::month{month},
                                        std::chrono::day{day}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return ymd;
}

std::optional<std::string> GroupKey(std::string const &date,
                                    epoch_core::ResampleRule rule) {
  const auto ymd = ParseIsoDate(date);
  if (!ymd) {
    return std::nullopt;
  }

  switch (rule) {
  case epoch_core::ResampleRule::weekly: {
    const std::chrono::sys_days days{*ymd};
    const std::chrono::weekday weekday{days};
    const auto monday = days - (weekday - std::chrono::Monday);
    return FormatDate(std::chrono::year_month_day{monday});
  }
  case epoch_core::ResampleRule::monthly:
    return FormatDate(*ymd).substr(0, 7);
  default:
    return FormatDate(*ymd);
  }
}

BarList ResampleBars(BarList const &bars, epoch_core::ResampleRule rule) {
  BarList out;
  std::optional<std::string> currentKey;
  size_t skipped = 0;

  for (auto const &bar : bars) {
    auto key = GroupKey(bar.date, rule);
    if (!key) {
      ++skipped;
      continue;
    }

    if (currentKey && *currentKey == *key) {
      auto &group = out.back();
      group.date = bar.date;
      group.high = std::max(group.high, bar.high);
      group.low = std::min(group.low, bar.low);
      group.close = bar.close;
      group.volume += bar.volume;
      continue;
    }

    currentKey = std::move(key);
    out.push_back(bar);
  }

  if (skipped > 0) {
    SPDLOG_WARN("ResampleBars({}): skipped {} bars with unparseable dates",
                epoch_core::ResampleRuleWrapper::ToString(rule), skipped);
  }
  return out;
}

BarList TailBars(BarList const &bars, size_t lookback) {
  if (lookback >= bars.size()) {
    return bars;
  }
  return BarList(bars.end() - static_cast<std::ptrdiff_t>(lookback),
                 bars.end());
}

} // namespace epoch_ta::data
