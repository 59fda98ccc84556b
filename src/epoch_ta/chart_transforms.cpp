#include <epoch_ta/transforms/chart_transforms.h>
#include <epoch_ta/transforms/trend.h>

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace epoch_ta::transform {

BarList HeikinAshi(BarList const &bars) {
  BarList out;
  if (bars.empty()) {
    return out;
  }
  out.reserve(bars.size());

  double prevOpen = (bars.front().open + bars.front().close) / 2.0;
  double prevClose = 0.0;
  for (size_t i = 0; i < bars.size(); ++i) {
    const auto &bar = bars[i];
    const double haClose = (bar.open + bar.high + bar.low + bar.close) / 4.0;
    const double haOpen = i == 0 ? prevOpen : (prevOpen + prevClose) / 2.0;

    out.push_back(Bar{.date = bar.date,
                      .open = haOpen,
                      .high = std::max({bar.high, haOpen, haClose}),
                      .low = std::min({bar.low, haOpen, haClose}),
                      .close = haClose,
                      .volume = bar.volume});

    prevOpen = haOpen;
    prevClose = haClose;
  }
  return out;
}

double DefaultRenkoBrickSize(BarList const &bars) {
  if (bars.empty()) {
    return 0.0;
  }
  const double latestClose = bars.back().close;
  const double atr = AverageTrueRange(bars, defaults::kAtrPeriod)
                         .value_or(latestClose * 0.01);
  return std::max(atr * 0.8, latestClose * 0.0025);
}

namespace {
// Total close-to-close travel; no walk can lay more than travel / size bricks.
double CloseTravel(BarList const &bars) {
  double travel = 0.0;
  for (size_t i = 1; i < bars.size(); ++i) {
    travel += std::abs(bars[i].close - bars[i - 1].close);
  }
  return travel;
}

Bar MakeBrick(Bar const &source, double open, double close) {
  return Bar{.date = source.date,
             .open = open,
             .high = std::max(open, close),
             .low = std::min(open, close),
             .close = close,
             .volume = source.volume};
}
} // namespace

BarList Renko(BarList const &bars, std::optional<double> brickSize) {
  if (bars.empty()) {
    return {};
  }

  double size = (brickSize && std::isfinite(*brickSize) && *brickSize > 0.0)
                    ? *brickSize
                    : DefaultRenkoBrickSize(bars);

  const double travel = CloseTravel(bars);
  if (size > 0.0 && travel / size > static_cast<double>(kMaxRenkoBricks)) {
    const double coarser = travel / static_cast<double>(kMaxRenkoBricks);
    SPDLOG_WARN("Renko: brick size {} would lay {:.0f} bricks, using {} to "
                "stay within {}",
                size, travel / size, coarser, kMaxRenkoBricks);
    size = coarser;
  }

  BarList bricks;
  if (size > 0.0) {
    double boundary = bars.front().close;
    for (size_t i = 1; i < bars.size(); ++i) {
      const auto &bar = bars[i];
      while (bar.close - boundary >= size) {
        bricks.push_back(MakeBrick(bar, boundary, boundary + size));
        boundary += size;
      }
      while (boundary - bar.close >= size) {
        bricks.push_back(MakeBrick(bar, boundary, boundary - size));
        boundary -= size;
      }
    }
  }

  if (bricks.empty()) {
    SPDLOG_DEBUG("Renko: no brick of size {} formed over {} bars, returning "
                 "the last bar",
                 size, bars.size());
    return {bars.back()};
  }
  return bricks;
}

} // namespace epoch_ta::transform
