#include <epoch_ta/price_action/patterns.h>
#include <epoch_ta/price_action/pivots.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <spdlog/spdlog.h>

namespace epoch_ta::price_action {

namespace {
using epoch_core::PivotType;
using epoch_core::SignalDirection;

constexpr double kHeadProminence = 1.03;
constexpr double kMaxShoulderDistance = 0.08;
constexpr double kDoubleTolerance = 0.03;
constexpr double kFlatSlope = 0.001;
constexpr double kDirectionalSlope = 0.0007;
constexpr size_t kTrianglePivots = 5;
constexpr size_t kMinTrianglePivots = 3;

PatternSignal MakeSignal(std::string name, SignalDirection direction,
                         double confidence, std::string description) {
  return PatternSignal{.name = std::move(name),
                       .direction = direction,
                       .confidence = std::clamp(confidence, 0.0, 1.0),
                       .description = std::move(description)};
}

std::vector<Pivot> LastN(std::vector<Pivot> const &pivots, size_t n) {
  if (pivots.size() <= n) {
    return pivots;
  }
  return {pivots.end() - static_cast<std::ptrdiff_t>(n), pivots.end()};
}

std::optional<PatternSignal> HeadAndShoulders(std::vector<Pivot> const &highs) {
  if (highs.size() < 3) {
    return std::nullopt;
  }
  const auto &h1 = highs[highs.size() - 3];
  const auto &h2 = highs[highs.size() - 2];
  const auto &h3 = highs[highs.size() - 1];

  const double shoulderDistance = std::abs(h1.price - h3.price) / h2.price;
  if (h2.price > h1.price * kHeadProminence &&
      h2.price > h3.price * kHeadProminence &&
      shoulderDistance < kMaxShoulderDistance) {
    return MakeSignal("Head & Shoulders", SignalDirection::Bearish,
                      std::max(0.4, 1.0 - shoulderDistance),
                      "Middle peak is significantly above both shoulders. "
                      "Downside breakdown risk is elevated.");
  }
  return std::nullopt;
}

// Relative gap between the last two pivots, nullopt with fewer than two.
std::optional<double> LastPairDifference(std::vector<Pivot> const &pivots) {
  if (pivots.size() < 2) {
    return std::nullopt;
  }
  const double p1 = pivots[pivots.size() - 2].price;
  const double p2 = pivots[pivots.size() - 1].price;
  return std::abs(p1 - p2) / ((p1 + p2) / 2.0);
}

std::optional<PatternSignal> Triangle(BarList const &bars,
                                      std::vector<Pivot> const &pivots) {
  const size_t cutoff =
      bars.size() > kTriangleLookbackBars ? bars.size() - kTriangleLookbackBars
                                          : 0;
  std::vector<Pivot> recent;
  std::ranges::copy_if(pivots, std::back_inserter(recent),
                       [cutoff](Pivot const &p) { return p.index >= cutoff; });

  const auto highs = LastN(FilterPivots(recent, PivotType::High), kTrianglePivots);
  const auto lows = LastN(FilterPivots(recent, PivotType::Low), kTrianglePivots);
  if (highs.size() < kMinTrianglePivots || lows.size() < kMinTrianglePivots) {
    return std::nullopt;
  }

  const double base = bars.back().close != 0.0 ? bars.back().close : 1.0;
  const double highSlope = RegressionSlope(highs) / base;
  const double lowSlope = RegressionSlope(lows) / base;

  if (std::abs(highSlope) < kFlatSlope && lowSlope > kDirectionalSlope) {
    return MakeSignal("Ascending Triangle", SignalDirection::Bullish, 0.62,
                      "Flat resistance with rising lows indicates potential "
                      "bullish breakout setup.");
  }
  if (highSlope < -kDirectionalSlope && lowSlope > kDirectionalSlope) {
    return MakeSignal("Symmetrical Triangle", SignalDirection::Neutral, 0.58,
                      "Converging highs and lows indicate compression. Wait "
                      "for breakout confirmation.");
  }
  if (highSlope < -kDirectionalSlope && std::abs(lowSlope) < kFlatSlope) {
    return MakeSignal("Descending Triangle", SignalDirection::Bearish, 0.60,
                      "Descending highs against flat support often resolves "
                      "to downside.");
  }
  return std::nullopt;
}
} // namespace

std::vector<PatternSignal> DetectPatterns(BarList const &bars) {
  std::vector<PatternSignal> out;
  if (bars.size() < kMinPatternBars) {
    SPDLOG_DEBUG("DetectPatterns: {} bars, need at least {}", bars.size(),
                 kMinPatternBars);
    return out;
  }

  const auto pivots = FindPivots(bars, kDefaultPivotWindow);
  const auto highs = FilterPivots(pivots, PivotType::High);
  const auto lows = FilterPivots(pivots, PivotType::Low);

  if (auto signal = HeadAndShoulders(highs)) {
    out.push_back(std::move(*signal));
  }

  if (auto diff = LastPairDifference(highs); diff && *diff < kDoubleTolerance) {
    out.push_back(MakeSignal("Double Top", SignalDirection::Bearish,
                             0.65 - *diff,
                             "Two similar highs suggest supply near "
                             "resistance. Confirmation needs neckline break."));
  }

  if (auto diff = LastPairDifference(lows); diff && *diff < kDoubleTolerance) {
    out.push_back(MakeSignal("Double Bottom", SignalDirection::Bullish,
                             0.65 - *diff,
                             "Repeated support reaction often precedes trend "
                             "reversal if neckline breaks."));
  }

  if (auto signal = Triangle(bars, pivots)) {
    out.push_back(std::move(*signal));
  }

  if (out.size() > kMaxPatternSignals) {
    out.resize(kMaxPatternSignals);
  }
  return out;
}

} // namespace epoch_ta::price_action
