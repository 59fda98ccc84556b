#pragma once
//
// Chart pattern detection
//
// Heuristic classification of the most recent pivots into head & shoulders,
// double top/bottom and triangle formations.  Confidence is a deterministic
// score derived from how tightly the thresholds are met, not a probability.
//

#include <epoch_ta/core/bar.h>
#include <epoch_ta/core/constants.h>

#include <string>

namespace epoch_ta::price_action {

struct PatternSignal {
  std::string name;
  epoch_core::SignalDirection direction{epoch_core::SignalDirection::Neutral};
  double confidence{};
  std::string description;
};

constexpr size_t kMinPatternBars = 60;
constexpr size_t kTriangleLookbackBars = 80;
constexpr size_t kMaxPatternSignals = 4;

/**
 * Detects patterns over the whole series.
 *
 * Signals come back in detection order: Head & Shoulders, Double Top,
 * Double Bottom, then at most one triangle.  Fewer than 60 bars yields no
 * signals.
 */
[[nodiscard]] std::vector<PatternSignal> DetectPatterns(BarList const &bars);

} // namespace epoch_ta::price_action
