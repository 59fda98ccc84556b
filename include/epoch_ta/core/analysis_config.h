#pragma once
//
// Analysis profile
//
// Periods and parameters for one report run, loaded from YAML.  Every key
// is optional; missing keys keep the defaults below.  Validate() throws on
// values the engine would otherwise silently degrade on.
//

#include <epoch_ta/backtest/sma_crossover.h>
#include <epoch_ta/core/constants.h>
#include <epoch_ta/summary/indicator_snapshot.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace epoch_ta {

struct TimeframeSpec {
  std::string label;
  size_t lookback{};
  epoch_core::ResampleRule resample{epoch_core::ResampleRule::daily};
};

struct AnalysisConfig {
  std::string log_level{"info"};
  summary::IndicatorSettings indicators{};
  std::optional<double> renko_brick_size{};
  int64_t volume_profile_bins{defaults::kVolumeProfileBins};
  backtest::BacktestOptions backtest{};
  std::vector<TimeframeSpec> timeframes{DefaultTimeframes()};

  // 1MO/3MO/6MO/1Y on daily bars, 5Y on weekly bars.
  static std::vector<TimeframeSpec> DefaultTimeframes();

  void Validate() const;
};

AnalysisConfig LoadAnalysisConfig(std::filesystem::path const &path);
AnalysisConfig LoadAnalysisConfigFromString(std::string const &yaml);

} // namespace epoch_ta

namespace YAML {
template <> struct convert<epoch_ta::TimeframeSpec> {
  static bool decode(Node const &node, epoch_ta::TimeframeSpec &rhs);
};

template <> struct convert<epoch_ta::AnalysisConfig> {
  static bool decode(Node const &node, epoch_ta::AnalysisConfig &rhs);
};
} // namespace YAML
