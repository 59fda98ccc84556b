#pragma once
//
// Full analysis report for one symbol's history: everything the dashboard
// panels read, composed from the individual engine components.
//

#include <epoch_ta/backtest/sma_crossover.h>
#include <epoch_ta/core/analysis_config.h>
#include <epoch_ta/core/bar.h>
#include <epoch_ta/price_action/patterns.h>
#include <epoch_ta/price_action/support_resistance.h>
#include <epoch_ta/summary/indicator_snapshot.h>
#include <epoch_ta/summary/timeframe_summary.h>
#include <epoch_ta/transforms/volume_profile.h>

#include <string>

namespace epoch_ta::report {

struct LevelSummary {
  price_action::SupportResistance levels;
  std::optional<double> nearest_support;
  std::optional<double> nearest_resistance;
  std::optional<double> support_distance_percent;
  std::optional<double> resistance_distance_percent;
};

struct AnalysisReport {
  size_t bar_count{};
  std::optional<std::string> first_date;
  std::optional<std::string> last_date;
  std::optional<double> last_close;
  summary::IndicatorSnapshot indicators;
  std::vector<price_action::PatternSignal> patterns;
  LevelSummary levels;
  transform::VolumeProfileResult volume_profile;
  backtest::BacktestResult backtest;
  std::vector<summary::TimeframeSignal> timeframes;
  epoch_core::ChartType chart_type{epoch_core::ChartType::none};
  BarList chart;
};

[[nodiscard]] AnalysisReport
BuildAnalysisReport(BarList const &bars, AnalysisConfig const &config,
                    epoch_core::ChartType chart = epoch_core::ChartType::none);

// Throws std::runtime_error with glaze's error context on malformed JSON.
[[nodiscard]] std::vector<RawBar> ReadHistoryJson(std::string const &json);

[[nodiscard]] std::string ToJson(AnalysisReport const &report,
                                 bool prettify = false);

} // namespace epoch_ta::report
