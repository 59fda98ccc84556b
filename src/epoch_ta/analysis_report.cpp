#include <epoch_ta/report/analysis_report.h>

#include <epoch_ta/core/glaze_custom_types.h>
#include <epoch_ta/data/resampler.h>
#include <epoch_ta/transforms/chart_transforms.h>

#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace epoch_ta::report {

namespace {
LevelSummary SummarizeLevels(BarList const &bars) {
  LevelSummary summary{.levels = price_action::DetectSupportResistance(bars)};
  if (bars.empty()) {
    return summary;
  }

  const std::optional<double> close = bars.back().close;
  summary.nearest_support =
      price_action::NearestLevel(summary.levels.supports, close);
  summary.nearest_resistance =
      price_action::NearestLevel(summary.levels.resistances, close);
  summary.support_distance_percent =
      price_action::PctDistance(close, summary.nearest_support);
  summary.resistance_distance_percent =
      price_action::PctDistance(close, summary.nearest_resistance);
  return summary;
}

std::vector<summary::TimeframeInput>
BuildTimeframeInputs(BarList const &bars,
                     std::vector<TimeframeSpec> const &specs) {
  std::vector<summary::TimeframeInput> inputs;
  inputs.reserve(specs.size());
  for (auto const &spec : specs) {
    auto resampled = spec.resample == epoch_core::ResampleRule::daily
                         ? bars
                         : data::ResampleBars(bars, spec.resample);
    inputs.push_back({spec.label, data::TailBars(resampled, spec.lookback)});
  }
  return inputs;
}

BarList BuildChart(BarList const &bars, epoch_core::ChartType chart,
                   std::optional<double> brickSize) {
  switch (chart) {
  case epoch_core::ChartType::heikin_ashi:
    return transform::HeikinAshi(bars);
  case epoch_core::ChartType::renko:
    return transform::Renko(bars, brickSize);
  default:
    return {};
  }
}
} // namespace

AnalysisReport BuildAnalysisReport(BarList const &bars,
                                   AnalysisConfig const &config,
                                   epoch_core::ChartType chart) {
  AnalysisReport report{.bar_count = bars.size()};
  if (!bars.empty()) {
    report.first_date = bars.front().date;
    report.last_date = bars.back().date;
    report.last_close = bars.back().close;
  }

  report.indicators = summary::BuildIndicatorSnapshot(bars, config.indicators);
  report.patterns = price_action::DetectPatterns(bars);
  report.levels = SummarizeLevels(bars);
  report.volume_profile =
      transform::VolumeProfile(bars, config.volume_profile_bins);
  report.backtest = backtest::SmaCrossoverBacktester{config.backtest}.Run(bars);
  report.timeframes = summary::SummarizeTimeframes(
      BuildTimeframeInputs(bars, config.timeframes));
  report.chart_type = chart;
  report.chart = BuildChart(bars, chart, config.renko_brick_size);

  SPDLOG_INFO("Analyzed {} bars: {} patterns, {} supports, {} resistances, "
              "{} backtest trades",
              report.bar_count, report.patterns.size(),
              report.levels.levels.supports.size(),
              report.levels.levels.resistances.size(),
              report.backtest.trades_count);
  return report;
}

std::vector<RawBar> ReadHistoryJson(std::string const &json) {
  std::vector<RawBar> rows;
  auto error = glz::read<glz::opts{.error_on_unknown_keys = false}>(rows, json);
  if (error) {
    throw std::runtime_error("Failed to parse OHLCV history: " +
                             glz::format_error(error, json));
  }
  return rows;
}

std::string ToJson(AnalysisReport const &report, bool prettify) {
  auto json = glz::write_json(report);
  if (!json) {
    throw std::runtime_error("Failed to serialize analysis report: " +
                             glz::format_error(json.error()));
  }
  return prettify ? glz::prettify_json(*json) : *json;
}

} // namespace epoch_ta::report
