#include <epoch_ta/core/analysis_config.h>

#include <algorithm>
#include <array>
#include <epoch_core/macros.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace epoch_ta {

namespace {
constexpr std::array kLogLevels{"trace", "debug",    "info", "warn",
                                "error", "critical", "off"};

template <typename T>
void ReadOptional(YAML::Node const &node, const char *key, T &out) {
  if (node && node[key]) {
    out = node[key].as<T>();
  }
}
} // namespace

std::vector<TimeframeSpec> AnalysisConfig::DefaultTimeframes() {
  using epoch_core::ResampleRule;
  return {{"1MO", 21, ResampleRule::daily},
          {"3MO", 63, ResampleRule::daily},
          {"6MO", 126, ResampleRule::daily},
          {"1Y", 252, ResampleRule::daily},
          {"5Y", 260, ResampleRule::weekly}};
}

void AnalysisConfig::Validate() const {
  AssertFromFormat(std::ranges::find(kLogLevels, log_level) != kLogLevels.end(),
                   "Unknown log level '{}'", log_level);

  auto const &ind = indicators;
  for (auto [name, value] : std::array<std::pair<const char *, int64_t>, 10>{
           {{"sma_period", ind.sma_period},
            {"ema_period", ind.ema_period},
            {"wma_period", ind.wma_period},
            {"rsi_period", ind.rsi_period},
            {"adx_period", ind.adx_period},
            {"macd.signal", ind.macd_signal},
            {"bollinger.period", ind.bollinger_period},
            {"stochastic.period", ind.stochastic_period},
            {"stochastic.smooth_k", ind.stochastic_smooth_k},
            {"stochastic.smooth_d", ind.stochastic_smooth_d}}}) {
    AssertFromFormat(value >= 1, "indicators.{} must be >= 1, got {}", name,
                     value);
  }
  AssertFromFormat(ind.macd_fast >= 1 && ind.macd_fast < ind.macd_slow,
                   "indicators.macd requires 1 <= fast < slow, got {}/{}",
                   ind.macd_fast, ind.macd_slow);
  AssertFromFormat(ind.bollinger_std_mult > 0.0,
                   "indicators.bollinger.std_mult must be > 0, got {}",
                   ind.bollinger_std_mult);

  if (renko_brick_size) {
    AssertFromFormat(*renko_brick_size > 0.0,
                     "renko.brick_size must be > 0, got {}", *renko_brick_size);
  }
  AssertFromFormat(volume_profile_bins >= 1,
                   "volume_profile.bins must be >= 1, got {}",
                   volume_profile_bins);

  AssertFromFormat(backtest.fast_period >= 2,
                   "backtest.fast_period must be >= 2, got {}",
                   backtest.fast_period);
  AssertFromFormat(backtest.slow_period >= 3,
                   "backtest.slow_period must be >= 3, got {}",
                   backtest.slow_period);
  AssertFromFormat(backtest.initial_capital > 0.0,
                   "backtest.initial_capital must be > 0, got {}",
                   backtest.initial_capital);

  for (auto const &tf : timeframes) {
    AssertFromFormat(!tf.label.empty(), "timeframe label must not be empty");
    AssertFromFormat(tf.lookback >= 1, "timeframe {} lookback must be >= 1",
                     tf.label);
  }
}

namespace {
AnalysisConfig Decode(YAML::Node const &node) {
  return node.IsNull() ? AnalysisConfig{} : node.as<AnalysisConfig>();
}
} // namespace

AnalysisConfig LoadAnalysisConfigFromString(std::string const &yaml) {
  auto config = Decode(YAML::Load(yaml));
  config.Validate();
  return config;
}

AnalysisConfig LoadAnalysisConfig(std::filesystem::path const &path) {
  SPDLOG_DEBUG("Loading analysis profile {}", path.string());
  auto config = Decode(YAML::LoadFile(path.string()));
  config.Validate();
  return config;
}

} // namespace epoch_ta

namespace YAML {

bool convert<epoch_ta::TimeframeSpec>::decode(Node const &node,
                                              epoch_ta::TimeframeSpec &rhs) {
  if (!node.IsMap()) {
    throw std::runtime_error("Invalid timeframe, expected a map with label "
                             "and lookback, not " +
                             YAML::Dump(node));
  }
  rhs.label = node["label"].as<std::string>();
  rhs.lookback = node["lookback"].as<size_t>();
  rhs.resample = epoch_core::ResampleRuleWrapper::FromString(
      node["resample"].as<std::string>("daily"));
  AssertFromFormat(rhs.resample != epoch_core::ResampleRule::Null,
                   "timeframe {} has an unknown resample rule", rhs.label);
  return true;
}

bool convert<epoch_ta::AnalysisConfig>::decode(Node const &node,
                                               epoch_ta::AnalysisConfig &rhs) {
  rhs = epoch_ta::AnalysisConfig{};
  if (node.IsNull()) {
    return true;
  }

  epoch_ta::ReadOptional(node["logging"], "level", rhs.log_level);

  if (auto ind = node["indicators"]) {
    auto &out = rhs.indicators;
    epoch_ta::ReadOptional(ind, "sma_period", out.sma_period);
    epoch_ta::ReadOptional(ind, "ema_period", out.ema_period);
    epoch_ta::ReadOptional(ind, "wma_period", out.wma_period);
    epoch_ta::ReadOptional(ind, "rsi_period", out.rsi_period);
    epoch_ta::ReadOptional(ind, "adx_period", out.adx_period);
    epoch_ta::ReadOptional(ind["macd"], "fast", out.macd_fast);
    epoch_ta::ReadOptional(ind["macd"], "slow", out.macd_slow);
    epoch_ta::ReadOptional(ind["macd"], "signal", out.macd_signal);
    epoch_ta::ReadOptional(ind["bollinger"], "period", out.bollinger_period);
    epoch_ta::ReadOptional(ind["bollinger"], "std_mult", out.bollinger_std_mult);
    epoch_ta::ReadOptional(ind["stochastic"], "period", out.stochastic_period);
    epoch_ta::ReadOptional(ind["stochastic"], "smooth_k", out.stochastic_smooth_k);
    epoch_ta::ReadOptional(ind["stochastic"], "smooth_d", out.stochastic_smooth_d);
  }

  if (auto renko = node["renko"]; renko && renko["brick_size"] &&
                                  !renko["brick_size"].IsNull()) {
    rhs.renko_brick_size = renko["brick_size"].as<double>();
  }

  epoch_ta::ReadOptional(node["volume_profile"], "bins", rhs.volume_profile_bins);

  if (auto bt = node["backtest"]) {
    epoch_ta::ReadOptional(bt, "fast_period", rhs.backtest.fast_period);
    epoch_ta::ReadOptional(bt, "slow_period", rhs.backtest.slow_period);
    epoch_ta::ReadOptional(bt, "initial_capital", rhs.backtest.initial_capital);
  }

  if (auto tfs = node["timeframes"]) {
    rhs.timeframes = tfs.as<std::vector<epoch_ta::TimeframeSpec>>();
  }
  return true;
}

} // namespace YAML
