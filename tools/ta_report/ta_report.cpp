//
// TA Report Tool
// Reads an OHLCV history (JSON array of bars) and writes the full technical
// analysis report as JSON
//

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include <epoch_core/macros.h>
#include <spdlog/spdlog.h>

#include <epoch_ta/core/analysis_config.h>
#include <epoch_ta/data/normalizer.h>
#include <epoch_ta/report/analysis_report.h>

namespace fs = std::filesystem;

struct ReportConfig {
    std::string input;
    std::optional<std::string> profile;
    std::optional<std::string> output;
    std::optional<std::string> log_level;
    epoch_core::ChartType chart = epoch_core::ChartType::none;
    bool prettify = false;
};

void PrintUsage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " --input FILE [options]\n"
              << "Options:\n"
              << "  --input FILE            OHLCV history as a JSON array of {date, open, high, low, close, volume}\n"
              << "  --config FILE           YAML analysis profile (default: built-in settings)\n"
              << "  --output FILE           Report destination (default: stdout)\n"
              << "  --chart TYPE            Chart transform to include: none, heikin_ashi, renko (default: none)\n"
              << "  --log-level LEVEL       trace, debug, info, warn, error, critical, off (overrides the profile)\n"
              << "  --pretty                Indent the JSON output\n"
              << "  --help                  Show this help\n";
}

ReportConfig ParseArgs(int argc, char* argv[]) {
    ReportConfig config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            exit(0);
        } else if (arg == "--input" && i + 1 < argc) {
            config.input = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config.profile = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            config.output = argv[++i];
        } else if (arg == "--chart" && i + 1 < argc) {
            config.chart = epoch_core::ChartTypeWrapper::FromString(argv[++i]);
            AssertFromFormat(config.chart != epoch_core::ChartType::Null,
                             "Unknown chart type {}", argv[i]);
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg == "--pretty") {
            config.prettify = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            PrintUsage(argv[0]);
            exit(1);
        }
    }

    if (config.input.empty()) {
        std::cerr << "Missing required --input\n";
        PrintUsage(argv[0]);
        exit(1);
    }
    return config;
}

std::string ReadFile(fs::path const& path) {
    std::ifstream file(path);
    AssertFromFormat(file.is_open(), "Failed to open {}", path.string());

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void WriteReport(std::optional<std::string> const& output, std::string const& json) {
    if (!output) {
        std::cout << json << "\n";
        return;
    }

    std::ofstream file(*output);
    AssertFromFormat(file.is_open(), "Failed to open {} for writing", *output);
    file << json << "\n";
    spdlog::info("Report written to {}", *output);
}

int main(int argc, char* argv[]) {
    try {
        auto config = ParseArgs(argc, argv);

        auto analysisConfig = config.profile
                                  ? epoch_ta::LoadAnalysisConfig(*config.profile)
                                  : epoch_ta::AnalysisConfig{};
        if (config.log_level) {
            analysisConfig.log_level = *config.log_level;
            analysisConfig.Validate();
        }
        spdlog::set_level(spdlog::level::from_str(analysisConfig.log_level));

        auto history = epoch_ta::report::ReadHistoryJson(ReadFile(config.input));
        auto bars = epoch_ta::data::NormalizeHistory(history);
        spdlog::info("Loaded {} rows from {}, {} usable bars", history.size(),
                     config.input, bars.size());

        auto report = epoch_ta::report::BuildAnalysisReport(bars, analysisConfig, config.chart);
        WriteReport(config.output, epoch_ta::report::ToJson(report, config.prettify));
    } catch (const std::exception& e) {
        spdlog::error("ta_report failed: {}", e.what());
        return 1;
    }

    return 0;
}
