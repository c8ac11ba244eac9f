#pragma once

/**
 * @file ScenarioConfig.hpp
 * @brief Scenario configuration structs
 *
 * These structs are NOT templated. A ScenarioConfig is what the command line
 * driver needs to run, summarise and export one simulation.
 */

#include <bioslurry/analysis/MetricsExtractor.hpp>
#include <bioslurry/core/Error.hpp>
#include <bioslurry/io/Console.hpp>
#include <bioslurry/model/Parameters.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace bioslurry {

// =============================================================================
// SummaryFormat
// =============================================================================

enum class SummaryFormat { None, Json, Yaml };

[[nodiscard]] inline std::string to_string(SummaryFormat format) {
    switch (format) {
    case SummaryFormat::None:
        return "none";
    case SummaryFormat::Json:
        return "json";
    case SummaryFormat::Yaml:
        return "yaml";
    }
    return "unknown";
}

/// @throws ConfigError for anything but "json", "yaml" or "none"
[[nodiscard]] inline SummaryFormat ParseSummaryFormat(const std::string &name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "json")
        return SummaryFormat::Json;
    if (lower == "yaml" || lower == "yml")
        return SummaryFormat::Yaml;
    if (lower == "none" || lower.empty())
        return SummaryFormat::None;
    BIOSLURRY_THROW(ConfigError("Unknown summary format: " + name));
}

// =============================================================================
// OutputConfig
// =============================================================================

/**
 * @brief Where and what to export after a run
 *
 * File names are derived from the scenario name:
 * `<name>_trajectory.csv`, `<name>_summary.json|yaml`.
 */
struct OutputConfig {
    std::string directory = ".";
    bool csv = true;                             ///< Full trajectory as CSV
    SummaryFormat summary = SummaryFormat::Json; ///< Metrics summary file
    bool table = true;                           ///< Print the results table to the console

    [[nodiscard]] static OutputConfig Default() { return OutputConfig{}; }

    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if ((csv || summary != SummaryFormat::None) && directory.empty()) {
            errors.push_back("Output directory must not be empty when exporting files");
        }
        return errors;
    }
};

// =============================================================================
// ScenarioConfig
// =============================================================================

/**
 * @brief Complete description of one scenario
 *
 * Parameter validity is checked by the engine, not here: a config with an
 * invalid ParameterSet loads fine and is rejected when run.
 */
struct ScenarioConfig {
    std::string name = "baseline";
    std::string description;
    std::string source_file; ///< File the config was loaded from (empty if built in code)

    ParameterSet parameters = ParameterSet::Default();
    DayLookupPolicy day_lookup = DayLookupPolicy::FirstSample;
    LogLevel console_level = LogLevel::Info;
    OutputConfig output = OutputConfig::Default();

    [[nodiscard]] static ScenarioConfig Default() { return ScenarioConfig{}; }

    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (name.empty()) {
            errors.push_back("Scenario name must not be empty");
        }
        for (const auto &e : output.Validate()) {
            errors.push_back(e);
        }
        return errors;
    }

    [[nodiscard]] std::string CsvFileName() const { return name + "_trajectory.csv"; }

    [[nodiscard]] std::string SummaryFileName() const {
        return name + "_summary." + to_string(output.summary);
    }
};

} // namespace bioslurry
