#pragma once

/**
 * @file ScenarioLoader.hpp
 * @brief Loads a scenario configuration from YAML
 *
 * Uses Vulcan's YAML infrastructure for:
 * - !include directive resolution
 * - ${VAR} environment variable expansion
 * - Type-safe value extraction
 */

#include <bioslurry/core/Error.hpp>
#include <bioslurry/io/ScenarioConfig.hpp>
#include <bioslurry/model/ParameterCatalog.hpp>

#include <vulcan/io/YamlEnv.hpp>
#include <vulcan/io/YamlNode.hpp>
#include <yaml-cpp/exceptions.h>

#include <string>
#include <vector>

namespace bioslurry::io {

/**
 * @brief Loads ScenarioConfig from YAML
 *
 * Every section is optional; missing values keep their defaults.
 *
 * @code
 * scenario:
 *   name: "high_sorption"
 * parameters:
 *   K_d: 200
 *   k_sorp: 0.3
 * time:
 *   t_final: 480
 *   dt: 0.25
 * metrics:
 *   day_lookup: nearest
 * logging:
 *   console_level: info
 * output:
 *   directory: "./results"
 *   csv: true
 *   summary: yaml
 *   table: false
 * @endcode
 */
class ScenarioLoader {
  public:
    /**
     * @brief Load a scenario file
     *
     * @throws ConfigError on parse errors, unknown parameter keys or bad enum values
     */
    static ScenarioConfig Load(const std::string &path) {
        try {
            auto root = vulcan::io::YamlEnv::LoadWithIncludesAndEnv(path);
            return ParseRoot(root, path);
        } catch (const vulcan::io::EnvVarError &e) {
            // EnvVarError derives from YamlError, must catch first
            throw ConfigError("Undefined environment variable: " + e.var_name(), path, -1,
                              "Set the variable or use ${" + e.var_name() + ":default}");
        } catch (const vulcan::io::YamlError &e) {
            throw ConfigError(e.what(), path);
        } catch (const YAML::Exception &e) {
            throw ConfigError(e.what(), path);
        }
    }

    /// Parse a scenario from a YAML string
    static ScenarioConfig Parse(const std::string &yaml_content) {
        try {
            auto root = vulcan::io::YamlNode::Parse(yaml_content);
            return ParseRoot(root, "<string>");
        } catch (const vulcan::io::YamlError &e) {
            throw ConfigError(e.what(), "<string>");
        } catch (const YAML::Exception &e) {
            throw ConfigError(e.what(), "<string>");
        }
    }

  private:
    static ScenarioConfig ParseRoot(const vulcan::io::YamlNode &root,
                                    const std::string &source_path) {
        ScenarioConfig cfg = ScenarioConfig::Default();
        cfg.source_file = source_path;

        if (root.Has("scenario")) {
            ParseScenarioSection(cfg, root["scenario"]);
        }
        if (root.Has("parameters")) {
            ParseParameters(cfg.parameters, root["parameters"], source_path);
        }
        if (root.Has("time")) {
            ParseTimeSection(cfg.parameters, root["time"]);
        }
        if (root.Has("metrics")) {
            ParseMetricsSection(cfg, root["metrics"]);
        }
        if (root.Has("logging")) {
            ParseLogging(cfg, root["logging"]);
        }
        if (root.Has("output")) {
            ParseOutput(cfg.output, root["output"]);
        }

        auto errors = cfg.Validate();
        if (!errors.empty()) {
            throw ConfigError(errors.front(), source_path);
        }
        return cfg;
    }

    // =========================================================================
    // Section Parsers
    // =========================================================================

    static void ParseScenarioSection(ScenarioConfig &cfg, const vulcan::io::YamlNode &node) {
        cfg.name = node.Get<std::string>("name", cfg.name);
        cfg.description = node.Get<std::string>("description", cfg.description);
    }

    /// Keys are resolved through ParameterCatalog; unknown keys are rejected
    static void ParseParameters(ParameterSet &params, const vulcan::io::YamlNode &node,
                                const std::string &source_path) {
        node.ForEachEntry([&](const std::string &key, const vulcan::io::YamlNode &val) {
            if (ParameterCatalog::Find(key) == nullptr) {
                throw ConfigError("unknown parameter '" + key + "'", source_path, -1,
                                  "valid keys are the ParameterSet field names, e.g. k_max");
            }
            ParameterCatalog::Set(params, key, val.As<double>());
        });
    }

    static void ParseTimeSection(ParameterSet &params, const vulcan::io::YamlNode &node) {
        params.t_final = node.Get<double>("t_final", params.t_final);
        params.dt = node.Get<double>("dt", params.dt);
    }

    static void ParseMetricsSection(ScenarioConfig &cfg, const vulcan::io::YamlNode &node) {
        if (node.Has("day_lookup")) {
            cfg.day_lookup = ParseDayLookupPolicy(node.Require<std::string>("day_lookup"));
        }
    }

    static void ParseLogging(ScenarioConfig &cfg, const vulcan::io::YamlNode &node) {
        if (node.Has("console_level")) {
            cfg.console_level = ParseLogLevel(node.Require<std::string>("console_level"));
        }
    }

    static void ParseOutput(OutputConfig &output, const vulcan::io::YamlNode &node) {
        output.directory = node.Get<std::string>("directory", output.directory);
        output.csv = node.Get<bool>("csv", output.csv);
        output.table = node.Get<bool>("table", output.table);
        if (node.Has("summary")) {
            output.summary = ParseSummaryFormat(node.Require<std::string>("summary"));
        }
    }
};

} // namespace bioslurry::io
