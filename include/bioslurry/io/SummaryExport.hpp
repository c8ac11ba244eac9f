#pragma once

/**
 * @file SummaryExport.hpp
 * @brief Metrics summary as JSON or YAML documents
 *
 * Both formats use the same keys: removal_day3/7/14, T90 (null when not
 * reached), X_max, t_X_max, X_final, C_A_peak, t_A_peak, final_removal,
 * plus a "calendar" block and the parameter set that produced the run.
 */

#include <bioslurry/analysis/MetricsExtractor.hpp>
#include <bioslurry/io/TrajectoryExport.hpp>
#include <bioslurry/model/ParameterCatalog.hpp>
#include <bioslurry/model/Parameters.hpp>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <string>

namespace bioslurry {

/**
 * @brief Build the JSON summary document
 */
[[nodiscard]] inline nlohmann::json SummaryToJson(const MetricsSummary &m,
                                                  const ParameterSet &params,
                                                  const std::string &scenario = "") {
    nlohmann::json j;
    if (!scenario.empty()) {
        j["scenario"] = scenario;
    }

    auto &metrics = j["metrics"];
    metrics["removal_day3"] = m.day3.removal_percent;
    metrics["removal_day7"] = m.day7.removal_percent;
    metrics["removal_day14"] = m.day14.removal_percent;
    metrics["T90"] = m.T90 ? nlohmann::json(*m.T90) : nlohmann::json(nullptr);
    metrics["X_max"] = m.X_max;
    metrics["t_X_max"] = m.t_X_max;
    metrics["X_final"] = m.X_final;
    metrics["C_A_peak"] = m.C_A_peak;
    metrics["t_A_peak"] = m.t_A_peak;
    metrics["final_removal"] = m.final_removal;

    j["calendar"]["day_lookup"] = to_string(m.day_lookup);
    j["calendar"]["points"] = nlohmann::json::array();
    for (const CalendarPoint *p : {&m.day3, &m.day7, &m.day14}) {
        nlohmann::json jp;
        jp["target_day"] = p->target_day;
        jp["index"] = p->index;
        jp["sample_day"] = p->sample_day;
        jp["matched"] = p->matched;
        jp["removal_percent"] = p->removal_percent;
        jp["C_G_aq"] = p->C_G_aq;
        j["calendar"]["points"].push_back(jp);
    }

    for (const auto &entry : ParameterCatalog::All()) {
        j["parameters"][entry.key] = params.*(entry.field);
    }
    return j;
}

/**
 * @brief Build the YAML summary document
 */
[[nodiscard]] inline std::string SummaryToYaml(const MetricsSummary &m, const ParameterSet &params,
                                               const std::string &scenario = "") {
    YAML::Emitter out;
    out << YAML::BeginMap;
    if (!scenario.empty()) {
        out << YAML::Key << "scenario" << YAML::Value << scenario;
    }

    out << YAML::Key << "metrics" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "removal_day3" << YAML::Value << m.day3.removal_percent;
    out << YAML::Key << "removal_day7" << YAML::Value << m.day7.removal_percent;
    out << YAML::Key << "removal_day14" << YAML::Value << m.day14.removal_percent;
    out << YAML::Key << "T90" << YAML::Value;
    if (m.T90) {
        out << *m.T90;
    } else {
        out << YAML::Null;
    }
    out << YAML::Key << "X_max" << YAML::Value << m.X_max;
    out << YAML::Key << "t_X_max" << YAML::Value << m.t_X_max;
    out << YAML::Key << "X_final" << YAML::Value << m.X_final;
    out << YAML::Key << "C_A_peak" << YAML::Value << m.C_A_peak;
    out << YAML::Key << "t_A_peak" << YAML::Value << m.t_A_peak;
    out << YAML::Key << "final_removal" << YAML::Value << m.final_removal;
    out << YAML::EndMap;

    out << YAML::Key << "calendar" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "day_lookup" << YAML::Value << to_string(m.day_lookup);
    out << YAML::Key << "points" << YAML::Value << YAML::BeginSeq;
    for (const CalendarPoint *p : {&m.day3, &m.day7, &m.day14}) {
        out << YAML::BeginMap;
        out << YAML::Key << "target_day" << YAML::Value << p->target_day;
        out << YAML::Key << "index" << YAML::Value << p->index;
        out << YAML::Key << "sample_day" << YAML::Value << p->sample_day;
        out << YAML::Key << "matched" << YAML::Value << p->matched;
        out << YAML::Key << "removal_percent" << YAML::Value << p->removal_percent;
        out << YAML::Key << "C_G_aq" << YAML::Value << p->C_G_aq;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    out << YAML::Key << "parameters" << YAML::Value << YAML::BeginMap;
    for (const auto &entry : ParameterCatalog::All()) {
        out << YAML::Key << entry.key << YAML::Value << params.*(entry.field);
    }
    out << YAML::EndMap;

    out << YAML::EndMap;
    return out.c_str();
}

/// @throws IOError on write failure
inline void WriteSummaryJson(const MetricsSummary &m, const ParameterSet &params,
                             const std::string &path, const std::string &scenario = "") {
    detail::WriteToFile(path, SummaryToJson(m, params, scenario).dump(2));
}

/// @throws IOError on write failure
inline void WriteSummaryYaml(const MetricsSummary &m, const ParameterSet &params,
                             const std::string &path, const std::string &scenario = "") {
    detail::WriteToFile(path, SummaryToYaml(m, params, scenario));
}

} // namespace bioslurry
