/**
 * @file test_scenario_loader.cpp
 * @brief Tests for ScenarioLoader YAML parsing
 */

#include <gtest/gtest.h>
#include <bioslurry/io/ScenarioLoader.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace bioslurry::io {
namespace {

namespace fs = std::filesystem;

fs::path WriteTemp(const std::string &name, const std::string &content) {
    const auto path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path;
}

// =============================================================================
// Parse Tests (from string)
// =============================================================================

TEST(ScenarioLoaderTest, EmptyDocumentKeepsDefaults) {
    auto cfg = ScenarioLoader::Parse("{}");
    EXPECT_EQ(cfg.name, "baseline");
    EXPECT_DOUBLE_EQ(cfg.parameters.k_max, 0.08);
    EXPECT_EQ(cfg.day_lookup, DayLookupPolicy::FirstSample);
    EXPECT_EQ(cfg.console_level, LogLevel::Info);
    EXPECT_TRUE(cfg.output.csv);
    EXPECT_EQ(cfg.output.summary, SummaryFormat::Json);
    EXPECT_EQ(cfg.source_file, "<string>");
}

TEST(ScenarioLoaderTest, ParseScenarioSection) {
    const char *yaml = R"(
scenario:
  name: "high_sorption"
  description: "Strongly sorbing soil"
)";
    auto cfg = ScenarioLoader::Parse(yaml);
    EXPECT_EQ(cfg.name, "high_sorption");
    EXPECT_EQ(cfg.description, "Strongly sorbing soil");
    EXPECT_EQ(cfg.CsvFileName(), "high_sorption_trajectory.csv");
    EXPECT_EQ(cfg.SummaryFileName(), "high_sorption_summary.json");
}

TEST(ScenarioLoaderTest, ParseParametersSubset) {
    const char *yaml = R"(
parameters:
  K_d: 200
  k_sorp: 0.3
  C_G_s_0: 15.5
)";
    auto cfg = ScenarioLoader::Parse(yaml);
    EXPECT_DOUBLE_EQ(cfg.parameters.K_d, 200.0);
    EXPECT_DOUBLE_EQ(cfg.parameters.k_sorp, 0.3);
    EXPECT_DOUBLE_EQ(cfg.parameters.C_G_s_0, 15.5);
    EXPECT_DOUBLE_EQ(cfg.parameters.theta, 0.1); // untouched
}

TEST(ScenarioLoaderTest, ParseTimeSection) {
    const char *yaml = R"(
time:
  t_final: 480
  dt: 0.25
)";
    auto cfg = ScenarioLoader::Parse(yaml);
    EXPECT_DOUBLE_EQ(cfg.parameters.t_final, 480.0);
    EXPECT_DOUBLE_EQ(cfg.parameters.dt, 0.25);
}

TEST(ScenarioLoaderTest, TimeSectionOverridesParameters) {
    const char *yaml = R"(
parameters:
  t_final: 100
time:
  t_final: 200
)";
    EXPECT_DOUBLE_EQ(ScenarioLoader::Parse(yaml).parameters.t_final, 200.0);
}

TEST(ScenarioLoaderTest, ParseMetricsLoggingOutput) {
    const char *yaml = R"(
metrics:
  day_lookup: nearest
logging:
  console_level: debug
output:
  directory: "results"
  csv: false
  summary: yaml
  table: false
)";
    auto cfg = ScenarioLoader::Parse(yaml);
    EXPECT_EQ(cfg.day_lookup, DayLookupPolicy::Nearest);
    EXPECT_EQ(cfg.console_level, LogLevel::Debug);
    EXPECT_EQ(cfg.output.directory, "results");
    EXPECT_FALSE(cfg.output.csv);
    EXPECT_EQ(cfg.output.summary, SummaryFormat::Yaml);
    EXPECT_FALSE(cfg.output.table);
}

TEST(ScenarioLoaderTest, InvalidParametersStillLoad) {
    const char *yaml = R"(
parameters:
  theta: -1
)";
    auto cfg = ScenarioLoader::Parse(yaml);
    EXPECT_FALSE(cfg.parameters.IsValid());
}

// =============================================================================
// Error Tests
// =============================================================================

TEST(ScenarioLoaderTest, ThrowsOnUnknownParameter) {
    const char *yaml = R"(
parameters:
  k_maximum: 0.1
)";
    try {
        (void)ScenarioLoader::Parse(yaml);
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string(e.what()).find("k_maximum"), std::string::npos);
        EXPECT_EQ(e.file(), "<string>");
    }
}

TEST(ScenarioLoaderTest, ThrowsOnUnknownDayLookup) {
    const char *yaml = R"(
metrics:
  day_lookup: closest
)";
    EXPECT_THROW((void)ScenarioLoader::Parse(yaml), ConfigError);
}

TEST(ScenarioLoaderTest, ThrowsOnUnknownSummaryFormat) {
    const char *yaml = R"(
output:
  summary: xml
)";
    EXPECT_THROW((void)ScenarioLoader::Parse(yaml), ConfigError);
}

TEST(ScenarioLoaderTest, ThrowsOnNonNumericParameter) {
    const char *yaml = R"(
parameters:
  k_max: fast
)";
    EXPECT_THROW((void)ScenarioLoader::Parse(yaml), ConfigError);
}

TEST(ScenarioLoaderTest, ThrowsOnEmptyName) {
    const char *yaml = R"(
scenario:
  name: ""
)";
    EXPECT_THROW((void)ScenarioLoader::Parse(yaml), ConfigError);
}

// =============================================================================
// File Tests
// =============================================================================

TEST(ScenarioLoaderTest, LoadMissingFileThrows) {
    EXPECT_THROW((void)ScenarioLoader::Load("/nonexistent/scenario.yaml"), ConfigError);
}

TEST(ScenarioLoaderTest, LoadExpandsEnvironmentDefault) {
    const auto path = WriteTemp("bioslurry_env_scenario.yaml", R"(
scenario:
  name: "env"
output:
  directory: "${BIOSLURRY_TEST_UNSET_DIR:fallback_dir}"
)");
    auto cfg = ScenarioLoader::Load(path.string());
    EXPECT_EQ(cfg.output.directory, "fallback_dir");
    EXPECT_EQ(cfg.source_file, path.string());
    fs::remove(path);
}

TEST(ScenarioLoaderTest, LoadUndefinedEnvironmentVariableThrows) {
    const auto path = WriteTemp("bioslurry_env_missing.yaml", R"(
output:
  directory: "${BIOSLURRY_TEST_SURELY_UNDEFINED}"
)");
    try {
        (void)ScenarioLoader::Load(path.string());
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string(e.what()).find("BIOSLURRY_TEST_SURELY_UNDEFINED"),
                  std::string::npos);
        EXPECT_FALSE(e.hint().empty());
    }
    fs::remove(path);
}

TEST(ScenarioLoaderTest, LoadExampleConfigs) {
    const std::string dir = BIOSLURRY_EXAMPLE_CONFIG_DIR;

    auto baseline = ScenarioLoader::Load(dir + "/baseline.yaml");
    EXPECT_EQ(baseline.name, "baseline");
    EXPECT_TRUE(baseline.parameters.IsValid());
    EXPECT_EQ(baseline.parameters.SampleCount(), 673u);

    auto high = ScenarioLoader::Load(dir + "/high_sorption.yaml");
    EXPECT_DOUBLE_EQ(high.parameters.K_d, 200.0);
    EXPECT_EQ(high.day_lookup, DayLookupPolicy::Nearest);

    auto short_run = ScenarioLoader::Load(dir + "/short_run.yaml");
    EXPECT_DOUBLE_EQ(short_run.parameters.t_final, 48.0);
    EXPECT_EQ(short_run.output.summary, SummaryFormat::None);
}

} // namespace
} // namespace bioslurry::io
