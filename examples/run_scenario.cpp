/**
 * @file run_scenario.cpp
 * @brief Command line driver: load a scenario, simulate, summarise, export
 *
 * Usage: ./run_scenario [scenario.yaml]
 *        Without an argument the built-in baseline scenario is run.
 */

#include <bioslurry/bioslurry.hpp>
#include <bioslurry/io/Banner.hpp>
#include <bioslurry/io/RunReport.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace bioslurry;
namespace fs = std::filesystem;

namespace {

void ExportResults(const ScenarioConfig &cfg, const Trajectory &trajectory,
                   const MetricsSummary &metrics, LogService &log) {
    LogContextManager::ScopedContext ctx("export", cfg.name);
    const double t_end = trajectory.Back().time_h;

    if (!cfg.output.csv && cfg.output.summary == SummaryFormat::None) {
        return;
    }

    std::error_code ec;
    fs::create_directories(cfg.output.directory, ec);
    if (ec) {
        throw IOError("create directory", cfg.output.directory, ec.message());
    }
    const fs::path dir(cfg.output.directory);

    if (cfg.output.csv) {
        const auto path = (dir / cfg.CsvFileName()).string();
        WriteTrajectoryCsv(trajectory, path);
        log.Info(t_end, "wrote " + path);
    }

    if (cfg.output.summary != SummaryFormat::None) {
        const auto path = (dir / cfg.SummaryFileName()).string();
        if (cfg.output.summary == SummaryFormat::Json) {
            WriteSummaryJson(metrics, cfg.parameters, path, cfg.name);
        } else {
            WriteSummaryYaml(metrics, cfg.parameters, path, cfg.name);
        }
        log.Info(t_end, "wrote " + path);
    }
}

} // namespace

int main(int argc, char *argv[]) {
    Console console;
    LogService &log = GetLogService();
    RunReport report(console);

    ScenarioConfig cfg = ScenarioConfig::Default();
    try {
        if (argc > 1) {
            cfg = io::ScenarioLoader::Load(argv[1]);
        }
    } catch (const Error &e) {
        console.Error(e.what());
        return 1;
    }

    log.SetMinLevel(cfg.console_level);
    log.AddSink(MakeConsoleSink(console), cfg.console_level);

    console.Write(Banner::GetSplashScreen(Version(), cfg.name));
    if (!cfg.description.empty()) {
        console.WriteLine("  " + cfg.description);
    }
    report.SetScenario(cfg.name);

    LogContextManager::ScopedContext ctx("setup", cfg.name);
    for (const auto &warning : ParameterCatalog::OutOfRange(cfg.parameters)) {
        BIOSLURRY_LOG_WARN(0.0, warning);
    }

    try {
        SimulationEngine engine(log);

        std::shared_ptr<const Trajectory> trajectory;
        double wall = 0.0;
        {
            // Run messages reach the console together once stepping ends
            LogService::BufferedScope buffered(log);
            const auto start = std::chrono::steady_clock::now();
            trajectory = engine.RunShared(cfg.parameters);
            const auto end = std::chrono::steady_clock::now();
            wall = std::chrono::duration<double>(end - start).count();
        }

        const auto metrics = ExtractMetrics(*trajectory, cfg.parameters, cfg.day_lookup);

        if (cfg.output.table) {
            console.WriteLine(Banner::GetSectionHeader("RESULTS"));
            console.Write(RenderResultsTable(*trajectory));
        }

        ExportResults(cfg, *trajectory, metrics, log);

        report.SetTiming(trajectory->Back().time_h, wall, trajectory->Size());
        report.SetMetrics(metrics);
        report.SetStatus(RunStatus::Success);
        report.Print();
    } catch (const ParameterError &e) {
        BIOSLURRY_LOG_ERROR(0.0, e.what());
        report.SetStatus(RunStatus::InvalidParameters, std::to_string(e.violations().size()) +
                                                           " constraint(s) violated");
        report.Print();
        return 1;
    } catch (const Error &e) {
        log.Error(0.0, e.what());
        report.SetStatus(RunStatus::Error, e.category());
        report.Print();
        return 1;
    }

    return 0;
}
