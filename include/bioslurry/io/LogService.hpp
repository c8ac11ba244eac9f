#pragma once

/**
 * @file LogService.hpp
 * @brief Unified logging service for Bioslurry
 *
 * Immediate and buffered logging modes, level-filtered sinks and a
 * thread-local context naming the scenario and stage being logged.
 */

#include <bioslurry/core/CoreTypes.hpp>
#include <bioslurry/io/Console.hpp>

#include <chrono>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bioslurry {

// =============================================================================
// LogContext
// =============================================================================

/**
 * @brief Who is logging: scenario name and pipeline stage
 */
struct LogContext {
    std::string scenario; ///< Scenario name (e.g., "baseline")
    std::string stage;    ///< Pipeline stage (e.g., "engine", "metrics")

    /// "scenario.stage" or just "stage" if no scenario
    [[nodiscard]] std::string FullPath() const { return MakeFullPath(scenario, stage); }

    [[nodiscard]] bool IsSet() const { return !stage.empty(); }
};

// =============================================================================
// LogEntry
// =============================================================================

/**
 * @brief A single log entry with full context
 *
 * sim_time is the model time in hours at which the message was produced.
 */
struct LogEntry {
    LogLevel level = LogLevel::Info;
    double sim_time = 0.0;
    std::string message;
    LogContext context;
    std::chrono::steady_clock::time_point wall_time;

    static LogEntry Create(LogLevel level, double sim_time, std::string_view message,
                           const LogContext &ctx) {
        LogEntry entry;
        entry.level = level;
        entry.sim_time = sim_time;
        entry.message = std::string(message);
        entry.context = ctx;
        entry.wall_time = std::chrono::steady_clock::now();
        return entry;
    }

    /// "[t h] [LVL] [scenario.stage] message"
    [[nodiscard]] std::string Format(bool include_context = true) const {
        std::ostringstream oss;
        oss << "[" << std::fixed << std::setprecision(2) << sim_time << " h] ";
        oss << "[" << to_string(level) << "] ";
        if (include_context && context.IsSet()) {
            oss << "[" << context.FullPath() << "] ";
        }
        oss << message;
        return oss.str();
    }

    [[nodiscard]] std::string FormatColored(const Console &console) const {
        std::ostringstream oss;
        oss << console.Colorize("[", AnsiColor::Dim);
        oss << std::fixed << std::setprecision(2) << sim_time << " h";
        oss << console.Colorize("]", AnsiColor::Dim) << " ";
        oss << console.Colorize("[" + std::string(to_string(level)) + "]", LevelColor(level))
            << " ";
        if (context.IsSet()) {
            oss << console.Colorize("[" + context.FullPath() + "]", AnsiColor::Cyan) << " ";
        }
        oss << message;
        return oss.str();
    }
};

// =============================================================================
// LogContextManager
// =============================================================================

/**
 * @brief Thread-local log context
 *
 * The driver and the engine set the context with ScopedContext; log calls
 * pick it up implicitly.
 */
class LogContextManager {
  public:
    [[nodiscard]] static const LogContext &GetContext() { return current_context_; }

    /**
     * @brief RAII guard: sets the stage (and optionally scenario), restores on exit
     *
     * An empty scenario keeps the enclosing scenario name.
     */
    class ScopedContext {
      public:
        explicit ScopedContext(const std::string &stage, const std::string &scenario = "")
            : previous_(current_context_) {
            if (!scenario.empty()) {
                current_context_.scenario = scenario;
            }
            current_context_.stage = stage;
        }

        ~ScopedContext() { current_context_ = previous_; }

        ScopedContext(const ScopedContext &) = delete;
        ScopedContext &operator=(const ScopedContext &) = delete;
        ScopedContext(ScopedContext &&) = delete;
        ScopedContext &operator=(ScopedContext &&) = delete;

      private:
        LogContext previous_;
    };

  private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    static inline thread_local LogContext current_context_;
};

// =============================================================================
// LogService
// =============================================================================

/**
 * @brief Unified logging service
 *
 * 1. **Immediate mode** (default): each entry is pushed to the sinks as soon
 *    as it is logged.
 * 2. **Buffered mode**: entries are collected and flushed together, used
 *    while a run is in progress.
 */
class LogService {
  public:
    /// Sink callback: receives a batch of entries
    using Sink = std::function<void(const std::vector<LogEntry> &)>;

    LogService() = default;

    // === Mode Control ===

    void SetImmediateMode(bool immediate) { immediate_mode_ = immediate; }
    [[nodiscard]] bool IsImmediateMode() const { return immediate_mode_; }

    /**
     * @brief RAII guard for buffered mode
     *
     * Flushes and restores the previous mode on destruction.
     */
    class BufferedScope {
      public:
        explicit BufferedScope(LogService &service)
            : service_(service), previous_mode_(service.immediate_mode_) {
            service_.SetImmediateMode(false);
        }

        ~BufferedScope() {
            service_.FlushAndClear();
            service_.SetImmediateMode(previous_mode_);
        }

        BufferedScope(const BufferedScope &) = delete;
        BufferedScope &operator=(const BufferedScope &) = delete;
        BufferedScope(BufferedScope &&) = delete;
        BufferedScope &operator=(BufferedScope &&) = delete;

      private:
        LogService &service_;
        bool previous_mode_;
    };

    // === Configuration ===

    void SetMinLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetMinLevel() const { return min_level_; }

    void AddSink(Sink sink) { AddSink(std::move(sink), LogLevel::Trace); }

    /// Sinks are called with the service lock held and must not log back into it
    void AddSink(Sink sink, LogLevel min_level) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.emplace_back(std::move(sink), min_level);
    }

    void ClearSinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    // === Logging API ===

    void Log(LogLevel level, double sim_time, std::string_view message) {
        Log(level, sim_time, message, LogContextManager::GetContext());
    }

    void Log(LogLevel level, double sim_time, std::string_view message, const LogContext &ctx) {
        if (level < min_level_) {
            return;
        }

        auto entry = LogEntry::Create(level, sim_time, message, ctx);

        std::lock_guard<std::mutex> lock(mutex_);
        if (level == LogLevel::Error) {
            ++error_count_;
        } else if (level == LogLevel::Fatal) {
            ++fatal_count_;
        }

        if (immediate_mode_) {
            FlushEntry(entry);
        } else {
            entries_.push_back(std::move(entry));
        }
    }

    void Trace(double t, std::string_view msg) { Log(LogLevel::Trace, t, msg); }
    void Debug(double t, std::string_view msg) { Log(LogLevel::Debug, t, msg); }
    void Info(double t, std::string_view msg) { Log(LogLevel::Info, t, msg); }
    void Event(double t, std::string_view msg) { Log(LogLevel::Event, t, msg); }
    void Warning(double t, std::string_view msg) { Log(LogLevel::Warning, t, msg); }
    void Error(double t, std::string_view msg) { Log(LogLevel::Error, t, msg); }
    void Fatal(double t, std::string_view msg) { Log(LogLevel::Fatal, t, msg); }

    // === Flush Control ===

    /// Push buffered entries to all sinks (each sink sees entries at or above its level)
    void Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[sink, min_level] : sinks_) {
            std::vector<LogEntry> filtered;
            filtered.reserve(entries_.size());
            for (const auto &entry : entries_) {
                if (entry.level >= min_level) {
                    filtered.push_back(entry);
                }
            }
            if (!filtered.empty()) {
                sink(filtered);
            }
        }
    }

    void FlushAndClear() {
        Flush();
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    // === Query API ===

    [[nodiscard]] std::size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] std::vector<LogEntry> GetPending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    [[nodiscard]] std::size_t ErrorCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_;
    }

    [[nodiscard]] std::size_t FatalCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fatal_count_;
    }

    void ResetErrorCounts() {
        std::lock_guard<std::mutex> lock(mutex_);
        error_count_ = 0;
        fatal_count_ = 0;
    }

  private:
    std::vector<LogEntry> entries_;
    std::vector<std::pair<Sink, LogLevel>> sinks_;
    LogLevel min_level_ = LogLevel::Info;
    bool immediate_mode_ = true;

    std::size_t error_count_ = 0;
    std::size_t fatal_count_ = 0;

    mutable std::mutex mutex_;

    void FlushEntry(const LogEntry &entry) {
        for (const auto &[sink, min_level] : sinks_) {
            if (entry.level >= min_level) {
                sink({entry});
            }
        }
    }
};

/**
 * @brief Sink that writes entries through a Console (colored when enabled)
 *
 * The console must outlive the service the sink is attached to.
 */
[[nodiscard]] inline LogService::Sink MakeConsoleSink(const Console &console) {
    return [&console](const std::vector<LogEntry> &entries) {
        for (const auto &entry : entries) {
            if (console.IsColorEnabled()) {
                console.WriteLine(entry.FormatColored(console));
            } else {
                console.WriteLine(entry.Format());
            }
        }
    };
}

/**
 * @brief Global log service singleton
 */
inline LogService &GetLogService() {
    static LogService instance;
    return instance;
}

} // namespace bioslurry

// =============================================================================
// Logging Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define BIOSLURRY_LOG_TRACE(sim_time, msg) ::bioslurry::GetLogService().Trace(sim_time, msg)
#define BIOSLURRY_LOG_DEBUG(sim_time, msg) ::bioslurry::GetLogService().Debug(sim_time, msg)
#define BIOSLURRY_LOG_INFO(sim_time, msg) ::bioslurry::GetLogService().Info(sim_time, msg)
#define BIOSLURRY_LOG_EVENT(sim_time, msg) ::bioslurry::GetLogService().Event(sim_time, msg)
#define BIOSLURRY_LOG_WARN(sim_time, msg) ::bioslurry::GetLogService().Warning(sim_time, msg)
#define BIOSLURRY_LOG_ERROR(sim_time, msg) ::bioslurry::GetLogService().Error(sim_time, msg)
// NOLINTEND(cppcoreguidelines-macro-usage)
