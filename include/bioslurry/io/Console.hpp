#pragma once

/**
 * @file Console.hpp
 * @brief Console abstraction with ANSI color support
 *
 * Terminal-aware output with ANSI escape codes and box-drawing characters.
 * Output goes to std::cout unless another stream is attached.
 */

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define STDOUT_FILENO 1
#else
#include <unistd.h>
#endif

namespace bioslurry {

// =============================================================================
// LogLevel
// =============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    Trace,   ///< Per-step detail
    Debug,   ///< Debugging info
    Info,    ///< Normal operation
    Event,   ///< Run milestones (started, completed, exported)
    Warning, ///< Potential issues
    Error,   ///< Rejected runs
    Fatal    ///< Unrecoverable errors
};

[[nodiscard]] inline const char *to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRC";
    case LogLevel::Debug:
        return "DBG";
    case LogLevel::Info:
        return "INF";
    case LogLevel::Event:
        return "EVT";
    case LogLevel::Warning:
        return "WRN";
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Fatal:
        return "FTL";
    }
    return "???";
}

/**
 * @brief Parse a level name (case-insensitive); "off" maps to Fatal
 *
 * @return Info for unrecognized names
 */
[[nodiscard]] inline LogLevel ParseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "event")
        return LogLevel::Event;
    if (lower == "warning" || lower == "warn")
        return LogLevel::Warning;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "off" || lower == "fatal")
        return LogLevel::Fatal;
    return LogLevel::Info;
}

// =============================================================================
// AnsiColor
// =============================================================================

struct AnsiColor {
    static constexpr const char *Reset = "\033[0m";
    static constexpr const char *Bold = "\033[1m";
    static constexpr const char *Dim = "\033[2m";

    static constexpr const char *Red = "\033[31m";
    static constexpr const char *Green = "\033[32m";
    static constexpr const char *Yellow = "\033[33m";
    static constexpr const char *Cyan = "\033[36m";
    static constexpr const char *White = "\033[37m";
    static constexpr const char *Gray = "\033[90m";

    static constexpr const char *BgRed = "\033[41m";
};

[[nodiscard]] inline const char *LevelColor(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return AnsiColor::Gray;
    case LogLevel::Debug:
        return AnsiColor::Cyan;
    case LogLevel::Info:
        return AnsiColor::White;
    case LogLevel::Event:
        return AnsiColor::Green;
    case LogLevel::Warning:
        return AnsiColor::Yellow;
    case LogLevel::Error:
        return AnsiColor::Red;
    case LogLevel::Fatal:
        return AnsiColor::BgRed;
    }
    return AnsiColor::White;
}

// =============================================================================
// BoxChars
// =============================================================================

/**
 * @brief Box-drawing characters (Unicode)
 */
struct BoxChars {
    static constexpr const char *TopLeft = "\u250C";     // ┌
    static constexpr const char *TopRight = "\u2510";    // ┐
    static constexpr const char *BottomLeft = "\u2514";  // └
    static constexpr const char *BottomRight = "\u2518"; // ┘
    static constexpr const char *Horizontal = "\u2500";  // ─
    static constexpr const char *Vertical = "\u2502";    // │
    static constexpr const char *TeeRight = "\u251C";    // ├
    static constexpr const char *TeeLeft = "\u2524";     // ┤
    static constexpr const char *TeeDown = "\u252C";     // ┬
    static constexpr const char *TeeUp = "\u2534";       // ┴
    static constexpr const char *Cross = "\u253C";       // ┼
};

// =============================================================================
// Console
// =============================================================================

/**
 * @brief Console output with color and formatting support
 *
 * Colors are enabled when stdout is a terminal. Attaching a different stream
 * (tests, log capture) disables them.
 */
class Console {
  public:
    Console() : is_tty_(isatty(STDOUT_FILENO) != 0), color_enabled_(is_tty_) {}

    explicit Console(std::ostream &out) : out_(&out) {}

    [[nodiscard]] bool IsTerminal() const { return is_tty_; }

    void SetColorEnabled(bool enabled) { color_enabled_ = enabled; }
    [[nodiscard]] bool IsColorEnabled() const { return color_enabled_; }

    void SetLogLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetLogLevel() const { return min_level_; }

    // === Logging Methods ===

    void Info(std::string_view msg) { Log(LogLevel::Info, msg); }
    void Event(std::string_view msg) { Log(LogLevel::Event, msg); }
    void Warning(std::string_view msg) { Log(LogLevel::Warning, msg); }
    void Error(std::string_view msg) { Log(LogLevel::Error, msg); }

    /// Log with explicit level: "[INF] message"
    void Log(LogLevel level, std::string_view msg) {
        if (level < min_level_) {
            return;
        }
        std::string prefix = "[" + std::string(to_string(level)) + "]";
        *out_ << Colorize(prefix, LevelColor(level)) << " " << msg << "\n";
    }

    // === Formatting Helpers ===

    /// Apply color if enabled
    [[nodiscard]] std::string Colorize(std::string_view text, const char *color) const {
        if (!color_enabled_) {
            return std::string(text);
        }
        return std::string(color) + std::string(text) + AnsiColor::Reset;
    }

    [[nodiscard]] static std::string PadRight(std::string_view text, std::size_t width) {
        if (text.size() >= width) {
            return std::string(text);
        }
        return std::string(text) + std::string(width - text.size(), ' ');
    }

    [[nodiscard]] static std::string PadLeft(std::string_view text, std::size_t width) {
        if (text.size() >= width) {
            return std::string(text);
        }
        return std::string(width - text.size(), ' ') + std::string(text);
    }

    /// Fixed-point formatting ("12.35" for 12.3456 at precision 2)
    [[nodiscard]] static std::string FormatFixed(double value, int precision = 2) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << value;
        return oss.str();
    }

    void Write(std::string_view text) const { *out_ << text; }
    void WriteLine(std::string_view text = "") const { *out_ << text << "\n"; }
    void Flush() const { out_->flush(); }

  private:
    std::ostream *out_ = &std::cout;
    bool is_tty_ = false;
    bool color_enabled_ = false;
    LogLevel min_level_ = LogLevel::Info;
};

} // namespace bioslurry
