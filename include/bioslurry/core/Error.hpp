#pragma once

/**
 * @file Error.hpp
 * @brief Consolidated error handling for Bioslurry
 *
 * Flat exception hierarchy: one base class carrying severity and category,
 * and one subclass per failure domain (parameters, trajectories, config, I/O).
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace bioslurry {

// =============================================================================
// Error Severity
// =============================================================================

enum class Severity : uint8_t {
    INFO,    ///< Informational (logged, no action)
    WARNING, ///< Warning (run continues)
    ERROR,   ///< Error (run is rejected)
    FATAL    ///< Fatal (programming error)
};

// =============================================================================
// Base Exception
// =============================================================================

/**
 * @brief Base class for all Bioslurry exceptions
 *
 * All exceptions carry a severity level and a category string used as
 * logging context.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg, Severity severity = Severity::ERROR,
                   std::string category = "general")
        : std::runtime_error("[bioslurry] " + msg), severity_(severity),
          category_(std::move(category)) {}

    [[nodiscard]] Severity severity() const { return severity_; }
    [[nodiscard]] const std::string &category() const { return category_; }

  protected:
    Severity severity_;
    std::string category_;
};

// =============================================================================
// Parameter Errors
// =============================================================================

/**
 * @brief Invalid parameter set
 *
 * Raised before any simulation work begins. Carries every violated
 * constraint, not just the first one.
 */
class ParameterError : public Error {
  public:
    explicit ParameterError(const std::string &msg)
        : Error("Parameter: " + msg, Severity::ERROR, "parameter"), violations_{msg} {}

    explicit ParameterError(std::vector<std::string> violations)
        : Error(FormatMessage(violations), Severity::ERROR, "parameter"),
          violations_(std::move(violations)) {}

    [[nodiscard]] const std::vector<std::string> &violations() const { return violations_; }

  private:
    static std::string FormatMessage(const std::vector<std::string> &violations) {
        std::string msg = "Parameter: invalid parameter set";
        for (const auto &v : violations) {
            msg += "\n  - " + v;
        }
        return msg;
    }

    std::vector<std::string> violations_;
};

// =============================================================================
// Trajectory Errors
// =============================================================================

/**
 * @brief Trajectory access errors (empty input, index out of range)
 */
class TrajectoryError : public Error {
  public:
    explicit TrajectoryError(const std::string &msg)
        : Error("Trajectory: " + msg, Severity::ERROR, "trajectory") {}

    TrajectoryError(std::size_t index, std::size_t size)
        : Error("Trajectory: index " + std::to_string(index) + " out of range (size " +
                    std::to_string(size) + ")",
                Severity::ERROR, "trajectory"),
          index_(index) {}

    [[nodiscard]] std::optional<std::size_t> index() const { return index_; }

    static TrajectoryError Empty(const std::string &operation) {
        return TrajectoryError(operation + " requires a non-empty trajectory");
    }

  private:
    std::optional<std::size_t> index_;
};

// =============================================================================
// Configuration Errors
// =============================================================================

/**
 * @brief Configuration/parsing errors with optional file context
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg)
        : Error("Config: " + msg, Severity::ERROR, "config") {}

    ConfigError(const std::string &message, const std::string &file, int line = -1,
                const std::string &hint = "")
        : Error(FormatMessage(message, file, line, hint), Severity::ERROR, "config"), file_(file),
          line_(line), hint_(hint) {}

    [[nodiscard]] const std::string &file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] const std::string &hint() const { return hint_; }

    static ConfigError UnknownKey(const std::string &section, const std::string &key) {
        return ConfigError("unknown key '" + key + "' in section '" + section + "'");
    }

  private:
    static std::string FormatMessage(const std::string &msg, const std::string &file, int line,
                                     const std::string &hint) {
        std::string result = "Config: " + msg;
        if (!file.empty()) {
            result += "\n  at: " + file;
            if (line >= 0) {
                result += ":" + std::to_string(line);
            }
        }
        if (!hint.empty()) {
            result += "\n  hint: " + hint;
        }
        return result;
    }

    std::string file_;
    int line_ = -1;
    std::string hint_;
};

// =============================================================================
// I/O Errors
// =============================================================================

/**
 * @brief File and I/O operation errors
 */
class IOError : public Error {
  public:
    explicit IOError(const std::string &msg) : Error("IO: " + msg, Severity::ERROR, "io") {}

    IOError(const std::string &operation, const std::string &path, const std::string &reason)
        : Error("IO: " + operation + " '" + path + "': " + reason, Severity::ERROR, "io"),
          path_(path) {}

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

} // namespace bioslurry

// =============================================================================
// Error Throwing Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define BIOSLURRY_THROW(error) throw(error)
// NOLINTEND(cppcoreguidelines-macro-usage)
