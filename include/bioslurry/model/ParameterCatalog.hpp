#pragma once

/**
 * @file ParameterCatalog.hpp
 * @brief Named, documented access to every ParameterSet field
 *
 * The catalog is the configuration surface: scenario files and front ends
 * address parameters by key, and each entry carries a label, a unit and an
 * advisory slider range.
 */

#include <bioslurry/core/Error.hpp>
#include <bioslurry/model/Parameters.hpp>

#include <string>
#include <vector>

namespace bioslurry {

/**
 * @brief Panel group a parameter belongs to
 */
enum class ParameterGroup {
    InitialConditions,
    Biodegradation,
    Sorption,
    Metabolite,
    Simulation
};

[[nodiscard]] std::string to_string(ParameterGroup group);

/**
 * @brief One adjustable parameter
 *
 * Bounds are advisory: values outside [min, max] are reported by
 * ParameterCatalog::OutOfRange() but never rejected here.
 */
struct ParameterDescriptor {
    std::string key;   ///< Field name (e.g. "k_max")
    std::string label; ///< Human-readable label
    std::string unit;  ///< Unit string (e.g. "1/h")
    ParameterGroup group = ParameterGroup::Simulation;
    double min = 0.0;
    double max = 0.0;
    double step = 0.0;
    double ParameterSet::*field = nullptr; ///< Bound member
};

/**
 * @brief Static registry of ParameterDescriptors in panel order
 */
class ParameterCatalog {
  public:
    /// All entries, grouped and ordered as presented to the user
    [[nodiscard]] static const std::vector<ParameterDescriptor> &All();

    /// Entries of one group, in order
    [[nodiscard]] static std::vector<const ParameterDescriptor *> InGroup(ParameterGroup group);

    /// @return nullptr if key is unknown
    [[nodiscard]] static const ParameterDescriptor *Find(const std::string &key);

    /// @throws ConfigError if key is unknown
    [[nodiscard]] static const ParameterDescriptor &Require(const std::string &key);

    /// @throws ConfigError if key is unknown
    [[nodiscard]] static double Get(const ParameterSet &params, const std::string &key);

    /// @throws ConfigError if key is unknown
    static void Set(ParameterSet &params, const std::string &key, double value);

    /**
     * @brief Advisory range check
     * @return One warning per parameter outside its [min, max] range
     */
    [[nodiscard]] static std::vector<std::string> OutOfRange(const ParameterSet &params);
};

} // namespace bioslurry
