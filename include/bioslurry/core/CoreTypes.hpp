#pragma once

/**
 * @file CoreTypes.hpp
 * @brief Core type definitions and version information for Bioslurry
 *
 * Re-exports Janus types so the kinetics and integrators can be written
 * against a single vector type.
 */

#include <cstddef>
#include <cstdint>
#include <string>

// Re-export Janus types
#include <janus/core/JanusTypes.hpp>

namespace bioslurry {

// =============================================================================
// Janus Type Re-exports
// =============================================================================

using janus::JanusVector;
using janus::NumericScalar;
using janus::NumericVector;

// =============================================================================
// State Layout
// =============================================================================

/// Position of each reactor state variable in the integrated vector
constexpr int kGlyphosateAq = 0;     ///< Aqueous glyphosate C_G,aq [mg/L]
constexpr int kGlyphosateSorbed = 1; ///< Sorbed glyphosate C_G,s [mg/kg]
constexpr int kAmpaAq = 2;           ///< Aqueous AMPA C_A,aq [mg/L]
constexpr int kBiomass = 3;          ///< Biomass X [mg/L]
constexpr int kStateSize = 4;

// =============================================================================
// Unit Conversion
// =============================================================================

constexpr double kHoursPerDay = 24.0;

[[nodiscard]] constexpr double HoursToDays(double hours) { return hours / kHoursPerDay; }

// =============================================================================
// Version Information
// =============================================================================

#define BIOSLURRY_VERSION_MAJOR 0
#define BIOSLURRY_VERSION_MINOR 3
#define BIOSLURRY_VERSION_PATCH 0

#define BIOSLURRY_STRINGIFY(x) #x
#define BIOSLURRY_VERSION_STR(major, minor, patch)                                                 \
    BIOSLURRY_STRINGIFY(major) "." BIOSLURRY_STRINGIFY(minor) "." BIOSLURRY_STRINGIFY(patch)

constexpr int VersionMajor() { return BIOSLURRY_VERSION_MAJOR; }
constexpr int VersionMinor() { return BIOSLURRY_VERSION_MINOR; }
constexpr int VersionPatch() { return BIOSLURRY_VERSION_PATCH; }

/// Version string (derived from components)
constexpr const char *Version() {
    return BIOSLURRY_VERSION_STR(BIOSLURRY_VERSION_MAJOR, BIOSLURRY_VERSION_MINOR,
                                 BIOSLURRY_VERSION_PATCH);
}

// =============================================================================
// Naming Utilities
// =============================================================================

/**
 * @brief Build a dotted path from a scope and a name
 *
 * Returns "scope.name" if scope is non-empty, otherwise just "name".
 */
inline std::string MakeFullPath(const std::string &scope, const std::string &name) {
    if (scope.empty())
        return name;
    return scope + "." + name;
}

} // namespace bioslurry
