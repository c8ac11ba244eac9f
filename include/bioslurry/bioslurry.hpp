#pragma once

/**
 * @file bioslurry.hpp
 * @brief Umbrella header for the Bioslurry reactor simulator
 *
 * Include this header to get access to all public Bioslurry APIs.
 */

// Core
#include <bioslurry/core/CoreTypes.hpp>
#include <bioslurry/core/Error.hpp>

// Model
#include <bioslurry/model/Kinetics.hpp>
#include <bioslurry/model/ParameterCatalog.hpp>
#include <bioslurry/model/Parameters.hpp>

// Simulation
#include <bioslurry/sim/EulerIntegrator.hpp>
#include <bioslurry/sim/Integrator.hpp>
#include <bioslurry/sim/Playback.hpp>
#include <bioslurry/sim/SimulationEngine.hpp>
#include <bioslurry/sim/Trajectory.hpp>

// Analysis
#include <bioslurry/analysis/MetricsExtractor.hpp>

// I/O
#include <bioslurry/io/Console.hpp>
#include <bioslurry/io/LogService.hpp>
#include <bioslurry/io/ScenarioConfig.hpp>
#include <bioslurry/io/ScenarioLoader.hpp>
#include <bioslurry/io/SummaryExport.hpp>
#include <bioslurry/io/TrajectoryExport.hpp>
