#pragma once

/// @file include/relsim/constants.hpp
/// @brief Physical and numerical constants for the relsim core.

#include <cstdint>

namespace relsim::constants {

// ─── Relativistic Bounds ──────────────────────────────────────────────────────

/// Maximum speed any integrated velocity is allowed to reach. Speeds above
/// this are scaled back after every integration step.
static constexpr double MAX_SPEED = 0.99999999999;

/// Speed of light in natural units.
static constexpr double SPEED_OF_LIGHT = 1.0;

// ─── Simulation Clock ─────────────────────────────────────────────────────────

/// Fixed physics tick (wall-clock seconds) and reference integration step.
static constexpr double PHYS_TIME_STEP = 1.0 / 240.0;

/// Coordinate time between baked checkpoints at the reference resolution.
static constexpr double EVENT_BAKE_INTERVAL = 1.0;

/// Upper bound on RK4 steps for one acceleration-segment query. Longer
/// segments use proportionally coarser steps.
static constexpr std::uint64_t MAX_SEGMENT_STEPS = 1u << 16;

/// Lower bound for any integration step or bake interval.
static constexpr double MIN_TIME_RESOLUTION = 1e-9;

// ─── Retarded-Time Solver ─────────────────────────────────────────────────────

/// Convergence threshold on the light-delay residual.
static constexpr double RETARDED_TIME_TOLERANCE = 0.001;

/// Iteration budget for the light-delay solver.
static constexpr int RETARDED_TIME_MAX_ITERATIONS = 30;

} // namespace relsim::constants
