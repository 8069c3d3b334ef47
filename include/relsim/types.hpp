#pragma once

/// @file include/relsim/types.hpp
/// @brief Shared primitive types for the relsim special-relativity core.
///
/// Every module includes this file. It defines the Eigen-based
/// linear-algebra aliases used for spacetime positions, velocities and
/// frame transforms.
///
/// Component layout of every 4-vector is [x, y, z, t]: the three spatial
/// components first, coordinate time last. Units are natural (c = 1).

#include <Eigen/Dense>

namespace relsim {

/// Dimensionality of flat spacetime (3 space + 1 time).
static constexpr int SPACETIME_DIM = 4;

/// Index of the time component in every 4-vector.
static constexpr int TIME_INDEX = 3;

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Coordinate 3-velocity dx/dt. Magnitude is a fraction of c.
using Velocity3 = Eigen::Vector3d;

/// A spatial 3-vector (displacement, proper acceleration).
using Vector3 = Eigen::Vector3d;

/// A generic spacetime 4-vector, layout [x, y, z, t].
using FourVector = Eigen::Matrix<double, SPACETIME_DIM, 1>;

/// An event in spacetime, layout [x, y, z, t].
using SpacetimePoint = FourVector;

/// A 4-velocity dx^μ/dτ, layout [γvx, γvy, γvz, γ].
using FourVelocity = FourVector;

/// A linear transform between two inertial frames' spacetime bases.
using BoostMatrix = Eigen::Matrix<double, SPACETIME_DIM, SPACETIME_DIM>;

/// The flat-spacetime metric η in the [x, y, z, t] layout.
using MetricMatrix = BoostMatrix;

} // namespace relsim
