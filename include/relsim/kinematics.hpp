#pragma once

/// @file include/relsim/kinematics.hpp
/// @brief Lorentz kinematics: γ, boosts, 3-/4-velocity conversions.
///
/// # Module: Lorentz Kinematics
///
/// ## Responsibility
/// Pure special-relativistic transforms on coordinate velocities and
/// spacetime vectors. Every other module is built on these.
///
/// ## Sign Convention
/// `lorentz_boost(v)` converts a vector expressed in the stationary frame's
/// basis into the basis of a frame moving at `+v`. The inverse boost is
/// `lorentz_boost(-v)`.
///
/// ## Guarantees
/// - All functions are noexcept and stateless
/// - Thread-safe: pure functions of their inputs
/// - Callers keep |v| < 1; velocities produced by the integrator are
///   clamped to MAX_SPEED, so this holds for every derived velocity
///
/// ## NOT Responsible For
/// - Integrating accelerated motion (see inertial_frame.hpp)
/// - Curved spacetime

#include "relsim/types.hpp"
#include "relsim/constants.hpp"

namespace relsim::kinematics {

// ── Core Transforms ───────────────────────────────────────────────────────────

/// Compute the Lorentz factor γ = 1 / √(1 − |v|²).
///
/// γ(0) = 1. The result is infinite or NaN for |v| ≥ 1.
[[nodiscard]] double lorentz_factor(const Velocity3& velocity) noexcept;

/// Build the boost into the rest frame of an observer moving at `velocity`.
///
/// Spatial block: I + (γ − 1)·v vᵀ / |v|². Time row and column: −γv, with γ
/// on the diagonal. Returns the identity when |v|² is within floating-point
/// precision of zero.
[[nodiscard]] BoostMatrix lorentz_boost(const Velocity3& velocity) noexcept;

/// Convert a 3-velocity into its 4-velocity: γ·(v, 1).
[[nodiscard]] FourVelocity velocity_3_to_4(const Velocity3& velocity) noexcept;

/// Convert a 4-velocity into its 3-velocity: u.spatial / u.t.
[[nodiscard]] Velocity3 velocity_4_to_3(const FourVelocity& velocity) noexcept;

/// Apply a 4×4 frame transform to a 3-velocity.
///
/// Shorthand for `velocity_4_to_3(transform * velocity_3_to_4(velocity))`.
[[nodiscard]] Velocity3 transform_3_velocity(const BoostMatrix& transform,
                                             const Velocity3&   velocity) noexcept;

/// Relativistic velocity addition.
///
/// Returns the velocity, in the stationary frame, of an object moving at
/// `velocity_b` relative to a frame that moves at `velocity_a`. The result is
/// sub-luminal whenever both inputs are.
[[nodiscard]] Velocity3 add_velocities(const Velocity3& velocity_a,
                                       const Velocity3& velocity_b) noexcept;

/// Scale `velocity` back to `max_speed` if it is faster. Slower velocities are
/// returned unchanged.
[[nodiscard]] Velocity3 clamp_speed(const Velocity3& velocity,
                                    double max_speed = constants::MAX_SPEED) noexcept;

// ── Proper Velocity ───────────────────────────────────────────────────────────

/// Displacement per unit of the moving clock's time: γv.
[[nodiscard]] Vector3 velocity_3_to_proper(const Velocity3& velocity) noexcept;

/// Inverse of `velocity_3_to_proper`: w / √(1 + |w|²). Zero maps to zero.
[[nodiscard]] Velocity3 velocity_proper_to_3(const Vector3& proper_velocity) noexcept;

[[nodiscard]] Vector3 velocity_4_to_proper(const FourVelocity& velocity) noexcept;

[[nodiscard]] FourVelocity velocity_proper_to_4(const Vector3& proper_velocity) noexcept;

// ── Hyperbolic Motion ─────────────────────────────────────────────────────────

/// Proper time elapsed after coordinate time `coord_time` for an object that
/// starts at rest and feels constant proper acceleration `proper_accel` along
/// one axis: asinh(a·t) / a.
///
/// The a → 0 limit (τ = t) is returned for a == 0.
[[nodiscard]] double const_accel_proper_time(double proper_accel,
                                             double coord_time) noexcept;

/// Displacement of the same object: (√(1 + (a·t)²) − 1) / a. Zero for a == 0.
[[nodiscard]] double const_accel_displacement(double proper_accel,
                                              double coord_time) noexcept;

// ── Minkowski Metric ──────────────────────────────────────────────────────────

/// The flat metric η = diag(−1, −1, −1, +1) for the [x, y, z, t] layout.
[[nodiscard]] MetricMatrix minkowski_metric() noexcept;

/// Inner product η(a, b) = a_t b_t − a_x b_x − a_y b_y − a_z b_z.
///
/// Positive for timelike separations, zero on the light cone.
[[nodiscard]] double minkowski_interval(const FourVector& a,
                                        const FourVector& b) noexcept;

/// Squared Minkowski length η(a, a).
[[nodiscard]] double minkowski_norm2(const FourVector& a) noexcept;

} // namespace relsim::kinematics
