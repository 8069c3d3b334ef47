#pragma once
/**
 * @file  inertial_frame.hpp
 * @brief Position + velocity pair and its constant-proper-acceleration step.
 *
 * Module:  src/frame/
 *
 * Responsibility
 * --------------
 * An InertialFrame is the instantaneous state of one entity: its spacetime
 * position [x, y, z, t] and its coordinate 3-velocity. It can be
 *
 *   • re-expressed in another frame's rest basis        (relative_to)
 *   • extrapolated along a straight worldline           (predict)
 *   • integrated under constant proper acceleration     (step)
 *
 * Invariant
 * ---------
 *   |velocity| ≤ MAX_SPEED after every `step`. Velocities are clamped,
 *   never rejected.
 *
 * Integration scheme
 * ------------------
 * An arbitrarily oriented proper acceleration α on a frame with non-zero
 * velocity has no closed form, so `step` uses RK4 on
 *
 *   dv/dt = (1 − |v|²)·(A − v·A_t),   A = lorentz_boost(−v)·(α, 0)
 *
 * Position is then integrated over the velocity history v(s), s ∈ [0, h],
 * reconstructed by a nested RK4 step from the starting velocity, instead of
 * integrating (x, v) jointly. Proper time is the integral of 1/γ(v(s)) over
 * the same history.
 */

#include "relsim/types.hpp"

namespace relsim {

struct InertialFrame {
    SpacetimePoint position = SpacetimePoint::Zero(); ///< [x, y, z, t]
    Velocity3      velocity = Velocity3::Zero();      ///< Coordinate velocity, c = 1

    /// Express this frame's position and velocity in the rest basis of
    /// `other`: position boost(other.v)·(x − x_other), velocity transformed
    /// by the same boost.
    [[nodiscard]] InertialFrame relative_to(const InertialFrame& other) const noexcept;

    /// Move along a straight worldline for `delta_time` of coordinate time.
    /// Velocity is unchanged.
    [[nodiscard]] InertialFrame predict(double delta_time) const noexcept;

    /**
     * @brief Integrate one segment of constant proper acceleration.
     *
     * Advances position (including its time component) by `delta_time` and
     * updates velocity, then clamps |velocity| to MAX_SPEED.
     *
     * @param delta_time    Coordinate time step h. Smaller is more precise.
     * @param proper_accel  Acceleration felt by the entity.
     * @return Elapsed proper time over the step.
     */
    double step(double delta_time, const Vector3& proper_accel) noexcept;
};

} // namespace relsim
