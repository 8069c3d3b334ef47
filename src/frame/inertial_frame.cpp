/**
 * @file  inertial_frame.cpp
 * @brief InertialFrame transforms and RK4 acceleration step.
 *
 * See inertial_frame.hpp for the full module contract.
 */

#include "relsim/inertial_frame.hpp"
#include "relsim/constants.hpp"
#include "relsim/integration.hpp"
#include "relsim/kinematics.hpp"

namespace relsim {

using integration::runge_kutta_step;
using kinematics::clamp_speed;
using kinematics::lorentz_boost;
using kinematics::lorentz_factor;

// ── Internal helpers ──────────────────────────────────────────────────────────

namespace {

/// Coordinate acceleration dv/dt of a frame moving at `velocity` that feels
/// `proper_accel` in its instantaneous rest frame.
///
/// RK4 stage values can overshoot c on large steps; they are clamped before
/// the boost so every evaluation stays physical.
Velocity3 coordinate_acceleration(const Velocity3& velocity,
                                  const Vector3&   proper_accel) noexcept {
    const Velocity3 v = clamp_speed(velocity);

    FourVector rest_accel;
    rest_accel << proper_accel, 0.0;

    const FourVector lab_accel = lorentz_boost(-v) * rest_accel;

    return (1.0 - v.squaredNorm()) * (lab_accel.head<3>() - v * lab_accel(TIME_INDEX));
}

} // namespace

// ── InertialFrame ─────────────────────────────────────────────────────────────

InertialFrame InertialFrame::relative_to(const InertialFrame& other) const noexcept {
    const BoostMatrix transform = lorentz_boost(other.velocity);

    return InertialFrame{
        .position = transform * (position - other.position),
        .velocity = kinematics::transform_3_velocity(transform, velocity),
    };
}

InertialFrame InertialFrame::predict(double delta_time) const noexcept {
    FourVector direction;
    direction << velocity, 1.0;

    return InertialFrame{
        .position = position + direction * delta_time,
        .velocity = velocity,
    };
}

double InertialFrame::step(double delta_time, const Vector3& proper_accel) noexcept {
    const Velocity3 initial_velocity = velocity;

    auto velocity_derivative = [&proper_accel](double, const Velocity3& v) -> Velocity3 {
        return coordinate_acceleration(v, proper_accel);
    };

    // v(s) for s ∈ [0, delta_time], reconstructed from the start of the step.
    auto velocity_at = [&](double s) -> Velocity3 {
        return clamp_speed(
            runge_kutta_step(initial_velocity, 0.0, s, velocity_derivative));
    };

    velocity = velocity_at(delta_time);

    const Vector3 displacement = runge_kutta_step(
        Vector3(position.head<3>()), 0.0, delta_time,
        [&](double s, const Vector3&) -> Vector3 { return velocity_at(s); });

    position.head<3>() = displacement;
    position(TIME_INDEX) += delta_time;

    return runge_kutta_step(
        0.0, 0.0, delta_time,
        [&](double s, double) -> double { return 1.0 / lorentz_factor(velocity_at(s)); });
}

} // namespace relsim
