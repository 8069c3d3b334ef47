/// @file src/kinematics/kinematics.cpp
/// @brief Lorentz kinematics implementation.

#include "relsim/kinematics.hpp"

#include <cmath>
#include <limits>

namespace relsim::kinematics {

// ─── Core Transforms ──────────────────────────────────────────────────────────

double lorentz_factor(const Velocity3& velocity) noexcept {
    return 1.0 / std::sqrt(1.0 - velocity.squaredNorm());
}

BoostMatrix lorentz_boost(const Velocity3& velocity) noexcept {
    const double speed2 = velocity.squaredNorm();

    // Below the smallest normal double the projector v vᵀ / |v|² is not
    // representable; the boost is the identity to working precision anyway.
    if (speed2 <= std::numeric_limits<double>::min()) {
        return BoostMatrix::Identity();
    }

    const double gamma = lorentz_factor(velocity);

    BoostMatrix boost = BoostMatrix::Zero();
    boost.topLeftCorner<3, 3>() =
        Eigen::Matrix3d::Identity()
        + (gamma - 1.0) * (velocity * velocity.transpose()) / speed2;
    boost.block<3, 1>(0, TIME_INDEX) = -gamma * velocity;
    boost.block<1, 3>(TIME_INDEX, 0) = -gamma * velocity.transpose();
    boost(TIME_INDEX, TIME_INDEX)    = gamma;
    return boost;
}

FourVelocity velocity_3_to_4(const Velocity3& velocity) noexcept {
    const double gamma = lorentz_factor(velocity);
    FourVelocity out;
    out << gamma * velocity, gamma;
    return out;
}

Velocity3 velocity_4_to_3(const FourVelocity& velocity) noexcept {
    return velocity.head<3>() / velocity(TIME_INDEX);
}

Velocity3 transform_3_velocity(const BoostMatrix& transform,
                               const Velocity3&   velocity) noexcept {
    return velocity_4_to_3(transform * velocity_3_to_4(velocity));
}

Velocity3 add_velocities(const Velocity3& velocity_a,
                         const Velocity3& velocity_b) noexcept {
    return transform_3_velocity(lorentz_boost(-velocity_a), velocity_b);
}

Velocity3 clamp_speed(const Velocity3& velocity, double max_speed) noexcept {
    if (velocity.squaredNorm() > max_speed * max_speed) {
        return velocity.normalized() * max_speed;
    }
    return velocity;
}

// ─── Proper Velocity ──────────────────────────────────────────────────────────

Vector3 velocity_3_to_proper(const Velocity3& velocity) noexcept {
    return velocity * lorentz_factor(velocity);
}

Velocity3 velocity_proper_to_3(const Vector3& proper_velocity) noexcept {
    // |v| = |w| / √(1 + |w|²) keeps the speed below 1 for any finite w.
    return proper_velocity / std::sqrt(1.0 + proper_velocity.squaredNorm());
}

Vector3 velocity_4_to_proper(const FourVelocity& velocity) noexcept {
    return velocity_3_to_proper(velocity_4_to_3(velocity));
}

FourVelocity velocity_proper_to_4(const Vector3& proper_velocity) noexcept {
    return velocity_3_to_4(velocity_proper_to_3(proper_velocity));
}

// ─── Hyperbolic Motion ────────────────────────────────────────────────────────

double const_accel_proper_time(double proper_accel, double coord_time) noexcept {
    if (proper_accel == 0.0) {
        return coord_time;
    }
    return std::asinh(proper_accel * coord_time) / proper_accel;
}

double const_accel_displacement(double proper_accel, double coord_time) noexcept {
    if (proper_accel == 0.0) {
        return 0.0;
    }
    const double at = proper_accel * coord_time;
    return (std::sqrt(1.0 + at * at) - 1.0) / proper_accel;
}

// ─── Minkowski Metric ─────────────────────────────────────────────────────────

MetricMatrix minkowski_metric() noexcept {
    MetricMatrix eta = MetricMatrix::Zero();
    eta.diagonal() << -1.0, -1.0, -1.0, 1.0;
    return eta;
}

double minkowski_interval(const FourVector& a, const FourVector& b) noexcept {
    return a(TIME_INDEX) * b(TIME_INDEX) - a.head<3>().dot(b.head<3>());
}

double minkowski_norm2(const FourVector& a) noexcept {
    return minkowski_interval(a, a);
}

} // namespace relsim::kinematics
