/**
 * @file  prop_velocity_subluminal.cpp
 * @brief Property: ∀ |u|,|v| < 1: |u ⊕ v| < 1 (never superluminal)
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_velocity_subluminal
 *
 * Mathematical basis:
 *   u ⊕ v = velocity_4_to_3(Λ(−u)·(γ_v, γ_v v)), and the Minkowski norm of a
 *   four-velocity is preserved by Λ, so the result stays inside the light
 *   cone for any pair of sub-luminal inputs.
 *
 * This is the safety property the integrator relies on: a composed speed
 * ≥ 1 would make γ infinite or NaN in every downstream boost.
 */

#include <rapidcheck.h>
#include <cmath>
#include <cstdlib>

#include "relsim/constants.hpp"
#include "relsim/inertial_frame.hpp"
#include "relsim/kinematics.hpp"

using namespace relsim;
using namespace relsim::kinematics;

namespace {

constexpr double SPEED_CAP = 0.9999;

Velocity3 to_velocity(double a, double b, double c) {
    Velocity3 v(std::tanh(a), std::tanh(b), std::tanh(c));
    const double speed = v.norm();
    if (speed > SPEED_CAP) v *= SPEED_CAP / speed;
    return v;
}

bool all_finite(double a, double b, double c) {
    return std::isfinite(a) && std::isfinite(b) && std::isfinite(c);
}

} // namespace

int main() {
    bool ok = true;

    // ── Property 1: |u ⊕ v| < 1 ─────────────────────────────────────────────
    ok &= rc::check(
        "velocity_subluminal: |add_velocities(u, v)| < 1 always",
        [](double ua, double ub, double uc, double va, double vb, double vc) {
            RC_PRE(all_finite(ua, ub, uc) && all_finite(va, vb, vc));
            const Velocity3 sum = add_velocities(to_velocity(ua, ub, uc),
                                                 to_velocity(va, vb, vc));
            RC_ASSERT(sum.allFinite());
            RC_ASSERT(sum.norm() < 1.0);
        }
    );

    // ── Property 2: clamp_speed never exceeds MAX_SPEED ──────────────────────
    ok &= rc::check(
        "velocity_subluminal: clamp_speed bounds any finite vector",
        [](double a, double b, double c) {
            RC_PRE(all_finite(a, b, c));
            const Velocity3 raw(a, b, c);
            RC_PRE(raw.allFinite() && std::isfinite(raw.squaredNorm()));
            RC_ASSERT(clamp_speed(raw).norm() <= constants::MAX_SPEED * (1.0 + 1e-15));
        }
    );

    // ── Property 3: any finite proper velocity maps below c ─────────────────
    ok &= rc::check(
        "velocity_subluminal: velocity_proper_to_3 stays below 1",
        [](double a, double b, double c) {
            RC_PRE(all_finite(a, b, c));
            const Vector3 w(a, b, c);
            RC_PRE(std::isfinite(w.squaredNorm()));
            RC_ASSERT(velocity_proper_to_3(w).norm() <= 1.0);
        }
    );

    // ── Property 4: one RK4 step keeps the frame sub-luminal ─────────────────
    ok &= rc::check(
        "velocity_subluminal: InertialFrame::step clamps to MAX_SPEED",
        [](double va, double vb, double vc, double aa, double ab, double ac) {
            RC_PRE(all_finite(va, vb, vc) && all_finite(aa, ab, ac));
            InertialFrame frame{.velocity = to_velocity(va, vb, vc)};
            const Vector3 accel = Vector3(std::tanh(aa), std::tanh(ab), std::tanh(ac)) * 50.0;

            const double tau = frame.step(constants::PHYS_TIME_STEP, accel);

            RC_ASSERT(std::isfinite(tau));
            RC_ASSERT(tau > 0.0);
            RC_ASSERT(tau <= constants::PHYS_TIME_STEP * (1.0 + 1e-12));
            RC_ASSERT(frame.velocity.norm() <= constants::MAX_SPEED * (1.0 + 1e-15));
        }
    );

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
