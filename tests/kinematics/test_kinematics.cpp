#include <gtest/gtest.h>
#include "relsim/kinematics.hpp"
#include "relsim/constants.hpp"
#include <cmath>

using namespace relsim;
using namespace relsim::kinematics;
using namespace relsim::constants;

// ─── lorentz_factor ───────────────────────────────────────────────────────────

TEST(LorentzFactor, AtRest_IsOne) {
    EXPECT_DOUBLE_EQ(lorentz_factor(Velocity3::Zero()), 1.0);
}

TEST(LorentzFactor, Speed06_ExactValue_1p25) {
    // |v| = 0.6 → γ = 1/√(1−0.36) = 1.25 exactly
    EXPECT_NEAR(lorentz_factor(Velocity3(0.6, 0.0, 0.0)), 1.25, 1e-12);
}

TEST(LorentzFactor, DependsOnlyOnSpeed) {
    // (0.36, 0.48, 0) has |v| = 0.6 as well
    EXPECT_NEAR(lorentz_factor(Velocity3(0.36, 0.48, 0.0)), 1.25, 1e-12);
    EXPECT_NEAR(lorentz_factor(Velocity3(0.0, 0.0, -0.6)), 1.25, 1e-12);
}

TEST(LorentzFactor, AlwaysAtLeastOne) {
    for (double s : {0.0, 0.1, 0.3, 0.5, 0.7, 0.9, 0.99, 0.999999}) {
        EXPECT_GE(lorentz_factor(Velocity3(0.0, s, 0.0)), 1.0) << "speed=" << s;
    }
}

TEST(LorentzFactor, MaxSpeed_IsFiniteAndLarge) {
    const double g = lorentz_factor(Velocity3(MAX_SPEED, 0.0, 0.0));
    EXPECT_TRUE(std::isfinite(g));
    EXPECT_GT(g, 1e5);
}

// ─── lorentz_boost ────────────────────────────────────────────────────────────

TEST(LorentzBoost, ZeroVelocity_IsIdentity) {
    EXPECT_TRUE(lorentz_boost(Velocity3::Zero()).isIdentity(0.0));
}

TEST(LorentzBoost, DenormalVelocity_IsIdentityWithoutNaN) {
    const BoostMatrix b = lorentz_boost(Velocity3(1e-170, 0.0, 0.0));
    EXPECT_TRUE(b.allFinite());
    EXPECT_TRUE(b.isIdentity(1e-15));
}

TEST(LorentzBoost, TinyVelocity_StaysFinite) {
    const BoostMatrix b = lorentz_boost(Velocity3(1e-13, -1e-13, 1e-13));
    EXPECT_TRUE(b.allFinite());
    EXPECT_TRUE(b.isIdentity(1e-12));
}

TEST(LorentzBoost, StandardBoostAlongX) {
    // v = 0.6 x̂: x' = γ(x − vt), t' = γ(t − vx)
    const BoostMatrix b = lorentz_boost(Velocity3(0.6, 0.0, 0.0));

    FourVector event;
    event << 0.0, 0.0, 0.0, 10.0;
    const FourVector moved = b * event;

    EXPECT_NEAR(moved(0), -7.5, 1e-12);
    EXPECT_NEAR(moved(1), 0.0, 1e-12);
    EXPECT_NEAR(moved(2), 0.0, 1e-12);
    EXPECT_NEAR(moved(TIME_INDEX), 12.5, 1e-12);
}

TEST(LorentzBoost, IsSymmetric) {
    const BoostMatrix b = lorentz_boost(Velocity3(0.2, -0.4, 0.5));
    EXPECT_TRUE(b.isApprox(b.transpose(), 1e-14));
}

TEST(LorentzBoost, NegatedVelocity_IsInverse) {
    const Velocity3 v(0.3, 0.5, -0.6);
    const BoostMatrix product = lorentz_boost(v) * lorentz_boost(-v);
    EXPECT_TRUE(product.isIdentity(1e-12));
}

TEST(LorentzBoost, ComovingObject_IsAtRestInBoostedFrame) {
    const Velocity3 v(-0.25, 0.1, 0.8);
    const FourVelocity u = lorentz_boost(v) * velocity_3_to_4(v);

    EXPECT_NEAR(u(0), 0.0, 1e-12);
    EXPECT_NEAR(u(1), 0.0, 1e-12);
    EXPECT_NEAR(u(2), 0.0, 1e-12);
    EXPECT_NEAR(u(TIME_INDEX), 1.0, 1e-12);
}

TEST(LorentzBoost, PreservesMinkowskiMetric) {
    // Λᵀ η Λ = η
    const BoostMatrix b  = lorentz_boost(Velocity3(0.1, 0.7, -0.3));
    const MetricMatrix eta = minkowski_metric();
    EXPECT_TRUE((b.transpose() * eta * b).isApprox(eta, 1e-12));
}

// ─── 3-/4-velocity conversion ─────────────────────────────────────────────────

TEST(VelocityConversion, ThreeToFour_AtRest) {
    const FourVelocity u = velocity_3_to_4(Velocity3::Zero());
    EXPECT_TRUE(u.isApprox(FourVelocity(0.0, 0.0, 0.0, 1.0)));
}

TEST(VelocityConversion, ThreeToFour_ScalesByGamma) {
    const FourVelocity u = velocity_3_to_4(Velocity3(0.6, 0.0, 0.0));
    EXPECT_NEAR(u(0), 0.75, 1e-12);
    EXPECT_NEAR(u(TIME_INDEX), 1.25, 1e-12);
}

TEST(VelocityConversion, FourVelocity_HasUnitMinkowskiNorm) {
    const FourVelocity u = velocity_3_to_4(Velocity3(0.5, -0.5, 0.5));
    EXPECT_NEAR(minkowski_norm2(u), 1.0, 1e-12);
}

TEST(VelocityConversion, RoundTrip) {
    for (const Velocity3& v : {Velocity3(0.0, 0.0, 0.0),
                               Velocity3(0.9, 0.0, 0.0),
                               Velocity3(-0.3, 0.4, 0.5),
                               Velocity3(0.0, 0.0, -0.999999)}) {
        EXPECT_TRUE((velocity_4_to_3(velocity_3_to_4(v)) - v).isZero(1e-12));
    }
}

TEST(TransformVelocity, ComovingVelocity_BecomesZero) {
    const Velocity3 v(0.4, 0.4, 0.4);
    EXPECT_TRUE(transform_3_velocity(lorentz_boost(v), v).isZero(1e-12));
}

// ─── add_velocities ───────────────────────────────────────────────────────────

TEST(AddVelocities, ZeroIsIdentity) {
    const Velocity3 v(0.3, -0.2, 0.7);
    EXPECT_TRUE(add_velocities(v, Velocity3::Zero()).isApprox(v, 1e-12));
    EXPECT_TRUE(add_velocities(Velocity3::Zero(), v).isApprox(v, 1e-12));
}

TEST(AddVelocities, Collinear_MatchesOneDimensionalFormula) {
    // (0.5 + 0.5) / (1 + 0.25) = 0.8
    const Velocity3 w = add_velocities(Velocity3(0.5, 0.0, 0.0), Velocity3(0.5, 0.0, 0.0));
    EXPECT_NEAR(w(0), 0.8, 1e-12);
    EXPECT_NEAR(w(1), 0.0, 1e-12);
    EXPECT_NEAR(w(2), 0.0, 1e-12);
}

TEST(AddVelocities, OppositeEqual_CancelToZero) {
    const Velocity3 v(0.2, 0.6, -0.1);
    EXPECT_TRUE(add_velocities(v, -v).isZero(1e-12));
}

TEST(AddVelocities, NeverReachesLightSpeed) {
    const Velocity3 a(0.99, 0.0, 0.0);
    for (const Velocity3& b : {Velocity3(0.99, 0.0, 0.0),
                               Velocity3(0.0, 0.99, 0.0),
                               Velocity3(0.7, 0.7, 0.0)}) {
        EXPECT_LT(add_velocities(a, b).norm(), 1.0);
    }
}

TEST(AddVelocities, Perpendicular_ComponentIsDilated) {
    // Frame moving at 0.6 x̂, object moving 0.5 ŷ in that frame:
    // w = (0.6, 0.5/γ, 0) with γ = 1.25
    const Velocity3 w = add_velocities(Velocity3(0.6, 0.0, 0.0), Velocity3(0.0, 0.5, 0.0));
    EXPECT_NEAR(w(0), 0.6, 1e-12);
    EXPECT_NEAR(w(1), 0.4, 1e-12);
}

// ─── clamp_speed ──────────────────────────────────────────────────────────────

TEST(ClampSpeed, SlowVelocity_Unchanged) {
    const Velocity3 v(0.1, 0.2, 0.3);
    EXPECT_TRUE((clamp_speed(v) - v).isZero(0.0));
}

TEST(ClampSpeed, Superluminal_ScaledToMaxSpeedKeepingDirection) {
    const Velocity3 c = clamp_speed(Velocity3(3.0, 4.0, 0.0));
    EXPECT_NEAR(c.norm(), MAX_SPEED, 1e-15);
    EXPECT_NEAR(c(0) / c(1), 0.75, 1e-12);
}

TEST(ClampSpeed, CustomBound) {
    EXPECT_NEAR(clamp_speed(Velocity3(0.0, 0.0, -0.9), 0.5)(2), -0.5, 1e-15);
}

// ─── Proper velocity ──────────────────────────────────────────────────────────

TEST(ProperVelocity, ThreeToProper_ScalesByGamma) {
    EXPECT_TRUE(velocity_3_to_proper(Velocity3(0.6, 0.0, 0.0))
                    .isApprox(Vector3(0.75, 0.0, 0.0), 1e-12));
}

TEST(ProperVelocity, ProperToThree_ZeroMapsToZero) {
    const Velocity3 v = velocity_proper_to_3(Vector3::Zero());
    EXPECT_TRUE(v.allFinite());
    EXPECT_TRUE(v.isZero(0.0));
}

TEST(ProperVelocity, HugeProperVelocity_StaysSubluminal) {
    const Velocity3 v = velocity_proper_to_3(Vector3(1e6, 0.0, 0.0));
    EXPECT_LT(v.norm(), 1.0);
    EXPECT_GT(v.norm(), 0.999999);
}

TEST(ProperVelocity, RoundTripThroughFourVelocity) {
    const Vector3 w(2.0, -1.0, 0.5);
    EXPECT_TRUE(velocity_4_to_proper(velocity_proper_to_4(w)).isApprox(w, 1e-12));
}

// ─── Hyperbolic motion ────────────────────────────────────────────────────────

TEST(HyperbolicMotion, ProperTime_AtSinhOne_IsOne) {
    EXPECT_NEAR(const_accel_proper_time(1.0, std::sinh(1.0)), 1.0, 1e-12);
}

TEST(HyperbolicMotion, ProperTime_LessThanCoordinateTime) {
    for (double t : {0.1, 1.0, 10.0}) {
        EXPECT_LT(const_accel_proper_time(0.5, t), t);
    }
}

TEST(HyperbolicMotion, Displacement_KnownValue) {
    // a = 1, t = √3 → (√(1+3) − 1)/1 = 1
    EXPECT_NEAR(const_accel_displacement(1.0, std::sqrt(3.0)), 1.0, 1e-12);
}

TEST(HyperbolicMotion, ZeroAcceleration_Limits) {
    EXPECT_DOUBLE_EQ(const_accel_proper_time(0.0, 4.0), 4.0);
    EXPECT_DOUBLE_EQ(const_accel_displacement(0.0, 4.0), 0.0);
}

// ─── Minkowski metric ─────────────────────────────────────────────────────────

TEST(Minkowski, Signature) {
    const MetricMatrix eta = minkowski_metric();
    EXPECT_DOUBLE_EQ(eta(0, 0), -1.0);
    EXPECT_DOUBLE_EQ(eta(1, 1), -1.0);
    EXPECT_DOUBLE_EQ(eta(2, 2), -1.0);
    EXPECT_DOUBLE_EQ(eta(TIME_INDEX, TIME_INDEX), 1.0);
    EXPECT_DOUBLE_EQ(eta.sum(), -2.0);
}

TEST(Minkowski, LightRay_IsNull) {
    EXPECT_NEAR(minkowski_norm2(FourVector(0.6, 0.8, 0.0, 1.0)), 0.0, 1e-15);
}

TEST(Minkowski, IntervalMatchesMetricMatrix) {
    const FourVector a(1.0, 2.0, 3.0, 4.0);
    const FourVector b(-2.0, 0.5, 1.0, 3.0);
    EXPECT_NEAR(minkowski_interval(a, b), a.dot(minkowski_metric() * b), 1e-12);
}

TEST(Minkowski, IntervalInvariantUnderBoost) {
    const FourVector a(3.0, -1.0, 2.0, 7.0);
    const BoostMatrix b = lorentz_boost(Velocity3(0.5, 0.5, 0.5));
    EXPECT_NEAR(minkowski_norm2(b * a), minkowski_norm2(a), 1e-10);
}
