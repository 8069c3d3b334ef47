/**
 * @file  bench/bench_worldline.cpp
 * @brief Google Benchmark suite for the relsim physics core.
 *
 * Module:  bench/
 *
 * Benchmarks
 * ----------
 *   BM_LorentzBoost                 : 4×4 boost construction
 *   BM_FrameStep                    : one RK4 step under proper acceleration
 *   BM_WorldlineQuery_Unbaked       : query cost grows with distance to event
 *   BM_WorldlineQuery_Baked         : query cost bounded by the bake interval
 *   BM_UniverseStep                 : one tick over N accelerating entities
 *   BM_RetardedTime                 : secant solve against a moving target
 *
 * Build (CMake):
 *   cmake -DRELSIM_BENCH=ON ..
 *   cmake --build build --target bench_worldline
 *   ./build/bench_worldline --benchmark_format=json
 *
 * Throughput units: items/second (queries, steps or entities processed).
 */

#include "benchmark/benchmark.h"

#include "relsim/constants.hpp"
#include "relsim/inertial_frame.hpp"
#include "relsim/kinematics.hpp"
#include "relsim/observation.hpp"
#include "relsim/universe.hpp"
#include "relsim/worldline.hpp"

#include <cstdint>
#include <utility>

// ── Fixture helpers ────────────────────────────────────────────────────────────

static relsim::Worldline make_accelerating(const relsim::Vector3& accel) {
    relsim::Worldline wl;
    wl.insert_event(0.0, relsim::Acceleration{accel});
    return wl;
}

// ── Kinematics ─────────────────────────────────────────────────────────────────

static void BM_LorentzBoost(benchmark::State& state) {
    relsim::Velocity3 v(0.3, -0.4, 0.5);
    for (auto _ : state) {
        benchmark::DoNotOptimize(v);
        auto boost = relsim::kinematics::lorentz_boost(v);
        benchmark::DoNotOptimize(boost);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_LorentzBoost);

static void BM_FrameStep(benchmark::State& state) {
    relsim::InertialFrame frame{};
    const relsim::Vector3 accel(0.1, 0.2, -0.3);
    for (auto _ : state) {
        double tau = frame.step(relsim::constants::PHYS_TIME_STEP, accel);
        benchmark::DoNotOptimize(tau);
        // Keep the speed bounded away from the clamp.
        if (frame.velocity.squaredNorm() > 0.81) frame.velocity.setZero();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_FrameStep);

// ── Worldline queries ──────────────────────────────────────────────────────────

static void BM_WorldlineQuery_Unbaked(benchmark::State& state) {
    const double horizon = static_cast<double>(state.range(0));
    const auto wl = make_accelerating(relsim::Vector3(0.5, 0.0, 0.0));
    for (auto _ : state) {
        auto e = wl.get_event_at_time(horizon - 0.5);
        benchmark::DoNotOptimize(e);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_WorldlineQuery_Unbaked)->RangeMultiplier(4)->Range(1, 64)
    ->Unit(benchmark::kMicrosecond);

static void BM_WorldlineQuery_Baked(benchmark::State& state) {
    const double horizon = static_cast<double>(state.range(0));
    auto wl = make_accelerating(relsim::Vector3(0.5, 0.0, 0.0));
    wl.bake_events(horizon);
    for (auto _ : state) {
        auto e = wl.get_event_at_time(horizon - 0.5);
        benchmark::DoNotOptimize(e);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
    state.counters["events"] = static_cast<double>(wl.size());
}
BENCHMARK(BM_WorldlineQuery_Baked)->RangeMultiplier(4)->Range(1, 64)
    ->Unit(benchmark::kMicrosecond);

// ── Universe ───────────────────────────────────────────────────────────────────

static void BM_UniverseStep(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    relsim::Universe universe(relsim::UniverseConfig{.worker_count = 0});
    for (std::size_t i = 0; i < n; ++i) {
        relsim::Entity e{};
        e.worldline = make_accelerating(relsim::Vector3(0.0, 0.01 * static_cast<double>(i % 7), 0.1));
        universe.insert_entity(std::move(e));
    }
    for (auto _ : state) {
        universe.step(relsim::constants::PHYS_TIME_STEP);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_UniverseStep)->RangeMultiplier(4)->Range(16, 4096)
    ->Unit(benchmark::kMicrosecond);

// ── Observation ────────────────────────────────────────────────────────────────

static void BM_RetardedTime(benchmark::State& state) {
    relsim::Worldline target(relsim::InertialFrame{
        .position = relsim::SpacetimePoint(200.0, 50.0, 0.0, 0.0),
        .velocity = relsim::Velocity3(-0.3, 0.0, 0.1)});
    target.insert_event(10.0, relsim::Acceleration{relsim::Vector3(0.0, 0.2, 0.0)});
    target.bake_events(300.0);

    const relsim::InertialFrame observer{
        .position = relsim::SpacetimePoint(0.0, 0.0, 0.0, 300.0)};

    int64_t iterations = 0;
    for (auto _ : state) {
        auto r = relsim::observation::find_retarded_event(target, observer, 300.0);
        iterations += r.iterations;
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
    state.counters["secant_iters"] = benchmark::Counter(
        static_cast<double>(iterations), benchmark::Counter::kAvgIterations);
}
BENCHMARK(BM_RetardedTime)->Unit(benchmark::kMicrosecond);
