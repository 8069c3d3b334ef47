/**
 * @file  fuzz_retarded_time.cpp
 * @brief libFuzzer target for observation::find_retarded_event
 *
 * Build:
 *   cmake -DRELSIM_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_retarded_time
 *
 * Run for 60 seconds:
 *   ./fuzz_retarded_time -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. Always terminates within max_iterations residual evaluations.
 *   2. The reported residual matches the returned event.
 *   3. `converged` is true exactly when |residual| < tolerance.
 *   4. Contraction factors lie in (0, 1].
 *
 * Fuzzer strategy:
 *   Bytes interpreted as:
 *     [4 doubles: target start position x, y, z, t]
 *     [3 doubles: target velocity]
 *     [3 doubles: target proper acceleration]
 *     [4 doubles: observer position]
 *     [3 doubles: observer velocity]
 *     [1 uint8:   max_iterations]
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "relsim/observation.hpp"

using namespace relsim;
using namespace relsim::observation;

static constexpr size_t DOUBLES   = 17;
static constexpr size_t MIN_INPUT = DOUBLES * sizeof(double) + 1;

static double fold(double raw, double bound) {
    if (std::isnan(raw)) return 0.0;
    return std::tanh(raw / bound) * bound;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < MIN_INPUT) return 0;

    double raw[DOUBLES];
    __builtin_memcpy(raw, data, sizeof(raw));
    const int max_iterations = 1 + data[sizeof(raw)] % 40;

    const InertialFrame target_start{
        .position = SpacetimePoint(fold(raw[0], 500.0), fold(raw[1], 500.0),
                                   fold(raw[2], 500.0), fold(raw[3], 50.0)),
        .velocity = Velocity3(fold(raw[4], 0.57), fold(raw[5], 0.57), fold(raw[6], 0.57)),
    };
    const Vector3 accel(fold(raw[7], 2.0), fold(raw[8], 2.0), fold(raw[9], 2.0));

    const double now = fold(raw[13], 50.0);
    const InertialFrame observer{
        .position = SpacetimePoint(fold(raw[10], 500.0), fold(raw[11], 500.0),
                                   fold(raw[12], 500.0), now),
        .velocity = Velocity3(fold(raw[14], 0.57), fold(raw[15], 0.57), fold(raw[16], 0.57)),
    };

    Worldline target(target_start);
    target.insert_event(target_start.position(TIME_INDEX), Acceleration{accel});
    // Bound the cost of any query to one bake interval of RK4 steps.
    target.bake_events(now);

    const ObservationConfig config{.max_iterations = max_iterations};
    const RetardedEvent r = find_retarded_event(target, observer, now, config);

    assert(r.iterations >= 1 && r.iterations <= max_iterations);
    if (std::isfinite(r.residual)) {
        const double distance =
            (r.event.frame.position.head<3>() - observer.position.head<3>()).norm();
        assert(std::abs(r.residual - ((now - r.event.time()) - distance)) < 1e-9);
        assert(r.converged == (std::abs(r.residual) < config.tolerance));
    } else {
        assert(!r.converged);
    }

    const ApparentState s = observe(target, observer, now, config);
    for (int axis = 0; axis < 3; ++axis) {
        if (std::isfinite(s.contraction(axis))) {
            assert(s.contraction(axis) > 0.0 && s.contraction(axis) <= 1.0 + 1e-12);
        }
    }

    return 0;
}
