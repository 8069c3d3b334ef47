/**
 * @file  fuzz_worldline.cpp
 * @brief libFuzzer target for Worldline command/bake/query sequences
 *
 * Build:
 *   cmake -DRELSIM_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_worldline
 *
 * Run for 60 seconds:
 *   ./fuzz_worldline -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. The event list is never empty.
 *   2. Event times stay strictly increasing.
 *   3. Every stored velocity satisfies |v| ≤ MAX_SPEED.
 *   4. Queries at finite times inside the fuzzed window return finite state.
 *
 * Fuzzer strategy:
 *   Bytes are consumed as a sequence of 33-byte records:
 *     [1 byte: opcode]  0 insert Inertial, 1 insert Acceleration,
 *                       2 bake, 3 query, 4 set resolution
 *     [1 double: time]
 *     [3 doubles: acceleration]
 *   Raw doubles are folded into bounded ranges so one input cannot ask for
 *   billions of RK4 steps.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "relsim/constants.hpp"
#include "relsim/worldline.hpp"

using namespace relsim;

static constexpr size_t RECORD_BYTES = 1 + 4 * sizeof(double);
static constexpr size_t MAX_RECORDS  = 64;

/// Fold an arbitrary double into [−bound, bound]; NaN maps to 0.
static double fold(double raw, double bound) {
    if (std::isnan(raw)) return 0.0;
    return std::tanh(raw / bound) * bound;
}

static void check_invariants(const Worldline& wl) {
    assert(wl.size() > 0);
    const auto events = wl.events();
    for (std::size_t i = 0; i < events.size(); ++i) {
        assert(events[i].frame.velocity.norm() <= constants::MAX_SPEED * (1.0 + 1e-12));
        if (i > 0) assert(events[i - 1].time() < events[i].time());
    }
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    Worldline wl;

    const size_t records = std::min(size / RECORD_BYTES, MAX_RECORDS);
    for (size_t r = 0; r < records; ++r) {
        const uint8_t* ptr = data + r * RECORD_BYTES;

        const uint8_t opcode = ptr[0] % 5;
        double raw[4];
        __builtin_memcpy(raw, ptr + 1, sizeof(raw));

        const double  t = fold(raw[0], 20.0);
        const Vector3 a(fold(raw[1], 1e3), fold(raw[2], 1e3), fold(raw[3], 1e3));

        switch (opcode) {
            case 0: wl.insert_event(t, Inertial{}); break;
            case 1: wl.insert_event(t, Acceleration{a}); break;
            case 2: wl.bake_events(t); break;
            case 3: {
                const WorldlineEvent e = wl.get_event_at_time(t);
                assert(e.frame.position.allFinite());
                assert(e.frame.velocity.allFinite());
                assert(std::isfinite(e.proper_time));
                assert(e.frame.velocity.norm() <= constants::MAX_SPEED * (1.0 + 1e-12));
                break;
            }
            default:
                // Resolution within [1/1024, 1/16].
                wl.set_time_resolution(std::ldexp(1.0, -4 - static_cast<int>(ptr[1] % 7)));
                break;
        }
        check_invariants(wl);
    }

    return 0;
}
