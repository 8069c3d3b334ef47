/// @file src/main.cpp
/// @brief relsim CLI entry point: headless relativistic flight sandbox.
///
/// Usage:
///   relsim [--grid R] [--ticks N] [--accel x,y,z] [--verbose]
///   relsim --help

#include "relsim/constants.hpp"
#include "relsim/kinematics.hpp"
#include "relsim/pilot.hpp"
#include "relsim/universe.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

struct SandboxArgs {
    int             grid_radius = 5;
    long            ticks       = 2400;
    relsim::Vector3 accel       = relsim::Vector3(0.25, 0.0, 0.0);
    bool            verbose     = false;
    bool            help        = false;
};

/// Spacing between neighbouring lattice entities.
constexpr double LATTICE_SPACING = 50.0;

/// Clock value the sandbox starts at, so light from the lattice has history.
constexpr double SANDBOX_START_TIME = 1000.0;

/// Number of nearest entities reported at the end of the run.
constexpr std::size_t REPORTED_ENTITIES = 5;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  relsim [--grid R] [--ticks N] [--accel x,y,z] [--verbose]\n"
        "  relsim --help\n"
        "\n"
        "  --grid R        lattice of (2R)^3 stationary entities (default 5)\n"
        "  --ticks N       physics ticks of 1/240 s to simulate (default 2400)\n"
        "  --accel x,y,z   user proper acceleration, c/s (default 0.25,0,0)\n"
        "  --verbose       per-tick diagnostics on stderr\n"
    );
}

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<relsim::Vector3> parse_vector(std::string_view text) {
    relsim::Vector3 out;
    for (int i = 0; i < 3; ++i) {
        const auto comma = text.find(',');
        const bool last  = (i == 2);
        if (last != (comma == std::string_view::npos)) {
            return std::nullopt;
        }
        const auto component = parse_number<double>(text.substr(0, comma));
        if (!component) {
            return std::nullopt;
        }
        out(i) = *component;
        if (!last) text.remove_prefix(comma + 1);
    }
    return out;
}

std::optional<SandboxArgs> parse_args(int argc, char* argv[]) {
    SandboxArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        const bool has_value = (i + 1 < argc);

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--grid" && has_value) {
            auto r = parse_number<int>(argv[++i]);
            if (!r || *r < 0) return std::nullopt;
            args.grid_radius = *r;
        } else if (arg == "--ticks" && has_value) {
            auto n = parse_number<long>(argv[++i]);
            if (!n || *n < 0) return std::nullopt;
            args.ticks = *n;
        } else if (arg == "--accel" && has_value) {
            auto a = parse_vector(argv[++i]);
            if (!a) return std::nullopt;
            args.accel = *a;
        } else {
            fmt::print(stderr, "Unknown or incomplete option: {}\n", arg);
            return std::nullopt;
        }
    }
    return args;
}

/// Stationary entities on a cubic lattice centred on the origin.
void populate_lattice(relsim::Universe& universe, int radius) {
    for (int x = -radius; x < radius; ++x) {
        for (int y = -radius; y < radius; ++y) {
            for (int z = -radius; z < radius; ++z) {
                relsim::InertialFrame start;
                start.position << x * LATTICE_SPACING, y * LATTICE_SPACING,
                                  z * LATTICE_SPACING, 0.0;

                relsim::Entity entity;
                entity.worldline    = relsim::Worldline(start);
                entity.model        = "subdivided_cube";
                entity.model_matrix = Eigen::Matrix4f::Identity() * 5.0f;
                entity.model_matrix(3, 3) = 1.0f;
                universe.insert_entity(std::move(entity));
            }
        }
    }
}

void print_user_state(const relsim::Universe& universe) {
    const auto event = universe.user_event_now();
    const auto& pos  = event.frame.position;
    const auto& vel  = event.frame.velocity;

    fmt::print(
        "Time: {:.3f}  (proper {:.3f})\n"
        "Displacement: {:.3f}, {:.3f}, {:.3f} ({:.3f}cs from origin)\n"
        "Velocity: {:.6f}c ({:.6f}, {:.6f}, {:.6f})\n"
        "Lorentz factor: {:.6f}\n",
        universe.time(), event.proper_time,
        pos(0), pos(1), pos(2), pos.head<3>().norm(),
        vel.norm(), vel(0), vel(1), vel(2),
        relsim::kinematics::lorentz_factor(vel));
}

void print_apparent_neighbours(const relsim::Universe& universe) {
    auto views = universe.observe_all();

    // Drop the user; sort the rest by apparent distance.
    std::erase_if(views, [&](const auto& v) { return v.first == universe.user_entity_id(); });
    std::sort(views.begin(), views.end(), [](const auto& a, const auto& b) {
        return a.second.relative_frame.position.template head<3>().norm()
             < b.second.relative_frame.position.template head<3>().norm();
    });

    const std::size_t shown = std::min(views.size(), REPORTED_ENTITIES);
    fmt::print("Nearest {} apparent entities (light-delayed, user rest frame):\n", shown);
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& [id, state] = views[i];
        const auto& p = state.relative_frame.position;
        fmt::print("  #{:<5d} at ({:9.3f}, {:9.3f}, {:9.3f})  emitted t={:.3f}  "
                   "contraction=({:.4f}, {:.4f}, {:.4f}){}\n",
                   id.value, p(0), p(1), p(2), state.emission.time(),
                   state.contraction(0), state.contraction(1), state.contraction(2),
                   state.converged ? "" : "  [unconverged]");
    }
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }
    if (args->help) {
        print_usage();
        return 0;
    }

    relsim::UniverseConfig config;
    config.start_time = SANDBOX_START_TIME;
    config.verbose    = args->verbose;

    // The user's clock starts with the sandbox, not at t = 0.
    relsim::InertialFrame user_start;
    user_start.position(relsim::TIME_INDEX) = SANDBOX_START_TIME;
    relsim::Entity user;
    user.worldline = relsim::Worldline(user_start);

    relsim::Universe universe(config, std::move(user));
    populate_lattice(universe, args->grid_radius);

    fmt::print("Universe: {} entities, start t={:.1f}, {} ticks at {:.6f}s\n",
               universe.size(), universe.time(), args->ticks,
               relsim::constants::PHYS_TIME_STEP);

    for (long tick = 0; tick < args->ticks; ++tick) {
        relsim::pilot::command_user_acceleration(universe, args->accel);
        universe.step(relsim::constants::PHYS_TIME_STEP);
    }

    print_user_state(universe);
    fmt::print("User worldline events: {}\n", universe.user_entity().worldline.size());
    print_apparent_neighbours(universe);
    return 0;
}
