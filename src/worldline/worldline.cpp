/**
 * @file  worldline.cpp
 * @brief Worldline keyframe queries, command insertion and baking.
 *
 * See worldline.hpp for the full module contract.
 */

#include "relsim/worldline.hpp"
#include "relsim/kinematics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace relsim {

namespace {

[[nodiscard]] double sanitize_step(double value, double fallback) noexcept {
    if (!std::isfinite(value) || value <= 0.0) return fallback;
    return std::max(value, constants::MIN_TIME_RESOLUTION);
}

} // namespace

// ── WorldlineEvent ────────────────────────────────────────────────────────────

WorldlineEvent WorldlineEvent::at_offset(double coord_time_offset,
                                         double time_resolution) const noexcept {
    if (const auto* accel = std::get_if<Acceleration>(&kind)) {
        if (!std::isfinite(coord_time_offset) || coord_time_offset <= 0.0) {
            return *this;
        }

        double resolution = sanitize_step(time_resolution, constants::PHYS_TIME_STEP);

        // Very long unbaked segments are integrated in at most
        // MAX_SEGMENT_STEPS equal steps; this also keeps the step count
        // representable.
        const double max_steps = static_cast<double>(constants::MAX_SEGMENT_STEPS);
        if (coord_time_offset / resolution > max_steps) {
            resolution = coord_time_offset / max_steps;
        }

        InertialFrame frame_out = frame;
        double        tau       = proper_time;

        // Whole steps of `resolution`, then one remainder step.
        const auto whole_steps =
            static_cast<std::uint64_t>(coord_time_offset / resolution);
        for (std::uint64_t i = 0; i < whole_steps; ++i) {
            tau += frame_out.step(resolution, accel->proper_acceleration);
        }

        const double remainder =
            coord_time_offset - static_cast<double>(whole_steps) * resolution;
        if (remainder > 0.0) {
            tau += frame_out.step(remainder, accel->proper_acceleration);
        }

        // Land exactly on the requested time regardless of summation error.
        frame_out.position(TIME_INDEX) = time() + coord_time_offset;

        return WorldlineEvent{frame_out, tau, kind};
    }

    return WorldlineEvent{
        .frame       = frame.predict(coord_time_offset),
        .proper_time = proper_time
                     + coord_time_offset / kinematics::lorentz_factor(frame.velocity),
        .kind        = kind,
    };
}

// ── Worldline ─────────────────────────────────────────────────────────────────

Worldline::Worldline(const InertialFrame& start_frame, WorldlineConfig config) noexcept
    : config_(config) {
    config_.time_resolution =
        sanitize_step(config_.time_resolution, constants::PHYS_TIME_STEP);
    config_.reference_time_step =
        sanitize_step(config_.reference_time_step, constants::PHYS_TIME_STEP);
    config_.bake_interval =
        sanitize_step(config_.bake_interval, constants::EVENT_BAKE_INTERVAL);

    InertialFrame seed = start_frame;
    seed.velocity = kinematics::clamp_speed(seed.velocity);

    events_.push_back(WorldlineEvent{seed, 0.0, Inertial{}});
}

std::size_t Worldline::first_index_at_or_after(double coord_time) const noexcept {
    const auto it = std::partition_point(
        events_.begin(), events_.end(),
        [coord_time](const WorldlineEvent& e) { return e.time() < coord_time; });
    return static_cast<std::size_t>(it - events_.begin());
}

std::size_t Worldline::first_index_after(double coord_time) const noexcept {
    const auto it = std::partition_point(
        events_.begin(), events_.end(),
        [coord_time](const WorldlineEvent& e) { return e.time() <= coord_time; });
    return static_cast<std::size_t>(it - events_.begin());
}

WorldlineEvent Worldline::get_event_at_time(double coord_time) const noexcept {
    const std::size_t after = first_index_after(coord_time);

    WorldlineEvent event;
    if (after == 0) {
        // Before the first event the entity is assumed to have been moving
        // uniformly forever.
        WorldlineEvent first = events_.front();
        first.kind = Inertial{};
        event = first.at_offset(coord_time - first.time(), config_.time_resolution);
    } else {
        const WorldlineEvent& governing = events_[after - 1];
        event = governing.at_offset(coord_time - governing.time(), config_.time_resolution);
    }

    // t0 + (t − t0) can round away from t.
    if (std::isfinite(coord_time)) {
        event.frame.position(TIME_INDEX) = coord_time;
    }
    return event;
}

void Worldline::insert_event(double coord_time, const WorldlineEventKind& kind) noexcept {
    if (!std::isfinite(coord_time)) return;

    bake_events(coord_time);
    append_event(coord_time, kind);
}

void Worldline::append_event(double coord_time, const WorldlineEventKind& kind) noexcept {
    // Resolve the state before truncating so the list is never empty, even
    // when the command lands at or before the first event.
    WorldlineEvent event = get_event_at_time(coord_time);
    event.kind = kind;

    const auto first_dropped =
        static_cast<std::ptrdiff_t>(first_index_at_or_after(coord_time));
    events_.erase(events_.begin() + first_dropped, events_.end());
    events_.push_back(event);
}

void Worldline::bake_events(double coord_time) noexcept {
    if (!std::isfinite(coord_time)) return;

    const WorldlineEvent& last = events_.back();
    if (last.time() >= coord_time) {
        // Already inside a defined bracket.
        return;
    }
    if (is_inertial(last.kind)) {
        // Linear motion extrapolates in closed form.
        return;
    }

    const WorldlineEventKind kind    = last.kind;
    const double             spacing = bake_spacing();

    for (double bake_time = events_.back().time() + spacing;
         bake_time < coord_time;
         bake_time = events_.back().time() + spacing) {
        // Spacing below the precision of the event time would re-append the
        // same checkpoint forever.
        if (bake_time <= events_.back().time()) break;
        append_event(bake_time, kind);
    }
}

void Worldline::set_time_resolution(double time_resolution) noexcept {
    config_.time_resolution = sanitize_step(time_resolution, config_.time_resolution);
}

void Worldline::set_reference_time_step(double reference_time_step) noexcept {
    config_.reference_time_step =
        sanitize_step(reference_time_step, config_.reference_time_step);
}

double Worldline::bake_spacing() const noexcept {
    return std::max(config_.bake_interval * config_.time_resolution
                        / config_.reference_time_step,
                    constants::MIN_TIME_RESOLUTION);
}

} // namespace relsim
