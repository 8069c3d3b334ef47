#pragma once
/**
 * @file  worldline.hpp
 * @brief Editable keyframe timeline describing an entity's whole motion.
 *
 * Module:  src/worldline/
 *
 * Responsibility
 * --------------
 * A Worldline is an ordered list of WorldlineEvents, strictly increasing in
 * coordinate time. Each event's kind is the law of motion from that event
 * until the next one (or forever, for the last event):
 *
 *   • before the first event   → inertial extrapolation backwards in time
 *   • at or after an event     → extrapolation from the latest such event,
 *                                using that event's kind
 *
 * Commands (`insert_event`) overwrite the future: every stored event at or
 * after the command time is dropped. Baking (`bake_events`) lays down
 * checkpoints of the same kind along an open-ended acceleration so a query
 * never integrates more than one bake interval of RK4 steps.
 *
 * Invariants
 * ----------
 *   • The event list is never empty.
 *   • Event times are strictly increasing.
 *   • Baking never changes the trajectory, only the cost of querying it.
 *
 * Thread safety
 * -------------
 * `get_event_at_time` is const and may run concurrently with other readers.
 * `insert_event` / `bake_events` require exclusive access.
 */

#include "relsim/constants.hpp"
#include "relsim/inertial_frame.hpp"
#include "relsim/types.hpp"

#include <cstddef>
#include <span>
#include <variant>
#include <vector>

namespace relsim {

// ── WorldlineEventKind ────────────────────────────────────────────────────────

/// Constant velocity.
struct Inertial {
    friend bool operator==(const Inertial&, const Inertial&) noexcept { return true; }
};

/// Constant proper acceleration, as felt by the entity.
struct Acceleration {
    Vector3 proper_acceleration = Vector3::Zero();

    friend bool operator==(const Acceleration& a, const Acceleration& b) noexcept {
        return a.proper_acceleration.cwiseEqual(b.proper_acceleration).all();
    }
};

using WorldlineEventKind = std::variant<Inertial, Acceleration>;

[[nodiscard]] inline bool is_inertial(const WorldlineEventKind& kind) noexcept {
    return std::holds_alternative<Inertial>(kind);
}

// ── WorldlineEvent ────────────────────────────────────────────────────────────

/**
 * @brief A keyframe: the entity's frame and clock at one coordinate time,
 *        plus the law of motion that applies from here on.
 */
struct WorldlineEvent {
    InertialFrame      frame{};
    double             proper_time{0.0};  ///< Entity clock since its epoch
    WorldlineEventKind kind{Inertial{}};

    /// Coordinate time of this event.
    [[nodiscard]] double time() const noexcept { return frame.position(TIME_INDEX); }

    /**
     * @brief Extrapolate this event by `coord_time_offset` using its kind.
     *
     * Inertial: closed form, any sign of offset. Acceleration: fixed RK4
     * steps of `time_resolution`, the last one shortened to land exactly on
     * the offset. At most `MAX_SEGMENT_STEPS` steps are taken; longer
     * offsets use a proportionally wider step. A non-positive or non-finite
     * offset on an acceleration segment returns this event unchanged.
     */
    [[nodiscard]] WorldlineEvent at_offset(double coord_time_offset,
                                           double time_resolution) const noexcept;
};

// ── WorldlineConfig ───────────────────────────────────────────────────────────

struct WorldlineConfig {
    /// Maximum coordinate-time step when integrating acceleration segments.
    double time_resolution = constants::PHYS_TIME_STEP;

    /// Resolution at which `bake_interval` applies unscaled.
    double reference_time_step = constants::PHYS_TIME_STEP;

    /// Coordinate time between baked checkpoints at the reference resolution.
    double bake_interval = constants::EVENT_BAKE_INTERVAL;
};

// ── Worldline ─────────────────────────────────────────────────────────────────

class Worldline {
public:
    /// Seed the worldline with one inertial event at `start_frame`,
    /// proper time zero.
    explicit Worldline(const InertialFrame& start_frame = InertialFrame{},
                       WorldlineConfig config = WorldlineConfig{}) noexcept;

    /// State of the entity at coordinate time `coord_time`.
    [[nodiscard]] WorldlineEvent get_event_at_time(double coord_time) const noexcept;

    /**
     * @brief Command a new law of motion from `coord_time` onwards.
     *
     * 1. Bake any open-ended acceleration up to `coord_time`.
     * 2. Compute the state at `coord_time`.
     * 3. Drop every event at or after `coord_time`.
     * 4. Append the state with the requested `kind`.
     *
     * Non-finite times are ignored.
     */
    void insert_event(double coord_time, const WorldlineEventKind& kind) noexcept;

    /**
     * @brief Lay down same-kind checkpoints from the last event up to
     *        `coord_time`.
     *
     * No-op when `coord_time` is not past the last event or when the last
     * event is inertial. Checkpoints are spaced
     * bake_interval · time_resolution / reference_time_step apart.
     */
    void bake_events(double coord_time) noexcept;

    [[nodiscard]] std::span<const WorldlineEvent> events() const noexcept { return events_; }
    [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }
    [[nodiscard]] const WorldlineEvent& front() const noexcept { return events_.front(); }
    [[nodiscard]] const WorldlineEvent& back() const noexcept { return events_.back(); }

    [[nodiscard]] double time_resolution() const noexcept { return config_.time_resolution; }

    /// Coordinate time between baked checkpoints.
    [[nodiscard]] double bake_spacing() const noexcept;

    /// Set the integration step. Clamped to at least MIN_TIME_RESOLUTION;
    /// non-positive or non-finite values are ignored.
    void set_time_resolution(double time_resolution) noexcept;

    /// Set the resolution at which `bake_interval` applies unscaled.
    /// Same clamping as `set_time_resolution`.
    void set_reference_time_step(double reference_time_step) noexcept;

    [[nodiscard]] const WorldlineConfig& config() const noexcept { return config_; }

private:
    /// Index of the first event with time ≥ `coord_time` (events_.size() if
    /// none).
    [[nodiscard]] std::size_t first_index_at_or_after(double coord_time) const noexcept;

    /// Index of the first event with time > `coord_time`.
    [[nodiscard]] std::size_t first_index_after(double coord_time) const noexcept;

    /// Steps 2–4 of `insert_event`, without baking.
    void append_event(double coord_time, const WorldlineEventKind& kind) noexcept;

    std::vector<WorldlineEvent> events_;
    WorldlineConfig             config_;
};

} // namespace relsim
