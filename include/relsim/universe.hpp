#pragma once

/// @file include/relsim/universe.hpp
/// @brief Multi-entity spacetime with one shared simulation clock.
///
/// # Module: Universe
///
/// ## Responsibility
/// Own every entity's worldline, a designated "user" entity, and the
/// authoritative clock: the coordinate time of the user's own "now".
///
/// ## Stepping
/// `step(delta)` advances the clock by `delta · γ_user`, so a fixed
/// wall-clock tick always lasts the same amount of the user's proper time.
/// Every entity then gets `time_resolution = reference_time_step · γ_user`
/// and bakes its worldline up to the new clock. Entities are independent, so
/// baking is split across worker threads, one contiguous block of entities
/// per worker.
///
/// ## Concurrency Contract
/// - `step` and any `insert_event` on an entity's worldline are mutating and
///   must not overlap each other or any reader
/// - `user_event_now`, `observe_all` and worldline queries are const and may
///   run concurrently with each other
///
/// ## Guarantees
/// - The user entity always exists and cannot be removed
/// - Entity identifiers are unique for the lifetime of the universe

#include "relsim/constants.hpp"
#include "relsim/observation.hpp"
#include "relsim/types.hpp"
#include "relsim/worldline.hpp"

#include <Eigen/Dense>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace relsim {

// ─── EntityId ─────────────────────────────────────────────────────────────────

struct EntityId {
    std::uint64_t value{0};

    friend auto operator<=>(const EntityId&, const EntityId&) = default;
};

// ─── Entity ───────────────────────────────────────────────────────────────────

/// One simulated point entity. Only `worldline` takes part in the physics;
/// the rest is carried for the renderer.
struct Entity {
    Worldline                  worldline{};
    std::optional<std::string> model{};
    Eigen::Matrix4f            model_matrix = Eigen::Matrix4f::Identity();
    Eigen::Vector4f            color        = Eigen::Vector4f::Ones();
};

// ─── UniverseConfig ───────────────────────────────────────────────────────────

struct UniverseConfig {
    /// Initial value of the shared clock.
    double start_time = 0.0;

    /// Integration step for an entity observed by a user at rest.
    double reference_time_step = constants::PHYS_TIME_STEP;

    /// Threads used by `step` and `observe_all`. 0 = hardware concurrency.
    unsigned worker_count = 0;

    /// If true, emit per-step diagnostics to stderr.
    bool verbose = false;
};

// ─── Universe ─────────────────────────────────────────────────────────────────

class Universe {
public:
    /// Create a universe containing only `user`.
    explicit Universe(UniverseConfig config = UniverseConfig{}, Entity user = Entity{});

    /// Add an entity and return its new identifier.
    EntityId insert_entity(Entity entity);

    /// Remove and return an entity.
    ///
    /// # Returns
    /// - `nullopt` if `id` is unknown or names the user entity
    std::optional<Entity> remove_entity(EntityId id);

    /// Look up an entity. Returns nullptr if `id` is unknown.
    [[nodiscard]] const Entity* find_entity(EntityId id) const noexcept;
    [[nodiscard]] Entity*       find_entity(EntityId id) noexcept;

    [[nodiscard]] const Entity& user_entity() const;
    [[nodiscard]] Entity&       user_entity();

    /// The user's worldline event at the current clock.
    [[nodiscard]] WorldlineEvent user_event_now() const;

    /// Advance the clock by one wall-clock tick `delta` and bake every
    /// worldline up to the new time. Non-finite deltas are ignored.
    void step(double delta);

    /// Light-delayed view of every entity (the user included) from the
    /// user's frame at the current clock. Ordered by entity id.
    [[nodiscard]] std::vector<std::pair<EntityId, observation::ApparentState>>
    observe_all(const observation::ObservationConfig& config =
                    observation::ObservationConfig{}) const;

    [[nodiscard]] double   time() const noexcept { return time_; }
    [[nodiscard]] EntityId user_entity_id() const noexcept { return user_id_; }
    [[nodiscard]] std::size_t size() const noexcept { return entities_.size(); }

    [[nodiscard]] const std::map<EntityId, Entity>& entities() const noexcept {
        return entities_;
    }

    [[nodiscard]] const UniverseConfig& config() const noexcept { return config_; }

private:
    EntityId next_id() noexcept;

    UniverseConfig             config_;
    std::map<EntityId, Entity> entities_;
    EntityId                   user_id_{};
    double                     time_{0.0};
    std::uint64_t              next_id_{1};
};

} // namespace relsim
