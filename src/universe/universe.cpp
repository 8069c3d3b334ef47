/// @file src/universe/universe.cpp
/// @brief Universe clock, entity registry and parallel stepping.

#include "relsim/universe.hpp"
#include "relsim/kinematics.hpp"

#include "parallel.hpp"

#include <fmt/core.h>

#include <cmath>

namespace relsim {

// ─── Construction ─────────────────────────────────────────────────────────────

Universe::Universe(UniverseConfig config, Entity user)
    : config_(config)
    , time_(config.start_time)
{
    if (!std::isfinite(config_.reference_time_step)
        || config_.reference_time_step < constants::MIN_TIME_RESOLUTION) {
        config_.reference_time_step = constants::PHYS_TIME_STEP;
    }
    user.worldline.set_reference_time_step(config_.reference_time_step);
    user_id_ = next_id();
    entities_.emplace(user_id_, std::move(user));
}

EntityId Universe::next_id() noexcept {
    return EntityId{next_id_++};
}

// ─── Entity registry ──────────────────────────────────────────────────────────

EntityId Universe::insert_entity(Entity entity) {
    entity.worldline.set_reference_time_step(config_.reference_time_step);
    const EntityId id = next_id();
    entities_.emplace(id, std::move(entity));
    return id;
}

std::optional<Entity> Universe::remove_entity(EntityId id) {
    if (id == user_id_) {
        return std::nullopt;
    }

    auto node = entities_.extract(id);
    if (node.empty()) {
        return std::nullopt;
    }
    return std::move(node.mapped());
}

const Entity* Universe::find_entity(EntityId id) const noexcept {
    const auto it = entities_.find(id);
    return it == entities_.end() ? nullptr : &it->second;
}

Entity* Universe::find_entity(EntityId id) noexcept {
    const auto it = entities_.find(id);
    return it == entities_.end() ? nullptr : &it->second;
}

const Entity& Universe::user_entity() const {
    return entities_.at(user_id_);
}

Entity& Universe::user_entity() {
    return entities_.at(user_id_);
}

WorldlineEvent Universe::user_event_now() const {
    return user_entity().worldline.get_event_at_time(time_);
}

// ─── Universe::step ───────────────────────────────────────────────────────────

void Universe::step(double delta) {
    if (!std::isfinite(delta)) {
        return;
    }

    const double user_gamma = kinematics::lorentz_factor(user_event_now().frame.velocity);

    // A moving user covers more coordinate time per tick of their own clock.
    time_ += delta * user_gamma;

    const double reference_time_step = config_.reference_time_step;
    const double time_resolution     = reference_time_step * user_gamma;

    std::vector<Worldline*> worldlines;
    worldlines.reserve(entities_.size());
    for (auto& [id, entity] : entities_) {
        worldlines.push_back(&entity.worldline);
    }

    const double now = time_;
    detail::parallel_for(worldlines.size(),
                         detail::resolve_worker_count(config_.worker_count),
                         [&worldlines, reference_time_step, time_resolution, now](std::size_t begin,
                                                             std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            worldlines[i]->set_reference_time_step(reference_time_step);
            worldlines[i]->set_time_resolution(time_resolution);
            worldlines[i]->bake_events(now);
        }
    });

    if (config_.verbose) {
        std::size_t event_count = 0;
        for (const Worldline* w : worldlines) event_count += w->size();
        fmt::print(stderr,
                   "[universe] t={:.6f}  gamma_user={:.6f}  resolution={:.3e}  events={}\n",
                   time_, user_gamma, time_resolution, event_count);
    }
}

// ─── Universe::observe_all ────────────────────────────────────────────────────

std::vector<std::pair<EntityId, observation::ApparentState>>
Universe::observe_all(const observation::ObservationConfig& config) const {
    const InertialFrame observer = user_event_now().frame;

    std::vector<std::pair<EntityId, observation::ApparentState>> out;
    out.reserve(entities_.size());
    std::vector<const Worldline*> worldlines;
    worldlines.reserve(entities_.size());
    for (const auto& [id, entity] : entities_) {
        out.emplace_back(id, observation::ApparentState{});
        worldlines.push_back(&entity.worldline);
    }

    const double now = time_;
    detail::parallel_for(out.size(),
                         detail::resolve_worker_count(config_.worker_count),
                         [&](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            out[i].second = observation::observe(*worldlines[i], observer, now, config);
        }
    });

    if (config_.verbose) {
        std::size_t unconverged = 0;
        for (const auto& [id, state] : out) {
            if (!state.converged) ++unconverged;
        }
        if (unconverged > 0) {
            fmt::print(stderr,
                       "[observation] {} of {} retarded-time solves hit the iteration budget\n",
                       unconverged, out.size());
        }
    }
    return out;
}

} // namespace relsim
