/// @file src/universe/pilot.cpp
/// @brief Thrust-change detection for the user entity.

#include "relsim/pilot.hpp"

#include <variant>

namespace relsim::pilot {

bool command_user_acceleration(Universe& universe, const Vector3& proper_accel) {
    const WorldlineEventKind active = universe.user_event_now().kind;

    Vector3 active_accel = Vector3::Zero();
    if (const auto* accel = std::get_if<Acceleration>(&active)) {
        active_accel = accel->proper_acceleration;
    }

    if (active_accel.cwiseEqual(proper_accel).all()) {
        return false;
    }

    WorldlineEventKind command = Inertial{};
    if (!proper_accel.isZero(0.0)) {
        command = Acceleration{proper_accel};
    }

    universe.user_entity().worldline.insert_event(universe.time(), command);
    return true;
}

} // namespace relsim::pilot
