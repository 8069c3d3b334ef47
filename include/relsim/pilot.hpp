#pragma once

/// @file include/relsim/pilot.hpp
/// @brief Turn a per-tick thrust input into worldline commands.
///
/// Input devices report the commanded proper acceleration every tick. Only
/// changes become worldline events, so holding a key does not flood the
/// user's worldline with identical commands.

#include "relsim/types.hpp"
#include "relsim/universe.hpp"

namespace relsim::pilot {

/// Command the user entity to feel `proper_accel` from `universe.time()` on.
///
/// A zero vector commands inertial motion. The command is dropped when it
/// matches the currently active one (an inertial segment counts as zero).
///
/// # Returns
/// `true` if an event was inserted on the user's worldline.
bool command_user_acceleration(Universe& universe, const Vector3& proper_accel);

} // namespace relsim::pilot
