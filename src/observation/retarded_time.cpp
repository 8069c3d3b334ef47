/**
 * @file  retarded_time.cpp
 * @brief Secant solver for the light-delayed emission event.
 *
 * See observation.hpp for the full module contract.
 */

#include "relsim/observation.hpp"
#include "relsim/kinematics.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace relsim::observation {

namespace {

/// (now − t_e) − |x_e − x_obs|: positive when the emission guess is too old.
double light_delay_residual(const WorldlineEvent& event,
                            const InertialFrame&  observer,
                            double                now) noexcept {
    const double travel_time =
        (event.frame.position.head<3>() - observer.position.head<3>()).norm()
        / constants::SPEED_OF_LIGHT;
    const double timeline_delay = now - event.time();
    return timeline_delay - travel_time;
}

} // namespace

RetardedEvent find_retarded_event(const Worldline&         worldline,
                                  const InertialFrame&     observer,
                                  double                   now,
                                  const ObservationConfig& config) noexcept {
    RetardedEvent result{};
    result.event = worldline.get_event_at_time(now);

    std::optional<double> prev_offset;
    std::optional<double> prev_change;

    const int max_iterations = std::max(config.max_iterations, 1);

    for (int i = 0; i < max_iterations; ++i) {
        const double offset = light_delay_residual(result.event, observer, now);
        result.residual   = offset;
        result.iterations = i + 1;

        if (!std::isfinite(offset)) break;

        if (std::abs(offset) < config.tolerance) {
            result.converged = true;
            return result;
        }

        // Slope of −offset with respect to the emission time.
        double derivative = 0.0;
        if (prev_offset && prev_change && *prev_change != 0.0) {
            derivative = (*prev_offset - offset) / *prev_change;
        }
        if (derivative == 0.0 || !std::isfinite(derivative)) {
            const InertialFrame relative = result.event.frame.relative_to(observer);
            derivative = kinematics::lorentz_factor(relative.velocity);
        }

        const double change = offset / derivative;
        if (!std::isfinite(change)) break;

        prev_offset = offset;
        prev_change = change;

        result.event = worldline.get_event_at_time(result.event.time() + change);
    }

    // Budget exhausted: report the residual of the estimate actually returned.
    result.residual  = light_delay_residual(result.event, observer, now);
    result.converged = std::abs(result.residual) < config.tolerance;
    return result;
}

ApparentState observe(const Worldline&         worldline,
                      const InertialFrame&     observer,
                      double                   now,
                      const ObservationConfig& config) noexcept {
    const RetardedEvent retarded = find_retarded_event(worldline, observer, now, config);

    ApparentState state{};
    state.emission       = retarded.event;
    state.relative_frame = retarded.event.frame.relative_to(observer);
    state.converged      = retarded.converged;

    // Unit length along each axis of the target shrinks by the diagonal of
    // the boost into the observer's view of it.
    const BoostMatrix boost = kinematics::lorentz_boost(state.relative_frame.velocity);
    for (int axis = 0; axis < 3; ++axis) {
        state.contraction(axis) = 1.0 / boost(axis, axis);
    }
    return state;
}

} // namespace relsim::observation
