#pragma once
/**
 * @file  observation.hpp
 * @brief Light-delayed (retarded-time) view of a worldline.
 *
 * Module:  src/observation/
 *
 * Responsibility
 * --------------
 * Find the event e* on a target worldline whose light reaches an observer at
 * coordinate time `now`:
 *
 *   now − e*.t = |e*.x − observer.x|          (c = 1)
 *
 * The residual  offset(t_e) = (now − t_e) − |x(t_e) − x_obs|  is driven to
 * zero by a secant iteration on the emission time. The very first step has
 * no previous sample, so it divides the residual by the relative Lorentz
 * factor between target and observer instead.
 *
 * The solver always terminates: it stops below `tolerance` or after
 * `max_iterations` and returns its best estimate either way. The result only
 * feeds rendering and never writes physics state.
 */

#include "relsim/constants.hpp"
#include "relsim/inertial_frame.hpp"
#include "relsim/types.hpp"
#include "relsim/worldline.hpp"

namespace relsim::observation {

struct ObservationConfig {
    double tolerance      = constants::RETARDED_TIME_TOLERANCE;
    int    max_iterations = constants::RETARDED_TIME_MAX_ITERATIONS;
};

/// Result of the retarded-time search.
struct RetardedEvent {
    WorldlineEvent event{};        ///< Best emission-event estimate
    double         residual{0.0};  ///< (now − t_e) − distance at `event`
    int            iterations{0};  ///< Residual evaluations performed
    bool           converged{false};
};

/// What the observer sees of one target, ready for a renderer.
struct ApparentState {
    WorldlineEvent emission{};        ///< Retarded event on the target worldline
    InertialFrame  relative_frame{};  ///< Emission frame in the observer's rest basis
    Vector3        contraction = Vector3::Ones(); ///< Per-axis length-contraction scale
    bool           converged{false};
};

/**
 * @brief Solve for the emission event seen by `observer` at time `now`.
 *
 * @param worldline  Target worldline (read only).
 * @param observer   Observer frame at `now`.
 * @param now        Universe coordinate time of the observation.
 * @param config     Tolerance and iteration budget.
 */
[[nodiscard]] RetardedEvent
find_retarded_event(const Worldline&         worldline,
                    const InertialFrame&     observer,
                    double                   now,
                    const ObservationConfig& config = ObservationConfig{}) noexcept;

/// Retarded event plus its observer-relative frame and contraction factors.
[[nodiscard]] ApparentState
observe(const Worldline&         worldline,
        const InertialFrame&     observer,
        double                   now,
        const ObservationConfig& config = ObservationConfig{}) noexcept;

} // namespace relsim::observation
