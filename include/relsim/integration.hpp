#pragma once
/**
 * @file  integration.hpp
 * @brief Classical fourth-order Runge-Kutta step.
 *
 * Responsibility
 * --------------
 * Advance the solution of dy/dt = f(t, y) by one step of size h:
 *
 *   k1 = f(t,       y)
 *   k2 = f(t + h/2, y + k1·h/2)
 *   k3 = f(t + h/2, y + k2·h/2)
 *   k4 = f(t + h,   y + k3·h)
 *   y' = y + (k1 + 2k2 + 2k3 + k4)·h/6
 *
 * `T` is any vector-space value type: `double` or a fixed-size Eigen vector.
 * Intermediate Eigen expressions are evaluated into `T` before being handed
 * to `f`, so `f` may take its argument as `const T&`.
 */

namespace relsim::integration {

template <typename T, typename Derivative>
[[nodiscard]] T runge_kutta_step(const T& initial_value,
                                 double   initial_time,
                                 double   time_step,
                                 Derivative&& derivative) {
    const double half = time_step / 2.0;

    const T k1 = derivative(initial_time, initial_value);
    const T k2 = derivative(initial_time + half, T(initial_value + k1 * half));
    const T k3 = derivative(initial_time + half, T(initial_value + k2 * half));
    const T k4 = derivative(initial_time + time_step, T(initial_value + k3 * time_step));

    return T(initial_value + (k1 + k2 * 2.0 + k3 * 2.0 + k4) * (time_step / 6.0));
}

} // namespace relsim::integration
