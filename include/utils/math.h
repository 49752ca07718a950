// Copyright (c) 2026 UltiMaker
// StretchEngine is released under the terms of the AGPLv3 or higher

#ifndef UTILS_MATH_H
#define UTILS_MATH_H

#include <algorithm>
#include <cmath>
#include <concepts>

namespace stretch
{

/**
 * @brief Returns the square of a value.
 *
 * @tparam T A multipliable type (arithmetic types such as int, float, double, etc.)
 * @param a The value to be squared.
 * @return T The square of the input value.
 */
template<typename T>
requires std::is_arithmetic_v<T>
[[nodiscard]] T square(const T& a)
{
    return a * a;
}

/**
 * @brief Linear interpolation between two values.
 *
 * @param a The value at \p t = 0.
 * @param b The value at \p t = 1.
 * @param t The interpolation parameter, not clamped.
 */
template<std::floating_point T>
[[nodiscard]] constexpr T lerp(const T a, const T b, const T t)
{
    return a + (b - a) * t;
}

/**
 * @brief Map \p value from the range [\p from_min, \p from_max] onto [0, 1], clamping outside the range.
 *
 * A degenerate input range maps everything at or above \p from_max to 1.
 */
[[nodiscard]] inline double inverse_lerp_clamped(const double from_min, const double from_max, const double value)
{
    if (from_max <= from_min)
    {
        return value >= from_max ? 1.0 : 0.0;
    }
    return std::clamp((value - from_min) / (from_max - from_min), 0.0, 1.0);
}

} // namespace stretch

#endif // UTILS_MATH_H
