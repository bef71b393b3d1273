/**
 * @file Interpolation.hpp
 * @brief Linear and barycentric interpolation helpers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_MATH_INTERPOLATION_HPP
    #define AUR_MATH_INTERPOLATION_HPP

    #include "Vec3.hpp"

    #include <aur/core/Concepts.hpp>

    #include <array>
    #include <concepts>

namespace aur::math {

/**
 * @brief Linear blend `a + (b - a) * t`.
 *
 * When @p a equals @p b the result equals @p a for every @p t, which the
 * HRTF renderer relies on for stationary sources.
 */
template <typename V, std::floating_point S>
    requires core::Lerpable<V, S>
[[nodiscard]] constexpr V lerp(V a, V b, S t)
{
    return a + (b - a) * t;
}

/**
 * @brief Barycentric weights of @p p with respect to triangle (a, b, c).
 *
 * @p p is expected to lie in the plane of the triangle.  The weights sum
 * to one.  A degenerate (zero-area) triangle yields {1, 0, 0}.
 *
 * @return {ka, kb, kc} such that p = ka * a + kb * b + kc * c.
 */
template <std::floating_point T>
[[nodiscard]] constexpr std::array<T, 3> barycentricCoords(Vec3<T> p, Vec3<T> a, Vec3<T> b, Vec3<T> c)
{
    const Vec3<T> v0 = b - a;
    const Vec3<T> v1 = c - a;
    const Vec3<T> v2 = p - a;

    const T d00 = v0.dot(v0);
    const T d01 = v0.dot(v1);
    const T d11 = v1.dot(v1);
    const T d20 = v2.dot(v0);
    const T d21 = v2.dot(v1);

    const T denom = d00 * d11 - d01 * d01;
    if (denom == T{})
        return {T{1}, T{}, T{}};

    const T kb = (d11 * d20 - d01 * d21) / denom;
    const T kc = (d00 * d21 - d01 * d20) / denom;
    return {T{1} - kb - kc, kb, kc};
}

} // namespace aur::math

#endif // AUR_MATH_INTERPOLATION_HPP
