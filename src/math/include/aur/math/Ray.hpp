/**
 * @file Ray.hpp
 * @brief Finite ray (segment) with triangle intersection.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_MATH_RAY_HPP
    #define AUR_MATH_RAY_HPP

    #include "Vec3.hpp"

    #include <aur/core/Types.hpp>

    #include <array>
    #include <optional>

namespace aur::math {

/**
 * @brief Segment `origin + dir * t` for t in [0, 1].
 *
 * The direction is deliberately not normalised: its length is the reach
 * of the ray.
 */
struct Ray final {
    Vec3f origin;
    Vec3f dir;

    /**
     * @brief Builds the segment from @p begin to @p end.
     * @return nullopt when both points coincide.
     */
    [[nodiscard]] static std::optional<Ray> fromTwoPoints(Vec3f begin, Vec3f end);

    [[nodiscard]] Vec3f at(core::f32 t) const { return origin + dir * t; }

    /**
     * @brief Möller–Trumbore intersection against a two-sided triangle.
     *
     * Edges and vertices are inclusive (within a small tolerance) so that
     * directions landing exactly on a mesh seam still hit.
     *
     * @return The intersection point, or nullopt on a miss or when the
     *         triangle is degenerate or parallel to the ray.
     */
    [[nodiscard]] std::optional<Vec3f> triangleIntersection(const std::array<Vec3f, 3> &triangle) const;
};

} // namespace aur::math

#endif // AUR_MATH_RAY_HPP
