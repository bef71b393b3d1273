/**
 * @file Vec3.hpp
 * @brief 3-component vector template used for directions and positions.
 *
 * @tparam T Scalar type satisfying aur::core::Arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_MATH_VEC3_HPP
    #define AUR_MATH_VEC3_HPP

    #include <aur/core/Concepts.hpp>

    #include <optional>

namespace aur::math {

template <core::Arithmetic T>
struct Vec3 final {
    T x{};
    T y{};
    T z{};

    constexpr Vec3() = default;
    constexpr Vec3(T x, T y, T z);

    [[nodiscard]] constexpr Vec3 operator+(Vec3 rhs) const;
    [[nodiscard]] constexpr Vec3 operator-(Vec3 rhs) const;
    [[nodiscard]] constexpr Vec3 operator*(T scalar)  const;
    [[nodiscard]] constexpr Vec3 operator/(T scalar)  const;
    [[nodiscard]] constexpr Vec3 operator-()          const;

    [[nodiscard]] constexpr bool operator==(const Vec3 &rhs) const = default;

    [[nodiscard]] constexpr T    dot(Vec3 rhs)      const;
    [[nodiscard]] constexpr Vec3 cross(Vec3 rhs)    const;
    [[nodiscard]] constexpr T    lengthSquared()    const;
    [[nodiscard]] T              length()           const;
    [[nodiscard]] T              distance(Vec3 rhs) const;

    /// @brief Unit vector, or nullopt when the length is zero.
    [[nodiscard]] std::optional<Vec3> tryNormalize() const;

    static constexpr Vec3 zero();
    static constexpr Vec3 unitX();
    static constexpr Vec3 unitY();
    static constexpr Vec3 unitZ();
};

using Vec3f = Vec3<float>;

} // namespace aur::math

    #include "Vec3.inl"

#endif // AUR_MATH_VEC3_HPP
