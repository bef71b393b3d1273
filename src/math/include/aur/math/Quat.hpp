/**
 * @file Quat.hpp
 * @brief Quaternion type for 3D rotation, parameterised on scalar type.
 *
 * Uses Hamilton convention (w, x, y, z) where w is the real part.  Used
 * to build the rotation handed to HrirSphere::transform when a sphere
 * must be re-oriented to the host's coordinate convention.
 *
 * @tparam T Scalar type satisfying aur::core::Arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_MATH_QUAT_HPP
    #define AUR_MATH_QUAT_HPP

    #include "Vec3.hpp"

namespace aur::math {

template <core::Arithmetic T>
struct Quat final {
    T w{};
    T x{};
    T y{};
    T z{};

    constexpr Quat() = default;
    constexpr Quat(T w, T x, T y, T z);

    [[nodiscard]] constexpr Quat    operator*(Quat rhs)  const;
    [[nodiscard]] constexpr Vec3<T> rotate(Vec3<T> v)    const;
    [[nodiscard]] constexpr Quat    conjugate()          const;

    static constexpr Quat identity();

    /// @brief Rotation of @p angleRad radians around @p axis (normalised here).
    static Quat fromAxisAngle(Vec3<T> axis, T angleRad);
};

using Quatf = Quat<float>;

} // namespace aur::math

    #include "Quat.inl"

#endif // AUR_MATH_QUAT_HPP
