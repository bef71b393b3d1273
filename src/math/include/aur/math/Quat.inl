/**
 * @file Quat.inl
 * @brief Inline implementation of quaternion operations.
 * @see   Quat.hpp
 */

#ifndef AUR_MATH_QUAT_INL
    #define AUR_MATH_QUAT_INL

#include <cmath>

namespace aur::math {

template <core::Arithmetic T>
constexpr Quat<T>::Quat(T w_, T x_, T y_, T z_) : w(w_), x(x_), y(y_), z(z_) {}

template <core::Arithmetic T>
constexpr Quat<T> Quat<T>::operator*(Quat rhs) const
{
    return {
        w * rhs.w - x * rhs.x - y * rhs.y - z * rhs.z,
        w * rhs.x + x * rhs.w + y * rhs.z - z * rhs.y,
        w * rhs.y - x * rhs.z + y * rhs.w + z * rhs.x,
        w * rhs.z + x * rhs.y - y * rhs.x + z * rhs.w
    };
}

template <core::Arithmetic T>
constexpr Vec3<T> Quat<T>::rotate(Vec3<T> v) const
{
    Vec3<T> qVec{x, y, z};
    Vec3<T> t = qVec.cross(v) * (T{2});
    return v + t * w + qVec.cross(t);
}

template <core::Arithmetic T>
constexpr Quat<T> Quat<T>::conjugate() const { return {w, -x, -y, -z}; }

template <core::Arithmetic T>
constexpr Quat<T> Quat<T>::identity() { return {T{1}, T{}, T{}, T{}}; }

template <core::Arithmetic T>
Quat<T> Quat<T>::fromAxisAngle(Vec3<T> axis, T angleRad)
{
    const auto unit = axis.tryNormalize();
    if (!unit)
        return identity();

    const T half = angleRad / T(2);
    const T s    = std::sin(half);
    return {std::cos(half), unit->x * s, unit->y * s, unit->z * s};
}

} // namespace aur::math

#endif // AUR_MATH_QUAT_INL
