/**
 * @file Vec3.inl
 * @brief Inline implementation of Vec3 operations.
 * @see   Vec3.hpp
 */

#ifndef AUR_MATH_VEC3_INL
    #define AUR_MATH_VEC3_INL

#include <cmath>

namespace aur::math {

template <core::Arithmetic T>
constexpr Vec3<T>::Vec3(T x_, T y_, T z_) : x(x_), y(y_), z(z_) {}

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::operator+(Vec3 rhs) const { return {x + rhs.x, y + rhs.y, z + rhs.z}; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::operator-(Vec3 rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z}; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::operator*(T s) const { return {x * s, y * s, z * s}; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::operator/(T s) const { return {x / s, y / s, z / s}; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::operator-() const { return {-x, -y, -z}; }

template <core::Arithmetic T>
constexpr T Vec3<T>::dot(Vec3 rhs) const { return x * rhs.x + y * rhs.y + z * rhs.z; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::cross(Vec3 rhs) const
{
    return {
        y * rhs.z - z * rhs.y,
        z * rhs.x - x * rhs.z,
        x * rhs.y - y * rhs.x
    };
}

template <core::Arithmetic T>
constexpr T Vec3<T>::lengthSquared() const { return dot(*this); }

template <core::Arithmetic T>
T Vec3<T>::length() const { return std::sqrt(lengthSquared()); }

template <core::Arithmetic T>
T Vec3<T>::distance(Vec3 rhs) const { return (*this - rhs).length(); }

template <core::Arithmetic T>
std::optional<Vec3<T>> Vec3<T>::tryNormalize() const
{
    const T len = length();
    if (len == T{})
        return std::nullopt;
    return *this / len;
}

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::zero()  { return {T{}, T{}, T{}}; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::unitX() { return {T{1}, T{}, T{}}; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::unitY() { return {T{}, T{1}, T{}}; }

template <core::Arithmetic T>
constexpr Vec3<T> Vec3<T>::unitZ() { return {T{}, T{}, T{1}}; }

} // namespace aur::math

#endif // AUR_MATH_VEC3_INL
