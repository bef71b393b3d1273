/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining the generic math types.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_CORE_CONCEPTS_HPP
    #define AUR_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace aur::core {

/**
 * @brief A type that supports basic arithmetic operations.
 */
template <typename T>
concept Arithmetic = std::is_arithmetic_v<T> || requires(T a, T b) {
    { a + b } -> std::convertible_to<T>;
    { a - b } -> std::convertible_to<T>;
    { a * b } -> std::convertible_to<T>;
    { a / b } -> std::convertible_to<T>;
};

/**
 * @brief A type that can be linearly blended: `a + (b - a) * t`.
 */
template <typename V, typename S>
concept Lerpable = requires(V a, V b, S t) {
    { a + (b - a) * t } -> std::convertible_to<V>;
};

} // namespace aur::core

#endif // AUR_CORE_CONCEPTS_HPP
