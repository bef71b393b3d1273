/**
 * @file Constants.hpp
 * @brief Library-wide compile-time defaults.
 *
 * Device and HRTF rendering parameters are centralised here; they seed
 * audio::Config::Builder and can be overridden per context.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_CORE_CONSTANTS_HPP
    #define AUR_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace aur::core {

inline constexpr u32   kDeviceSampleRate        = 44'100;

// 513 + 512 - 1 = 1024: a power-of-two pad length for 512-tap HRIRs.
inline constexpr usize kHrtfBlockLength         = 513;
inline constexpr usize kHrtfInterpolationSteps  = 8;

inline constexpr f32   kHrtfRayLength           = 10.0f;

} // namespace aur::core

#endif // AUR_CORE_CONSTANTS_HPP
