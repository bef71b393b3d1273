// /////////////////////////////////////////////////////////////////////////////
/// @file DistanceModel.hpp
/// @brief Distance attenuation models applied to spatial sources.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <aur/core/Types.hpp>

namespace aur::audio {

/// @brief Attenuation law; the distance is clamped to [radius, maxDistance] first.
enum class DistanceModel : core::u8
{
    kNone,                ///< Gain is always 1.
    kInverseDistance,     ///< radius / (radius + rolloff * (d - radius))
    kLinearDistance,      ///< 1 - rolloff * (d - radius) / (maxDistance - radius)
    kExponentialDistance  ///< (d / radius) ^ -rolloff
};

/// @brief Parameters of one source consumed by a DistanceModel.
struct DistanceParams
{
    core::f32 radius{1.0f};
    core::f32 rolloffFactor{1.0f};
    core::f32 maxDistance{1000.0f};
};

/// @brief Evaluates @p model at @p distance; result is in [0, 1].
[[nodiscard]] core::f32 distanceGain(DistanceModel model, core::f32 distance, const DistanceParams& params) noexcept;

} // namespace aur::audio
