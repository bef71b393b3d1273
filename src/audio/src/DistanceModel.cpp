// /////////////////////////////////////////////////////////////////////////////
/// @file DistanceModel.cpp
/// @brief Distance attenuation laws.
// /////////////////////////////////////////////////////////////////////////////

#include <aur/audio/DistanceModel.hpp>

#include <algorithm>
#include <cmath>

namespace aur::audio {

core::f32 distanceGain(DistanceModel model, core::f32 distance, const DistanceParams& params) noexcept
{
    const core::f32 radius = params.radius;
    const core::f32 maxDistance = std::max(params.maxDistance, radius);
    const core::f32 d = std::clamp(distance, radius, maxDistance);

    core::f32 gain = 1.0f;
    switch (model)
    {
        case DistanceModel::kNone:
            break;
        case DistanceModel::kInverseDistance:
        {
            const core::f32 denom = radius + params.rolloffFactor * (d - radius);
            gain = denom > 0.0f ? radius / denom : 1.0f;
            break;
        }
        case DistanceModel::kLinearDistance:
        {
            const core::f32 range = maxDistance - radius;
            gain = range > 0.0f ? 1.0f - params.rolloffFactor * (d - radius) / range : 1.0f;
            break;
        }
        case DistanceModel::kExponentialDistance:
            gain = radius > 0.0f ? std::pow(d / radius, -params.rolloffFactor) : 1.0f;
            break;
    }
    return std::clamp(gain, 0.0f, 1.0f);
}

} // namespace aur::audio
