// /////////////////////////////////////////////////////////////////////////////
/// @file SoundSource.cpp
/// @brief SoundSource implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <aur/audio/Listener.hpp>
#include <aur/audio/SoundSource.hpp>

#include <algorithm>

namespace aur::audio {

void SoundSource::setPanning(core::f32 panning) noexcept
{
    panning_ = std::clamp(panning, -1.0f, 1.0f);
}

void SoundSource::setFrameSamples(std::span<const StereoSample> samples)
{
    frame_.assign(samples.begin(), samples.end());
}

math::Vec3f SoundSource::samplingVector(const Listener& listener) const
{
    const auto toSource = (position_ - listener.position()).tryNormalize();
    if (!toSource)
        return math::Vec3f::zero();
    return listener.toListenerSpace(*toSource);
}

core::f32 SoundSource::distanceGain(const Listener& listener, DistanceModel model) const
{
    return audio::distanceGain(model, position_.distance(listener.position()), distance_);
}

} // namespace aur::audio
