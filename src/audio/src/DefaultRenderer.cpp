// /////////////////////////////////////////////////////////////////////////////
/// @file DefaultRenderer.cpp
/// @brief Gain and panning mixdown.
// /////////////////////////////////////////////////////////////////////////////

#include <aur/audio/DefaultRenderer.hpp>
#include <aur/audio/Listener.hpp>
#include <aur/audio/SoundSource.hpp>

#include <algorithm>

namespace aur::audio {

void renderSourceDefault(SoundSource& source,
                         const Listener& listener,
                         DistanceModel model,
                         OutputFrame out)
{
    core::f32 gain = source.gain();
    core::f32 pan = source.panning();
    if (source.isSpatial())
    {
        gain *= source.distanceGain(listener, model);
        pan = std::clamp(source.samplingVector(listener).x, -1.0f, 1.0f);
    }

    const core::f32 leftGain = gain * std::min(1.0f, 1.0f - pan);
    const core::f32 rightGain = gain * std::min(1.0f, 1.0f + pan);

    const auto samples = source.frameSamples();
    const core::usize count = std::min(samples.size(), out.size());
    for (core::usize i = 0; i < count; ++i)
    {
        out[i].left += samples[i].left * leftGain;
        out[i].right += samples[i].right * rightGain;
    }
}

void DefaultRenderer::renderSource(SoundSource& source,
                                   const Listener& listener,
                                   DistanceModel model,
                                   OutputFrame out)
{
    renderSourceDefault(source, listener, model, out);
}

const char* DefaultRenderer::name() const noexcept { return "DefaultRenderer"; }

} // namespace aur::audio
