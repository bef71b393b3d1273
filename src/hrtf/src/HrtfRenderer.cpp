/**
 * @file HrtfRenderer.cpp
 * @brief Implementation of the interpolated binaural block renderer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "aur/hrtf/HrtfRenderer.hpp"

#include <aur/audio/DefaultRenderer.hpp>
#include <aur/audio/Listener.hpp>
#include <aur/audio/SoundSource.hpp>
#include <aur/core/Assert.hpp>
#include <aur/core/Log.hpp>
#include <aur/dsp/OverlapSave.hpp>
#include <aur/math/Interpolation.hpp>

#include <algorithm>
#include <bit>
#include <format>

namespace aur::hrtf {

HrtfRenderer::HrtfRenderer(HrirSphere sphere, const audio::Config &config)
    : _sphere(std::move(sphere)), _config(config), _padLength(_sphere.padLength()),
      _tailLength(_sphere.impulseLength() - 1), _fft(_padLength, dsp::FftDirection::kForward),
      _ifft(_padLength, dsp::FftDirection::kInverse), _leftIn(_padLength), _rightIn(_padLength),
      _leftOut(_padLength), _rightOut(_padLength)
{
    AUR_VERIFY(_sphere.sampleRate() == config.sampleRate());
    AUR_VERIFY(_padLength == dsp::padLength(config.hrtfBlockLength(), _sphere.impulseLength()));

    const HrirPoint &first = _sphere.points().front();
    _leftHrtf.assign(first.leftSpectrum().begin(), first.leftSpectrum().end());
    _rightHrtf.assign(first.rightSpectrum().begin(), first.rightSpectrum().end());

    if (!std::has_single_bit(_padLength))
    {
        core::Log::warn("HRTF", std::format("pad length {} (block {} + impulse {} - 1) is not a power of two, "
                                            "convolution falls back to a slower FFT",
                                            _padLength, config.hrtfBlockLength(), _sphere.impulseLength()));
    }
}

void HrtfRenderer::renderSource(audio::SoundSource &source,
                                const audio::Listener &listener,
                                audio::DistanceModel model,
                                audio::OutputFrame out)
{
    if (!source.isSpatial())
    {
        audio::renderSourceDefault(source, listener, model, out);
        return;
    }
    renderSpatial(source, listener, model, out);
}

void HrtfRenderer::renderSpatial(audio::SoundSource &source,
                                 const audio::Listener &listener,
                                 audio::DistanceModel model,
                                 audio::OutputFrame out)
{
    const core::usize blockLength = _config.hrtfBlockLength();
    const core::usize steps = _config.interpolationSteps();
    AUR_VERIFY(out.size() >= blockLength * steps);

    dsp::ConvolutionState &state = source.hrtfState();
    if (!state.isSized(_tailLength))
        state.reset(_tailLength);

    const math::Vec3f newVector = source.samplingVector(listener);
    const core::f32 newGain = source.distanceGain(listener, model);
    const math::Vec3f prevVector = state.prevSamplingVector.value_or(newVector);
    const core::f32 prevGain = state.prevDistanceGain.value_or(newGain);

    // The inverse transform is unnormalised.
    const core::f32 norm = 1.0f / static_cast<core::f32>(_padLength);

    for (core::usize step = 0; step < steps; ++step)
    {
        const core::f32 t = _config.interpolation()
                          ? static_cast<core::f32>(step + 1) / static_cast<core::f32>(steps)
                          : 1.0f;

        _sphere.sampleBilinear(math::lerp(prevVector, newVector, t), _leftHrtf, _rightHrtf);

        fetchBlock(source, step);
        dsp::convolveOverlapSave(_leftIn, _leftOut, _leftHrtf, state.leftTail, _fft, _ifft);
        dsp::convolveOverlapSave(_rightIn, _rightOut, _rightHrtf, state.rightTail, _fft, _ifft);

        const core::f32 k = math::lerp(prevGain, newGain, t) * norm;
        const auto block = out.subspan(step * blockLength, blockLength);
        for (core::usize i = 0; i < blockLength; ++i)
        {
            block[i].left += _leftIn[_tailLength + i].real() * k;
            block[i].right += _rightIn[_tailLength + i].real() * k;
        }
    }

    state.prevSamplingVector = newVector;
    state.prevDistanceGain = newGain;
}

void HrtfRenderer::fetchBlock(const audio::SoundSource &source, core::usize step)
{
    const core::usize blockLength = _config.hrtfBlockLength();
    const auto samples = source.frameSamples();
    const core::usize offset = step * blockLength;
    const core::usize available = offset < samples.size() ? std::min(blockLength, samples.size() - offset) : 0;

    for (core::usize i = 0; i < blockLength; ++i)
    {
        const dsp::Complex sample(i < available ? samples[offset + i].left : 0.0f, 0.0f);
        _leftIn[_tailLength + i] = sample;
        _rightIn[_tailLength + i] = sample;
    }
}

} // namespace aur::hrtf
