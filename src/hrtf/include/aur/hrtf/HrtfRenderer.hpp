/**
 * @file HrtfRenderer.hpp
 * @brief Binaural renderer convolving spatial sources with a HRIR sphere.
 *
 * One output frame is split into interpolationSteps() blocks of
 * hrtfBlockLength() samples.  Each block is convolved with spectra
 * sampled at a direction interpolated between the previous frame's
 * sampling vector and the current one, which removes the clicks of a
 * per-frame HRTF switch on moving sources.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_HRTF_HRTF_RENDERER_HPP
    #define AUR_HRTF_HRTF_RENDERER_HPP

    #include "HrirSphere.hpp"

    #include <aur/audio/Config.hpp>
    #include <aur/audio/IRenderer.hpp>
    #include <aur/core/NonCopyable.hpp>
    #include <aur/core/Types.hpp>
    #include <aur/dsp/Fft.hpp>

    #include <vector>

namespace aur::hrtf {

class HrtfRenderer final : public audio::IRenderer, private core::NonCopyable<HrtfRenderer> {
public:
    /**
     * @brief Takes ownership of @p sphere and allocates every scratch buffer.
     *
     * @p config must be the configuration the sphere was loaded with.
     */
    HrtfRenderer(HrirSphere sphere, const audio::Config &config);

    /**
     * @brief Mixes one frame of @p source into @p out.
     *
     * Generic sources go through audio::renderSourceDefault().  Spatial
     * sources are convolved block by block; @p out must hold at least
     * config().frameLength() samples and the source's frame is zero-padded
     * when shorter.  Spatial sources are mono: only the left channel is
     * convolved, and only the distance gain is applied.
     *
     * Allocation-free, except for sizing the source's convolution state the
     * first time it is rendered.
     */
    void renderSource(audio::SoundSource &source,
                      const audio::Listener &listener,
                      audio::DistanceModel model,
                      audio::OutputFrame out) override;

    [[nodiscard]] const char *name() const noexcept override { return "HrtfRenderer"; }

    [[nodiscard]] const HrirSphere    &sphere() const noexcept { return _sphere; }
    [[nodiscard]] const audio::Config &config() const noexcept { return _config; }

private:
    void renderSpatial(audio::SoundSource &source,
                       const audio::Listener &listener,
                       audio::DistanceModel model,
                       audio::OutputFrame out);

    // Copies block @p step of the source's left channel behind the tail
    // region of both input buffers.
    void fetchBlock(const audio::SoundSource &source, core::usize step);

    HrirSphere    _sphere;
    audio::Config _config;
    core::usize   _padLength;
    core::usize   _tailLength;

    dsp::Fft _fft;
    dsp::Fft _ifft;

    std::vector<dsp::Complex> _leftIn;
    std::vector<dsp::Complex> _rightIn;
    std::vector<dsp::Complex> _leftOut;
    std::vector<dsp::Complex> _rightOut;
    std::vector<dsp::Complex> _leftHrtf;
    std::vector<dsp::Complex> _rightHrtf;
};

} // namespace aur::hrtf

#endif // AUR_HRTF_HRTF_RENDERER_HPP
