/**
 * @file ConvolutionState.hpp
 * @brief Per-source state carried between HRTF render calls.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_DSP_CONVOLUTION_STATE_HPP
    #define AUR_DSP_CONVOLUTION_STATE_HPP

    #include <aur/core/Types.hpp>
    #include <aur/math/Vec3.hpp>

    #include <optional>
    #include <vector>

namespace aur::dsp {

/**
 * @brief Overlap-save tails plus the interpolation anchors of one source.
 *
 * Owned by the source and handed by reference to the renderer, which is
 * its only writer.  Tails hold the last `impulseLength - 1` raw input
 * samples of the previous block; the previous sampling vector and gain
 * are absent until the first render, so that first render does not ramp.
 */
struct ConvolutionState {
    std::vector<core::f32>     leftTail;
    std::vector<core::f32>     rightTail;
    std::optional<math::Vec3f> prevSamplingVector;
    std::optional<core::f32>   prevDistanceGain;

    /// @brief True when both tails already hold @p tailLength samples.
    [[nodiscard]] bool isSized(core::usize tailLength) const noexcept
    {
        return leftTail.size() == tailLength && rightTail.size() == tailLength;
    }

    /// @brief Zero-fills both tails to @p tailLength and forgets the anchors.
    void reset(core::usize tailLength)
    {
        leftTail.assign(tailLength, 0.0f);
        rightTail.assign(tailLength, 0.0f);
        prevSamplingVector.reset();
        prevDistanceGain.reset();
    }
};

} // namespace aur::dsp

#endif // AUR_DSP_CONVOLUTION_STATE_HPP
