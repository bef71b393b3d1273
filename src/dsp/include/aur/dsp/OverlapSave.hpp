/**
 * @file OverlapSave.hpp
 * @brief Single-channel overlap-save block convolution.
 *
 * Per block the cost is one forward transform, one spectral multiply and
 * one inverse transform, independent of the impulse length.  Against a
 * 512-tap impulse and ~3500-sample blocks this is roughly an order of
 * magnitude cheaper than direct convolution, which matters because it
 * runs once per channel, per spatial source, per audio frame.
 *
 * Buffer layout (length `padLength = blockLength + impulseLength - 1`):
 *
 *   [ tail : impulseLength - 1 ][ fresh samples : blockLength ]
 *
 * The caller writes the fresh samples; convolveOverlapSave() writes the
 * tail, saves the new tail and leaves the unnormalised result in
 * @p inBuffer, whose last blockLength entries are the valid output.
 *
 * @see https://ccrma.stanford.edu/~jos/ReviewFourier/FFT_Convolution_vs_Direct.html
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_DSP_OVERLAP_SAVE_HPP
    #define AUR_DSP_OVERLAP_SAVE_HPP

    #include "Fft.hpp"

    #include <aur/core/Types.hpp>

    #include <span>

namespace aur::dsp {

/**
 * @brief Length of every transform buffer for the given block/impulse pair.
 */
[[nodiscard]] constexpr core::usize padLength(core::usize blockLength, core::usize impulseLength) noexcept
{
    return blockLength + impulseLength - 1;
}

/**
 * @brief Convolves one block of one channel against @p spectrum.
 *
 * @param inBuffer  Raw samples after the tail region on entry; the
 *                  unnormalised convolution (scale by 1 / size) on exit.
 * @param outBuffer Scratch of the same length, holds the product spectrum.
 * @param spectrum  Impulse response spectrum; its length must equal
 *                  inBuffer's, otherwise the process aborts.
 * @param tail      Previous block's last raw samples, replaced in place.
 * @param fft       Forward plan of inBuffer's length.
 * @param ifft      Inverse plan of inBuffer's length.
 */
void convolveOverlapSave(
    std::span<Complex> inBuffer,
    std::span<Complex> outBuffer,
    std::span<const Complex> spectrum,
    std::span<core::f32> tail,
    Fft &fft,
    Fft &ifft
);

} // namespace aur::dsp

#endif // AUR_DSP_OVERLAP_SAVE_HPP
