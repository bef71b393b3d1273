/**
 * @file OverlapSave.cpp
 * @brief Implementation of the overlap-save convolution step.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "aur/dsp/OverlapSave.hpp"

#include <aur/core/Assert.hpp>

namespace aur::dsp {

namespace {

// Writes the saved tail at the head of the buffer, then keeps the buffer's
// last raw samples for the next block.  Both happen before the transform.
void exchangeTail(std::span<core::f32> tail, std::span<Complex> buffer)
{
    const core::usize tailLength = tail.size();

    for (core::usize i = 0; i < tailLength; ++i)
        buffer[i] = Complex(tail[i], 0.0f);

    const core::usize lastStart = buffer.size() - tailLength;
    for (core::usize i = 0; i < tailLength; ++i)
        tail[i] = buffer[lastStart + i].real();
}

} // anonymous namespace

void convolveOverlapSave(
    std::span<Complex> inBuffer,
    std::span<Complex> outBuffer,
    std::span<const Complex> spectrum,
    std::span<core::f32> tail,
    Fft &fft,
    Fft &ifft
) {
    AUR_VERIFY(spectrum.size() == inBuffer.size());
    AUR_VERIFY(outBuffer.size() == inBuffer.size());
    AUR_VERIFY(tail.size() < inBuffer.size());
    AUR_ASSERT(fft.direction() == FftDirection::kForward);
    AUR_ASSERT(ifft.direction() == FftDirection::kInverse);

    exchangeTail(tail, inBuffer);

    fft.process(inBuffer, outBuffer);

    for (core::usize i = 0; i < outBuffer.size(); ++i)
        outBuffer[i] *= spectrum[i];

    ifft.process(outBuffer, inBuffer);
}

} // namespace aur::dsp
