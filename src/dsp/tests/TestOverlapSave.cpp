/**
 * @file TestOverlapSave.cpp
 * @brief Unit tests for dsp::convolveOverlapSave.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "aur/dsp/OverlapSave.hpp"

#include <cmath>
#include <vector>

namespace aur::dsp {

using Catch::Matchers::WithinAbs;

namespace {

std::vector<float> directConvolution(const std::vector<float> &signal, const std::vector<float> &impulse)
{
    std::vector<float> output(signal.size(), 0.0f);
    for (core::usize n = 0; n < signal.size(); ++n)
        for (core::usize k = 0; k < impulse.size() && k <= n; ++k)
            output[n] += signal[n - k] * impulse[k];
    return output;
}

} // namespace

TEST_CASE("padLength is block + impulse - 1", "[dsp][overlap-save]")
{
    STATIC_REQUIRE(padLength(513, 512) == 1024);
    STATIC_REQUIRE(padLength(64, 1) == 64);
}

TEST_CASE("convolveOverlapSave matches direct convolution across blocks", "[dsp][overlap-save]")
{
    // 16 + 17 - 1 = 32 uses radix-2, 16 + 8 - 1 = 23 uses Bluestein.
    const core::usize impulseLength = GENERATE(17, 8);
    const core::usize blockLength = 16;
    const core::usize blocks = 3;
    const core::usize pad = padLength(blockLength, impulseLength);
    const core::usize tailLength = impulseLength - 1;

    std::vector<float> impulse(impulseLength);
    for (core::usize i = 0; i < impulseLength; ++i)
        impulse[i] = std::cos(0.5f * static_cast<float>(i)) / static_cast<float>(i + 1);

    std::vector<float> signal(blockLength * blocks);
    for (core::usize i = 0; i < signal.size(); ++i)
        signal[i] = std::sin(0.21f * static_cast<float>(i)) + ((i % 5 == 0) ? 0.5f : 0.0f);

    Fft fft(pad, FftDirection::kForward);
    Fft ifft(pad, FftDirection::kInverse);

    std::vector<Complex> spectrum(pad, Complex(0.0f, 0.0f));
    for (core::usize i = 0; i < impulseLength; ++i)
        spectrum[i] = Complex(impulse[i], 0.0f);
    fft.process(spectrum, spectrum);

    std::vector<Complex> inBuffer(pad);
    std::vector<Complex> outBuffer(pad);
    std::vector<float> tail(tailLength, 0.0f);
    std::vector<float> output;

    for (core::usize b = 0; b < blocks; ++b)
    {
        for (core::usize i = 0; i < blockLength; ++i)
            inBuffer[tailLength + i] = Complex(signal[b * blockLength + i], 0.0f);

        convolveOverlapSave(inBuffer, outBuffer, spectrum, tail, fft, ifft);

        for (core::usize i = 0; i < blockLength; ++i)
            output.push_back(inBuffer[tailLength + i].real() / static_cast<float>(pad));
    }

    const auto expected = directConvolution(signal, impulse);
    REQUIRE(output.size() == expected.size());
    for (core::usize i = 0; i < expected.size(); ++i)
        REQUIRE_THAT(output[i], WithinAbs(expected[i], 1e-4));
}

TEST_CASE("convolveOverlapSave keeps the last raw samples as tail", "[dsp][overlap-save]")
{
    const core::usize pad = 8;
    Fft fft(pad, FftDirection::kForward);
    Fft ifft(pad, FftDirection::kInverse);

    std::vector<Complex> spectrum(pad, Complex(1.0f, 0.0f));
    std::vector<Complex> inBuffer(pad);
    std::vector<Complex> outBuffer(pad);
    std::vector<float> tail{9.0f, 9.0f};

    for (core::usize i = 0; i < pad; ++i)
        inBuffer[i] = Complex(static_cast<float>(i), 0.0f);

    convolveOverlapSave(inBuffer, outBuffer, spectrum, tail, fft, ifft);

    REQUIRE(tail[0] == 6.0f);
    REQUIRE(tail[1] == 7.0f);
    // A flat spectrum is the identity: the saved tail now heads the block.
    REQUIRE_THAT(inBuffer[0].real() / static_cast<float>(pad), WithinAbs(9.0, 1e-5));
    REQUIRE_THAT(inBuffer[2].real() / static_cast<float>(pad), WithinAbs(2.0, 1e-5));
}

} // namespace aur::dsp
