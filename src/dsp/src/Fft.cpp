/**
 * @file Fft.cpp
 * @brief Radix-2 Cooley-Tukey kernel with a Bluestein fallback.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "aur/dsp/Fft.hpp"

#include <aur/core/Assert.hpp>
#include <aur/core/Log.hpp>

#include <algorithm>
#include <bit>
#include <cmath>
#include <format>
#include <numbers>

namespace aur::dsp {

Fft::Fft(core::usize size, FftDirection direction)
    : _size(size)
    , _direction(direction)
{
    AUR_VERIFY(size > 0);

    if (std::has_single_bit(size)) {
        _twiddles = makeTwiddles(size, direction);
        return;
    }

    planBluestein();
    core::Log::debug("DSP", std::format(
        "Fft: length {} is not a power of two, using Bluestein over {} points",
        _size, _bluesteinSize));
}

std::vector<Complex> Fft::makeTwiddles(core::usize n, FftDirection direction)
{
    const double sign = direction == FftDirection::kForward ? -1.0 : 1.0;

    std::vector<Complex> twiddles(n / 2);
    for (core::usize k = 0; k < twiddles.size(); ++k) {
        const double angle = sign * 2.0 * std::numbers::pi * static_cast<double>(k) / static_cast<double>(n);
        twiddles[k] = Complex(static_cast<core::f32>(std::cos(angle)), static_cast<core::f32>(std::sin(angle)));
    }
    return twiddles;
}

void Fft::bitReversalPermutation(std::span<Complex> x)
{
    const core::usize n = x.size();
    core::usize j = 0;

    for (core::usize i = 1; i < n; ++i) {
        core::usize bit = n >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(x[i], x[j]);
        }
    }
}

void Fft::butterflyPass(std::span<Complex> x, std::span<const Complex> twiddles)
{
    const core::usize n = x.size();

    for (core::usize len = 2; len <= n; len <<= 1) {
        const core::usize halfLen = len / 2;
        const core::usize stride  = n / len;

        for (core::usize i = 0; i < n; i += len) {
            for (core::usize k = 0; k < halfLen; ++k) {
                const Complex u = x[i + k];
                const Complex v = x[i + k + halfLen] * twiddles[k * stride];
                x[i + k]           = u + v;
                x[i + k + halfLen] = u - v;
            }
        }
    }
}

void Fft::planBluestein()
{
    const core::usize n = _size;
    const core::usize m = std::bit_ceil(2 * n - 1);
    const double sign = _direction == FftDirection::kForward ? -1.0 : 1.0;

    _bluesteinSize     = m;
    _bluesteinTwiddles = makeTwiddles(m, FftDirection::kForward);

    // w_k = e^{sign * i * pi * k^2 / n}; k^2 is reduced mod 2n to keep the
    // angle small for long transforms.
    _chirp.resize(n);
    for (core::usize k = 0; k < n; ++k) {
        const core::u64 k2 = (static_cast<core::u64>(k) * k) % (2 * static_cast<core::u64>(n));
        const double angle = sign * std::numbers::pi * static_cast<double>(k2) / static_cast<double>(n);
        _chirp[k] = Complex(static_cast<core::f32>(std::cos(angle)), static_cast<core::f32>(std::sin(angle)));
    }

    _chirpSpectrum.assign(m, Complex{});
    _chirpSpectrum[0] = std::conj(_chirp[0]);
    for (core::usize k = 1; k < n; ++k) {
        _chirpSpectrum[k]     = std::conj(_chirp[k]);
        _chirpSpectrum[m - k] = std::conj(_chirp[k]);
    }
    bitReversalPermutation(_chirpSpectrum);
    butterflyPass(_chirpSpectrum, _bluesteinTwiddles);

    _work.assign(m, Complex{});
}

void Fft::process(std::span<const Complex> input, std::span<Complex> output)
{
    AUR_VERIFY(input.size() == _size);
    AUR_VERIFY(output.size() == _size);

    if (!isPowerOfTwo()) {
        processBluestein(input, output);
        return;
    }

    if (input.data() != output.data())
        std::copy(input.begin(), input.end(), output.begin());

    bitReversalPermutation(output);
    butterflyPass(output, _twiddles);
}

void Fft::processBluestein(std::span<const Complex> input, std::span<Complex> output)
{
    const core::usize n = _size;

    for (core::usize k = 0; k < n; ++k)
        _work[k] = input[k] * _chirp[k];
    std::fill(_work.begin() + static_cast<std::ptrdiff_t>(n), _work.end(), Complex{});

    bitReversalPermutation(_work);
    butterflyPass(_work, _bluesteinTwiddles);

    // Circular convolution with the chirp, inverse taken as conj(fft(conj(.))).
    for (core::usize k = 0; k < _bluesteinSize; ++k)
        _work[k] = std::conj(_work[k] * _chirpSpectrum[k]);

    bitReversalPermutation(_work);
    butterflyPass(_work, _bluesteinTwiddles);

    const core::f32 scale = 1.0f / static_cast<core::f32>(_bluesteinSize);
    for (core::usize k = 0; k < n; ++k)
        output[k] = std::conj(_work[k]) * scale * _chirp[k];
}

} // namespace aur::dsp
