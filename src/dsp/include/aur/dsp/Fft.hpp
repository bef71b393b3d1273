/**
 * @file Fft.hpp
 * @brief Complex FFT plan of a fixed length and direction.
 *
 * Power-of-two lengths run the iterative Cooley-Tukey radix-2 kernel
 * (bit-reversal permutation followed by butterfly passes).  Any other
 * length is handled with Bluestein's chirp-z algorithm on top of the same
 * kernel, at roughly twice the cost.
 *
 * All twiddles, chirps and scratch memory are allocated by the
 * constructor: process() never allocates, so a plan can be used from the
 * audio thread.  process() mutates the plan's scratch buffers, so one plan
 * must not be shared by two threads at once.
 *
 * The inverse transform is unnormalised: inverse(forward(x)) == N * x.
 *
 * @code
 *   dsp::Fft fft(1024, dsp::FftDirection::kForward);
 *   fft.process(timeDomain, spectrum);
 * @endcode
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_DSP_FFT_HPP
    #define AUR_DSP_FFT_HPP

    #include <aur/core/NonCopyable.hpp>
    #include <aur/core/Types.hpp>

    #include <complex>
    #include <span>
    #include <vector>

namespace aur::dsp {

using Complex = std::complex<core::f32>;

enum class FftDirection : core::u8 {
    kForward,
    kInverse
};

class Fft final : private core::NonCopyable<Fft> {
public:
    /**
     * @brief Plans a transform of @p size points.
     * @param size      Transform length, at least 1.
     * @param direction kForward uses e^{-i...}, kInverse uses e^{+i...}.
     */
    Fft(core::usize size, FftDirection direction);

    Fft(Fft &&) noexcept            = default;
    Fft &operator=(Fft &&) noexcept = default;

    /**
     * @brief Transforms @p input into @p output.
     *
     * Both spans must hold exactly size() elements.  They may alias.
     */
    void process(std::span<const Complex> input, std::span<Complex> output);

    [[nodiscard]] core::usize  size()          const noexcept { return _size; }
    [[nodiscard]] FftDirection direction()     const noexcept { return _direction; }
    [[nodiscard]] bool         isPowerOfTwo()  const noexcept { return _bluesteinSize == 0; }

private:
    static void bitReversalPermutation(std::span<Complex> x);
    static void butterflyPass(std::span<Complex> x, std::span<const Complex> twiddles);
    static std::vector<Complex> makeTwiddles(core::usize n, FftDirection direction);

    void planBluestein();
    void processBluestein(std::span<const Complex> input, std::span<Complex> output);

    core::usize  _size;
    FftDirection _direction;

    std::vector<Complex> _twiddles;

    // Bluestein state, empty for power-of-two sizes.
    core::usize          _bluesteinSize{0};
    std::vector<Complex> _bluesteinTwiddles;
    std::vector<Complex> _chirp;
    std::vector<Complex> _chirpSpectrum;
    std::vector<Complex> _work;
};

} // namespace aur::dsp

#endif // AUR_DSP_FFT_HPP
