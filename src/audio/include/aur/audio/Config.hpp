// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Audio rendering configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises the device rate and the HRTF block geometry that every
/// spectrum and scratch buffer is sized from.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <aur/core/Constants.hpp>
#include <aur/core/Types.hpp>

namespace aur::audio {

/// @brief Immutable audio configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& sampleRate(core::u32 hz) noexcept;
        Builder& hrtfBlockLength(core::usize samples) noexcept;
        Builder& interpolationSteps(core::usize steps) noexcept;
        Builder& interpolation(bool enabled) noexcept;

        /// @brief Zero block length or step count is raised to 1.
        [[nodiscard]] Config build() const noexcept;

    private:
        core::u32   sampleRate_{core::kDeviceSampleRate};
        core::usize hrtfBlockLength_{core::kHrtfBlockLength};
        core::usize interpolationSteps_{core::kHrtfInterpolationSteps};
        bool        interpolation_{true};
    };

    [[nodiscard]] core::u32   sampleRate()         const noexcept { return sampleRate_; }
    [[nodiscard]] core::usize hrtfBlockLength()    const noexcept { return hrtfBlockLength_; }
    [[nodiscard]] core::usize interpolationSteps() const noexcept { return interpolationSteps_; }
    [[nodiscard]] bool        interpolation()      const noexcept { return interpolation_; }

    /// @brief Samples per channel in one rendered frame.
    [[nodiscard]] core::usize frameLength() const noexcept { return hrtfBlockLength_ * interpolationSteps_; }

private:
    friend class Builder;

    core::u32   sampleRate_{core::kDeviceSampleRate};
    core::usize hrtfBlockLength_{core::kHrtfBlockLength};
    core::usize interpolationSteps_{core::kHrtfInterpolationSteps};
    bool        interpolation_{true};
};

} // namespace aur::audio
