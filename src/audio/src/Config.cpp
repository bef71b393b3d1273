// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <aur/audio/Config.hpp>

#include <algorithm>

namespace aur::audio {

Config::Builder& Config::Builder::sampleRate(core::u32 hz) noexcept
{
    sampleRate_ = hz;
    return *this;
}

Config::Builder& Config::Builder::hrtfBlockLength(core::usize samples) noexcept
{
    hrtfBlockLength_ = samples;
    return *this;
}

Config::Builder& Config::Builder::interpolationSteps(core::usize steps) noexcept
{
    interpolationSteps_ = steps;
    return *this;
}

Config::Builder& Config::Builder::interpolation(bool enabled) noexcept
{
    interpolation_ = enabled;
    return *this;
}

Config Config::Builder::build() const noexcept
{
    Config cfg;
    cfg.sampleRate_         = sampleRate_;
    cfg.hrtfBlockLength_    = std::max<core::usize>(hrtfBlockLength_, 1);
    cfg.interpolationSteps_ = std::max<core::usize>(interpolationSteps_, 1);
    cfg.interpolation_      = interpolation_;
    return cfg;
}

} // namespace aur::audio
