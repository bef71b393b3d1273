// /////////////////////////////////////////////////////////////////////////////
/// @file Types.hpp
/// @brief Sample and frame types exchanged between renderers and sources.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <aur/core/Types.hpp>

#include <span>

namespace aur::audio {

/// @brief One interleaved stereo sample.
struct StereoSample
{
    core::f32 left{0.0f};
    core::f32 right{0.0f};
};

/// @brief Output frame a renderer mixes into; contents are accumulated, never overwritten.
using OutputFrame = std::span<StereoSample>;

} // namespace aur::audio
