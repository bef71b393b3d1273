// /////////////////////////////////////////////////////////////////////////////
/// @file SoundSource.hpp
/// @brief Sound source as seen by the renderers.
///
/// Decoding and playback cursors live in the host; each frame the host
/// hands the source the raw stereo samples it is about to play through
/// setFrameSamples().  Spatial sources also carry the per-source HRTF
/// convolution state, which only the HRTF renderer writes.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <aur/audio/DistanceModel.hpp>
#include <aur/audio/Types.hpp>
#include <aur/core/Types.hpp>
#include <aur/dsp/ConvolutionState.hpp>
#include <aur/math/Vec3.hpp>

#include <span>
#include <vector>

namespace aur::audio {

class Listener;

enum class SourceKind : core::u8
{
    kGeneric,  ///< Plain stereo playback, gain and panning only.
    kSpatial   ///< Positioned in the world, attenuated by distance.
};

class SoundSource
{
public:
    explicit SoundSource(SourceKind kind = SourceKind::kGeneric) noexcept : kind_{kind} {}

    [[nodiscard]] SourceKind kind()      const noexcept { return kind_; }
    [[nodiscard]] bool       isSpatial() const noexcept { return kind_ == SourceKind::kSpatial; }

    void setGain(core::f32 gain) noexcept { gain_ = gain; }
    [[nodiscard]] core::f32 gain() const noexcept { return gain_; }

    /// @brief Stereo balance of generic sources in [-1, 1]; negative is left.
    void setPanning(core::f32 panning) noexcept;
    [[nodiscard]] core::f32 panning() const noexcept { return panning_; }

    void setPosition(const math::Vec3f& position) noexcept { position_ = position; }
    [[nodiscard]] const math::Vec3f& position() const noexcept { return position_; }

    void setRadius(core::f32 radius) noexcept { distance_.radius = radius; }
    void setRolloffFactor(core::f32 rolloff) noexcept { distance_.rolloffFactor = rolloff; }
    void setMaxDistance(core::f32 maxDistance) noexcept { distance_.maxDistance = maxDistance; }
    [[nodiscard]] const DistanceParams& distanceParams() const noexcept { return distance_; }

    /// @brief Replaces the raw samples of the current frame.
    void setFrameSamples(std::span<const StereoSample> samples);
    [[nodiscard]] std::span<const StereoSample> frameSamples() const noexcept { return frame_; }

    /// @brief Listener-space unit direction towards the source, zero when co-located.
    [[nodiscard]] math::Vec3f samplingVector(const Listener& listener) const;

    /// @brief Attenuation of the source for @p listener under @p model.
    [[nodiscard]] core::f32 distanceGain(const Listener& listener, DistanceModel model) const;

    [[nodiscard]] dsp::ConvolutionState&       hrtfState() noexcept { return hrtfState_; }
    [[nodiscard]] const dsp::ConvolutionState& hrtfState() const noexcept { return hrtfState_; }

    /// @brief Forgets convolution history, e.g. when the source is re-attached.
    void resetHrtfState() noexcept { hrtfState_ = {}; }

private:
    SourceKind kind_;
    core::f32 gain_{1.0f};
    core::f32 panning_{0.0f};
    math::Vec3f position_{};
    DistanceParams distance_{};
    std::vector<StereoSample> frame_;
    dsp::ConvolutionState hrtfState_;
};

} // namespace aur::audio
