// /////////////////////////////////////////////////////////////////////////////
/// @file IRenderer.hpp
/// @brief Abstract per-source renderer interface.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <aur/audio/DistanceModel.hpp>
#include <aur/audio/Types.hpp>

namespace aur::audio {

class Listener;
class SoundSource;

// /////////////////////////////////////////////////////////////////////////////
/// @class IRenderer
/// @brief Strategy interface the audio context mixes every source through.
///
/// Renderers accumulate into the output frame, which already holds the
/// contributions of previously rendered sources.  A renderer instance is
/// driven by one audio thread; callers serialise access to it.
// /////////////////////////////////////////////////////////////////////////////
class IRenderer
{
public:
    virtual ~IRenderer() = default;

    /// @brief Mixes one frame of @p source into @p out.
    /// @param source   Source to render; its per-source state may be updated.
    /// @param listener Point of view.
    /// @param model    Distance attenuation law of the context.
    /// @param out      Frame to accumulate into.
    virtual void renderSource(SoundSource& source,
                              const Listener& listener,
                              DistanceModel model,
                              OutputFrame out) = 0;

    /// @brief Returns a human-readable name.
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace aur::audio
