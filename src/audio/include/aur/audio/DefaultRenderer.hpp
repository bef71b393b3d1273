// /////////////////////////////////////////////////////////////////////////////
/// @file DefaultRenderer.hpp
/// @brief Gain and panning renderer used for non-HRTF output.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <aur/audio/IRenderer.hpp>

namespace aur::audio {

/// @brief Mixes @p source into @p out with gain and linear panning.
///
/// Spatial sources are panned by the right component of their sampling
/// vector and scaled by their distance gain.  Samples beyond the shorter
/// of the source frame and @p out are skipped.
void renderSourceDefault(SoundSource& source,
                         const Listener& listener,
                         DistanceModel model,
                         OutputFrame out);

// /////////////////////////////////////////////////////////////////////////////
/// @class DefaultRenderer
/// @brief IRenderer adapter over renderSourceDefault().
// /////////////////////////////////////////////////////////////////////////////
class DefaultRenderer final : public IRenderer
{
public:
    void renderSource(SoundSource& source,
                      const Listener& listener,
                      DistanceModel model,
                      OutputFrame out) override;

    [[nodiscard]] const char* name() const noexcept override;
};

} // namespace aur::audio
