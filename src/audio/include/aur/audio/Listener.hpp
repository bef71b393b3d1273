// /////////////////////////////////////////////////////////////////////////////
/// @file Listener.hpp
/// @brief Listener position and orientation basis.
///
/// HRIR spheres are measured in a right-handed frame.  Hosts using a
/// left-handed frame orient the listener with setOrientationLh(), which
/// flips the right axis so sampling vectors land on the correct ear.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <aur/math/Vec3.hpp>

namespace aur::audio {

/// @brief The point of view every spatial source is rendered for.
class Listener
{
public:
    Listener() = default;

    void setPosition(const math::Vec3f& position) noexcept { position_ = position; }
    [[nodiscard]] const math::Vec3f& position() const noexcept { return position_; }

    /// @brief Right-handed orientation: right = look x up.
    void setOrientationRh(const math::Vec3f& look, const math::Vec3f& up);

    /// @brief Left-handed orientation: right = up x look.
    void setOrientationLh(const math::Vec3f& look, const math::Vec3f& up);

    /// @brief Sets an already orthonormal basis verbatim.
    void setBasis(const math::Vec3f& right, const math::Vec3f& up, const math::Vec3f& look) noexcept;

    [[nodiscard]] const math::Vec3f& right() const noexcept { return right_; }
    [[nodiscard]] const math::Vec3f& up()    const noexcept { return up_; }
    [[nodiscard]] const math::Vec3f& look()  const noexcept { return look_; }

    /// @brief Expresses a world-space direction in the listener basis (right, up, look).
    [[nodiscard]] math::Vec3f toListenerSpace(const math::Vec3f& direction) const noexcept;

private:
    void orient(const math::Vec3f& right, const math::Vec3f& up, const math::Vec3f& look);

    math::Vec3f position_{};
    math::Vec3f right_{math::Vec3f::unitX()};
    math::Vec3f up_{math::Vec3f::unitY()};
    math::Vec3f look_{math::Vec3f::unitZ()};
};

} // namespace aur::audio
