// /////////////////////////////////////////////////////////////////////////////
/// @file Listener.cpp
/// @brief Listener basis construction.
// /////////////////////////////////////////////////////////////////////////////

#include <aur/audio/Listener.hpp>
#include <aur/core/Log.hpp>

namespace aur::audio {

void Listener::setOrientationRh(const math::Vec3f& look, const math::Vec3f& up)
{
    orient(look.cross(up), up, look);
}

void Listener::setOrientationLh(const math::Vec3f& look, const math::Vec3f& up)
{
    orient(up.cross(look), up, look);
}

void Listener::setBasis(const math::Vec3f& right, const math::Vec3f& up, const math::Vec3f& look) noexcept
{
    right_ = right;
    up_ = up;
    look_ = look;
}

void Listener::orient(const math::Vec3f& right, const math::Vec3f& up, const math::Vec3f& look)
{
    const auto r = right.tryNormalize();
    const auto u = up.tryNormalize();
    const auto l = look.tryNormalize();
    if (!r || !u || !l)
    {
        core::Log::warn("AUDIO", "Listener: degenerate orientation ignored (look and up must be non-zero and not parallel)");
        return;
    }
    setBasis(*r, *u, *l);
}

math::Vec3f Listener::toListenerSpace(const math::Vec3f& direction) const noexcept
{
    return {direction.dot(right_), direction.dot(up_), direction.dot(look_)};
}

} // namespace aur::audio
