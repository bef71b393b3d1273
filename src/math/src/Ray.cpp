/**
 * @file Ray.cpp
 * @brief Implementation of ray construction and ray/triangle intersection.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "aur/math/Ray.hpp"

#include <cmath>

namespace aur::math {

namespace {

constexpr core::f32 kParallelEpsilon = 1e-9f;
constexpr core::f32 kEdgeTolerance   = 1e-5f;

} // anonymous namespace

std::optional<Ray> Ray::fromTwoPoints(Vec3f begin, Vec3f end)
{
    const Vec3f dir = end - begin;
    if (dir.lengthSquared() == 0.0f)
        return std::nullopt;
    return Ray{begin, dir};
}

std::optional<Vec3f> Ray::triangleIntersection(const std::array<Vec3f, 3> &triangle) const
{
    const Vec3f edge1 = triangle[1] - triangle[0];
    const Vec3f edge2 = triangle[2] - triangle[0];

    const Vec3f pvec = dir.cross(edge2);
    const core::f32 det = edge1.dot(pvec);
    if (std::fabs(det) < kParallelEpsilon)
        return std::nullopt;

    const core::f32 invDet = 1.0f / det;
    const Vec3f tvec = origin - triangle[0];

    const core::f32 u = tvec.dot(pvec) * invDet;
    if (u < -kEdgeTolerance || u > 1.0f + kEdgeTolerance)
        return std::nullopt;

    const Vec3f qvec = tvec.cross(edge1);
    const core::f32 v = dir.dot(qvec) * invDet;
    if (v < -kEdgeTolerance || u + v > 1.0f + kEdgeTolerance)
        return std::nullopt;

    const core::f32 t = edge2.dot(qvec) * invDet;
    if (t < 0.0f || t > 1.0f)
        return std::nullopt;

    return at(t);
}

} // namespace aur::math
