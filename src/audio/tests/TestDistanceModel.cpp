/**
 * @file TestDistanceModel.cpp
 * @brief Unit tests for audio::distanceGain.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "aur/audio/DistanceModel.hpp"

namespace aur::audio {

using Catch::Matchers::WithinAbs;

TEST_CASE("DistanceModel::kNone never attenuates", "[audio][distance]")
{
    const DistanceParams params{};
    REQUIRE(distanceGain(DistanceModel::kNone, 0.0f, params) == 1.0f);
    REQUIRE(distanceGain(DistanceModel::kNone, 500.0f, params) == 1.0f);
}

TEST_CASE("DistanceModel laws follow their formulas", "[audio][distance]")
{
    const DistanceParams params{2.0f, 1.0f, 12.0f};

    SECTION("inverse")
    {
        REQUIRE_THAT(distanceGain(DistanceModel::kInverseDistance, 4.0f, params), WithinAbs(0.5f, 1e-6f));
        REQUIRE_THAT(distanceGain(DistanceModel::kInverseDistance, 8.0f, params), WithinAbs(0.25f, 1e-6f));
    }

    SECTION("linear")
    {
        REQUIRE_THAT(distanceGain(DistanceModel::kLinearDistance, 7.0f, params), WithinAbs(0.5f, 1e-6f));
        REQUIRE_THAT(distanceGain(DistanceModel::kLinearDistance, 12.0f, params), WithinAbs(0.0f, 1e-6f));
    }

    SECTION("exponential")
    {
        REQUIRE_THAT(distanceGain(DistanceModel::kExponentialDistance, 4.0f, params), WithinAbs(0.5f, 1e-6f));
    }
}

TEST_CASE("DistanceModel clamps distance to [radius, maxDistance]", "[audio][distance]")
{
    const DistanceParams params{2.0f, 1.0f, 12.0f};

    REQUIRE(distanceGain(DistanceModel::kInverseDistance, 0.5f, params) == 1.0f);
    REQUIRE(distanceGain(DistanceModel::kLinearDistance, 1000.0f, params) == 0.0f);
    REQUIRE_THAT(distanceGain(DistanceModel::kInverseDistance, 1000.0f, params),
                 WithinAbs(distanceGain(DistanceModel::kInverseDistance, 12.0f, params), 1e-6f));
}

} // namespace aur::audio
