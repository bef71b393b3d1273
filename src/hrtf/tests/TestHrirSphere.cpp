/**
 * @file TestHrirSphere.cpp
 * @brief Unit tests for hrtf::HrirSphere loading and sampling.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "HrirFixture.hpp"
#include "aur/hrtf/HrirSphere.hpp"

#include <algorithm>
#include <numbers>
#include <sstream>

namespace aur::hrtf {

using Catch::Matchers::WithinAbs;
using test::delta;
using test::HrirFileBuilder;
using test::TempHrirFile;

namespace {

constexpr core::u32 kImpulseLength = 8;

audio::Config smallConfig()
{
    return audio::Config::Builder{}.hrtfBlockLength(57).interpolationSteps(2).build();
}

// Vertex i gets a left delta at i and a right delta at i + 1.
HrirFileBuilder indexedOctahedron()
{
    return test::octahedron(kImpulseLength, [](core::usize i, const math::Vec3f &) {
        return std::pair{delta(kImpulseLength, i), delta(kImpulseLength, i + 1)};
    });
}

core::Expected<HrirSphere> parseBytes(const std::string &bytes, const audio::Config &config)
{
    std::istringstream in(bytes, std::ios::binary);
    return HrirSphere::parse(in, config);
}

void requireSpectraClose(std::span<const dsp::Complex> actual, std::span<const dsp::Complex> expected)
{
    REQUIRE(actual.size() == expected.size());
    for (core::usize i = 0; i < actual.size(); ++i)
    {
        REQUIRE_THAT(actual[i].real(), WithinAbs(expected[i].real(), 1e-4));
        REQUIRE_THAT(actual[i].imag(), WithinAbs(expected[i].imag(), 1e-4));
    }
}

} // namespace

TEST_CASE("HrirSphere::load reads a valid file", "[hrtf][sphere]")
{
    TempHrirFile file("load_ok", indexedOctahedron().bytes());

    auto sphere = HrirSphere::load(file.path(), smallConfig());
    REQUIRE(sphere.has_value());

    REQUIRE(sphere->sampleRate() == 44'100);
    REQUIRE(sphere->impulseLength() == kImpulseLength);
    REQUIRE(sphere->padLength() == 57 + kImpulseLength - 1);
    REQUIRE(sphere->points().size() == 6);
    REQUIRE(sphere->faces().size() == 8);
    REQUIRE(sphere->points()[3].position() == -math::Vec3f::unitY());
    REQUIRE(sphere->faces()[1].c == 5);

    for (const auto &point : sphere->points())
    {
        REQUIRE(point.leftSpectrum().size() == sphere->padLength());
        REQUIRE(point.rightSpectrum().size() == sphere->padLength());
    }

    // A delta at sample 0 transforms to a flat spectrum.
    for (const auto &bin : sphere->points()[0].leftSpectrum())
    {
        REQUIRE_THAT(bin.real(), WithinAbs(1.0, 1e-5));
        REQUIRE_THAT(bin.imag(), WithinAbs(0.0, 1e-5));
    }
}

TEST_CASE("HrirSphere::load reports typed errors", "[hrtf][sphere]")
{
    const audio::Config config = smallConfig();

    SECTION("missing file")
    {
        const auto sphere = HrirSphere::load(std::filesystem::temp_directory_path() / "aur_hrtf_missing.hrir", config);
        REQUIRE_FALSE(sphere.has_value());
        REQUIRE(sphere.error().code() == core::ErrorCode::kIoError);
    }

    SECTION("sample rate mismatch carries both rates")
    {
        TempHrirFile file("load_rate", indexedOctahedron().sampleRate(48'000).bytes());
        const auto sphere = HrirSphere::load(file.path(), config);
        REQUIRE_FALSE(sphere.has_value());
        REQUIRE(sphere.error().code() == core::ErrorCode::kInvalidSampleRate);
        REQUIRE(sphere.error().sampleRates().has_value());
        REQUIRE(sphere.error().sampleRates()->actual == 48'000);
        REQUIRE(sphere.error().sampleRates()->required == 44'100);
    }

    SECTION("zero impulse length")
    {
        const auto sphere = parseBytes(HrirFileBuilder{}.impulseLength(0).bytes(), config);
        REQUIRE_FALSE(sphere.has_value());
        REQUIRE(sphere.error().code() == core::ErrorCode::kInvalidLength);
    }

    SECTION("bad magic")
    {
        for (const char *magic : {"XRIR", "HRIX", "RIFF"})
        {
            const auto sphere = parseBytes(indexedOctahedron().magic(magic).bytes(), config);
            REQUIRE_FALSE(sphere.has_value());
            REQUIRE(sphere.error().code() == core::ErrorCode::kInvalidFileFormat);
        }
    }

    SECTION("truncated data")
    {
        const std::string bytes = indexedOctahedron().bytes();
        const auto sphere = parseBytes(bytes.substr(0, bytes.size() - 3), config);
        REQUIRE_FALSE(sphere.has_value());
        REQUIRE(sphere.error().code() == core::ErrorCode::kIoError);

        const auto header = parseBytes(bytes.substr(0, 10), config);
        REQUIRE_FALSE(header.has_value());
        REQUIRE(header.error().code() == core::ErrorCode::kIoError);
    }

    SECTION("face index out of range")
    {
        auto builder = indexedOctahedron();
        builder.face(0, 2, 6);
        const auto sphere = parseBytes(builder.bytes(), config);
        REQUIRE_FALSE(sphere.has_value());
        REQUIRE(sphere.error().code() == core::ErrorCode::kInvalidFileFormat);
    }

    SECTION("index count not a multiple of three")
    {
        auto builder = indexedOctahedron();
        builder.index(1);
        const auto sphere = parseBytes(builder.bytes(), config);
        REQUIRE_FALSE(sphere.has_value());
        REQUIRE(sphere.error().code() == core::ErrorCode::kInvalidFileFormat);
    }

    SECTION("no vertices")
    {
        const auto sphere = parseBytes(HrirFileBuilder{}.bytes(), config);
        REQUIRE_FALSE(sphere.has_value());
        REQUIRE(sphere.error().code() == core::ErrorCode::kInvalidFileFormat);
    }
}

TEST_CASE("HrirSphere rejects a header announcing more samples than the file holds", "[hrtf][sphere]")
{
    const audio::Config config = smallConfig();

    // One vertex of 2^30-sample impulses, but only its position is stored.
    const std::string bytes = HrirFileBuilder{}
                                  .impulseLength(0x4000'0000u)
                                  .vertex(math::Vec3f::unitX(), {}, {})
                                  .bytes();

    SECTION("from a file")
    {
        TempHrirFile file("huge_impulse", bytes);
        const auto sphere = HrirSphere::load(file.path(), config);
        REQUIRE_FALSE(sphere.has_value());
        REQUIRE(sphere.error().code() == core::ErrorCode::kIoError);
    }

    SECTION("from a stream of unknown size")
    {
        const auto sphere = parseBytes(bytes, config);
        REQUIRE_FALSE(sphere.has_value());
        REQUIRE(sphere.error().code() == core::ErrorCode::kIoError);
    }

    SECTION("a file cut inside its face indices")
    {
        std::string shortened = indexedOctahedron().bytes();
        shortened.resize(24);
        TempHrirFile file("short_indices", shortened);
        const auto sphere = HrirSphere::load(file.path(), config);
        REQUIRE_FALSE(sphere.has_value());
        REQUIRE(sphere.error().code() == core::ErrorCode::kIoError);
    }
}

TEST_CASE("HrirSphere::sampleBilinear at a vertex returns its spectra", "[hrtf][sampling]")
{
    auto sphere = parseBytes(indexedOctahedron().bytes(), smallConfig());
    REQUIRE(sphere.has_value());

    std::vector<dsp::Complex> left(sphere->padLength());
    std::vector<dsp::Complex> right(sphere->padLength());

    for (core::usize v = 0; v < sphere->points().size(); ++v)
    {
        const HrirPoint &point = sphere->points()[v];
        REQUIRE(sphere->sampleBilinear(point.position() * 3.0f, left, right));
        requireSpectraClose(left, point.leftSpectrum());
        requireSpectraClose(right, point.rightSpectrum());
    }
}

TEST_CASE("HrirSphere::intersect yields barycentric weights", "[hrtf][sampling]")
{
    auto sphere = parseBytes(indexedOctahedron().bytes(), smallConfig());
    REQUIRE(sphere.has_value());

    const auto hit = sphere->intersect(math::Vec3f(1.0f, 2.0f, 3.0f));
    REQUIRE(hit.has_value());
    REQUIRE(hit->face == 0);
    REQUIRE_THAT(hit->weights[0], WithinAbs(1.0f / 6.0f, 1e-5f));
    REQUIRE_THAT(hit->weights[1], WithinAbs(2.0f / 6.0f, 1e-5f));
    REQUIRE_THAT(hit->weights[2], WithinAbs(3.0f / 6.0f, 1e-5f));

    for (const math::Vec3f &dir : {math::Vec3f(-0.3f, 0.8f, -0.1f), math::Vec3f(0.2f, -0.2f, 0.9f),
                                   math::Vec3f(-1.0f, -1.0f, -1.0f)})
    {
        const auto other = sphere->intersect(dir);
        REQUIRE(other.has_value());
        REQUIRE(other->face < sphere->faces().size());
        const float sum = other->weights[0] + other->weights[1] + other->weights[2];
        REQUIRE_THAT(sum, WithinAbs(1.0f, 1e-5f));
        for (float w : other->weights)
        {
            REQUIRE(w >= -1e-5f);
            REQUIRE(w <= 1.0f + 1e-5f);
        }
    }

    REQUIRE_FALSE(sphere->intersect(math::Vec3f::zero()).has_value());
}

TEST_CASE("HrirSphere::sampleBilinear blends three spectra", "[hrtf][sampling]")
{
    auto sphere = parseBytes(indexedOctahedron().bytes(), smallConfig());
    REQUIRE(sphere.has_value());

    std::vector<dsp::Complex> left(sphere->padLength());
    std::vector<dsp::Complex> right(sphere->padLength());
    REQUIRE(sphere->sampleBilinear(math::Vec3f(1.0f, 2.0f, 3.0f), left, right));

    const auto points = sphere->points();
    for (core::usize i = 0; i < left.size(); ++i)
    {
        const dsp::Complex expected = points[0].leftSpectrum()[i] * (1.0f / 6.0f)
                                    + points[2].leftSpectrum()[i] * (2.0f / 6.0f)
                                    + points[4].leftSpectrum()[i] * (3.0f / 6.0f);
        REQUIRE_THAT(left[i].real(), WithinAbs(expected.real(), 1e-4));
        REQUIRE_THAT(left[i].imag(), WithinAbs(expected.imag(), 1e-4));
    }
}

TEST_CASE("HrirSphere::sampleBilinear with a zero direction uses the first point", "[hrtf][sampling]")
{
    auto sphere = parseBytes(indexedOctahedron().bytes(), smallConfig());
    REQUIRE(sphere.has_value());

    std::vector<dsp::Complex> left(sphere->padLength());
    std::vector<dsp::Complex> right(sphere->padLength());
    REQUIRE(sphere->sampleBilinear(math::Vec3f::zero(), left, right));

    const HrirPoint &first = sphere->points()[0];
    REQUIRE(std::equal(left.begin(), left.end(), first.leftSpectrum().begin()));
    REQUIRE(std::equal(right.begin(), right.end(), first.rightSpectrum().begin()));
}

TEST_CASE("HrirSphere::sampleBilinear leaves outputs untouched on a miss", "[hrtf][sampling]")
{
    // Single face covering the +X +Y +Z octant.
    HrirFileBuilder builder;
    builder.impulseLength(kImpulseLength)
        .vertex(math::Vec3f::unitX(), delta(kImpulseLength, 0), delta(kImpulseLength, 1))
        .vertex(math::Vec3f::unitY(), delta(kImpulseLength, 2), delta(kImpulseLength, 3))
        .vertex(math::Vec3f::unitZ(), delta(kImpulseLength, 4), delta(kImpulseLength, 5))
        .face(0, 1, 2);

    auto sphere = parseBytes(builder.bytes(), smallConfig());
    REQUIRE(sphere.has_value());

    const dsp::Complex sentinel(42.0f, -7.0f);
    std::vector<dsp::Complex> left(sphere->padLength(), sentinel);
    std::vector<dsp::Complex> right(sphere->padLength(), sentinel);

    REQUIRE_FALSE(sphere->sampleBilinear(math::Vec3f(-1.0f, -1.0f, -1.0f), left, right));
    REQUIRE(std::ranges::all_of(left, [&](const dsp::Complex &c) { return c == sentinel; }));
    REQUIRE(std::ranges::all_of(right, [&](const dsp::Complex &c) { return c == sentinel; }));
    REQUIRE_FALSE(sphere->intersect(math::Vec3f(-1.0f, -1.0f, -1.0f)).has_value());
}

TEST_CASE("HrirSphere::transform re-orients points", "[hrtf][sphere]")
{
    auto sphere = parseBytes(indexedOctahedron().bytes(), smallConfig());
    REQUIRE(sphere.has_value());

    SECTION("rotation")
    {
        const auto q = math::Quatf::fromAxisAngle(math::Vec3f::unitY(), std::numbers::pi_v<float> / 2.0f);
        sphere->transform(math::Mat4f::fromQuat(q));

        const math::Vec3f moved = sphere->points()[4].position();
        REQUIRE_THAT(moved.x, WithinAbs(1.0f, 1e-5f));
        REQUIRE_THAT(moved.y, WithinAbs(0.0f, 1e-5f));
        REQUIRE_THAT(moved.z, WithinAbs(0.0f, 1e-5f));
    }

    SECTION("translation is ignored")
    {
        sphere->transform(math::Mat4f::translate(math::Vec3f(3.0f, 3.0f, 3.0f)));
        REQUIRE(sphere->points()[0].position() == math::Vec3f::unitX());
    }
}

} // namespace aur::hrtf
