/**
 * @file HrirSphere.cpp
 * @brief HRIR sphere file parsing and barycentric sampling.
 *
 * File layout, all fields little-endian:
 *   magic "HRIR", u32 sample rate, u32 impulse length, u32 vertex count,
 *   u32 index count, index count u32 face indices, then per vertex
 *   x y z f32 followed by the left and right impulses (length f32 each).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "aur/hrtf/HrirSphere.hpp"

#include <aur/core/Assert.hpp>
#include <aur/core/Constants.hpp>
#include <aur/core/Log.hpp>
#include <aur/dsp/OverlapSave.hpp>
#include <aur/math/Interpolation.hpp>

#include <algorithm>
#include <bit>
#include <format>
#include <fstream>
#include <istream>
#include <system_error>

namespace aur::hrtf {

namespace {

constexpr std::array<char, 4> kMagic{'H', 'R', 'I', 'R'};

class LittleEndianReader final {
public:
    explicit LittleEndianReader(std::istream &in) : _in(in) {}

    core::ExpectedVoid readBytes(std::span<char> out, std::string_view what)
    {
        _in.read(out.data(), static_cast<std::streamsize>(out.size()));
        if (!_in)
            return core::makeError(core::ErrorCode::kIoError,
                                   std::format("unexpected end of file while reading {}", what));
        return {};
    }

    core::Expected<core::u32> readU32(std::string_view what)
    {
        std::array<char, 4> raw{};
        AUR_TRY_VOID(readBytes(raw, what));
        return static_cast<core::u32>(static_cast<unsigned char>(raw[0]))
             | static_cast<core::u32>(static_cast<unsigned char>(raw[1])) << 8
             | static_cast<core::u32>(static_cast<unsigned char>(raw[2])) << 16
             | static_cast<core::u32>(static_cast<unsigned char>(raw[3])) << 24;
    }

    core::Expected<core::f32> readF32(std::string_view what)
    {
        const core::u32 bits = AUR_TRY(readU32(what));
        return std::bit_cast<core::f32>(bits);
    }

private:
    std::istream &_in;
};

// Fixed header: magic, sample rate, impulse length, vertex count, index count.
constexpr core::u64 kHeaderBytes = 20;

// Impulses as stored in the file, before any FFT plan exists.
struct RawVertex {
    math::Vec3f             position;
    std::vector<core::f32>  left;
    std::vector<core::f32>  right;
};

core::Expected<std::vector<core::f32>> readImpulse(LittleEndianReader &reader, core::u32 impulseLength,
                                                   std::string_view what)
{
    std::vector<core::f32> samples;
    for (core::u32 i = 0; i < impulseLength; ++i)
        samples.push_back(AUR_TRY(reader.readF32(what)));
    return samples;
}

// Zero-pads an impulse to the FFT size and returns its spectrum.
std::vector<dsp::Complex> toSpectrum(const std::vector<core::f32> &impulse, dsp::Fft &fft)
{
    std::vector<dsp::Complex> buffer(fft.size(), dsp::Complex(0.0f, 0.0f));
    for (core::usize i = 0; i < impulse.size(); ++i)
        buffer[i] = dsp::Complex(impulse[i], 0.0f);
    fft.process(buffer, buffer);
    return buffer;
}

// True when @p available bytes cannot hold the payload the header announces.
bool payloadExceeds(core::u64 available, core::u32 impulseLength, core::u32 vertexCount, core::u32 indexCount)
{
    const core::u64 fixed = kHeaderBytes + 4 * static_cast<core::u64>(indexCount);
    const core::u64 perVertex = 12 + 8 * static_cast<core::u64>(impulseLength);
    if (available < fixed)
        return true;
    return (available - fixed) / perVertex < vertexCount;
}

} // namespace

HrirSphere::HrirSphere(std::vector<HrirPoint> points, std::vector<HrirFace> faces,
                       core::usize impulseLength, core::usize padLength, core::u32 sampleRate)
    : _points(std::move(points)), _faces(std::move(faces)), _impulseLength(impulseLength),
      _padLength(padLength), _sampleRate(sampleRate)
{
}

core::Expected<HrirSphere> HrirSphere::load(const std::filesystem::path &path, const audio::Config &config)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        auto error = core::makeError(core::ErrorCode::kIoError, std::format("cannot open {}", path.string()));
        core::Log::error("HRTF", error.error().format());
        return error;
    }

    std::error_code ec;
    const core::u64 size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        auto error = core::makeError(core::ErrorCode::kIoError,
                                     std::format("cannot stat {}: {}", path.string(), ec.message()));
        core::Log::error("HRTF", error.error().format());
        return error;
    }

    auto sphere = parse(file, config, size);
    if (!sphere)
    {
        core::Log::error("HRTF", std::format("{}: {}", path.string(), sphere.error().format()));
        return sphere;
    }

    core::Log::info("HRTF", std::format("loaded {} ({} points, {} faces, impulse {}, pad {})", path.string(),
                                        sphere->points().size(), sphere->faces().size(),
                                        sphere->impulseLength(), sphere->padLength()));
    return sphere;
}

core::Expected<HrirSphere> HrirSphere::parse(std::istream &in, const audio::Config &config)
{
    return parse(in, config, std::nullopt);
}

core::Expected<HrirSphere> HrirSphere::parse(std::istream &in, const audio::Config &config,
                                             std::optional<core::u64> available)
{
    LittleEndianReader reader(in);

    std::array<char, 4> magic{};
    AUR_TRY_VOID(reader.readBytes(magic, "magic"));
    if (magic != kMagic)
        return core::makeError(core::ErrorCode::kInvalidFileFormat, "missing HRIR magic");

    const core::u32 sampleRate = AUR_TRY(reader.readU32("sample rate"));
    if (sampleRate != config.sampleRate())
    {
        return core::makeSampleRateError(
            sampleRate, config.sampleRate(),
            std::format("sphere sampled at {} Hz, device runs at {} Hz", sampleRate, config.sampleRate()));
    }

    const core::u32 impulseLength = AUR_TRY(reader.readU32("impulse length"));
    if (impulseLength == 0)
        return core::makeError(core::ErrorCode::kInvalidLength, "impulse length is zero");

    const core::u32 vertexCount = AUR_TRY(reader.readU32("vertex count"));
    const core::u32 indexCount = AUR_TRY(reader.readU32("index count"));
    if (vertexCount == 0)
        return core::makeError(core::ErrorCode::kInvalidFileFormat, "sphere has no vertices");
    if (indexCount % 3 != 0)
    {
        return core::makeError(core::ErrorCode::kInvalidFileFormat,
                               std::format("index count {} is not a multiple of 3", indexCount));
    }
    if (available && payloadExceeds(*available, impulseLength, vertexCount, indexCount))
    {
        return core::makeError(core::ErrorCode::kIoError,
                               std::format("file holds {} bytes, too short for {} vertices of {} samples",
                                           *available, vertexCount, impulseLength));
    }

    // Counts come from the file; storage grows with what is actually read.
    std::vector<core::u32> indices;
    for (core::u32 i = 0; i < indexCount; ++i)
    {
        const core::u32 index = AUR_TRY(reader.readU32("face indices"));
        if (index >= vertexCount)
        {
            return core::makeError(core::ErrorCode::kInvalidFileFormat,
                                   std::format("face index {} out of range ({} vertices)", index, vertexCount));
        }
        indices.push_back(index);
    }

    std::vector<HrirFace> faces;
    faces.reserve(indices.size() / 3);
    for (core::usize i = 0; i + 2 < indices.size(); i += 3)
        faces.push_back({indices[i], indices[i + 1], indices[i + 2]});

    // The FFT plan is sized from the header, so it is only built once the
    // whole payload has actually been read.
    std::vector<RawVertex> raw;
    for (core::u32 v = 0; v < vertexCount; ++v)
    {
        const core::f32 x = AUR_TRY(reader.readF32("vertex position"));
        const core::f32 y = AUR_TRY(reader.readF32("vertex position"));
        const core::f32 z = AUR_TRY(reader.readF32("vertex position"));
        auto left = AUR_TRY(readImpulse(reader, impulseLength, "left impulse"));
        auto right = AUR_TRY(readImpulse(reader, impulseLength, "right impulse"));
        raw.push_back({math::Vec3f(x, y, z), std::move(left), std::move(right)});
    }

    const core::usize padLength = dsp::padLength(config.hrtfBlockLength(), impulseLength);
    dsp::Fft fft(padLength, dsp::FftDirection::kForward);

    std::vector<HrirPoint> points;
    points.reserve(raw.size());
    for (auto &vertex : raw)
    {
        points.emplace_back(vertex.position, toSpectrum(vertex.left, fft), toSpectrum(vertex.right, fft));
        vertex.left = {};
        vertex.right = {};
    }

    return HrirSphere(std::move(points), std::move(faces), impulseLength, padLength, sampleRate);
}

void HrirSphere::transform(const math::Mat4f &matrix)
{
    for (auto &point : _points)
        point.setPosition(matrix.transformDirection(point.position()));
}

std::optional<SphereHit> HrirSphere::intersect(const math::Vec3f &direction) const
{
    const auto ray = math::Ray::fromTwoPoints(math::Vec3f::zero(), direction * core::kHrtfRayLength);
    if (!ray)
        return std::nullopt;
    return firstHit(*ray);
}

std::optional<SphereHit> HrirSphere::firstHit(const math::Ray &ray) const
{
    for (core::usize i = 0; i < _faces.size(); ++i)
    {
        const HrirFace &face = _faces[i];
        const math::Vec3f &a = _points[face.a].position();
        const math::Vec3f &b = _points[face.b].position();
        const math::Vec3f &c = _points[face.c].position();

        if (const auto point = ray.triangleIntersection({a, b, c}))
            return SphereHit{i, *point, math::barycentricCoords(*point, a, b, c)};
    }
    return std::nullopt;
}

bool HrirSphere::sampleBilinear(const math::Vec3f &direction,
                                std::span<dsp::Complex> left,
                                std::span<dsp::Complex> right) const
{
    AUR_VERIFY(left.size() == _padLength && right.size() == _padLength);

    const auto ray = math::Ray::fromTwoPoints(math::Vec3f::zero(), direction * core::kHrtfRayLength);
    if (!ray)
    {
        const HrirPoint &first = _points.front();
        std::ranges::copy(first.leftSpectrum(), left.begin());
        std::ranges::copy(first.rightSpectrum(), right.begin());
        return true;
    }

    const auto hit = firstHit(*ray);
    if (!hit)
        return false;

    const HrirFace &face = _faces[hit->face];
    const HrirPoint &a = _points[face.a];
    const HrirPoint &b = _points[face.b];
    const HrirPoint &c = _points[face.c];
    const auto [ka, kb, kc] = hit->weights;

    for (core::usize i = 0; i < _padLength; ++i)
    {
        left[i] = a.leftSpectrum()[i] * ka + b.leftSpectrum()[i] * kb + c.leftSpectrum()[i] * kc;
        right[i] = a.rightSpectrum()[i] * ka + b.rightSpectrum()[i] * kb + c.rightSpectrum()[i] * kc;
    }
    return true;
}

} // namespace aur::hrtf
