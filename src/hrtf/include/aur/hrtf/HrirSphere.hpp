/**
 * @file HrirSphere.hpp
 * @brief Triangulated sphere of head-related impulse responses.
 *
 * An HRIR sphere is a set of directions connected into a closed triangle
 * mesh.  Every vertex carries the impulse responses measured for the left
 * and right ear from that direction.  At load time each response is
 * zero-padded to the convolution length and transformed once; only the
 * spectra are kept, since the same spectra are reused by every render
 * call of every source.
 *
 * Spheres are measured in a right-handed frame.  Hosts working in another
 * convention either orient their listener accordingly or re-orient the
 * sphere once with transform().
 *
 * Ready-made spheres (IRCAM Listen database) are distributed by the
 * hrir_sphere_builder project.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_HRTF_HRIR_SPHERE_HPP
    #define AUR_HRTF_HRIR_SPHERE_HPP

    #include <aur/audio/Config.hpp>
    #include <aur/core/Expected.hpp>
    #include <aur/core/NonCopyable.hpp>
    #include <aur/core/Types.hpp>
    #include <aur/dsp/Fft.hpp>
    #include <aur/math/Mat4.hpp>
    #include <aur/math/Ray.hpp>
    #include <aur/math/Vec3.hpp>

    #include <array>
    #include <filesystem>
    #include <iosfwd>
    #include <optional>
    #include <span>
    #include <vector>

namespace aur::hrtf {

/**
 * @brief One direction of the sphere with its left/right ear spectra.
 */
class HrirPoint final {
public:
    HrirPoint(math::Vec3f position, std::vector<dsp::Complex> left, std::vector<dsp::Complex> right)
        : _position(position), _left(std::move(left)), _right(std::move(right)) {}

    [[nodiscard]] const math::Vec3f &position() const noexcept { return _position; }
    void setPosition(const math::Vec3f &position) noexcept { _position = position; }

    [[nodiscard]] std::span<const dsp::Complex> leftSpectrum()  const noexcept { return _left; }
    [[nodiscard]] std::span<const dsp::Complex> rightSpectrum() const noexcept { return _right; }

private:
    math::Vec3f               _position;
    std::vector<dsp::Complex> _left;
    std::vector<dsp::Complex> _right;
};

/**
 * @brief Triangle of the sphere mesh, as indices into the point list.
 */
struct HrirFace {
    core::u32 a;
    core::u32 b;
    core::u32 c;
};

/**
 * @brief Result of casting a direction onto the mesh.
 */
struct SphereHit {
    core::usize              face;     ///< Index into faces().
    math::Vec3f              point;    ///< Intersection point.
    std::array<core::f32, 3> weights;  ///< Barycentric weights of the face's a, b, c.
};

/**
 * @brief Immutable-after-load store of HRTF spectra on a sphere mesh.
 *
 * Invariants: at least one point; every face index is in bounds; every
 * spectrum holds padLength() bins.
 */
class HrirSphere final : private core::NonCopyable<HrirSphere> {
public:
    /**
     * @brief Loads and pre-transforms an HRIR sphere file.
     *
     * The file's sample rate must equal @p config.sampleRate(); the pad
     * length is derived from @p config.hrtfBlockLength().
     *
     * The file size is checked against the counts in the header before
     * any impulse is read.
     *
     * @return The sphere, or kIoError (open failure, file shorter than its
     *         header announces, truncated payload),
     *         kInvalidFileFormat (bad magic, empty or malformed mesh),
     *         kInvalidSampleRate (carries both rates), kInvalidLength
     *         (zero impulse length).
     */
    [[nodiscard]] static core::Expected<HrirSphere> load(const std::filesystem::path &path,
                                                          const audio::Config &config);

    /**
     * @brief Parses a sphere from an already opened binary stream.
     * @see load()
     */
    [[nodiscard]] static core::Expected<HrirSphere> parse(std::istream &in, const audio::Config &config);

    HrirSphere(HrirSphere &&) noexcept            = default;
    HrirSphere &operator=(HrirSphere &&) noexcept = default;

    /**
     * @brief Rotates and/or scales every point.
     *
     * Only the 3x3 part of @p matrix is applied.  The matrix must not
     * carry a translation: sampling casts rays from the origin, so a
     * translated sphere would no longer surround it.
     */
    void transform(const math::Mat4f &matrix);

    [[nodiscard]] std::span<const HrirPoint> points() const noexcept { return _points; }
    [[nodiscard]] std::span<HrirPoint>       points()       noexcept { return _points; }
    [[nodiscard]] std::span<const HrirFace>  faces()  const noexcept { return _faces; }

    [[nodiscard]] core::usize impulseLength() const noexcept { return _impulseLength; }
    [[nodiscard]] core::usize padLength()     const noexcept { return _padLength; }
    [[nodiscard]] core::u32   sampleRate()    const noexcept { return _sampleRate; }

    /**
     * @brief First face, in file order, hit by a ray cast along @p direction.
     * @return nullopt for a zero direction or when no face is hit.
     */
    [[nodiscard]] std::optional<SphereHit> intersect(const math::Vec3f &direction) const;

    /**
     * @brief Bilinear (barycentric) sampling of the spectra along @p direction.
     *
     * Writes the weighted sum of the hit face's three spectra into
     * @p left and @p right, which must hold padLength() bins.  A zero
     * direction copies the first point's spectra.  When the ray misses
     * every face (mesh seams, degenerate faces) the outputs are left
     * untouched and false is returned: the caller keeps the spectra of its
     * previous call.
     *
     * Never allocates.
     */
    bool sampleBilinear(const math::Vec3f &direction,
                        std::span<dsp::Complex> left,
                        std::span<dsp::Complex> right) const;

private:
    HrirSphere(std::vector<HrirPoint> points, std::vector<HrirFace> faces,
               core::usize impulseLength, core::usize padLength, core::u32 sampleRate);

    /// @p available is the stream size in bytes when known.
    [[nodiscard]] static core::Expected<HrirSphere> parse(std::istream &in, const audio::Config &config,
                                                           std::optional<core::u64> available);

    [[nodiscard]] std::optional<SphereHit> firstHit(const math::Ray &ray) const;

    std::vector<HrirPoint> _points;
    std::vector<HrirFace>  _faces;
    core::usize            _impulseLength;
    core::usize            _padLength;
    core::u32              _sampleRate;
};

} // namespace aur::hrtf

#endif // AUR_HRTF_HRIR_SPHERE_HPP
