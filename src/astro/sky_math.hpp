#pragma once

/// @file sky_math.hpp
/// @brief Spherical geometry on the celestial sphere: separations, offsets, centres.

#include "core/types.hpp"

#include <span>

namespace skyalign::astro
{
    /// @brief Position on the celestial sphere.
    struct SkyPosition
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Angular offset along the two sky axes, in arcseconds.
    ///
    /// `d_ra` is measured along the great circle through the origin that is
    /// perpendicular to its meridian, so it already carries the cos(dec)
    /// foreshortening. `d_dec` is measured along the meridian.
    struct Offset
    {
        f64 d_ra  = 0.0;   ///< Offset in the RA direction (arcsec)
        f64 d_dec = 0.0;   ///< Offset in the Dec direction (arcsec)

        Offset& operator+=(const Offset& other)
        {
            d_ra += other.d_ra;
            d_dec += other.d_dec;
            return *this;
        }

        [[nodiscard]] Offset operator-() const { return Offset{.d_ra = -d_ra, .d_dec = -d_dec}; }
    };

    /// @brief Static utility class for spherical astrometry.
    ///
    /// All positions are in radians, all offsets in arcseconds.
    class SkyMath
    {
    public:
        SkyMath() = delete;

        /// @brief Build a position from degrees, normalizing RA to [0, 2π).
        [[nodiscard]] static SkyPosition from_degrees(f64 ra_deg, f64 dec_deg);

        /// @brief Great-circle distance between two positions (radians).
        ///
        /// Haversine form: symmetric in its arguments and well conditioned
        /// for arcsecond-scale separations.
        [[nodiscard]] static f64 separation(const SkyPosition& a, const SkyPosition& b);

        /// @brief Spherical offsets of `target` as seen from `origin`.
        ///
        /// The target is rotated into the frame whose (0, 0) point is the
        /// origin; its longitude and latitude in that frame are the offsets.
        [[nodiscard]] static Offset offset_between(const SkyPosition& origin, const SkyPosition& target);

        /// @brief Position reached by moving `origin` by `offset`.
        ///
        /// Exact inverse of offset_between():
        /// offset_by(a, offset_between(a, b)) == b.
        [[nodiscard]] static SkyPosition offset_by(const SkyPosition& origin, const Offset& offset);

        /// @brief Unit vector for a position.
        [[nodiscard]] static Vec3d to_cartesian(const SkyPosition& position);

        /// @brief Position of a (not necessarily unit) Cartesian vector.
        [[nodiscard]] static SkyPosition from_cartesian(const Vec3d& v);

        /// @brief Rough centre of a set of positions: the renormalized mean of
        /// their unit vectors. Returns (0, 0) for an empty set.
        [[nodiscard]] static SkyPosition mean_position(std::span<const SkyPosition> positions);

    private:
        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace skyalign::astro
