/// @file sky_math.cpp
/// @brief Implementation of spherical astrometry helpers.

#include "astro/sky_math.hpp"

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>

namespace skyalign::astro
{

SkyPosition SkyMath::from_degrees(f64 ra_deg, f64 dec_deg)
{
    return SkyPosition{
        .ra  = normalize_radians(ra_deg * astro_constants::kDegToRad),
        .dec = dec_deg * astro_constants::kDegToRad,
    };
}

// -----------------------------------------------------------------
// Haversine separation
//
// hav(θ) = hav(Δdec) + cos(dec1) × cos(dec2) × hav(Δra)
// θ = 2 × asin(√hav(θ))
// -----------------------------------------------------------------

f64 SkyMath::separation(const SkyPosition& a, const SkyPosition& b)
{
    const f64 sin_ddec = std::sin((b.dec - a.dec) * 0.5);
    const f64 sin_dra  = std::sin((b.ra - a.ra) * 0.5);

    const f64 hav = sin_ddec * sin_ddec + std::cos(a.dec) * std::cos(b.dec) * sin_dra * sin_dra;

    return 2.0 * std::asin(std::sqrt(std::clamp(hav, 0.0, 1.0)));
}

// -----------------------------------------------------------------
// Offset frame centred on the origin (a0, d0)
//
// Rotate by -a0 about the pole, then by d0 about the new y axis:
//   x' =  cos(d0) × cos(d) × cos(Δa) + sin(d0) × sin(d)
//   y' =  cos(d) × sin(Δa)
//   z' = -sin(d0) × cos(d) × cos(Δa) + cos(d0) × sin(d)
//
//   d_ra  = atan2(y', x')
//   d_dec = asin(z')
// -----------------------------------------------------------------

Offset SkyMath::offset_between(const SkyPosition& origin, const SkyPosition& target)
{
    const f64 delta_ra = target.ra - origin.ra;

    const f64 sin_d0 = std::sin(origin.dec);
    const f64 cos_d0 = std::cos(origin.dec);
    const f64 sin_d  = std::sin(target.dec);
    const f64 cos_d  = std::cos(target.dec);
    const f64 cos_da = std::cos(delta_ra);
    const f64 sin_da = std::sin(delta_ra);

    const f64 x = cos_d0 * cos_d * cos_da + sin_d0 * sin_d;
    const f64 y = cos_d * sin_da;
    const f64 z = -sin_d0 * cos_d * cos_da + cos_d0 * sin_d;

    const f64 lon = std::atan2(y, x);
    const f64 lat = std::atan2(z, std::hypot(x, y));

    return Offset{
        .d_ra  = lon * astro_constants::kRadToArcSec,
        .d_dec = lat * astro_constants::kRadToArcSec,
    };
}

// -----------------------------------------------------------------
// Inverse rotation of the offset frame back to equatorial:
//   x' = cos(lat) × cos(lon), y' = cos(lat) × sin(lon), z' = sin(lat)
//   x  = cos(d0) × x' - sin(d0) × z'
//   y  = y'
//   z  = sin(d0) × x' + cos(d0) × z'
//   ra = a0 + atan2(y, x), dec = atan2(z, √(x² + y²))
// -----------------------------------------------------------------

SkyPosition SkyMath::offset_by(const SkyPosition& origin, const Offset& offset)
{
    const f64 lon = offset.d_ra * astro_constants::kArcSecToRad;
    const f64 lat = offset.d_dec * astro_constants::kArcSecToRad;

    const f64 sin_d0 = std::sin(origin.dec);
    const f64 cos_d0 = std::cos(origin.dec);

    const f64 xp = std::cos(lat) * std::cos(lon);
    const f64 yp = std::cos(lat) * std::sin(lon);
    const f64 zp = std::sin(lat);

    const f64 x = cos_d0 * xp - sin_d0 * zp;
    const f64 y = yp;
    const f64 z = sin_d0 * xp + cos_d0 * zp;

    return SkyPosition{
        .ra  = normalize_radians(origin.ra + std::atan2(y, x)),
        .dec = std::atan2(z, std::hypot(x, y)),
    };
}

Vec3d SkyMath::to_cartesian(const SkyPosition& position)
{
    const f64 cos_dec = std::cos(position.dec);
    return Vec3d{
        cos_dec * std::cos(position.ra),
        cos_dec * std::sin(position.ra),
        std::sin(position.dec),
    };
}

SkyPosition SkyMath::from_cartesian(const Vec3d& v)
{
    return SkyPosition{
        .ra  = normalize_radians(std::atan2(v.y, v.x)),
        .dec = std::atan2(v.z, std::hypot(v.x, v.y)),
    };
}

SkyPosition SkyMath::mean_position(std::span<const SkyPosition> positions)
{
    if (positions.empty())
    {
        return SkyPosition{.ra = 0.0, .dec = 0.0};
    }

    Vec3d sum{0.0};
    for (const auto& position : positions)
    {
        sum += to_cartesian(position);
    }

    const f64 length = glm::length(sum);
    if (length <= 0.0)
    {
        return SkyPosition{.ra = 0.0, .dec = 0.0};
    }

    return from_cartesian(sum / length);
}

// -----------------------------------------------------------------
// Normalize angle to [0, 2π)
// -----------------------------------------------------------------

f64 SkyMath::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    // A tiny negative remainder rounds up to exactly 2π
    if (angle >= astro_constants::kTwoPi)
    {
        angle = 0.0;
    }
    return angle;
}

} // namespace skyalign::astro
