/// @file test_sky_math.cpp
/// @brief Unit tests for skyalign::astro::SkyMath.
///
/// Verifies separations, spherical offsets and their inverse, and the
/// Cartesian mean used for beam centres.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/sky_math.hpp"
#include "core/types.hpp"

#include <array>
#include <cmath>
#include <vector>

using namespace skyalign;
using namespace skyalign::astro;

// =================================================================
// Tolerances
// =================================================================

/// Well below a microarcsecond, for exact-inverse checks
static constexpr f64 kTightRad = 1e-12;

/// Offsets in arcsec that should agree to numerical precision
static constexpr f64 kTightArcsec = 1e-6;

static f64 arcsec_between(const SkyPosition& a, const SkyPosition& b)
{
    return SkyMath::separation(a, b) * astro_constants::kRadToArcSec;
}

// =================================================================
// Separation
// =================================================================

TEST_CASE("One degree along a meridian")
{
    const auto a = SkyMath::from_degrees(120.0, 10.0);
    const auto b = SkyMath::from_degrees(120.0, 11.0);

    CHECK(SkyMath::separation(a, b) * astro_constants::kRadToDeg == doctest::Approx(1.0).epsilon(1e-12));
}

TEST_CASE("Separation is symmetric and zero for identical positions")
{
    const auto a = SkyMath::from_degrees(33.3, -47.1);
    const auto b = SkyMath::from_degrees(33.302, -47.099);

    CHECK(SkyMath::separation(a, b) == SkyMath::separation(b, a));
    CHECK(SkyMath::separation(a, a) == 0.0);
}

TEST_CASE("Separation across the RA wrap")
{
    const auto a = SkyMath::from_degrees(359.9990, 0.0);
    const auto b = SkyMath::from_degrees(0.0010, 0.0);

    CHECK(arcsec_between(a, b) == doctest::Approx(7.2).epsilon(1e-9));
}

TEST_CASE("Antipodal positions are 180 degrees apart")
{
    const auto a = SkyMath::from_degrees(10.0, 25.0);
    const auto b = SkyMath::from_degrees(190.0, -25.0);

    CHECK(SkyMath::separation(a, b) == doctest::Approx(astro_constants::kPi).epsilon(1e-12));
}

// =================================================================
// Spherical offsets
// =================================================================

TEST_CASE("Pure declination offset")
{
    const auto origin = SkyMath::from_degrees(10.0, 20.0);
    const auto target = SkyMath::from_degrees(10.0, 20.0 + 5.0 / 3600.0);

    const auto offset = SkyMath::offset_between(origin, target);

    CHECK(offset.d_ra == doctest::Approx(0.0));
    CHECK(offset.d_dec == doctest::Approx(5.0).epsilon(1e-9));
}

TEST_CASE("RA offset carries the cos(dec) foreshortening")
{
    // 20 arcsec of RA at Dec 60° spans 10 arcsec on the sky
    const auto origin = SkyMath::from_degrees(200.0, 60.0);
    const auto target = SkyMath::from_degrees(200.0 + 20.0 / 3600.0, 60.0);

    const auto offset = SkyMath::offset_between(origin, target);

    CHECK(offset.d_ra == doctest::Approx(10.0).epsilon(1e-6));
    // Small-circle vs great-circle curvature: sub-milliarcsecond
    CHECK(std::abs(offset.d_dec) < 1e-3);
}

TEST_CASE("offset_by inverts offset_between")
{
    const std::array<std::array<f64, 4>, 5> cases{{
        {150.0, -30.0, 150.002, -29.9985},
        {359.9995, 12.0, 0.0004, 12.0003},
        {45.0, 89.99, 225.0, 89.995},
        {271.3, -64.2, 271.297, -64.201},
        {0.0, 0.0, 0.0, 0.0},
    }};

    for (const auto& c : cases)
    {
        const auto a = SkyMath::from_degrees(c[0], c[1]);
        const auto b = SkyMath::from_degrees(c[2], c[3]);

        const auto reached = SkyMath::offset_by(a, SkyMath::offset_between(a, b));

        CHECK(SkyMath::separation(reached, b) < kTightRad);
    }
}

TEST_CASE("Zero offset leaves a position unchanged")
{
    for (f64 dec = -85.0; dec <= 85.0; dec += 17.0)
    {
        const auto p = SkyMath::from_degrees(123.456, dec);
        const auto q = SkyMath::offset_by(p, Offset{});

        CHECK(q.ra == doctest::Approx(p.ra).epsilon(1e-14));
        CHECK(q.dec == doctest::Approx(p.dec).epsilon(1e-14));
    }
}

TEST_CASE("Shifting forward then back returns to the start")
{
    const Offset d{.d_ra = 4.5, .d_dec = -3.25};

    for (f64 dec = -70.0; dec <= 70.0; dec += 35.0)
    {
        const auto p = SkyMath::from_degrees(88.8, dec);
        const auto back = SkyMath::offset_by(SkyMath::offset_by(p, d), -d);

        // Each shift uses its own origin, so only first order cancels
        CHECK(arcsec_between(p, back) < 1e-2);
    }
}

TEST_CASE("Common shift preserves separations between nearby points")
{
    const auto a = SkyMath::from_degrees(210.0, -20.0);
    const auto b = SkyMath::offset_by(a, Offset{.d_ra = 18.0, .d_dec = 24.0});
    const Offset shift{.d_ra = -5.0, .d_dec = 2.0};

    const f64 before = arcsec_between(a, b);
    const f64 after  = arcsec_between(SkyMath::offset_by(a, shift), SkyMath::offset_by(b, shift));

    CHECK(before == doctest::Approx(30.0).epsilon(1e-6));
    CHECK(std::abs(after - before) < 1e-2);
}

TEST_CASE("Offsets accumulate field-wise and negate")
{
    Offset total{};
    total += Offset{.d_ra = 1.5, .d_dec = -2.0};
    total += Offset{.d_ra = 0.25, .d_dec = 0.5};

    CHECK(total.d_ra == doctest::Approx(1.75));
    CHECK(total.d_dec == doctest::Approx(-1.5));

    const Offset neg = -total;
    CHECK(neg.d_ra == doctest::Approx(-1.75));
    CHECK(neg.d_dec == doctest::Approx(1.5));
}

// =================================================================
// Cartesian helpers
// =================================================================

TEST_CASE("Cartesian round trip")
{
    const auto p = SkyMath::from_degrees(301.0, -41.5);
    const auto q = SkyMath::from_cartesian(SkyMath::to_cartesian(p));

    CHECK(SkyMath::separation(p, q) < kTightRad);
}

TEST_CASE("Mean position of a symmetric pattern is its centre")
{
    const auto center = SkyMath::from_degrees(45.0, 30.0);
    const std::vector<SkyPosition> ring{
        SkyMath::offset_by(center, Offset{.d_ra = 600.0, .d_dec = 0.0}),
        SkyMath::offset_by(center, Offset{.d_ra = -600.0, .d_dec = 0.0}),
        SkyMath::offset_by(center, Offset{.d_ra = 0.0, .d_dec = 600.0}),
        SkyMath::offset_by(center, Offset{.d_ra = 0.0, .d_dec = -600.0}),
    };

    const auto mean = SkyMath::mean_position(ring);

    CHECK(arcsec_between(mean, center) < 0.1);
}

TEST_CASE("Mean position of nothing is the origin")
{
    const auto mean = SkyMath::mean_position({});

    CHECK(mean.ra == 0.0);
    CHECK(mean.dec == 0.0);
}

TEST_CASE("from_degrees normalizes RA into [0, 2π)")
{
    const auto p = SkyMath::from_degrees(-10.0, 5.0);

    CHECK(p.ra == doctest::Approx(350.0 * astro_constants::kDegToRad));
    CHECK(p.dec == doctest::Approx(5.0 * astro_constants::kDegToRad));
    CHECK(SkyMath::offset_between(p, p).d_ra == doctest::Approx(0.0).epsilon(kTightArcsec));
}

// =================================================================
// Right ascension range
// =================================================================

TEST_CASE("Right ascension stays inside [0, 2π)")
{
    for (const f64 ra_deg : {-1e-15, -1e-13, -360.0, 0.0, 360.0, 720.0 - 1e-13})
    {
        const auto p = SkyMath::from_degrees(ra_deg, 0.0);
        CHECK(p.ra >= 0.0);
        CHECK(p.ra < astro_constants::kTwoPi);
    }

    CHECK(SkyMath::from_degrees(-1e-15, 0.0).ra == 0.0);

    const auto wrapped = SkyMath::from_cartesian(Vec3d{1.0, -1e-17, 0.0});
    CHECK(wrapped.ra >= 0.0);
    CHECK(wrapped.ra < astro_constants::kTwoPi);
}
