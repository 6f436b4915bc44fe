/// @file test_cross_matcher.cpp
/// @brief Unit tests for skyalign::align::CrossMatcher.
///
/// Covers radius-join semantics, argument-order symmetry, offset
/// statistics and the no-match sentinel.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "align/cross_matcher.hpp"
#include "align/point_set.hpp"
#include "astro/sky_math.hpp"
#include "test_support.hpp"

#include <cmath>
#include <vector>

using namespace skyalign;
using namespace skyalign::align;
using astro::Offset;
using astro::SkyMath;
using test_support::grid_field;
using test_support::shifted;

TEST_CASE("Identical sets match point for point with zero offset")
{
    const SphericalPointSet a(grid_field(150.0, -30.0, 5, 6));

    const auto result = CrossMatcher::match(a, a, 1.0);

    CHECK(result.usable());
    CHECK(result.count == a.size());
    CHECK(result.pairs.size() == a.size());
    CHECK(result.offset_mean.d_ra == 0.0);
    CHECK(result.offset_mean.d_dec == 0.0);
    CHECK(result.offset_std.d_ra == 0.0);
    CHECK(result.offset_std.d_dec == 0.0);
    CHECK(result.total_separation_arcsec == 0.0);

    for (const auto& pair : result.pairs)
    {
        CHECK(pair.index_a == pair.index_b);
    }
}

TEST_CASE("Known shift is recovered as the mean offset")
{
    const auto positions = grid_field(20.0, 45.0, 6, 6);
    const SphericalPointSet a(positions);
    const SphericalPointSet b(shifted(positions, Offset{.d_ra = 3.0, .d_dec = -2.0}));

    const auto result = CrossMatcher::match(a, b, 9.0);

    REQUIRE(result.count == positions.size());
    CHECK(result.offset_mean.d_ra == doctest::Approx(3.0).epsilon(1e-6));
    CHECK(result.offset_mean.d_dec == doctest::Approx(-2.0).epsilon(1e-6));
    CHECK(result.offset_std.d_ra < 1e-6);
    CHECK(result.offset_std.d_dec < 1e-6);
    CHECK(result.total_separation_arcsec ==
          doctest::Approx(static_cast<f64>(positions.size()) * std::sqrt(13.0)).epsilon(1e-6));
}

TEST_CASE("Offsets are B relative to A")
{
    const auto positions = grid_field(100.0, 0.0, 2, 2);
    const SphericalPointSet a(positions);
    const SphericalPointSet b(shifted(positions, Offset{.d_ra = 0.0, .d_dec = 4.0}));

    const auto forward  = CrossMatcher::match(a, b, 9.0);
    const auto backward = CrossMatcher::match(b, a, 9.0);

    CHECK(forward.offset_mean.d_dec == doctest::Approx(4.0).epsilon(1e-6));
    CHECK(backward.offset_mean.d_dec == doctest::Approx(-4.0).epsilon(1e-6));
}

TEST_CASE("Every pair inside the limit is reported")
{
    const auto origin = SkyMath::from_degrees(210.0, -50.0);

    // One A point with two B neighbours inside 9 arcsec and one outside
    const SphericalPointSet a(std::vector<astro::SkyPosition>{origin});
    const SphericalPointSet b(std::vector<astro::SkyPosition>{
        SkyMath::offset_by(origin, Offset{.d_ra = 2.0, .d_dec = 0.0}),
        SkyMath::offset_by(origin, Offset{.d_ra = 0.0, .d_dec = -6.0}),
        SkyMath::offset_by(origin, Offset{.d_ra = 12.0, .d_dec = 0.0}),
    });

    const auto result = CrossMatcher::match(a, b, 9.0);

    REQUIRE(result.count == 2);
    CHECK(result.pairs[0].index_b == 0);
    CHECK(result.pairs[1].index_b == 1);
    CHECK(result.pairs[0].separation_arcsec == doctest::Approx(2.0).epsilon(1e-6));
    CHECK(result.pairs[1].separation_arcsec == doctest::Approx(6.0).epsilon(1e-6));

    // Mean of (2, 0) and (0, -6); population std
    CHECK(result.offset_mean.d_ra == doctest::Approx(1.0).epsilon(1e-6));
    CHECK(result.offset_mean.d_dec == doctest::Approx(-3.0).epsilon(1e-6));
    CHECK(result.offset_std.d_ra == doctest::Approx(1.0).epsilon(1e-6));
    CHECK(result.offset_std.d_dec == doctest::Approx(3.0).epsilon(1e-6));
}

TEST_CASE("Match count does not depend on argument order")
{
    // Crowded sets so that several points have multiple partners
    const auto base = grid_field(5.0, 10.0, 4, 4, 6.0);
    const SphericalPointSet a(base);
    const SphericalPointSet b(shifted(base, Offset{.d_ra = 1.7, .d_dec = 2.9}));

    for (const f64 limit : {0.5, 3.5, 6.0, 9.0, 15.0})
    {
        const auto ab = CrossMatcher::match(a, b, limit);
        const auto ba = CrossMatcher::match(b, a, limit);

        CHECK(ab.count == ba.count);
        CHECK(CrossMatcher::count(a, b, limit) == ab.count);
        CHECK(CrossMatcher::count(b, a, limit) == ba.count);
        CHECK(ab.total_separation_arcsec == doctest::Approx(ba.total_separation_arcsec));
    }

    CHECK(CrossMatcher::match(a, b, 9.0).count > a.size());
}

TEST_CASE("Antipodal clusters never match")
{
    const SphericalPointSet a(grid_field(30.0, 40.0, 3, 3));
    const SphericalPointSet b(grid_field(210.0, -40.0, 3, 3));

    const auto result = CrossMatcher::match(a, b, 9.0);

    CHECK(result.count == 0);
    CHECK(result.pairs.empty());
    CHECK_FALSE(result.usable());
    CHECK(std::isnan(result.offset_mean.d_ra));
    CHECK(std::isnan(result.offset_mean.d_dec));
    CHECK(std::isnan(result.offset_std.d_ra));
    CHECK(std::isnan(result.offset_std.d_dec));
}

TEST_CASE("Matching against an empty set is unusable")
{
    const SphericalPointSet a(grid_field(30.0, 40.0, 2, 2));
    const SphericalPointSet empty;

    CHECK_FALSE(CrossMatcher::match(a, empty, 9.0).usable());
    CHECK_FALSE(CrossMatcher::match(empty, a, 9.0).usable());
    CHECK(CrossMatcher::count(empty, empty, 9.0) == 0);
}

TEST_CASE("count() reports the summed separation")
{
    const auto positions = grid_field(250.0, -10.0, 3, 3);
    const SphericalPointSet a(positions);
    const SphericalPointSet b(shifted(positions, Offset{.d_ra = 0.0, .d_dec = 5.0}));

    f64 total = 0.0;
    const usize n = CrossMatcher::count(a, b, 9.0, &total);

    CHECK(n == positions.size());
    CHECK(total == doctest::Approx(5.0 * static_cast<f64>(positions.size())).epsilon(1e-6));
}
