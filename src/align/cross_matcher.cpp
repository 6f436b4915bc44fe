/// @file cross_matcher.cpp
/// @brief CrossMatcher implementation.

#include "align/cross_matcher.hpp"

#include <cmath>
#include <limits>

namespace skyalign::align
{

namespace
{

constexpr f64 kNaN = std::numeric_limits<f64>::quiet_NaN();

// Population mean and standard deviation of one offset component
void accumulate_statistics(MatchResult& result)
{
    if (result.pairs.empty())
    {
        result.offset_mean = astro::Offset{.d_ra = kNaN, .d_dec = kNaN};
        result.offset_std  = astro::Offset{.d_ra = kNaN, .d_dec = kNaN};
        return;
    }

    const auto n = static_cast<f64>(result.pairs.size());

    f64 sum_ra  = 0.0;
    f64 sum_dec = 0.0;
    for (const auto& pair : result.pairs)
    {
        sum_ra += pair.offset.d_ra;
        sum_dec += pair.offset.d_dec;
    }
    const f64 mean_ra  = sum_ra / n;
    const f64 mean_dec = sum_dec / n;

    f64 var_ra  = 0.0;
    f64 var_dec = 0.0;
    for (const auto& pair : result.pairs)
    {
        var_ra += (pair.offset.d_ra - mean_ra) * (pair.offset.d_ra - mean_ra);
        var_dec += (pair.offset.d_dec - mean_dec) * (pair.offset.d_dec - mean_dec);
    }

    result.offset_mean = astro::Offset{.d_ra = mean_ra, .d_dec = mean_dec};
    result.offset_std  = astro::Offset{.d_ra = std::sqrt(var_ra / n), .d_dec = std::sqrt(var_dec / n)};
}

} // anonymous namespace

MatchResult CrossMatcher::match(const SphericalPointSet& a,
                                const SphericalPointSet& b,
                                f64 separation_limit_arcsec)
{
    MatchResult result;

    const f64 limit_rad = separation_limit_arcsec * astro_constants::kArcSecToRad;
    std::vector<usize> neighbours;

    for (usize i = 0; i < a.size(); ++i)
    {
        b.query(a[i], limit_rad, neighbours);

        for (const usize j : neighbours)
        {
            const f64 separation = astro::SkyMath::separation(a[i], b[j]) * astro_constants::kRadToArcSec;

            result.pairs.push_back(MatchPair{
                .index_a           = i,
                .index_b           = j,
                .separation_arcsec = separation,
                .offset            = astro::SkyMath::offset_between(a[i], b[j]),
            });
            result.total_separation_arcsec += separation;
        }
    }

    result.count = result.pairs.size();
    accumulate_statistics(result);

    return result;
}

usize CrossMatcher::count(const SphericalPointSet& a,
                          const SphericalPointSet& b,
                          f64 separation_limit_arcsec,
                          f64* total_separation_arcsec)
{
    const f64 limit_rad = separation_limit_arcsec * astro_constants::kArcSecToRad;
    std::vector<usize> neighbours;

    usize matches = 0;
    f64 total = 0.0;

    for (usize i = 0; i < a.size(); ++i)
    {
        b.query(a[i], limit_rad, neighbours);
        matches += neighbours.size();

        if (total_separation_arcsec != nullptr)
        {
            for (const usize j : neighbours)
            {
                total += astro::SkyMath::separation(a[i], b[j]) * astro_constants::kRadToArcSec;
            }
        }
    }

    if (total_separation_arcsec != nullptr)
    {
        *total_separation_arcsec = total;
    }

    return matches;
}

} // namespace skyalign::align
