#pragma once

/// @file cross_matcher.hpp
/// @brief Radius-based cross-match between two point sets.

#include "align/point_set.hpp"
#include "astro/sky_math.hpp"
#include "core/types.hpp"

#include <vector>

namespace skyalign::align
{
    /// @brief One correspondence between a point in A and a point in B.
    struct MatchPair
    {
        usize index_a;              ///< Index into A
        usize index_b;              ///< Index into B
        f64 separation_arcsec;      ///< Great-circle distance A→B
        astro::Offset offset;       ///< Spherical offset of B as seen from A
    };

    /// @brief Outcome of matching catalogue A against catalogue B.
    ///
    /// With `count == 0` the mean and std are NaN and usable() is false;
    /// such a result must never be read as a (0, 0) shift.
    struct MatchResult
    {
        std::vector<MatchPair> pairs;
        usize count = 0;
        astro::Offset offset_mean{};        ///< Mean of (B − A) per axis (arcsec)
        astro::Offset offset_std{};         ///< Population std of (B − A) per axis (arcsec)
        f64 total_separation_arcsec = 0.0;  ///< Sum of pair separations

        [[nodiscard]] bool usable() const { return count > 0; }
    };

    /// @brief Symmetric "search within radius" matcher.
    ///
    /// Every (a, b) with separation(a, b) <= limit is reported, so one point
    /// may take part in several pairs when neighbours crowd inside the limit.
    /// The pair set is therefore identical whichever argument comes first.
    class CrossMatcher
    {
    public:
        CrossMatcher() = delete;

        /// @brief Match every point of `a` against `b`.
        /// @param separation_limit_arcsec Maximum separation for a match (> 0).
        [[nodiscard]] static MatchResult match(const SphericalPointSet& a,
                                               const SphericalPointSet& b,
                                               f64 separation_limit_arcsec);

        /// @brief Count-only variant for the match matrix and statistics.
        ///
        /// Skips per-pair offsets; `total_separation_arcsec` receives the
        /// summed separations when non-null.
        [[nodiscard]] static usize count(const SphericalPointSet& a,
                                         const SphericalPointSet& b,
                                         f64 separation_limit_arcsec,
                                         f64* total_separation_arcsec = nullptr);
    };

} // namespace skyalign::align
