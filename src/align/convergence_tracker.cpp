/// @file convergence_tracker.cpp
/// @brief ConvergenceTracker implementation.

#include "align/convergence_tracker.hpp"

#include "align/cross_matcher.hpp"

namespace skyalign::align
{

StepStatistics ConvergenceTracker::snapshot(std::span<const Catalogue> catalogues, f64 separation_limit_arcsec)
{
    StepStatistics stats;

    for (usize i = 0; i < catalogues.size(); ++i)
    {
        for (usize j = i + 1; j < catalogues.size(); ++j)
        {
            f64 separation = 0.0;
            stats.total_matches += CrossMatcher::count(catalogues[i].points, catalogues[j].points,
                                                       separation_limit_arcsec, &separation);
            stats.total_separation_arcsec += separation;
        }
    }

    return stats;
}

} // namespace skyalign::align
