#pragma once

/// @file convergence_tracker.hpp
/// @brief Aggregate separation statistics across every catalogue pair.

#include "align/catalogue.hpp"
#include "core/types.hpp"

#include <span>

namespace skyalign::align
{
    /// @brief All-pairs match summary for one scheduler step.
    struct StepStatistics
    {
        usize step = 0;                        ///< Scheduler step this snapshot follows
        f64 total_separation_arcsec = 0.0;     ///< Sum of matched separations over all pairs
        usize total_matches = 0;               ///< Number of matched pairs contributing

        /// @brief Mean matched separation, 0 when nothing matched.
        [[nodiscard]] f64 mean_separation_arcsec() const
        {
            return total_matches > 0 ? total_separation_arcsec / static_cast<f64>(total_matches) : 0.0;
        }
    };

    /// @brief Observability signal for the scheduler's progress.
    ///
    /// Nothing computed here feeds back into scheduling decisions.
    class ConvergenceTracker
    {
    public:
        ConvergenceTracker() = delete;

        /// @brief Cross-match every unordered pair and sum separations and counts.
        [[nodiscard]] static StepStatistics snapshot(std::span<const Catalogue> catalogues,
                                                     f64 separation_limit_arcsec);
    };

} // namespace skyalign::align
