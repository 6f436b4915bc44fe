#pragma once

/// @file alignment_scheduler.hpp
/// @brief Greedy incremental registration of catalogues onto a shared frame.

#include "align/alignment_config.hpp"
#include "align/catalogue.hpp"
#include "align/convergence_tracker.hpp"
#include "align/cross_matcher.hpp"
#include "align/match_matrix.hpp"
#include "align/reseed_source.hpp"
#include "astro/sky_math.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace skyalign::align
{
    /// @brief What a scheduler step did.
    enum class StepKind : u8
    {
        Shift,      ///< A floating catalogue was moved onto a fixed one and fixed
        Reseed,     ///< No floating catalogues were left; the partition was reset
    };

    [[nodiscard]] inline const char* to_string(StepKind kind)
    {
        switch (kind)
        {
        case StepKind::Shift:  return "shift";
        case StepKind::Reseed: return "reseed";
        }
        return "unknown";
    }

    /// @brief Record of one executed step.
    struct StepRecord
    {
        usize step = 0;
        StepKind kind = StepKind::Shift;
        usize reference = 0;        ///< Fixed catalogue matched against, or the new seed on reseed
        usize moved = 0;            ///< Catalogue shifted and fixed (equals reference on reseed)
        usize match_count = 0;      ///< Matches behind the applied correction
        astro::Offset correction{}; ///< Offset applied to `moved` (zero on reseed or no match)
    };

    /// @brief Everything a run produced besides the updated catalogues.
    struct AlignmentReport
    {
        usize seed = 0;                         ///< Index chosen by SeedSelector
        MatchMatrix initial_matrix;             ///< Match counts before any shift
        std::vector<StepRecord> steps;          ///< One per executed step
        std::vector<StepStatistics> statistics; ///< One per step when gathering is enabled

        [[nodiscard]] usize reseed_count() const;
    };

    /// @brief Drives which catalogue is shifted onto which, one step at a time.
    ///
    /// Each of the catalogues × passes steps either:
    /// - matches every (fixed, floating) combination, takes the pair with
    ///   the most matches (first in fixed-major index order on ties), moves
    ///   the floating catalogue by minus the mean (floating − fixed) offset
    ///   and fixes it; or
    /// - when nothing is floating, unfixes everything and fixes a single
    ///   catalogue picked by the ReseedSource.
    ///
    /// Matches are recomputed every step because every shift moves points
    /// and the initial matrix goes stale immediately.
    class AlignmentScheduler
    {
    public:
        AlignmentScheduler(const AlignmentConfig& config, ReseedSource& reseed_source);

        /// @brief Register `catalogues` in place.
        ///
        /// @return The run report, or std::nullopt when the input is empty,
        ///         the configuration is invalid, or seeding breaks the
        ///         one-fixed invariant.
        [[nodiscard]] std::optional<AlignmentReport> run(std::span<Catalogue> catalogues);

        [[nodiscard]] const AlignmentConfig& config() const { return m_config; }

    private:
        struct Candidate
        {
            usize fixed;
            usize floating;
            MatchResult result;
        };

        /// @brief Best (fixed, floating) pair, std::nullopt when nothing floats.
        [[nodiscard]] std::optional<Candidate> find_next_pair(std::span<const Catalogue> catalogues) const;

        [[nodiscard]] std::optional<StepRecord> reseed(std::span<Catalogue> catalogues, usize step);

        [[nodiscard]] StepRecord shift(std::span<Catalogue> catalogues, const Candidate& candidate, usize step) const;

        AlignmentConfig m_config;
        ReseedSource& m_reseed_source;
    };

} // namespace skyalign::align
