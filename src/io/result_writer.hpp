#pragma once

/// @file result_writer.hpp
/// @brief CSV writers for offsets, match matrices and convergence series.

#include "align/catalogue.hpp"
#include "align/convergence_tracker.hpp"
#include "align/match_matrix.hpp"

#include <filesystem>
#include <span>

namespace skyalign::io
{
    /// @brief Static utility class writing run results for downstream tools.
    ///
    /// Every writer returns false (after logging) if the file cannot be
    /// written.
    class ResultWriter
    {
    public:
        ResultWriter() = delete;

        /// @brief Per-beam offsets:
        /// `beam,center_ra_deg,center_dec_deg,n_sources,d_ra_arcsec,d_dec_arcsec`.
        [[nodiscard]] static bool write_offsets(const std::filesystem::path& path,
                                                std::span<const align::Catalogue> catalogues);

        /// @brief Dense K×K match counts, one row per line, no header.
        [[nodiscard]] static bool write_match_matrix(const std::filesystem::path& path,
                                                     const align::MatchMatrix& matrix);

        /// @brief Convergence series:
        /// `step,total_separation_arcsec,total_matches,mean_separation_arcsec`.
        [[nodiscard]] static bool write_statistics(const std::filesystem::path& path,
                                                   std::span<const align::StepStatistics> statistics);
    };

} // namespace skyalign::io
