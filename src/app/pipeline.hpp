#pragma once

/// @file pipeline.hpp
/// @brief End-to-end run: load beams, register them, write results.

#include "align/alignment_scheduler.hpp"
#include "align/catalogue.hpp"
#include "app/options.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace skyalign::app
{
    /// @brief Files produced by a run.
    struct OutputPaths
    {
        std::filesystem::path offsets;
        std::filesystem::path match_matrix;
        std::filesystem::path statistics;

        /// @brief `<prefix>_offsets.csv`, `<prefix>_match_matrix.csv`,
        /// `<prefix>_statistics.csv`.
        [[nodiscard]] static OutputPaths from_prefix(const std::string& prefix);
    };

    /// @brief Result of a successful run.
    struct PipelineResult
    {
        std::vector<align::Catalogue> catalogues;
        align::AlignmentReport report;
        OutputPaths outputs;
    };

    class Pipeline
    {
    public:
        Pipeline() = delete;

        /// @brief Run every stage for `options`.
        /// @return The aligned catalogues and report, or std::nullopt if any
        ///         stage failed (the failure is logged).
        [[nodiscard]] static std::optional<PipelineResult> run(const Options& options);

        /// @brief Log a per-beam table of the final offsets.
        static void log_summary(const PipelineResult& result);
    };

} // namespace skyalign::app
