#pragma once

/// @file options.hpp
/// @brief Command-line options for the skyalign tool.

#include "align/alignment_config.hpp"
#include "align/reseed_source.hpp"
#include "catalog/component_record.hpp"
#include "core/types.hpp"

#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace skyalign::app
{
    /// @brief Everything the tool needs for one run.
    struct Options
    {
        std::filesystem::path catalogue_dir;
        u32 sbid = 0;
        u32 beams = 36;
        align::AlignmentConfig alignment{};
        catalog::SelectionConfig selection{};
        u64 seed = align::PcgReseedSource::kDefaultSeed;
        std::string output_prefix = "skyalign";
        spdlog::level::level_enum log_level = spdlog::level::info;
        bool show_help = false;
    };

    /// @brief Parse argv with Boost.Program_options.
    ///
    /// Usage text goes to `out` for --help and on errors.
    /// @return Parsed options (with show_help set for --help), or
    ///         std::nullopt if the command line is invalid.
    [[nodiscard]] std::optional<Options> parse_options(int argc, const char* const argv[], std::ostream& out);

} // namespace skyalign::app
