#pragma once

/// @file catalogue_loader.hpp
/// @brief Loads per-beam component catalogues from CSV files.

#include "align/catalogue.hpp"
#include "catalog/component_record.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skyalign::catalog
{
    /// @brief Static utility class for reading beam catalogues.
    ///
    /// Files are CSV with a header row. The header must name the columns
    /// `ra`, `dec` (degrees), `int_flux` and `peak_flux`; order is free and
    /// any other columns are ignored.
    class CatalogueLoader
    {
    public:
        CatalogueLoader() = delete;

        /// @brief Read every component of one catalogue file.
        ///
        /// Malformed rows are skipped with a warning; row numbers count data
        /// rows from 1.
        ///
        /// @return Components on success, std::nullopt if the file cannot be
        ///         opened, lacks a required column, or has no valid rows.
        [[nodiscard]] static std::optional<std::vector<ComponentRecord>>
            load_components(const std::filesystem::path& path);

        /// @brief File name pattern for one beam:
        /// `SB{sbid}.*.beam{beam:02d}.i.MFS.image_comp.csv`.
        [[nodiscard]] static bool matches_beam(std::string_view filename, u32 sbid, u32 beam);

        /// @brief Locate the catalogue of `beam` inside `directory`.
        /// If several files match, the lexicographically first is used.
        [[nodiscard]] static std::optional<std::filesystem::path>
            beam_path(const std::filesystem::path& directory, u32 sbid, u32 beam);

        /// @brief Load, filter and wrap beams 0..beam_count-1 as catalogues.
        ///
        /// Each catalogue's centre is estimated from all of its components,
        /// its points from the components surviving the selection. Any beam
        /// that cannot be loaded aborts the whole load.
        [[nodiscard]] static std::optional<std::vector<align::Catalogue>>
            load_beams(const std::filesystem::path& directory, u32 sbid, u32 beam_count,
                       const SelectionConfig& selection);

        /// @brief Build a catalogue from already loaded components.
        [[nodiscard]] static align::Catalogue make_catalogue(u32 id,
                                                             const std::vector<ComponentRecord>& components,
                                                             const SelectionConfig& selection);

    private:
        /// @brief Split a CSV line on commas.
        [[nodiscard]] static std::vector<std::string_view> split(std::string_view line);

        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
    };

} // namespace skyalign::catalog
