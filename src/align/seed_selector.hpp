#pragma once

/// @file seed_selector.hpp
/// @brief Chooses the catalogue that anchors the shared frame.

#include "align/catalogue.hpp"
#include "align/match_matrix.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>

namespace skyalign::align
{
    class SeedSelector
    {
    public:
        SeedSelector() = delete;

        /// @brief Index with the largest row+column match total.
        /// Ties go to the lowest index. std::nullopt for an empty matrix.
        [[nodiscard]] static std::optional<usize> choose(const MatchMatrix& matrix);

        /// @brief Choose the seed and mark it as the only fixed catalogue.
        ///
        /// @return The seed index, or std::nullopt if the matrix does not
        ///         describe `catalogues` or the one-fixed invariant fails.
        [[nodiscard]] static std::optional<usize> select(const MatchMatrix& matrix,
                                                         std::span<Catalogue> catalogues);

        /// @brief Number of catalogues currently fixed.
        [[nodiscard]] static usize count_fixed(std::span<const Catalogue> catalogues);
    };

} // namespace skyalign::align
