#pragma once

/// @file match_matrix.hpp
/// @brief Pairwise match-count matrix over a set of catalogues.

#include "align/catalogue.hpp"
#include "core/types.hpp"

#include <span>
#include <vector>

namespace skyalign::align
{
    /// @brief Square K×K matrix of match counts.
    ///
    /// Only the upper triangle (i < j) is populated; the diagonal and lower
    /// triangle stay zero.
    class MatchMatrix
    {
    public:
        MatchMatrix() = default;
        explicit MatchMatrix(usize size);

        [[nodiscard]] usize size() const { return m_size; }

        [[nodiscard]] usize at(usize row, usize col) const { return m_counts[row * m_size + col]; }
        void set(usize row, usize col, usize count) { m_counts[row * m_size + col] = count; }

        /// @brief Row plus column sum for catalogue `index`: all matches it
        /// takes part in, whichever triangle holds them.
        [[nodiscard]] usize total_for(usize index) const;

        /// @brief Sum of every stored count.
        [[nodiscard]] usize total() const;

    private:
        usize m_size = 0;
        std::vector<usize> m_counts;
    };

    /// @brief Builds a MatchMatrix by cross-matching every unordered pair once.
    class MatchMatrixBuilder
    {
    public:
        MatchMatrixBuilder() = delete;

        /// @brief Cross-match each pair (i, j), i < j, storing the count at [i][j].
        [[nodiscard]] static MatchMatrix build(std::span<const Catalogue> catalogues,
                                               f64 separation_limit_arcsec);
    };

} // namespace skyalign::align
