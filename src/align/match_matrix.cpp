/// @file match_matrix.cpp
/// @brief MatchMatrix and MatchMatrixBuilder implementation.

#include "align/match_matrix.hpp"

#include "align/cross_matcher.hpp"
#include "core/logger.hpp"

#include <numeric>

namespace skyalign::align
{

MatchMatrix::MatchMatrix(usize size)
    : m_size(size)
    , m_counts(size * size, 0)
{
}

usize MatchMatrix::total_for(usize index) const
{
    usize total = 0;
    for (usize k = 0; k < m_size; ++k)
    {
        total += at(index, k) + at(k, index);
    }
    return total;
}

usize MatchMatrix::total() const
{
    return std::accumulate(m_counts.begin(), m_counts.end(), usize{0});
}

MatchMatrix MatchMatrixBuilder::build(std::span<const Catalogue> catalogues, f64 separation_limit_arcsec)
{
    MatchMatrix matrix(catalogues.size());

    for (usize i = 0; i < catalogues.size(); ++i)
    {
        for (usize j = i + 1; j < catalogues.size(); ++j)
        {
            const usize count = CrossMatcher::count(catalogues[i].points, catalogues[j].points,
                                                    separation_limit_arcsec);
            matrix.set(i, j, count);
        }
    }

    SKY_CORE_DEBUG("MatchMatrixBuilder: {} catalogues, {} matches at {:.2f} arcsec",
                   catalogues.size(), matrix.total(), separation_limit_arcsec);

    return matrix;
}

} // namespace skyalign::align
