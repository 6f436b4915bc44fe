/// @file seed_selector.cpp
/// @brief SeedSelector implementation.

#include "align/seed_selector.hpp"

#include "core/logger.hpp"

#include <algorithm>

namespace skyalign::align
{

std::optional<usize> SeedSelector::choose(const MatchMatrix& matrix)
{
    if (matrix.size() == 0)
    {
        return std::nullopt;
    }

    usize best_index = 0;
    usize best_total = matrix.total_for(0);

    for (usize i = 1; i < matrix.size(); ++i)
    {
        const usize total = matrix.total_for(i);
        // Strictly greater: the first index reaching the maximum wins
        if (total > best_total)
        {
            best_total = total;
            best_index = i;
        }
    }

    return best_index;
}

std::optional<usize> SeedSelector::select(const MatchMatrix& matrix, std::span<Catalogue> catalogues)
{
    if (matrix.size() != catalogues.size())
    {
        SKY_CORE_ERROR("SeedSelector: matrix covers {} catalogues, {} supplied",
                       matrix.size(), catalogues.size());
        return std::nullopt;
    }

    const auto seed = choose(matrix);
    if (!seed)
    {
        SKY_CORE_ERROR("SeedSelector: no catalogues to choose from");
        return std::nullopt;
    }

    for (usize i = 0; i < catalogues.size(); ++i)
    {
        catalogues[i].state = (i == *seed) ? CatalogueState::Fixed : CatalogueState::Floating;
    }

    const usize fixed = count_fixed(catalogues);
    if (fixed != 1)
    {
        SKY_CORE_CRITICAL("SeedSelector: {} catalogues fixed after seeding, expected exactly 1", fixed);
        return std::nullopt;
    }

    SKY_CORE_INFO("SeedSelector: seed is beam {} (index {}, {} matches)",
                  catalogues[*seed].id, *seed, matrix.total_for(*seed));

    return seed;
}

usize SeedSelector::count_fixed(std::span<const Catalogue> catalogues)
{
    return static_cast<usize>(std::count_if(catalogues.begin(), catalogues.end(),
                                            [](const Catalogue& c) { return c.fixed(); }));
}

} // namespace skyalign::align
