#pragma once

/// @file catalogue.hpp
/// @brief Per-beam catalogue record: points plus registration state.

#include "align/point_set.hpp"
#include "astro/sky_math.hpp"
#include "core/types.hpp"

namespace skyalign::align
{
    /// @brief Registration state of a catalogue within the current pass.
    enum class CatalogueState : u8
    {
        Floating,   ///< Still waiting to be registered
        Fixed,      ///< Positions are part of the shared frame
    };

    [[nodiscard]] inline const char* to_string(CatalogueState state)
    {
        switch (state)
        {
        case CatalogueState::Floating: return "floating";
        case CatalogueState::Fixed:    return "fixed";
        }
        return "unknown";
    }

    /// @brief One beam's source list and its registration bookkeeping.
    ///
    /// Only AlignmentScheduler (and SeedSelector on its behalf) changes
    /// `state`, `offset` and `points` once a run has started.
    struct Catalogue
    {
        u32 id = 0;                         ///< Beam index, unique within a run
        SphericalPointSet points;           ///< Quality-filtered source positions
        astro::SkyPosition center{};        ///< Rough beam centre (metadata only)
        CatalogueState state = CatalogueState::Floating;
        astro::Offset offset{};             ///< Cumulative correction applied so far (arcsec)

        [[nodiscard]] bool fixed() const { return state == CatalogueState::Fixed; }
    };

} // namespace skyalign::align
