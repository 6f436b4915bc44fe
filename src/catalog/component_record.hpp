#pragma once

/// @file component_record.hpp
/// @brief One source component read from a per-beam catalogue file.

#include "astro/sky_math.hpp"
#include "core/types.hpp"

namespace skyalign::catalog
{
    /// @brief Runtime representation of a single catalogue component.
    ///
    /// Coordinates are converted to radians on load.
    struct ComponentRecord
    {
        astro::SkyPosition position;    ///< Fitted component position
        f64 int_flux;                   ///< Integrated flux density
        f64 peak_flux;                  ///< Peak flux density
        u32 row;                        ///< 1-based data row in the source file
    };

    /// @brief Quality cuts applied before alignment.
    struct SelectionConfig
    {
        f64 isolation_limit_deg = 0.01;  ///< Nearest neighbour must be farther than this
        f64 min_flux_ratio = 0.8;        ///< Exclusive lower bound on int_flux / peak_flux
        f64 max_flux_ratio = 1.2;        ///< Exclusive upper bound on int_flux / peak_flux
    };

} // namespace skyalign::catalog
