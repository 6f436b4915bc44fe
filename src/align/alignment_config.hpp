#pragma once

/// @file alignment_config.hpp
/// @brief Tunables for a registration run.

#include "core/types.hpp"

namespace skyalign::align
{
    /// @brief Configuration for AlignmentScheduler.
    /// Use designated initializers: AlignmentConfig{.passes = 3}.
    struct AlignmentConfig
    {
        f64 separation_limit_arcsec = 9.0;  ///< Maximum separation for a match
        u32 passes = 1;                     ///< Steps run = catalogues × passes
        bool gather_statistics = true;      ///< Snapshot all-pairs statistics each step

        /// @brief Check the configuration, logging the first problem found.
        [[nodiscard]] bool validate() const;
    };

} // namespace skyalign::align
