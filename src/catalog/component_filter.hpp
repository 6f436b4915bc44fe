#pragma once

/// @file component_filter.hpp
/// @brief Isolation and compactness cuts for catalogue components.

#include "catalog/component_record.hpp"
#include "core/types.hpp"

#include <span>
#include <vector>

namespace skyalign::catalog
{
    class ComponentFilter
    {
    public:
        ComponentFilter() = delete;

        /// @brief Per-component keep mask.
        ///
        /// A component is kept when no other component lies within
        /// `isolation_limit_deg` of it and its int/peak flux ratio lies
        /// strictly inside (min_flux_ratio, max_flux_ratio). The sign of the
        /// fluxes is not checked, only their ratio.
        [[nodiscard]] static std::vector<bool> mask(std::span<const ComponentRecord> records,
                                                    const SelectionConfig& config);

        /// @brief Components passing mask(), in original order.
        [[nodiscard]] static std::vector<ComponentRecord> select(std::span<const ComponentRecord> records,
                                                                 const SelectionConfig& config);

        [[nodiscard]] static bool is_compact(const ComponentRecord& record, const SelectionConfig& config);
    };

} // namespace skyalign::catalog
