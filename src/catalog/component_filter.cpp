/// @file component_filter.cpp
/// @brief ComponentFilter implementation.

#include "catalog/component_filter.hpp"

#include "align/point_set.hpp"

#include <utility>

namespace skyalign::catalog
{

std::vector<bool> ComponentFilter::mask(std::span<const ComponentRecord> records, const SelectionConfig& config)
{
    std::vector<astro::SkyPosition> positions;
    positions.reserve(records.size());
    for (const auto& record : records)
    {
        positions.push_back(record.position);
    }

    const align::SphericalPointSet index(std::move(positions));
    const f64 isolation_rad = config.isolation_limit_deg * astro_constants::kDegToRad;

    std::vector<bool> keep(records.size(), false);
    std::vector<usize> neighbours;

    for (usize i = 0; i < records.size(); ++i)
    {
        if (!is_compact(records[i], config))
        {
            continue;
        }

        // The query always finds the component itself
        index.query(records[i].position, isolation_rad, neighbours);
        keep[i] = neighbours.size() <= 1;
    }

    return keep;
}

std::vector<ComponentRecord> ComponentFilter::select(std::span<const ComponentRecord> records,
                                                     const SelectionConfig& config)
{
    const auto keep = mask(records, config);

    std::vector<ComponentRecord> selected;
    for (usize i = 0; i < records.size(); ++i)
    {
        if (keep[i])
        {
            selected.push_back(records[i]);
        }
    }
    return selected;
}

bool ComponentFilter::is_compact(const ComponentRecord& record, const SelectionConfig& config)
{
    // Only the ratio is tested. A zero peak gives an infinite or NaN ratio,
    // which fails both comparisons; equal-signed negative fluxes can pass.
    const f64 ratio = record.int_flux / record.peak_flux;
    return config.min_flux_ratio < ratio && ratio < config.max_flux_ratio;
}

} // namespace skyalign::catalog
