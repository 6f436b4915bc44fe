/// @file point_set.cpp
/// @brief SphericalPointSet implementation.

#include "align/point_set.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace skyalign::align
{

SphericalPointSet::SphericalPointSet(std::vector<astro::SkyPosition> positions)
    : m_positions(std::move(positions))
{
    build_index();
}

SphericalPointSet SphericalPointSet::shifted(const astro::Offset& offset) const
{
    std::vector<astro::SkyPosition> moved;
    moved.reserve(m_positions.size());

    for (const auto& position : m_positions)
    {
        moved.push_back(astro::SkyMath::offset_by(position, offset));
    }

    return SphericalPointSet(std::move(moved));
}

void SphericalPointSet::query(const astro::SkyPosition& center, f64 radius_rad, std::vector<usize>& out) const
{
    out.clear();

    // Pad the band slightly so rounding in the subtraction never hides a
    // candidate; the exact separation test below decides membership.
    const f64 pad = radius_rad * 1e-9 + 1e-15;
    const f64 lo  = center.dec - radius_rad - pad;
    const f64 hi  = center.dec + radius_rad + pad;

    const auto first = std::lower_bound(m_sorted_dec.begin(), m_sorted_dec.end(), lo);
    const auto last  = std::upper_bound(first, m_sorted_dec.end(), hi);

    for (auto it = first; it != last; ++it)
    {
        const usize index = m_dec_order[static_cast<usize>(it - m_sorted_dec.begin())];
        if (astro::SkyMath::separation(center, m_positions[index]) <= radius_rad)
        {
            out.push_back(index);
        }
    }

    std::sort(out.begin(), out.end());
}

void SphericalPointSet::build_index()
{
    m_dec_order.resize(m_positions.size());
    std::iota(m_dec_order.begin(), m_dec_order.end(), usize{0});

    std::stable_sort(m_dec_order.begin(), m_dec_order.end(), [this](usize a, usize b) {
        return m_positions[a].dec < m_positions[b].dec;
    });

    m_sorted_dec.clear();
    m_sorted_dec.reserve(m_dec_order.size());
    for (const usize index : m_dec_order)
    {
        m_sorted_dec.push_back(m_positions[index].dec);
    }
}

} // namespace skyalign::align
