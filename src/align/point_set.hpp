#pragma once

/// @file point_set.hpp
/// @brief Immutable ordered set of sky positions with a declination-sorted index.

#include "astro/sky_math.hpp"
#include "core/types.hpp"

#include <span>
#include <vector>

namespace skyalign::align
{
    /// @brief Ordered collection of source positions from one catalogue.
    ///
    /// Positions never change after construction. shifted() produces a new
    /// set with every point moved by the same spherical offset.
    ///
    /// Radius queries are accelerated by a declination-sorted index: any
    /// point within r of a position lies in the declination band ±r around
    /// it, so a binary search narrows the candidates before the exact
    /// great-circle test. Unlike an RA/Dec grid this stays exact across the
    /// RA wrap and near the poles.
    class SphericalPointSet
    {
    public:
        SphericalPointSet() = default;
        explicit SphericalPointSet(std::vector<astro::SkyPosition> positions);

        /// @brief Number of points.
        [[nodiscard]] usize size() const { return m_positions.size(); }
        [[nodiscard]] bool empty() const { return m_positions.empty(); }

        /// @brief Read-only view in original order.
        [[nodiscard]] std::span<const astro::SkyPosition> positions() const { return m_positions; }

        [[nodiscard]] const astro::SkyPosition& operator[](usize index) const { return m_positions[index]; }

        /// @brief New set with every point moved by `offset`.
        ///
        /// Each point is used as the origin of its own offset frame, making
        /// this the inverse of the per-pair offset measurement.
        [[nodiscard]] SphericalPointSet shifted(const astro::Offset& offset) const;

        /// @brief Indices of every point within `radius_rad` of `center`,
        /// in ascending index order. `out` is cleared first.
        void query(const astro::SkyPosition& center, f64 radius_rad, std::vector<usize>& out) const;

    private:
        std::vector<astro::SkyPosition> m_positions;

        // Indices into m_positions sorted by declination, with the matching
        // declinations stored alongside for the binary search.
        std::vector<usize> m_dec_order;
        std::vector<f64> m_sorted_dec;

        void build_index();
    };

} // namespace skyalign::align
