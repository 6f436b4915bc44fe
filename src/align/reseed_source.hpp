#pragma once

/// @file reseed_source.hpp
/// @brief Injectable choice of the catalogue that restarts a pass.

#include "core/random.hpp"
#include "core/types.hpp"

namespace skyalign::align
{
    /// @brief Picks one of N catalogues when the frontier is exhausted.
    class ReseedSource
    {
    public:
        virtual ~ReseedSource() = default;

        /// @brief Return an index in [0, n). Called only with n >= 1.
        [[nodiscard]] virtual usize pick(usize n) = 0;
    };

    /// @brief Uniform reseeding driven by a seeded PcgRng.
    class PcgReseedSource final : public ReseedSource
    {
    public:
        /// Default seed used by the command-line tool when none is given.
        static constexpr u64 kDefaultSeed = 0x5EEDCA7A1060ULL;

        explicit PcgReseedSource(u64 seed = kDefaultSeed);

        [[nodiscard]] usize pick(usize n) override;

    private:
        core::PcgRng m_rng;
    };

} // namespace skyalign::align
