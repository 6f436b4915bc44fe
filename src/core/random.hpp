#pragma once

/// @file random.hpp
/// @brief Seeded PCG-XSH-RR 32/64 pseudorandom generator.
///
/// Same seed and stream produce the same sequence on every platform,
/// which keeps reseeding decisions reproducible across runs.

#include "core/types.hpp"

namespace skyalign::core
{
    class PcgRng
    {
    public:
        explicit PcgRng(u64 seed, u64 stream = 1)
            : m_state(seed + (stream | 1))
            , m_inc((stream << 1) | 1)
        {
            next();
        }

        /// @brief Next raw 32-bit output.
        u32 next()
        {
            const u64 old = m_state;
            m_state = old * 6364136223846793005ULL + m_inc;
            const auto xorshifted = static_cast<u32>(((old >> 18u) ^ old) >> 27u);
            const auto rot = static_cast<u32>(old >> 59u);
            return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
        }

        /// @brief Unbiased integer in [0, n). n must be non-zero.
        u32 next_below(u32 n)
        {
            // Reject the low remainder band so every residue is equally likely
            const u32 threshold = (0u - n) % n;
            for (;;)
            {
                const u32 r = next();
                if (r >= threshold)
                {
                    return r % n;
                }
            }
        }

    private:
        u64 m_state;
        u64 m_inc;
    };

} // namespace skyalign::core
