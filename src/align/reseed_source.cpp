/// @file reseed_source.cpp
/// @brief PcgReseedSource implementation.

#include "align/reseed_source.hpp"

namespace skyalign::align
{

PcgReseedSource::PcgReseedSource(u64 seed)
    : m_rng(seed)
{
}

usize PcgReseedSource::pick(usize n)
{
    return static_cast<usize>(m_rng.next_below(static_cast<u32>(n)));
}

} // namespace skyalign::align
