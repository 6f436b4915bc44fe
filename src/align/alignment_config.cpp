/// @file alignment_config.cpp
/// @brief AlignmentConfig validation.

#include "align/alignment_config.hpp"

#include "core/logger.hpp"

#include <cmath>

namespace skyalign::align
{

bool AlignmentConfig::validate() const
{
    if (!std::isfinite(separation_limit_arcsec) || separation_limit_arcsec <= 0.0)
    {
        SKY_CORE_CRITICAL("AlignmentConfig: separation limit must be positive, got {} arcsec",
                          separation_limit_arcsec);
        return false;
    }

    if (passes < 1)
    {
        SKY_CORE_CRITICAL("AlignmentConfig: passes must be at least 1, got {}", passes);
        return false;
    }

    return true;
}

} // namespace skyalign::align
