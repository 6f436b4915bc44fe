/// @file alignment_scheduler.cpp
/// @brief AlignmentScheduler implementation.

#include "align/alignment_scheduler.hpp"

#include "align/seed_selector.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace skyalign::align
{

usize AlignmentReport::reseed_count() const
{
    return static_cast<usize>(std::count_if(steps.begin(), steps.end(),
                                            [](const StepRecord& s) { return s.kind == StepKind::Reseed; }));
}

AlignmentScheduler::AlignmentScheduler(const AlignmentConfig& config, ReseedSource& reseed_source)
    : m_config(config)
    , m_reseed_source(reseed_source)
{
}

std::optional<AlignmentReport> AlignmentScheduler::run(std::span<Catalogue> catalogues)
{
    if (catalogues.empty())
    {
        SKY_CORE_CRITICAL("AlignmentScheduler: no catalogues supplied");
        return std::nullopt;
    }

    if (!m_config.validate())
    {
        return std::nullopt;
    }

    AlignmentReport report;
    report.initial_matrix = MatchMatrixBuilder::build(catalogues, m_config.separation_limit_arcsec);

    const auto seed = SeedSelector::select(report.initial_matrix, catalogues);
    if (!seed)
    {
        return std::nullopt;
    }
    report.seed = *seed;

    const usize total_steps = catalogues.size() * m_config.passes;
    report.steps.reserve(total_steps);
    if (m_config.gather_statistics)
    {
        report.statistics.reserve(total_steps);
    }

    SKY_CORE_INFO("AlignmentScheduler: {} catalogues, {} pass(es), {} steps, limit {:.2f} arcsec",
                  catalogues.size(), m_config.passes, total_steps, m_config.separation_limit_arcsec);

    for (usize step = 0; step < total_steps; ++step)
    {
        const auto candidate = find_next_pair(catalogues);

        if (candidate)
        {
            report.steps.push_back(shift(catalogues, *candidate, step));
        }
        else
        {
            auto record = reseed(catalogues, step);
            if (!record)
            {
                return std::nullopt;
            }
            report.steps.push_back(*record);
        }

        if (m_config.gather_statistics)
        {
            auto stats = ConvergenceTracker::snapshot(catalogues, m_config.separation_limit_arcsec);
            stats.step = step;
            SKY_CORE_DEBUG("AlignmentScheduler: step {} mean separation {:.4f} arcsec over {} matches",
                           step, stats.mean_separation_arcsec(), stats.total_matches);
            report.statistics.push_back(stats);
        }
    }

    SKY_CORE_INFO("AlignmentScheduler: finished {} steps ({} reseeds)", report.steps.size(), report.reseed_count());

    return report;
}

// -----------------------------------------------------------------
// Find-next-pair: best match count over the whole fixed × floating
// bipartite set. Enumeration is fixed-major in index order and only a
// strictly larger count replaces the incumbent.
// -----------------------------------------------------------------

std::optional<AlignmentScheduler::Candidate>
AlignmentScheduler::find_next_pair(std::span<const Catalogue> catalogues) const
{
    std::optional<Candidate> best;

    for (usize f = 0; f < catalogues.size(); ++f)
    {
        if (!catalogues[f].fixed())
        {
            continue;
        }

        for (usize c = 0; c < catalogues.size(); ++c)
        {
            if (catalogues[c].fixed())
            {
                continue;
            }

            auto result = CrossMatcher::match(catalogues[f].points, catalogues[c].points,
                                              m_config.separation_limit_arcsec);

            if (!best || result.count > best->result.count)
            {
                best = Candidate{.fixed = f, .floating = c, .result = std::move(result)};
            }
        }
    }

    return best;
}

std::optional<StepRecord> AlignmentScheduler::reseed(std::span<Catalogue> catalogues, usize step)
{
    const usize chosen = m_reseed_source.pick(catalogues.size());
    if (chosen >= catalogues.size())
    {
        SKY_CORE_CRITICAL("AlignmentScheduler: reseed source returned {} for {} catalogues",
                          chosen, catalogues.size());
        return std::nullopt;
    }

    for (usize i = 0; i < catalogues.size(); ++i)
    {
        catalogues[i].state = (i == chosen) ? CatalogueState::Fixed : CatalogueState::Floating;
    }

    SKY_CORE_INFO("AlignmentScheduler: step {} reseeds on beam {} (index {})", step, catalogues[chosen].id, chosen);

    return StepRecord{
        .step        = step,
        .kind        = StepKind::Reseed,
        .reference   = chosen,
        .moved       = chosen,
        .match_count = 0,
        .correction  = astro::Offset{},
    };
}

StepRecord AlignmentScheduler::shift(std::span<Catalogue> catalogues, const Candidate& candidate, usize step) const
{
    Catalogue& target = catalogues[candidate.floating];

    // The mean is (floating − fixed); moving by its negation lands the
    // floating catalogue on the fixed one. No matches means no usable
    // offset, so the catalogue is fixed where it stands.
    astro::Offset correction{};
    if (candidate.result.usable())
    {
        correction = -candidate.result.offset_mean;
    }
    else
    {
        SKY_CORE_WARN("AlignmentScheduler: step {} beam {} has no matches to any fixed beam, fixing unshifted",
                      step, target.id);
    }

    target.points = target.points.shifted(correction);
    target.offset += correction;
    target.state = CatalogueState::Fixed;

    SKY_CORE_DEBUG("AlignmentScheduler: step {} beam {} -> beam {} ({} matches), shift ({:+.3f}, {:+.3f}) arcsec",
                   step, target.id, catalogues[candidate.fixed].id, candidate.result.count,
                   correction.d_ra, correction.d_dec);

    return StepRecord{
        .step        = step,
        .kind        = StepKind::Shift,
        .reference   = candidate.fixed,
        .moved       = candidate.floating,
        .match_count = candidate.result.count,
        .correction  = correction,
    };
}

} // namespace skyalign::align
