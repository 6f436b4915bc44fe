/// @file pipeline.cpp
/// @brief Pipeline implementation.

#include "app/pipeline.hpp"

#include "align/reseed_source.hpp"
#include "catalog/catalogue_loader.hpp"
#include "core/logger.hpp"
#include "io/result_writer.hpp"

#include <utility>

namespace skyalign::app
{

OutputPaths OutputPaths::from_prefix(const std::string& prefix)
{
    return OutputPaths{
        .offsets      = prefix + "_offsets.csv",
        .match_matrix = prefix + "_match_matrix.csv",
        .statistics   = prefix + "_statistics.csv",
    };
}

std::optional<PipelineResult> Pipeline::run(const Options& options)
{
    // -----------------------------------------------------------------
    // 1. Load and filter the per-beam catalogues
    // -----------------------------------------------------------------
    auto catalogues = catalog::CatalogueLoader::load_beams(
        options.catalogue_dir, options.sbid, options.beams, options.selection);
    if (!catalogues)
    {
        SKY_CRITICAL("Could not load catalogues for SB{} from {}", options.sbid, options.catalogue_dir.string());
        return std::nullopt;
    }

    // -----------------------------------------------------------------
    // 2. Register
    // -----------------------------------------------------------------
    align::PcgReseedSource reseed_source(options.seed);
    align::AlignmentScheduler scheduler(options.alignment, reseed_source);

    auto report = scheduler.run(*catalogues);
    if (!report)
    {
        SKY_CRITICAL("Alignment aborted, no results written");
        return std::nullopt;
    }

    // -----------------------------------------------------------------
    // 3. Write results
    // -----------------------------------------------------------------
    const auto outputs = OutputPaths::from_prefix(options.output_prefix);

    if (!io::ResultWriter::write_match_matrix(outputs.match_matrix, report->initial_matrix) ||
        !io::ResultWriter::write_offsets(outputs.offsets, *catalogues))
    {
        return std::nullopt;
    }

    if (options.alignment.gather_statistics &&
        !io::ResultWriter::write_statistics(outputs.statistics, report->statistics))
    {
        return std::nullopt;
    }

    return PipelineResult{
        .catalogues = std::move(*catalogues),
        .report     = std::move(*report),
        .outputs    = outputs,
    };
}

void Pipeline::log_summary(const PipelineResult& result)
{
    SKY_INFO("Seed beam {}, {} steps, {} reseeds",
             result.catalogues[result.report.seed].id,
             result.report.steps.size(),
             result.report.reseed_count());

    for (const auto& record : result.report.steps)
    {
        SKY_DEBUG("step {:3d}  {:<6}  beam {:02d} -> beam {:02d}  {:5d} matches  ({:+.3f}, {:+.3f})",
                  record.step, align::to_string(record.kind),
                  result.catalogues[record.moved].id, result.catalogues[record.reference].id,
                  record.match_count, record.correction.d_ra, record.correction.d_dec);
    }

    SKY_INFO(" beam  sources  state       d_ra(\")   d_dec(\")");
    for (const auto& catalogue : result.catalogues)
    {
        SKY_INFO("  {:02d}   {:6d}  {:<8}  {:+8.3f}   {:+8.3f}",
                 catalogue.id, catalogue.points.size(), align::to_string(catalogue.state),
                 catalogue.offset.d_ra, catalogue.offset.d_dec);
    }

    if (!result.report.statistics.empty())
    {
        const auto& first = result.report.statistics.front();
        const auto& last  = result.report.statistics.back();
        SKY_INFO("Mean matched separation {:.4f}\" -> {:.4f}\"",
                 first.mean_separation_arcsec(), last.mean_separation_arcsec());
    }
}

} // namespace skyalign::app
