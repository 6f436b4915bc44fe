/// @file result_writer.cpp
/// @brief ResultWriter implementation.

#include "io/result_writer.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <fstream>

namespace skyalign::io
{

namespace
{

bool finish(std::ofstream& file, const std::filesystem::path& path, const char* what)
{
    file.flush();
    if (!file)
    {
        SKY_CORE_ERROR("ResultWriter: Failed writing {} to {}", what, path.string());
        return false;
    }
    SKY_CORE_INFO("ResultWriter: Wrote {} to {}", what, path.string());
    return true;
}

} // anonymous namespace

bool ResultWriter::write_offsets(const std::filesystem::path& path, std::span<const align::Catalogue> catalogues)
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        SKY_CORE_ERROR("ResultWriter: Failed to open file: {}", path.string());
        return false;
    }

    file << "beam,center_ra_deg,center_dec_deg,n_sources,d_ra_arcsec,d_dec_arcsec\n";
    for (const auto& catalogue : catalogues)
    {
        file << fmt::format("{},{:.8f},{:.8f},{},{:.6f},{:.6f}\n",
                            catalogue.id,
                            catalogue.center.ra * astro_constants::kRadToDeg,
                            catalogue.center.dec * astro_constants::kRadToDeg,
                            catalogue.points.size(),
                            catalogue.offset.d_ra,
                            catalogue.offset.d_dec);
    }

    return finish(file, path, "offsets");
}

bool ResultWriter::write_match_matrix(const std::filesystem::path& path, const align::MatchMatrix& matrix)
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        SKY_CORE_ERROR("ResultWriter: Failed to open file: {}", path.string());
        return false;
    }

    for (usize row = 0; row < matrix.size(); ++row)
    {
        for (usize col = 0; col < matrix.size(); ++col)
        {
            if (col > 0)
            {
                file << ',';
            }
            file << matrix.at(row, col);
        }
        file << '\n';
    }

    return finish(file, path, "match matrix");
}

bool ResultWriter::write_statistics(const std::filesystem::path& path,
                                    std::span<const align::StepStatistics> statistics)
{
    std::ofstream file(path);
    if (!file.is_open())
    {
        SKY_CORE_ERROR("ResultWriter: Failed to open file: {}", path.string());
        return false;
    }

    file << "step,total_separation_arcsec,total_matches,mean_separation_arcsec\n";
    for (const auto& stats : statistics)
    {
        file << fmt::format("{},{:.6f},{},{:.6f}\n",
                            stats.step,
                            stats.total_separation_arcsec,
                            stats.total_matches,
                            stats.mean_separation_arcsec());
    }

    return finish(file, path, "statistics");
}

} // namespace skyalign::io
