/// @file test_pipeline.cpp
/// @brief End-to-end tests for skyalign::app::Pipeline.
///
/// Writes a small synthetic observation (three beams of the same field,
/// each with its own pointing error) and checks the recovered offsets and
/// the files written.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "app/pipeline.hpp"
#include "core/logger.hpp"
#include "test_support.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <fstream>
#include <string>

using namespace skyalign;
using namespace skyalign::app;
using test_support::TempDir;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    skyalign::core::Logger::init(spdlog::level::off);
    const int result = doctest::Context(argc, argv).run();
    skyalign::core::Logger::shutdown();
    return result;
}

namespace
{

constexpr u32 kSbid = 4242;

const std::array<astro::Offset, 3> kPointingErrors{{
    {.d_ra = 0.0, .d_dec = 0.0},
    {.d_ra = 2.0, .d_dec = -1.0},
    {.d_ra = -1.5, .d_dec = 3.0},
}};

// Isolated, compact sources: 2 arcmin apart, int/peak ratio of 1
void write_observation(const TempDir& dir)
{
    const auto field = test_support::grid_field(120.0, -50.0, 5, 5, 120.0);

    for (u32 beam = 0; beam < kPointingErrors.size(); ++beam)
    {
        std::string csv = "island,ra,dec,int_flux,peak_flux\n";
        u32 island = 0;
        for (const auto& p : test_support::shifted(field, kPointingErrors[beam]))
        {
            csv += fmt::format("{},{:.10f},{:.10f},1.5,1.5\n", island++,
                               p.ra * astro_constants::kRadToDeg, p.dec * astro_constants::kRadToDeg);
        }
        dir.write(fmt::format("SB{}.EMU_0800-50.beam{:02d}.i.MFS.image_comp.csv", kSbid, beam), csv);
    }
}

Options options_for(const TempDir& dir)
{
    Options options;
    options.catalogue_dir = dir.path();
    options.sbid = kSbid;
    options.beams = static_cast<u32>(kPointingErrors.size());
    options.output_prefix = (dir.path() / "run").string();
    return options;
}

usize count_lines(const std::filesystem::path& path)
{
    std::ifstream file(path);
    usize lines = 0;
    std::string line;
    while (std::getline(file, line))
    {
        ++lines;
    }
    return lines;
}

} // anonymous namespace

TEST_CASE("Output paths derive from the prefix")
{
    const auto outputs = OutputPaths::from_prefix("out/SB1");

    CHECK(outputs.offsets == std::filesystem::path("out/SB1_offsets.csv"));
    CHECK(outputs.match_matrix == std::filesystem::path("out/SB1_match_matrix.csv"));
    CHECK(outputs.statistics == std::filesystem::path("out/SB1_statistics.csv"));
}

TEST_CASE("Pointing errors are recovered end to end")
{
    const TempDir dir("skyalign_pipeline_run");
    write_observation(dir);

    const auto result = Pipeline::run(options_for(dir));

    REQUIRE(result.has_value());
    REQUIRE(result->catalogues.size() == kPointingErrors.size());
    CHECK(result->report.seed == 0);
    CHECK(result->report.steps.size() == kPointingErrors.size());

    for (usize i = 0; i < kPointingErrors.size(); ++i)
    {
        const auto& catalogue = result->catalogues[i];
        CHECK(catalogue.id == i);
        CHECK(catalogue.points.size() == 25);
        CHECK(catalogue.offset.d_ra == doctest::Approx(-kPointingErrors[i].d_ra).epsilon(1e-3));
        CHECK(catalogue.offset.d_dec == doctest::Approx(-kPointingErrors[i].d_dec).epsilon(1e-3));
    }

    Pipeline::log_summary(*result);

    CHECK(count_lines(result->outputs.offsets) == 1 + kPointingErrors.size());
    CHECK(count_lines(result->outputs.match_matrix) == kPointingErrors.size());
    CHECK(count_lines(result->outputs.statistics) == 1 + kPointingErrors.size());
}

TEST_CASE("Statistics file is skipped when gathering is off")
{
    const TempDir dir("skyalign_pipeline_no_stats");
    write_observation(dir);

    auto options = options_for(dir);
    options.alignment.gather_statistics = false;

    const auto result = Pipeline::run(options);

    REQUIRE(result.has_value());
    CHECK(result->report.statistics.empty());
    CHECK(std::filesystem::exists(result->outputs.offsets));
    CHECK_FALSE(std::filesystem::exists(result->outputs.statistics));
}

TEST_CASE("Failures write nothing")
{
    const TempDir dir("skyalign_pipeline_fail");
    write_observation(dir);
    const auto outputs = OutputPaths::from_prefix((dir.path() / "run").string());

    SUBCASE("missing beam")
    {
        auto options = options_for(dir);
        options.beams = 4;
        CHECK_FALSE(Pipeline::run(options).has_value());
    }

    SUBCASE("invalid alignment configuration")
    {
        auto options = options_for(dir);
        options.alignment.passes = 0;
        CHECK_FALSE(Pipeline::run(options).has_value());
    }

    CHECK_FALSE(std::filesystem::exists(outputs.offsets));
    CHECK_FALSE(std::filesystem::exists(outputs.match_matrix));
}
