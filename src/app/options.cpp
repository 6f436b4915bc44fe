/// @file options.cpp
/// @brief Command-line parsing with Boost.Program_options.

#include "app/options.hpp"

#include <boost/program_options.hpp>

#include <array>
#include <string_view>
#include <utility>

namespace po = boost::program_options;

namespace skyalign::app
{

namespace
{

constexpr i64 kMaxBeams = 1024;
constexpr i64 kMaxPasses = 10000;

std::optional<spdlog::level::level_enum> parse_level(std::string_view name)
{
    constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> kLevels{{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};

    for (const auto& [key, level] : kLevels)
    {
        if (key == name)
        {
            return level;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<Options> parse_options(int argc, const char* const argv[], std::ostream& out)
{
    Options options;
    std::string catalogue_dir;
    std::string log_level = "info";
    bool no_statistics = false;

    // Counts are read signed so a negative value is rejected rather than
    // wrapped into a huge unsigned one
    i64 beams = 36;
    i64 passes = 1;

    po::options_description desc("skyalign: register per-beam catalogues onto a common frame");
    desc.add_options()
        ("help,h", "print this help")
        ("catalogue-dir,d", po::value<std::string>(&catalogue_dir), "directory holding the per-beam CSV catalogues")
        ("sbid,s", po::value<u32>(&options.sbid), "scheduling block id used in the file names")
        ("beams,b", po::value<i64>(&beams)->default_value(36), "number of beams to load")
        ("separation", po::value<f64>(&options.alignment.separation_limit_arcsec)->default_value(9.0),
            "match separation limit (arcsec)")
        ("passes", po::value<i64>(&passes)->default_value(1),
            "number of passes over the catalogues")
        ("no-statistics", po::bool_switch(&no_statistics), "skip per-step convergence statistics")
        ("isolation", po::value<f64>(&options.selection.isolation_limit_deg)->default_value(0.01),
            "minimum distance to the nearest other component (deg)")
        ("seed", po::value<u64>(&options.seed)->default_value(align::PcgReseedSource::kDefaultSeed),
            "seed for reseeding choices")
        ("output-prefix,o", po::value<std::string>(&options.output_prefix)->default_value("skyalign"),
            "prefix for the written CSV files")
        ("log-level", po::value<std::string>(&log_level)->default_value("info"),
            "console log level: trace, debug, info, warn, error, critical, off");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        out << "error: " << e.what() << "\n\n" << desc << '\n';
        return std::nullopt;
    }

    if (vm.count("help") > 0)
    {
        out << desc << '\n';
        options.show_help = true;
        return options;
    }

    if (catalogue_dir.empty() || vm.count("sbid") == 0)
    {
        out << "error: --catalogue-dir and --sbid are required\n\n" << desc << '\n';
        return std::nullopt;
    }

    if (beams < 1 || beams > kMaxBeams)
    {
        out << "error: --beams must be between 1 and " << kMaxBeams << "\n\n" << desc << '\n';
        return std::nullopt;
    }

    if (passes < 1 || passes > kMaxPasses)
    {
        out << "error: --passes must be between 1 and " << kMaxPasses << "\n\n" << desc << '\n';
        return std::nullopt;
    }

    if (!(options.selection.isolation_limit_deg >= 0.0))
    {
        out << "error: --isolation must not be negative\n\n" << desc << '\n';
        return std::nullopt;
    }

    const auto level = parse_level(log_level);
    if (!level)
    {
        out << "error: unknown log level '" << log_level << "'\n";
        return std::nullopt;
    }

    options.catalogue_dir = catalogue_dir;
    options.beams = static_cast<u32>(beams);
    options.alignment.passes = static_cast<u32>(passes);
    options.log_level = *level;
    options.alignment.gather_statistics = !no_statistics;

    return options;
}

} // namespace skyalign::app
