/// @file catalogue_loader.cpp
/// @brief Implementation of the per-beam CSV catalogue loader.

#include "catalog/catalogue_loader.hpp"

#include "catalog/component_filter.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <utility>

namespace skyalign::catalog
{

namespace
{

constexpr std::array<std::string_view, 4> kRequiredColumns{"ra", "dec", "int_flux", "peak_flux"};

bool equals_ignore_case(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

// -----------------------------------------------------------------
// Load components: header row, then ra,dec,int_flux,peak_flux by name
// -----------------------------------------------------------------

std::optional<std::vector<ComponentRecord>>
CatalogueLoader::load_components(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SKY_CORE_ERROR("CatalogueLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string line;
    if (!std::getline(file, line))
    {
        SKY_CORE_ERROR("CatalogueLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    // Resolve column positions from the header
    const auto header = split(line);
    std::array<usize, kRequiredColumns.size()> column{};
    for (usize c = 0; c < kRequiredColumns.size(); ++c)
    {
        const auto it = std::find_if(header.begin(), header.end(), [&](std::string_view name) {
            return equals_ignore_case(trim(name), kRequiredColumns[c]);
        });
        if (it == header.end())
        {
            SKY_CORE_ERROR("CatalogueLoader: Missing column '{}' in {}", kRequiredColumns[c], path.string());
            return std::nullopt;
        }
        column[c] = static_cast<usize>(it - header.begin());
    }
    const usize min_fields = *std::max_element(column.begin(), column.end()) + 1;

    std::vector<ComponentRecord> components;
    u32 row = 0;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        if (trim(line).empty())
        {
            continue;
        }
        ++row;

        const auto fields = split(line);
        if (fields.size() < min_fields)
        {
            SKY_CORE_WARN("CatalogueLoader: Malformed row {}: {}", row, line);
            ++skipped;
            continue;
        }

        const auto ra_deg    = parse_f64(trim(fields[column[0]]));
        const auto dec_deg   = parse_f64(trim(fields[column[1]]));
        const auto int_flux  = parse_f64(trim(fields[column[2]]));
        const auto peak_flux = parse_f64(trim(fields[column[3]]));

        if (!ra_deg || !dec_deg || !int_flux || !peak_flux || std::abs(*dec_deg) > 90.0)
        {
            SKY_CORE_WARN("CatalogueLoader: Failed to parse values on row {}: {}", row, line);
            ++skipped;
            continue;
        }

        components.push_back(ComponentRecord{
            .position  = astro::SkyMath::from_degrees(*ra_deg, *dec_deg),
            .int_flux  = *int_flux,
            .peak_flux = *peak_flux,
            .row       = row,
        });
    }

    if (components.empty())
    {
        SKY_CORE_ERROR("CatalogueLoader: No valid components found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        SKY_CORE_WARN("CatalogueLoader: Skipped {} malformed rows in {}", skipped, path.string());
    }

    SKY_CORE_DEBUG("CatalogueLoader: Loaded {} components from {}", components.size(), path.string());

    return components;
}

bool CatalogueLoader::matches_beam(std::string_view filename, u32 sbid, u32 beam)
{
    const std::string prefix = fmt::format("SB{}.", sbid);
    const std::string suffix = fmt::format(".beam{:02d}.i.MFS.image_comp.csv", beam);

    // The wildcard between prefix and suffix must match at least one character
    return filename.size() > prefix.size() + suffix.size() &&
           filename.starts_with(prefix) &&
           filename.ends_with(suffix);
}

std::optional<std::filesystem::path>
CatalogueLoader::beam_path(const std::filesystem::path& directory, u32 sbid, u32 beam)
{
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec)
    {
        SKY_CORE_ERROR("CatalogueLoader: Cannot read directory {}: {}", directory.string(), ec.message());
        return std::nullopt;
    }

    std::vector<std::filesystem::path> candidates;
    for (const auto& entry : it)
    {
        if (entry.is_regular_file() && matches_beam(entry.path().filename().string(), sbid, beam))
        {
            candidates.push_back(entry.path());
        }
    }

    if (candidates.empty())
    {
        SKY_CORE_ERROR("CatalogueLoader: No catalogue for SB{} beam {:02d} in {}", sbid, beam, directory.string());
        return std::nullopt;
    }

    std::sort(candidates.begin(), candidates.end());
    if (candidates.size() > 1)
    {
        SKY_CORE_WARN("CatalogueLoader: {} files match SB{} beam {:02d}, using {}",
                      candidates.size(), sbid, beam, candidates.front().filename().string());
    }

    return candidates.front();
}

std::optional<std::vector<align::Catalogue>>
CatalogueLoader::load_beams(const std::filesystem::path& directory, u32 sbid, u32 beam_count,
                            const SelectionConfig& selection)
{
    std::vector<align::Catalogue> catalogues;
    catalogues.reserve(beam_count);

    for (u32 beam = 0; beam < beam_count; ++beam)
    {
        const auto path = beam_path(directory, sbid, beam);
        if (!path)
        {
            return std::nullopt;
        }

        const auto components = load_components(*path);
        if (!components)
        {
            return std::nullopt;
        }

        catalogues.push_back(make_catalogue(beam, *components, selection));
    }

    SKY_CORE_INFO("CatalogueLoader: Loaded {} beams for SB{} from {}", catalogues.size(), sbid, directory.string());

    return catalogues;
}

align::Catalogue CatalogueLoader::make_catalogue(u32 id,
                                                 const std::vector<ComponentRecord>& components,
                                                 const SelectionConfig& selection)
{
    std::vector<astro::SkyPosition> all_positions;
    all_positions.reserve(components.size());
    for (const auto& component : components)
    {
        all_positions.push_back(component.position);
    }

    const auto kept = ComponentFilter::select(components, selection);

    std::vector<astro::SkyPosition> kept_positions;
    kept_positions.reserve(kept.size());
    for (const auto& component : kept)
    {
        kept_positions.push_back(component.position);
    }

    if (kept_positions.empty())
    {
        SKY_CORE_WARN("CatalogueLoader: Beam {:02d} has no components left after selection", id);
    }

    SKY_CORE_DEBUG("CatalogueLoader: Beam {:02d} keeps {}/{} components", id, kept.size(), components.size());

    return align::Catalogue{
        .id     = id,
        .points = align::SphericalPointSet(std::move(kept_positions)),
        .center = astro::SkyMath::mean_position(all_positions),
        .state  = align::CatalogueState::Floating,
        .offset = astro::Offset{},
    };
}

// -----------------------------------------------------------------
// Utility: split on commas (no quoting; catalogue columns are numeric)
// -----------------------------------------------------------------

std::vector<std::string_view> CatalogueLoader::split(std::string_view line)
{
    std::vector<std::string_view> fields;
    usize start = 0;
    while (true)
    {
        const usize comma = line.find(',', start);
        if (comma == std::string_view::npos)
        {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, comma - start));
        start = comma + 1;
    }
    return fields;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view CatalogueLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> CatalogueLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }

    return value;
}

} // namespace skyalign::catalog
