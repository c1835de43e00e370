/// @file catalog_loader.cpp
/// @brief Implementation of the CSV host catalog loader.

#include "catalog/catalog_loader.hpp"

#include "core/logger.hpp"
#include "core/text.hpp"

#include <array>
#include <charconv>
#include <fstream>
#include <string>
#include <utility>

namespace transitscan::catalog
{

namespace
{

constexpr std::size_t kColumnCount = 8;

std::optional<f64> optional_f64(std::string_view sv)
{
    return core::text::parse_f64(core::text::trim(sv));
}

std::optional<u64> parse_u64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }
    u64 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Load host CSV: TIC,Name,RA_deg,Dec_deg,Tmag,Radius,Mass,Teff
// -----------------------------------------------------------------

std::optional<std::vector<HostMetadata>>
CatalogLoader::load_host_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        TSC_CORE_ERROR("CatalogLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::vector<HostMetadata> hosts;
    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        TSC_CORE_ERROR("CatalogLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    u32 line_number = 1;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (core::text::trim(line).empty())
        {
            continue;
        }

        auto host = parse_host_line(line);
        if (!host)
        {
            TSC_CORE_WARN("CatalogLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }
        hosts.push_back(std::move(*host));
    }

    if (hosts.empty())
    {
        TSC_CORE_ERROR("CatalogLoader: No valid hosts found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        TSC_CORE_WARN("CatalogLoader: Skipped {} malformed lines", skipped);
    }

    TSC_CORE_INFO("CatalogLoader: Loaded {} hosts from {}", hosts.size(), path.string());

    return hosts;
}

std::optional<HostMetadata> CatalogLoader::parse_host_line(std::string_view line)
{
    std::array<std::string_view, kColumnCount> fields;
    std::size_t count = 0;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t comma = line.find(',', start);
        const std::string_view field = line.substr(start, comma == std::string_view::npos ? std::string_view::npos
                                                                                          : comma - start);
        if (count == kColumnCount)
        {
            return std::nullopt;
        }
        fields[count++] = core::text::trim(field);
        if (comma == std::string_view::npos)
        {
            break;
        }
        start = comma + 1;
    }
    if (count != kColumnCount)
    {
        return std::nullopt;
    }

    const auto tic = parse_u64(fields[0]);
    if (!tic)
    {
        return std::nullopt;
    }

    // Non-empty numeric fields must parse
    std::array<std::optional<f64>, 6> numbers;
    for (std::size_t i = 0; i < numbers.size(); ++i)
    {
        const std::string_view field = fields[i + 2];
        if (field.empty())
        {
            continue;
        }
        numbers[i] = optional_f64(field);
        if (!numbers[i])
        {
            return std::nullopt;
        }
    }

    return HostMetadata{
        .identifier  = *tic,
        .name        = std::string(fields[1]),
        .ra_deg      = numbers[0],
        .dec_deg     = numbers[1],
        .magnitude   = numbers[2],
        .radius      = numbers[3],
        .mass        = numbers[4],
        .temperature = numbers[5],
    };
}

} // namespace transitscan::catalog
