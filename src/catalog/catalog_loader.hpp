#pragma once

/// @file catalog_loader.hpp
/// @brief Loads host-star metadata catalogs from CSV files.

#include "catalog/host_lookup.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace transitscan::catalog
{
    /// @brief Static utility class for loading host catalog files.
    class CatalogLoader
    {
    public:
        CatalogLoader() = delete;

        /// @brief Load host stars from a TIC-keyed CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   TIC, Name, RA_deg, Dec_deg, Tmag, Radius, Mass, Teff
        ///
        /// TIC is required; the numeric columns may be empty. Lines with a
        /// missing or non-numeric TIC, or with the wrong column count, are
        /// skipped and counted.
        ///
        /// @param path Path to the CSV file.
        /// @return Entries on success, std::nullopt if the file cannot be read or holds no valid rows.
        [[nodiscard]] static std::optional<std::vector<HostMetadata>>
            load_host_csv(const std::filesystem::path& path);

        /// @brief Parse one data line. @return std::nullopt if malformed.
        [[nodiscard]] static std::optional<HostMetadata> parse_host_line(std::string_view line);
    };

} // namespace transitscan::catalog
