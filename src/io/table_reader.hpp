#pragma once

/// @file table_reader.hpp
/// @brief Loads delimited light-curve text (CSV, TSV, whitespace tables) into a Table.

#include "io/table.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transitscan::io
{
    /// @brief Static utility class for reading uploaded light-curve tables.
    ///
    /// The first non-comment line is the header. Lines starting with '#' are
    /// comments; they are scanned (together with the first 50 lines) for a
    /// target identifier such as "# TIC ID: 50365310".
    ///
    /// The delimiter is sniffed in the order ',', '\\t', ';', '|', whitespace:
    /// the first one that yields at least 2 columns and at least 10 data rows
    /// wins. Cells that do not parse as numbers are stored as null.
    class TableReader
    {
    public:
        TableReader() = delete;

        /// Minimum data rows for a delimiter to be accepted.
        static constexpr std::size_t kMinRows = 10;
        /// Lines scanned for a target identifier.
        static constexpr std::size_t kIdScanLines = 50;

        /// @brief Load a table from a file.
        /// @return Table on success, std::nullopt if unreadable or not tabular.
        [[nodiscard]] static std::optional<Table> load_file(const std::filesystem::path& path);

        /// @brief Parse a table from in-memory text.
        /// @return Table on success, std::nullopt if not tabular.
        [[nodiscard]] static std::optional<Table> parse(std::string_view content);

        /// @brief Extract a TIC-style identifier from one line of text.
        /// Matches "TIC ID: 123", "TICID=123", "TIC 123" (case-insensitive).
        [[nodiscard]] static std::optional<std::string> extract_target_id(std::string_view line);

    private:
        /// @brief Split one line on a delimiter. ' ' means runs of spaces/tabs.
        [[nodiscard]] static std::vector<std::string_view> split(std::string_view line, char delimiter);

        /// @brief Attempt a parse with one delimiter.
        [[nodiscard]] static std::optional<Table> parse_with(const std::vector<std::string_view>& lines,
                                                             char delimiter);
    };

} // namespace transitscan::io
