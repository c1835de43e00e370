#pragma once

/// @file text.hpp
/// @brief Small string utilities shared by the CSV, INI and catalog parsers.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace transitscan::core::text
{
    /// @brief Trim leading and trailing whitespace (space, tab, CR) from a string_view.
    [[nodiscard]] std::string_view trim(std::string_view sv);

    /// @brief Parse a single f64 value from a trimmed string_view.
    /// Accepts an optional leading '+'. Rejects trailing garbage.
    /// @return The parsed value, or std::nullopt on failure.
    [[nodiscard]] std::optional<f64> parse_f64(std::string_view sv);

    /// @brief Parse a single u32 value from a trimmed string_view.
    /// @return The parsed value, or std::nullopt on failure.
    [[nodiscard]] std::optional<u32> parse_u32(std::string_view sv);

    /// @brief Parse true/false, yes/no, on/off, 1/0 (case-insensitive).
    [[nodiscard]] std::optional<bool> parse_bool(std::string_view sv);

    /// @brief ASCII lower-case copy.
    [[nodiscard]] std::string to_lower(std::string_view sv);

    /// @brief Case-insensitive ASCII equality.
    [[nodiscard]] bool iequals(std::string_view a, std::string_view b);

} // namespace transitscan::core::text
