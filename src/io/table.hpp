#pragma once

/// @file table.hpp
/// @brief In-memory tabular light-curve data: named columns of nullable numbers.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transitscan::io
{
    /// @brief One named column. Cells that were empty or non-numeric are std::nullopt.
    struct Column
    {
        std::string                     name;
        std::vector<std::optional<f64>> values;

        /// @brief Number of cells holding a numeric value.
        [[nodiscard]] std::size_t numeric_count() const;

        /// @brief Numeric cells in row order, nulls dropped.
        [[nodiscard]] std::vector<f64> numeric_values(std::size_t limit = static_cast<std::size_t>(-1)) const;
    };

    /// @brief A parsed table plus metadata scraped from comment lines.
    struct Table
    {
        std::vector<Column>        columns;
        std::optional<std::string> target_id;  ///< e.g. TIC number found in a header comment

        [[nodiscard]] std::size_t row_count() const
        {
            return columns.empty() ? 0 : columns.front().values.size();
        }

        [[nodiscard]] const Column* find(std::string_view name) const;

        [[nodiscard]] std::vector<std::string> column_names() const;
    };

} // namespace transitscan::io
