/// @file table.cpp
/// @brief Column and Table helpers.

#include "io/table.hpp"

#include <algorithm>

namespace transitscan::io
{

std::size_t Column::numeric_count() const
{
    return static_cast<std::size_t>(std::count_if(values.begin(), values.end(),
        [](const std::optional<f64>& v) { return v.has_value(); }));
}

std::vector<f64> Column::numeric_values(std::size_t limit) const
{
    std::vector<f64> out;
    for (const auto& v : values)
    {
        if (out.size() >= limit)
        {
            break;
        }
        if (v)
        {
            out.push_back(*v);
        }
    }
    return out;
}

const Column* Table::find(std::string_view name) const
{
    for (const auto& column : columns)
    {
        if (column.name == name)
        {
            return &column;
        }
    }
    return nullptr;
}

std::vector<std::string> Table::column_names() const
{
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& column : columns)
    {
        names.push_back(column.name);
    }
    return names;
}

} // namespace transitscan::io
