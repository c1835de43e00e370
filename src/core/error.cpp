/// @file error.cpp
/// @brief InputError message formatting.

#include "core/error.hpp"

namespace transitscan
{

namespace
{

std::string with_columns(const std::string& message, const std::vector<std::string>& columns)
{
    if (columns.empty())
    {
        return message;
    }

    std::string text = message + " (available columns: ";
    for (std::size_t i = 0; i < columns.size(); ++i)
    {
        if (i > 0)
        {
            text += ", ";
        }
        text += columns[i];
    }
    text += ")";
    return text;
}

} // anonymous namespace

InputError::InputError(const std::string& message, std::vector<std::string> available_columns)
    : Error(with_columns(message, available_columns))
    , m_available_columns(std::move(available_columns))
{
}

} // namespace transitscan
