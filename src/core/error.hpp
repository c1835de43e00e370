#pragma once

/// @file error.hpp
/// @brief Exception types surfaced to callers of the analysis pipeline.

#include <stdexcept>
#include <string>
#include <vector>

namespace transitscan
{
    /// @brief Base class for every error TransitScan throws.
    class Error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief Structurally invalid input: empty or unparseable table, or no
    /// usable time/flux column. Aborts the whole request.
    class InputError : public Error
    {
    public:
        explicit InputError(const std::string& message,
                            std::vector<std::string> available_columns = {});

        /// @brief Column names found in the table, for reporting back to the user.
        [[nodiscard]] const std::vector<std::string>& available_columns() const
        {
            return m_available_columns;
        }

    private:
        std::vector<std::string> m_available_columns;
    };

    /// @brief Record store failure (insert, query, or unique-name conflict).
    /// Local to one signal: the engine records it and carries on.
    class StorageError : public Error
    {
    public:
        using Error::Error;
    };

} // namespace transitscan
