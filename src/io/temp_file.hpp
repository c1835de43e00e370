#pragma once

/// @file temp_file.hpp
/// @brief Scoped on-disk copy of uploaded content, removed on every exit path.

#include <filesystem>
#include <string_view>

namespace transitscan::io
{
    /// @brief Writes content to a unique file in the system temp directory and
    /// deletes it when the object goes out of scope (including stack unwinding).
    class ScopedTempFile
    {
    public:
        /// @brief Create the file. Throws std::runtime_error if it cannot be written.
        /// @param content   Bytes to write.
        /// @param extension Suffix for the generated name, e.g. ".csv".
        explicit ScopedTempFile(std::string_view content, std::string_view extension = ".csv");
        ~ScopedTempFile();

        ScopedTempFile(const ScopedTempFile&) = delete;
        ScopedTempFile& operator=(const ScopedTempFile&) = delete;

        ScopedTempFile(ScopedTempFile&& other) noexcept;
        ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

        [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    private:
        void remove() noexcept;

        std::filesystem::path m_path;
    };

} // namespace transitscan::io
