/// @file temp_file.cpp
/// @brief ScopedTempFile implementation.

#include "io/temp_file.hpp"

#include "core/logger.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace transitscan::io
{

namespace
{

std::filesystem::path unique_temp_path(std::string_view extension)
{
    static std::atomic<unsigned> s_counter{0};

    const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    std::string name = "transitscan-" + std::to_string(::getpid()) + "-" +
                       std::to_string(ticks) + "-" + std::to_string(s_counter.fetch_add(1));
    name += extension;
    return std::filesystem::temp_directory_path() / name;
}

} // anonymous namespace

ScopedTempFile::ScopedTempFile(std::string_view content, std::string_view extension)
    : m_path(unique_temp_path(extension))
{
    std::ofstream file(m_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        throw std::runtime_error("Failed to create temporary file " + m_path.string());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file)
    {
        remove();
        throw std::runtime_error("Failed to write temporary file " + m_path.string());
    }
    TSC_CORE_DEBUG("ScopedTempFile: Created {} ({} bytes)", m_path.string(), content.size());
}

ScopedTempFile::~ScopedTempFile()
{
    remove();
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : m_path(std::exchange(other.m_path, {}))
{
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept
{
    if (this != &other)
    {
        remove();
        m_path = std::exchange(other.m_path, {});
    }
    return *this;
}

void ScopedTempFile::remove() noexcept
{
    if (m_path.empty())
    {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(m_path, ec);
    if (ec)
    {
        TSC_CORE_WARN("ScopedTempFile: Failed to remove {}: {}", m_path.string(), ec.message());
    }
    m_path.clear();
}

} // namespace transitscan::io
