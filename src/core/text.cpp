/// @file text.cpp
/// @brief Implementation of the shared string utilities.

#include "core/text.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace transitscan::core::text
{

// -----------------------------------------------------------------
// trim whitespace
// -----------------------------------------------------------------

std::string_view trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> parse_f64(std::string_view sv)
{
    sv = trim(sv);
    if (!sv.empty() && sv.front() == '+')
    {
        sv.remove_prefix(1);
    }
    if (sv.empty())
    {
        return std::nullopt;
    }

    // std::from_chars for double requires C++17 and MSVC/GCC 11+/Clang 16+
    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

// -----------------------------------------------------------------
// parse u32 from string_view
// -----------------------------------------------------------------

std::optional<u32> parse_u32(std::string_view sv)
{
    sv = trim(sv);
    if (sv.empty())
    {
        return std::nullopt;
    }

    u32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

std::optional<bool> parse_bool(std::string_view sv)
{
    const std::string lower = to_lower(trim(sv));
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1")
    {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0")
    {
        return false;
    }
    return std::nullopt;
}

std::string to_lower(std::string_view sv)
{
    std::string out(sv);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
        {
            return false;
        }
    }
    return true;
}

} // namespace transitscan::core::text
