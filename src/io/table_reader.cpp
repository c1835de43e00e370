/// @file table_reader.cpp
/// @brief Implementation of the delimited light-curve table reader.

#include "io/table_reader.hpp"

#include "core/logger.hpp"
#include "core/text.hpp"

#include <array>
#include <fstream>
#include <regex>
#include <sstream>

namespace transitscan::io
{

namespace
{

std::string_view strip_quotes(std::string_view sv)
{
    sv = core::text::trim(sv);
    if (sv.size() >= 2 && ((sv.front() == '"' && sv.back() == '"') ||
                           (sv.front() == '\'' && sv.back() == '\'')))
    {
        sv = sv.substr(1, sv.size() - 2);
    }
    return core::text::trim(sv);
}

std::vector<std::string_view> split_lines(std::string_view content)
{
    std::vector<std::string_view> lines;
    while (!content.empty())
    {
        const auto nl = content.find('\n');
        lines.push_back(content.substr(0, nl));
        if (nl == std::string_view::npos)
        {
            break;
        }
        content.remove_prefix(nl + 1);
    }
    return lines;
}

char delimiter_name(char delimiter)
{
    return delimiter == '\t' ? 't' : delimiter;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Load from file
// -----------------------------------------------------------------

std::optional<Table> TableReader::load_file(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        TSC_CORE_ERROR("TableReader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();

    auto table = parse(content.str());
    if (table)
    {
        TSC_CORE_INFO("TableReader: Loaded {} rows x {} columns from {}",
                      table->row_count(), table->columns.size(), path.string());
    }
    return table;
}

// -----------------------------------------------------------------
// Parse from memory
// -----------------------------------------------------------------

std::optional<Table> TableReader::parse(std::string_view content)
{
    const auto all_lines = split_lines(content);

    std::optional<std::string> target_id;
    std::vector<std::string_view> data_lines;

    for (std::size_t i = 0; i < all_lines.size(); ++i)
    {
        const std::string_view line = core::text::trim(all_lines[i]);
        if (line.empty())
        {
            continue;
        }

        const bool is_comment = line.front() == '#';
        if (!target_id && (is_comment || i < kIdScanLines))
        {
            target_id = extract_target_id(line);
        }
        if (!is_comment)
        {
            data_lines.push_back(line);
        }
    }

    if (data_lines.size() < 2)
    {
        TSC_CORE_ERROR("TableReader: No tabular content found");
        return std::nullopt;
    }

    constexpr std::array<char, 5> kDelimiters = {',', '\t', ';', '|', ' '};
    for (const char delimiter : kDelimiters)
    {
        auto table = parse_with(data_lines, delimiter);
        if (table)
        {
            table->target_id = target_id;
            TSC_CORE_DEBUG("TableReader: Delimiter '{}' accepted", delimiter_name(delimiter));
            return table;
        }
    }

    TSC_CORE_ERROR("TableReader: Could not parse file or insufficient data "
                   "(need >= 2 columns and >= {} rows)", kMinRows);
    return std::nullopt;
}

// -----------------------------------------------------------------
// Target identifier from comments/header lines
// -----------------------------------------------------------------

std::optional<std::string> TableReader::extract_target_id(std::string_view line)
{
    static const std::regex kTicPattern(R"((?:TIC\s*ID|TICID|TIC)[\s:=]+(\d+))",
                                        std::regex::icase);

    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(line.begin(), line.end(), match, kTicPattern))
    {
        return match[1].str();
    }
    return std::nullopt;
}

// -----------------------------------------------------------------
// Internals
// -----------------------------------------------------------------

std::vector<std::string_view> TableReader::split(std::string_view line, char delimiter)
{
    std::vector<std::string_view> cells;

    if (delimiter == ' ')
    {
        std::size_t pos = 0;
        while (pos < line.size())
        {
            while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t'))
            {
                ++pos;
            }
            if (pos >= line.size())
            {
                break;
            }
            const std::size_t start = pos;
            while (pos < line.size() && line[pos] != ' ' && line[pos] != '\t')
            {
                ++pos;
            }
            cells.push_back(line.substr(start, pos - start));
        }
        return cells;
    }

    std::size_t start = 0;
    while (true)
    {
        const auto pos = line.find(delimiter, start);
        if (pos == std::string_view::npos)
        {
            cells.push_back(line.substr(start));
            break;
        }
        cells.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return cells;
}

std::optional<Table> TableReader::parse_with(const std::vector<std::string_view>& lines, char delimiter)
{
    const auto header = split(lines.front(), delimiter);
    if (header.size() < 2)
    {
        return std::nullopt;
    }

    Table table;
    table.columns.resize(header.size());
    for (std::size_t c = 0; c < header.size(); ++c)
    {
        const std::string_view name = strip_quotes(header[c]);
        table.columns[c].name = name.empty() ? "column_" + std::to_string(c + 1) : std::string(name);
    }

    u32 skipped = 0;
    for (std::size_t i = 1; i < lines.size(); ++i)
    {
        const auto cells = split(lines[i], delimiter);
        if (cells.size() != header.size())
        {
            ++skipped;
            continue;
        }
        for (std::size_t c = 0; c < cells.size(); ++c)
        {
            table.columns[c].values.push_back(core::text::parse_f64(strip_quotes(cells[c])));
        }
    }

    if (table.row_count() < kMinRows)
    {
        return std::nullopt;
    }

    if (skipped > 0)
    {
        TSC_CORE_WARN("TableReader: Skipped {} malformed lines", skipped);
    }

    return table;
}

} // namespace transitscan::io
