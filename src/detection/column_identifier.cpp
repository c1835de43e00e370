/// @file column_identifier.cpp
/// @brief Name heuristics and statistical fallbacks for time/flux column detection.

#include "detection/column_identifier.hpp"

#include "core/logger.hpp"
#include "core/text.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>
#include <span>

namespace transitscan::detection
{

namespace
{

constexpr std::array<std::string_view, 7> kTimeKeywords = {
    "time", "bjd", "jd", "mjd", "hjd", "date", "epoch",
};

constexpr std::array<std::string_view, 3> kCadenceKeywords = {
    "cadence", "frame", "index",
};

constexpr std::array<std::string_view, 9> kFluxKeywords = {
    "flux", "intensity", "mag", "brightness", "count", "signal", "adu", "electron", "rate",
};

// Substrings that disqualify a column as flux (uncertainties, flags, systematics)
constexpr std::array<std::string_view, 10> kNonFluxSubstrings = {
    "err", "uncertainty", "sigma", "quality", "bkg", "background",
    "pos_corr", "centr", "timecorr", "flag",
};

// Whole-word catalog / stellar metadata terms
constexpr std::array<std::string_view, 16> kNonFluxTokens = {
    "ra", "dec", "teff", "logg", "feh", "radius", "mass", "tmag", "kepmag",
    "tic", "kic", "epic", "id", "x", "y", "sector",
};

bool contains_any(std::string_view name, std::span<const std::string_view> keywords)
{
    return std::any_of(keywords.begin(), keywords.end(),
                       [&](std::string_view k) { return name.find(k) != std::string_view::npos; });
}

std::vector<std::string_view> tokens(std::string_view name)
{
    std::vector<std::string_view> out;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= name.size(); ++i)
    {
        const bool boundary = i == name.size() || !std::isalnum(static_cast<unsigned char>(name[i]));
        if (boundary)
        {
            if (i > start)
            {
                out.push_back(name.substr(start, i - start));
            }
            start = i + 1;
        }
    }
    return out;
}

std::vector<f64> column_as_nan_filled(const io::Column& column)
{
    std::vector<f64> out;
    out.reserve(column.values.size());
    for (const auto& v : column.values)
    {
        out.push_back(v.value_or(std::numeric_limits<f64>::quiet_NaN()));
    }
    return out;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Combined identification
// -----------------------------------------------------------------

std::optional<ColumnSelection> ColumnIdentifier::identify(const io::Table& table)
{
    auto selection = identify_time(table);
    if (!selection)
    {
        TSC_CORE_WARN("ColumnIdentifier: No time column could be determined");
        return std::nullopt;
    }

    const auto flux = identify_flux(table, selection->time_column);
    if (!flux)
    {
        TSC_CORE_WARN("ColumnIdentifier: No flux column could be determined");
        return std::nullopt;
    }

    selection->flux_column = *flux;
    TSC_CORE_INFO("ColumnIdentifier: Time '{}' ({}), flux '{}'", selection->time_column,
                  time_source_name(selection->time_source), selection->flux_column);
    return selection;
}

// -----------------------------------------------------------------
// Time axis
// -----------------------------------------------------------------

std::optional<ColumnSelection> ColumnIdentifier::identify_time(const io::Table& table)
{
    // 1. Name match
    for (const auto& column : table.columns)
    {
        if (is_time_name(core::text::to_lower(column.name)) && column.numeric_count() > 0)
        {
            return ColumnSelection{.time_column = column.name, .time_source = TimeSource::TimeColumn};
        }
    }

    // 2. Cadence / frame counter
    for (const auto& column : table.columns)
    {
        if (is_cadence_name(core::text::to_lower(column.name)) && column.numeric_count() > 1)
        {
            return ColumnSelection{.time_column = column.name, .time_source = TimeSource::CadenceColumn};
        }
    }

    // 3. Statistical: first mostly-increasing numeric column
    for (const auto& column : table.columns)
    {
        const std::string lower = core::text::to_lower(column.name);
        if (is_flux_name(lower) || is_excluded_from_flux(lower))
        {
            continue;
        }
        if (is_mostly_increasing(column.numeric_values(kMonotonicProbe)))
        {
            return ColumnSelection{.time_column = column.name, .time_source = TimeSource::TimeColumn};
        }
    }

    return std::nullopt;
}

bool ColumnIdentifier::is_mostly_increasing(const std::vector<f64>& values)
{
    const std::size_t n = std::min(values.size(), kMonotonicProbe);
    if (n < 3)
    {
        return false;
    }

    std::size_t increasing = 0;
    for (std::size_t i = 1; i < n; ++i)
    {
        if (values[i] > values[i - 1])
        {
            ++increasing;
        }
    }
    return static_cast<f64>(increasing) > kMonotonicFraction * static_cast<f64>(n - 1);
}

// -----------------------------------------------------------------
// Flux axis
// -----------------------------------------------------------------

std::optional<std::string> ColumnIdentifier::identify_flux(const io::Table& table, std::string_view exclude)
{
    const io::Column* pdcsap  = nullptr;
    const io::Column* sap     = nullptr;
    const io::Column* by_name = nullptr;
    std::vector<const io::Column*> candidates;

    for (const auto& column : table.columns)
    {
        if (column.name == exclude || column.numeric_count() == 0)
        {
            continue;
        }
        const std::string lower = core::text::to_lower(column.name);
        if (is_excluded_from_flux(lower))
        {
            continue;
        }

        if (lower == "pdcsap_flux")
        {
            pdcsap = &column;
        }
        else if (lower == "sap_flux")
        {
            sap = &column;
        }
        else if (!by_name && is_flux_name(lower))
        {
            by_name = &column;
        }
        candidates.push_back(&column);
    }

    if (pdcsap)  return pdcsap->name;
    if (sap)     return sap->name;
    if (by_name) return by_name->name;

    // Statistical fallback: largest bounded coefficient of variation
    const io::Column* best = nullptr;
    f64 best_cv = 0.0;
    for (const io::Column* column : candidates)
    {
        const auto values = column->numeric_values();
        const std::set<f64> distinct(values.begin(), values.end());
        if (distinct.size() < 2 || is_mostly_increasing(values))
        {
            continue;
        }

        const FluxStats stats = compute_stats(values);
        if (stats.mean == 0.0)
        {
            continue;
        }
        const f64 cv = stats.std_dev / std::abs(stats.mean);
        if (cv > kMaxCoefficientOfVariation || !std::isfinite(cv))
        {
            TSC_CORE_DEBUG("ColumnIdentifier: Rejecting '{}' (cv = {:.3f})", column->name, cv);
            continue;
        }
        if (!best || cv > best_cv)
        {
            best    = column;
            best_cv = cv;
        }
    }

    if (!best)
    {
        return std::nullopt;
    }
    TSC_CORE_DEBUG("ColumnIdentifier: Flux '{}' chosen by variation (cv = {:.4f})", best->name, best_cv);
    return best->name;
}

// -----------------------------------------------------------------
// Light-curve extraction
// -----------------------------------------------------------------

LightCurve ColumnIdentifier::extract(const io::Table& table, const ColumnSelection& selection)
{
    const io::Column* time_column = table.find(selection.time_column);
    const io::Column* flux_column = table.find(selection.flux_column);
    if (!time_column || !flux_column)
    {
        return {};
    }

    std::vector<f64> time = column_as_nan_filled(*time_column);
    const std::vector<f64> flux = column_as_nan_filled(*flux_column);

    if (selection.time_source == TimeSource::CadenceColumn)
    {
        const auto numeric = time_column->numeric_values();
        const f64 first = numeric.empty() ? 0.0 : *std::min_element(numeric.begin(), numeric.end());
        for (f64& t : time)
        {
            t = (t - first) * astro_constants::kKeplerCadenceDays;
        }
    }

    return LightCurve::from_columns(time, flux);
}

// -----------------------------------------------------------------
// Name classification
// -----------------------------------------------------------------

bool ColumnIdentifier::is_time_name(std::string_view lower_name)
{
    if (contains_any(lower_name, kNonFluxSubstrings) || lower_name.find("corr") != std::string_view::npos)
    {
        return false;
    }
    return contains_any(lower_name, kTimeKeywords);
}

bool ColumnIdentifier::is_cadence_name(std::string_view lower_name)
{
    return contains_any(lower_name, kCadenceKeywords);
}

bool ColumnIdentifier::is_flux_name(std::string_view lower_name)
{
    return contains_any(lower_name, kFluxKeywords);
}

bool ColumnIdentifier::is_excluded_from_flux(std::string_view lower_name)
{
    if (contains_any(lower_name, kNonFluxSubstrings))
    {
        return true;
    }
    if (is_time_name(lower_name) || is_cadence_name(lower_name))
    {
        return true;
    }
    for (const auto token : tokens(lower_name))
    {
        if (std::find(kNonFluxTokens.begin(), kNonFluxTokens.end(), token) != kNonFluxTokens.end())
        {
            return true;
        }
    }
    return false;
}

const char* time_source_name(TimeSource source)
{
    switch (source)
    {
        case TimeSource::TimeColumn:    return "time column";
        case TimeSource::CadenceColumn: return "cadence column";
        default:                        return "unknown";
    }
}

} // namespace transitscan::detection
