/// @file config.cpp
/// @brief INI and environment loading for AppConfig.
///
/// Runs before Logger::init(), so diagnostics go to spdlog's default logger.

#include "core/config.hpp"

#include "core/text.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace transitscan::core
{

// -----------------------------------------------------------------
// File loading
// -----------------------------------------------------------------

std::optional<AppConfig> ConfigLoader::load_ini(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        spdlog::error("ConfigLoader: Failed to open config file: {}", path.string());
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return parse_ini(content.str());
}

AppConfig ConfigLoader::parse_ini(std::string_view content)
{
    AppConfig config;
    std::string section;
    u32 line_number = 0;

    std::istringstream stream{std::string(content)};
    std::string line;
    while (std::getline(stream, line))
    {
        ++line_number;
        const std::string_view trimmed = text::trim(line);

        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';')
        {
            continue;
        }

        if (trimmed.front() == '[')
        {
            if (trimmed.back() != ']')
            {
                spdlog::warn("ConfigLoader: Malformed section header on line {}: {}", line_number, line);
                continue;
            }
            section = text::to_lower(text::trim(trimmed.substr(1, trimmed.size() - 2)));
            continue;
        }

        const auto eq = trimmed.find('=');
        if (eq == std::string_view::npos)
        {
            spdlog::warn("ConfigLoader: Expected key = value on line {}: {}", line_number, line);
            continue;
        }

        const std::string key = text::to_lower(text::trim(trimmed.substr(0, eq)));
        const std::string_view value = text::trim(trimmed.substr(eq + 1));

        if (!assign(config, section, key, value))
        {
            spdlog::warn("ConfigLoader: Ignoring [{}] {} = '{}' (line {})",
                         section, key, value, line_number);
        }
    }

    return config;
}

// -----------------------------------------------------------------
// Environment overrides
// -----------------------------------------------------------------

void ConfigLoader::apply_env_overrides(AppConfig& config)
{
    if (const char* url = std::getenv("TRANSITSCAN_CLASSIFIER_URL"))
    {
        if (!apply_classifier_url(config.classifier, url))
        {
            spdlog::warn("ConfigLoader: TRANSITSCAN_CLASSIFIER_URL is not an http URL: {}", url);
        }
    }
    if (const char* db = std::getenv("TRANSITSCAN_DB_PATH"))
    {
        config.store.backend     = "sqlite";
        config.store.sqlite_path = db;
    }
    if (const char* level = std::getenv("TRANSITSCAN_LOG_LEVEL"))
    {
        config.logging.level = level;
    }
}

bool ConfigLoader::apply_classifier_url(ClassifierConfig& config, std::string_view url)
{
    constexpr std::string_view kScheme = "http://";
    url = text::trim(url);
    if (url.substr(0, kScheme.size()) != kScheme)
    {
        return false;
    }
    url.remove_prefix(kScheme.size());

    std::string_view authority = url;
    std::string target = "/predict";
    if (const auto slash = url.find('/'); slash != std::string_view::npos)
    {
        authority = url.substr(0, slash);
        target    = std::string(url.substr(slash));
    }

    std::string_view host = authority;
    u16 port = 80;
    if (const auto colon = authority.rfind(':'); colon != std::string_view::npos)
    {
        const auto parsed = text::parse_u32(authority.substr(colon + 1));
        if (!parsed || *parsed == 0 || *parsed > 65535)
        {
            return false;
        }
        host = authority.substr(0, colon);
        port = static_cast<u16>(*parsed);
    }
    if (host.empty())
    {
        return false;
    }

    config.enabled = true;
    config.host    = std::string(host);
    config.port    = port;
    config.target  = target;
    return true;
}

// -----------------------------------------------------------------
// Key assignment
// -----------------------------------------------------------------

bool ConfigLoader::assign(AppConfig& config, std::string_view section,
                          std::string_view key, std::string_view value)
{
    auto set_f64 = [&](f64& field) {
        const auto v = text::parse_f64(value);
        if (v) field = *v;
        return v.has_value();
    };
    auto set_u32 = [&](u32& field) {
        const auto v = text::parse_u32(value);
        if (v) field = *v;
        return v.has_value();
    };
    auto set_bool = [&](bool& field) {
        const auto v = text::parse_bool(value);
        if (v) field = *v;
        return v.has_value();
    };

    if (section == "logging")
    {
        if (key == "level")   { config.logging.level = std::string(value); return true; }
        if (key == "file")    { config.logging.file_path = std::string(value); return true; }
        if (key == "console") { return set_bool(config.logging.console); }
    }
    else if (section == "search")
    {
        auto& s = config.search;
        // Grid shape and signal count are fixed; the period bounds depend on them
        if (key == "min_period_days" || key == "period_grid_size" ||
            key == "phase_bins" || key == "max_signals")
        {
            spdlog::warn("ConfigLoader: [search] {} is fixed and cannot be configured, ignoring '{}'",
                         key, value);
            return true;
        }
        if (key == "max_period_cap_days") return set_f64(s.max_period_cap_days);
        if (key == "base_snr_threshold")  return set_f64(s.base_snr_threshold);
        if (key == "snr_threshold_step")  return set_f64(s.snr_threshold_step);
        if (key == "min_depth_ppm")       return set_f64(s.min_depth_ppm);
        if (key == "min_samples")         return set_u32(s.min_samples);
        if (key == "outlier_sigma")       return set_f64(s.outlier_sigma);
    }
    else if (section == "classifier")
    {
        auto& c = config.classifier;
        if (key == "enabled")   return set_bool(c.enabled);
        if (key == "url")       return apply_classifier_url(c, value);
        if (key == "host")      { c.host = std::string(value); return !c.host.empty(); }
        if (key == "target")    { c.target = std::string(value); return true; }
        if (key == "timeout_s")
        {
            const auto v = text::parse_f64(value);
            if (!v || *v <= 0.0) return false;
            c.timeout_s = *v;
            return true;
        }
        if (key == "dataset")   { c.dataset_tag = std::string(value); return true; }
        if (key == "port")
        {
            const auto v = text::parse_u32(value);
            if (!v || *v == 0 || *v > 65535) return false;
            c.port = static_cast<u16>(*v);
            return true;
        }
    }
    else if (section == "catalog")
    {
        if (key == "host_catalog") { config.catalog.host_catalog_path = std::string(value); return true; }
    }
    else if (section == "store")
    {
        if (key == "backend")
        {
            const std::string backend = text::to_lower(value);
            if (backend != "memory" && backend != "sqlite") return false;
            config.store.backend = backend;
            return true;
        }
        if (key == "sqlite_path") { config.store.sqlite_path = std::string(value); return true; }
    }
    else if (section == "discovery")
    {
        auto& d = config.discovery;
        if (key == "storage_probability_threshold") return set_f64(d.storage_probability_threshold);
        if (key == "duplicate_period_tolerance")    return set_f64(d.duplicate_period_tolerance);
    }

    return false;
}

} // namespace transitscan::core
