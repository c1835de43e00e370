#pragma once

/// @file config.hpp
/// @brief Runtime configuration structs and the INI/environment loader.

#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace transitscan::core
{
    /// @brief Logger sinks and verbosity.
    struct LoggingConfig
    {
        std::string level     = "info";           ///< spdlog level name
        std::string file_path = "transitscan.log"; ///< Empty disables the file sink
        bool        console   = true;
    };

    /// @brief Periodic search and multi-signal extraction parameters.
    struct SearchConfig
    {
        f64 min_period_days     = 0.5;
        f64 max_period_cap_days = 500.0;  ///< max period = min(span / 3, cap)
        u32 period_grid_size    = 200;
        u32 phase_bins          = 50;
        u32 max_signals         = 5;
        f64 base_snr_threshold  = 2.0;    ///< threshold at iteration 0
        f64 snr_threshold_step  = 0.5;    ///< added per iteration
        f64 min_depth_ppm       = 100.0;
        u32 min_samples         = 100;
        u32 min_bin_samples     = 8;      ///< a transit bin needs at least this many samples
        f64 outlier_sigma       = 10.0;   ///< <= 0 disables outlier removal
    };

    /// @brief External classification service endpoint.
    struct ClassifierConfig
    {
        bool        enabled     = true;
        std::string host        = "127.0.0.1";
        u16         port        = 5001;
        std::string target      = "/predict";
        f64         timeout_s   = 5.0;
        std::string dataset_tag = "uploaded";
    };

    /// @brief Local host-star metadata catalog.
    struct CatalogConfig
    {
        std::filesystem::path host_catalog_path; ///< Empty disables host lookup
    };

    /// @brief Discovery record store backend.
    struct StoreConfig
    {
        std::string           backend     = "memory"; ///< "memory" or "sqlite"
        std::filesystem::path sqlite_path = "transitscan.db";
    };

    /// @brief Persistence policy for classified signals.
    struct DiscoveryConfig
    {
        /// Signals are stored only when probability exceeds this value.
        f64 storage_probability_threshold = 0.5;
        /// Relative period tolerance for same-host deduplication.
        f64 duplicate_period_tolerance = 0.01;
    };

    /// @brief Aggregate of every configuration section.
    struct AppConfig
    {
        LoggingConfig    logging;
        SearchConfig     search;
        ClassifierConfig classifier;
        CatalogConfig    catalog;
        StoreConfig      store;
        DiscoveryConfig  discovery;
    };

    /// @brief Static utility class for loading AppConfig from INI files and the environment.
    class ConfigLoader
    {
    public:
        ConfigLoader() = delete;

        /// @brief Load configuration from an INI file.
        ///
        /// Sections: [logging] [search] [classifier] [catalog] [store] [discovery].
        /// Lines starting with '#' or ';' are comments. Unknown keys and
        /// malformed values are logged and leave the default in place.
        ///
        /// @param path Path to the INI file.
        /// @return Parsed configuration, std::nullopt if the file cannot be read.
        [[nodiscard]] static std::optional<AppConfig> load_ini(const std::filesystem::path& path);

        /// @brief Parse INI text into a configuration (defaults for anything absent).
        [[nodiscard]] static AppConfig parse_ini(std::string_view content);

        /// @brief Apply TRANSITSCAN_CLASSIFIER_URL, TRANSITSCAN_DB_PATH and
        /// TRANSITSCAN_LOG_LEVEL if set.
        static void apply_env_overrides(AppConfig& config);

        /// @brief Split an "http://host[:port][/path]" URL into the classifier section.
        /// @return false if the URL is not a plain http URL.
        [[nodiscard]] static bool apply_classifier_url(ClassifierConfig& config, std::string_view url);

    private:
        /// @brief Assign one key of one section. @return false if the key is unknown
        /// or the value does not parse.
        static bool assign(AppConfig& config, std::string_view section,
                           std::string_view key, std::string_view value);
    };

} // namespace transitscan::core
