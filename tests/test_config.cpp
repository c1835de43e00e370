/// @file test_config.cpp
/// @brief Unit tests for transitscan::core::ConfigLoader.

#include <doctest/doctest.h>

#include "core/config.hpp"
#include "io/temp_file.hpp"

#include <cstdlib>

using namespace transitscan;
using namespace transitscan::core;

// =================================================================
// Defaults
// =================================================================

TEST_CASE("Defaults match the documented search parameters")
{
    const AppConfig cfg;
    CHECK(cfg.search.min_period_days == doctest::Approx(0.5));
    CHECK(cfg.search.max_period_cap_days == doctest::Approx(500.0));
    CHECK(cfg.search.period_grid_size == 200);
    CHECK(cfg.search.phase_bins == 50);
    CHECK(cfg.search.max_signals == 5);
    CHECK(cfg.search.base_snr_threshold == doctest::Approx(2.0));
    CHECK(cfg.search.snr_threshold_step == doctest::Approx(0.5));
    CHECK(cfg.search.min_samples == 100);
    CHECK(cfg.search.min_bin_samples == 8);
    CHECK(cfg.discovery.storage_probability_threshold == doctest::Approx(0.5));
    CHECK(cfg.discovery.duplicate_period_tolerance == doctest::Approx(0.01));
    CHECK(cfg.store.backend == "memory");
}

// =================================================================
// INI parsing
// =================================================================

TEST_CASE("INI sections override defaults")
{
    const AppConfig cfg = ConfigLoader::parse_ini(
        "# TransitScan configuration\n"
        "[search]\n"
        "min_samples = 150\n"
        "base_snr_threshold = 2.5\n"
        "min_depth_ppm = 250\n"
        "\n"
        "; classifier endpoint\n"
        "[Classifier]\n"
        "host = classifier.local\n"
        "port = 8080\n"
        "timeout_s = 1.5\n"
        "dataset = kepler\n"
        "\n"
        "[store]\n"
        "backend = SQLite\n"
        "sqlite_path = /tmp/discoveries.db\n"
        "\n"
        "[discovery]\n"
        "storage_probability_threshold = 0.6\n");

    CHECK(cfg.search.min_samples == 150);
    CHECK(cfg.search.base_snr_threshold == doctest::Approx(2.5));
    CHECK(cfg.search.min_depth_ppm == doctest::Approx(250.0));
    CHECK(cfg.classifier.host == "classifier.local");
    CHECK(cfg.classifier.port == 8080);
    CHECK(cfg.classifier.timeout_s == doctest::Approx(1.5));
    CHECK(cfg.classifier.dataset_tag == "kepler");
    CHECK(cfg.store.backend == "sqlite");
    CHECK(cfg.store.sqlite_path.string() == "/tmp/discoveries.db");
    CHECK(cfg.discovery.storage_probability_threshold == doctest::Approx(0.6));
}

TEST_CASE("Malformed values keep the defaults")
{
    const AppConfig cfg = ConfigLoader::parse_ini(
        "[classifier]\n"
        "port = 70000\n"
        "timeout_s = -1\n"
        "enabled = maybe\n"
        "[search]\n"
        "min_samples = lots\n"
        "outlier_sigma = high\n"
        "unknown_key = 1\n"
        "[store]\n"
        "backend = postgres\n"
        "not a key value line\n");

    CHECK(cfg.classifier.port == 5001);
    CHECK(cfg.classifier.timeout_s == doctest::Approx(5.0));
    CHECK(cfg.classifier.enabled);
    CHECK(cfg.search.min_samples == 100);
    CHECK(cfg.search.outlier_sigma == doctest::Approx(10.0));
    CHECK(cfg.store.backend == "memory");
}

TEST_CASE("Period grid shape and signal count cannot be configured")
{
    const AppConfig cfg = ConfigLoader::parse_ini(
        "[search]\n"
        "min_period_days = 0.1\n"
        "period_grid_size = 1000\n"
        "phase_bins = 40\n"
        "max_signals = 9\n"
        "max_period_cap_days = 100\n");

    CHECK(cfg.search.min_period_days == doctest::Approx(0.5));
    CHECK(cfg.search.period_grid_size == 200);
    CHECK(cfg.search.phase_bins == 50);
    CHECK(cfg.search.max_signals == 5);
    CHECK(cfg.search.max_period_cap_days == doctest::Approx(100.0));
}

TEST_CASE("load_ini reads a file and fails on a missing one")
{
    const io::ScopedTempFile file("[logging]\nlevel = debug\nconsole = off\n", ".ini");
    const auto cfg = ConfigLoader::load_ini(file.path());
    REQUIRE(cfg.has_value());
    CHECK(cfg->logging.level == "debug");
    CHECK_FALSE(cfg->logging.console);

    CHECK_FALSE(ConfigLoader::load_ini("/nonexistent/transitscan.ini").has_value());
}

// =================================================================
// Classifier URL
// =================================================================

TEST_CASE("Classifier URL is split into host, port and target")
{
    ClassifierConfig c;

    SUBCASE("host, port and path")
    {
        CHECK(ConfigLoader::apply_classifier_url(c, "http://ml.example.org:8081/api/v2/predict"));
        CHECK(c.host == "ml.example.org");
        CHECK(c.port == 8081);
        CHECK(c.target == "/api/v2/predict");
    }
    SUBCASE("host only")
    {
        CHECK(ConfigLoader::apply_classifier_url(c, "http://localhost"));
        CHECK(c.host == "localhost");
        CHECK(c.port == 80);
        CHECK(c.target == "/predict");
    }
    SUBCASE("rejected URLs leave the config untouched")
    {
        CHECK_FALSE(ConfigLoader::apply_classifier_url(c, "https://secure.example.org/predict"));
        CHECK_FALSE(ConfigLoader::apply_classifier_url(c, "http://:5001/predict"));
        CHECK_FALSE(ConfigLoader::apply_classifier_url(c, "http://host:notaport/"));
        CHECK(c.host == "127.0.0.1");
        CHECK(c.port == 5001);
    }
}

TEST_CASE("Environment overrides")
{
    ::setenv("TRANSITSCAN_CLASSIFIER_URL", "http://10.0.0.5:9000/classify", 1);
    ::setenv("TRANSITSCAN_DB_PATH", "/var/lib/transitscan/discoveries.db", 1);

    AppConfig cfg;
    cfg.classifier.enabled = false;
    ConfigLoader::apply_env_overrides(cfg);

    ::unsetenv("TRANSITSCAN_CLASSIFIER_URL");
    ::unsetenv("TRANSITSCAN_DB_PATH");

    CHECK(cfg.classifier.enabled);
    CHECK(cfg.classifier.host == "10.0.0.5");
    CHECK(cfg.classifier.port == 9000);
    CHECK(cfg.classifier.target == "/classify");
    CHECK(cfg.store.backend == "sqlite");
    CHECK(cfg.store.sqlite_path.string() == "/var/lib/transitscan/discoveries.db");
}
