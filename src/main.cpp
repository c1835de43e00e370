// src/main.cpp - TransitScan command-line entry point
//
//  transitscan [--config file.ini] analyze <file.csv> [--tic ID] [--dataset TAG] [--json]
//  transitscan [--config file.ini] analyze --stdin [...]
//  transitscan [--config file.ini] list [--host H] [--json]
//
// Exit codes: 0 success (including zero detections), 1 input or usage error,
// 2 storage or initialisation failure.

#include "catalog/catalog_loader.hpp"
#include "catalog/host_catalog.hpp"
#include "classification/http_classifier.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "discovery/discovery_engine.hpp"
#include "io/table_reader.hpp"
#include "io/temp_file.hpp"
#include "report/console_report.hpp"
#include "report/json_report.hpp"
#include "storage/memory_store.hpp"
#include "storage/sqlite_store.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

using namespace transitscan;

namespace {

constexpr int kExitOk      = 0;
constexpr int kExitInput   = 1;
constexpr int kExitStorage = 2;

struct AnalyzeOptions {
    std::string file;
    bool        from_stdin{false};
    std::string tic;
    std::string dataset;
    bool        json{false};
};

struct ListOptions {
    std::string host;
    bool        json{false};
};

// -----------------------------------------------------------------------
// Collaborator construction
// -----------------------------------------------------------------------
std::unique_ptr<storage::DiscoveryStore> makeStore(const core::StoreConfig& cfg) {
    if (cfg.backend == "memory") {
        return std::make_unique<storage::MemoryDiscoveryStore>();
    }
    if (cfg.backend == "sqlite") {
        return std::make_unique<storage::SqliteDiscoveryStore>(cfg.sqlite_path);
    }
    throw StorageError("Unknown store backend '" + cfg.backend + "'");
}

std::optional<catalog::HostCatalog> loadHosts(const core::CatalogConfig& cfg) {
    if (cfg.host_catalog_path.empty()) return std::nullopt;
    auto hosts = catalog::CatalogLoader::load_host_csv(cfg.host_catalog_path);
    if (!hosts) {
        TSC_WARN("Host catalog unavailable, continuing without host metadata");
        return std::nullopt;
    }
    return catalog::HostCatalog(std::move(*hosts));
}

// -----------------------------------------------------------------------
// analyze
// -----------------------------------------------------------------------
int runAnalyze(const core::AppConfig& cfg, const AnalyzeOptions& opts) {
    std::optional<io::Table> table;
    if (opts.from_stdin) {
        const std::string content{std::istreambuf_iterator<char>(std::cin),
                                  std::istreambuf_iterator<char>()};
        const io::ScopedTempFile upload(content);
        table = io::TableReader::load_file(upload.path());
    } else {
        table = io::TableReader::load_file(opts.file);
    }
    if (!table) {
        std::cerr << "error: input is not a readable light-curve table\n";
        return kExitInput;
    }

    auto store = makeStore(cfg.store);
    auto hosts = loadHosts(cfg.catalog);
    std::unique_ptr<classification::ClassifierService> classifier;
    if (cfg.classifier.enabled) {
        classifier = std::make_unique<classification::HttpClassifier>(cfg.classifier);
    }

    const discovery::DiscoveryEngine engine(cfg, classifier.get(), hosts ? &*hosts : nullptr, *store);

    std::optional<std::string> externalId;
    if (!opts.tic.empty()) externalId = opts.tic;

    discovery::AnalysisReport result;
    try {
        result = engine.analyze(*table, externalId);
    } catch (const InputError& e) {
        std::cerr << "error: " << e.what() << '\n';
        return kExitInput;
    }

    if (opts.json) {
        std::cout << report::to_json(result).dump(2) << '\n';
    } else {
        report::ConsoleReport{}.render(std::cout, result);
    }
    return kExitOk;
}

// -----------------------------------------------------------------------
// list
// -----------------------------------------------------------------------
int runList(const core::AppConfig& cfg, const ListOptions& opts) {
    auto store = makeStore(cfg.store);

    storage::RecordFilter filter;
    if (!opts.host.empty()) filter.host = opts.host;
    const auto records = store->query(filter);

    if (opts.json) {
        std::cout << report::to_json(records).dump(2) << '\n';
    } else {
        report::ConsoleReport{}.renderRecords(std::cout, records);
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"TransitScan - periodic transit search for stellar light curves"};
    app.require_subcommand(1);

    std::string configPath;
    app.add_option("--config", configPath, "Path to an INI configuration file");

    AnalyzeOptions analyzeOpts;
    auto analyzeCmd = app.add_subcommand("analyze", "Search a light-curve table for transits");
    analyzeCmd->add_option("file", analyzeOpts.file, "CSV/TSV light curve");
    analyzeCmd->add_flag("--stdin", analyzeOpts.from_stdin, "Read the table from standard input");
    analyzeCmd->add_option("--tic", analyzeOpts.tic, "Target identifier (TIC number)");
    analyzeCmd->add_option("--dataset", analyzeOpts.dataset, "Source dataset tag");
    analyzeCmd->add_flag("--json", analyzeOpts.json, "Print the report as JSON");

    ListOptions listOpts;
    auto listCmd = app.add_subcommand("list", "List stored discoveries");
    listCmd->add_option("--host", listOpts.host, "Only records of this host");
    listCmd->add_flag("--json", listOpts.json, "Print records as JSON");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e) == 0 ? kExitOk : kExitInput;
    }

    if (analyzeCmd->parsed() && analyzeOpts.file.empty() == !analyzeOpts.from_stdin) {
        std::cerr << "error: analyze needs exactly one of <file> or --stdin\n";
        return kExitInput;
    }

    // -----------------------------------------------------------------------
    // Configuration and logging
    // -----------------------------------------------------------------------
    // Console-only until the configured sinks are known; the loader logs.
    core::Logger::init(core::LoggingConfig{.level = "info", .file_path = "", .console = true});

    core::AppConfig cfg;
    if (!configPath.empty()) {
        auto loaded = core::ConfigLoader::load_ini(configPath);
        if (!loaded) {
            std::cerr << "error: cannot read configuration " << configPath << '\n';
            core::Logger::shutdown();
            return kExitStorage;
        }
        cfg = std::move(*loaded);
    }
    core::ConfigLoader::apply_env_overrides(cfg);
    if (!analyzeOpts.dataset.empty()) cfg.classifier.dataset_tag = analyzeOpts.dataset;

    try {
        core::Logger::init(cfg.logging);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "error: cannot open log sink: " << e.what() << '\n';
        core::Logger::shutdown();
        return kExitStorage;
    }

    int rc = kExitOk;
    try {
        rc = analyzeCmd->parsed() ? runAnalyze(cfg, analyzeOpts) : runList(cfg, listOpts);
    } catch (const StorageError& e) {
        TSC_CRITICAL("Storage failure: {}", e.what());
        std::cerr << "error: " << e.what() << '\n';
        rc = kExitStorage;
    } catch (const std::runtime_error& e) {
        TSC_CRITICAL("Initialisation failure: {}", e.what());
        std::cerr << "error: " << e.what() << '\n';
        rc = kExitStorage;
    }

    core::Logger::shutdown();
    return rc;
}
