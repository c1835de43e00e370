#pragma once
// discovery/discovery_engine.hpp - Light-curve analysis and discovery recording
//
// Pipeline for one uploaded table:
//  - column identification and light-curve cleaning
//  - multi-signal extraction
//  - features, classification (service or rule fallback) and raw-SNR override
//  - naming, deduplication and persistence of eligible signals
//  - phase-fold plot data per signal

#include "analysis/feature_synthesizer.hpp"
#include "catalog/host_lookup.hpp"
#include "classification/classifier_adapter.hpp"
#include "core/config.hpp"
#include "detection/transit_search.hpp"
#include "io/table.hpp"
#include "storage/discovery_store.hpp"
#include <optional>
#include <string>
#include <vector>

namespace transitscan::discovery {

// -----------------------------------------------------------------------
// Per-signal result
// -----------------------------------------------------------------------
struct SignalReport {
    detection::DetectedSignal            detection;
    analysis::FeatureVector              features;
    classification::ClassificationResult classification;
    std::vector<Vec2d>                   plot_points;    ///< (phase, normalized flux)
    std::string                          name;
    analysis::PlanetType                 planet_type{analysis::PlanetType::Unknown};
    bool                                 eligible{false}; ///< Passed the storage policy
    bool                                 duplicate{false};
    bool                                 stored{false};
    std::string                          storage_error;  ///< Empty unless the store failed
};

// -----------------------------------------------------------------------
// Whole-request result
// -----------------------------------------------------------------------
struct AnalysisReport {
    std::vector<SignalReport>           signals;
    std::size_t                         total_detected{0};
    std::size_t                         stored_count{0};
    std::string                         host_name;       ///< "TIC <id>" or "Unknown"
    std::optional<catalog::HostMetadata> host_info;
    std::string                         time_column;
    std::string                         flux_column;
    std::size_t                         samples_used{0};
    std::size_t                         outliers_removed{0};
    std::string                         message;
};

// -----------------------------------------------------------------------
// DiscoveryEngine
// -----------------------------------------------------------------------
class DiscoveryEngine {
public:
    /// Collaborators are non-owning; classifier and hosts may be null.
    DiscoveryEngine(const core::AppConfig& config,
                    classification::ClassifierService* classifier,
                    const catalog::HostLookup* hosts,
                    storage::DiscoveryStore& store);

    /// Analyze one table. Throws InputError when the table is empty or its
    /// time/flux columns cannot be identified; every other failure is
    /// recorded in the report.
    AnalysisReport analyze(const io::Table& table,
                           std::optional<std::string> externalId = std::nullopt) const;

    /// Storage policy: not a false positive and probability above threshold.
    bool isEligible(const classification::ClassificationResult& result) const;

    /// "TIC-<id> b", "TIC-<id> c", ... or "Planet-<stamp>-<n>" without an id.
    static std::string signalName(const std::optional<std::string>& targetId,
                                  const std::string& stamp, std::size_t index);

    /// "TIC <id>" for a numeric id, the id itself otherwise, "Unknown" without one.
    static std::string hostName(const std::optional<std::string>& targetId);

    /// Strip a leading "TIC" from a numeric identifier; empty input yields nullopt.
    static std::optional<std::string> normalizeTargetId(std::optional<std::string> id);

private:
    core::AppConfig                     m_config;
    classification::ClassifierAdapter   m_classifier;
    const catalog::HostLookup*          m_hosts;
    storage::DiscoveryStore&            m_store;
};

} // namespace transitscan::discovery
