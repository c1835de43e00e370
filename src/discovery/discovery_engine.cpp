// discovery/discovery_engine.cpp
#include "discovery/discovery_engine.hpp"
#include "astro/time_system.hpp"
#include "catalog/host_catalog.hpp"
#include "classification/confidence_override.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/text.hpp"
#include "detection/column_identifier.hpp"
#include "detection/signal_extractor.hpp"
#include "discovery/dedup_gate.hpp"
#include "plot/phase_fold.hpp"
#include <utility>

namespace transitscan::discovery {

DiscoveryEngine::DiscoveryEngine(const core::AppConfig& config,
                                 classification::ClassifierService* classifier,
                                 const catalog::HostLookup* hosts,
                                 storage::DiscoveryStore& store)
    : m_config(config)
    , m_classifier(classifier, config.classifier.dataset_tag)
    , m_hosts(hosts)
    , m_store(store) {}

// -----------------------------------------------------------------------
// analyze
// -----------------------------------------------------------------------
AnalysisReport DiscoveryEngine::analyze(const io::Table& table,
                                        std::optional<std::string> externalId) const {
    if (table.columns.empty() || table.row_count() == 0) {
        throw InputError("The uploaded table is empty", table.column_names());
    }

    const auto selection = detection::ColumnIdentifier::identify(table);
    if (!selection) {
        throw InputError("Could not identify time and flux columns", table.column_names());
    }

    detection::LightCurve curve = detection::ColumnIdentifier::extract(table, *selection);
    if (curve.empty()) {
        throw InputError("Columns '" + selection->time_column + "' and '" + selection->flux_column +
                             "' hold no numeric rows",
                         table.column_names());
    }

    AnalysisReport report;
    report.time_column      = selection->time_column;
    report.flux_column      = selection->flux_column;
    report.outliers_removed = curve.remove_outliers(m_config.search.outlier_sigma);
    report.samples_used     = curve.size();

    TSC_INFO("Analyzing {} samples over {:.2f} d ({} outliers removed)",
             curve.size(), curve.span(), report.outliers_removed);

    // Host identity
    const auto targetId = normalizeTargetId(externalId ? std::move(externalId) : table.target_id);
    report.host_name = hostName(targetId);
    if (targetId && m_hosts) {
        report.host_info = m_hosts->lookup(*targetId);
        if (!report.host_info) {
            TSC_WARN("No host metadata for '{}'", *targetId);
        }
    }

    // Detection
    const detection::SignalExtractor extractor(m_config.search);
    detection::Extraction extraction = extractor.extract(curve);
    report.total_detected = extraction.signals.size();

    if (extraction.signals.empty()) {
        report.message = "No periodic transit signals detected in " +
                         std::to_string(report.samples_used) + " samples";
        TSC_INFO("{}", report.message);
        return report;
    }

    const astro::DateTime now = astro::TimeSystem::now_utc();
    const std::string stamp = astro::TimeSystem::compact_stamp(now);
    const std::string discoveredAt = astro::TimeSystem::to_iso8601(now);
    const DedupGate gate(m_store, m_config.discovery.duplicate_period_tolerance);

    for (std::size_t i = 0; i < extraction.signals.size(); ++i) {
        SignalReport sr;
        sr.detection = std::move(extraction.signals[i]);
        sr.features  = analysis::FeatureSynthesizer::synthesize(sr.detection, curve);
        sr.classification = classification::ConfidenceOverride::apply(
            m_classifier.classify(sr.features), sr.detection.snr);
        sr.name        = signalName(targetId, stamp, i);
        sr.planet_type = analysis::FeatureSynthesizer::planet_type(
            sr.features.planetary_radius_earth, sr.features.orbital_period_days);
        sr.plot_points = plot::PhaseFold::build(curve, sr.detection.period_days);
        sr.eligible    = isEligible(sr.classification);

        TSC_INFO("{}: P = {:.4f} d, depth = {:.0f} ppm, SNR = {:.2f} -> {} ({:.2f}, {})",
                 sr.name, sr.features.orbital_period_days, sr.features.transit_depth_ppm,
                 sr.features.snr, classification::label_name(sr.classification.label),
                 sr.classification.probability,
                 classification::verdict_source_name(sr.classification.source));

        if (sr.eligible) {
            try {
                if (gate.isDuplicate(sr.name, report.host_name, sr.features.orbital_period_days)) {
                    sr.duplicate = true;
                    TSC_INFO("{} duplicates a stored discovery, not stored", sr.name);
                } else {
                    m_store.insert(storage::DiscoveredObject{
                        .name          = sr.name,
                        .host          = report.host_name,
                        .period_days   = sr.features.orbital_period_days,
                        .radius_earth  = sr.features.planetary_radius_earth,
                        .depth_ppm     = sr.features.transit_depth_ppm,
                        .label         = sr.classification.label,
                        .probability   = sr.classification.probability,
                        .discovered_at = discoveredAt,
                        .dataset       = m_config.classifier.dataset_tag,
                    });
                    sr.stored = true;
                    ++report.stored_count;
                }
            } catch (const StorageError& e) {
                sr.storage_error = e.what();
                TSC_WARN("Failed to store {}: {}", sr.name, e.what());
            }
        }

        report.signals.push_back(std::move(sr));
    }

    report.message = "Detected " + std::to_string(report.total_detected) + " transit signal" +
                     (report.total_detected == 1 ? "" : "s") + ", stored " +
                     std::to_string(report.stored_count);
    TSC_INFO("{}", report.message);
    return report;
}

// -----------------------------------------------------------------------
// isEligible
// -----------------------------------------------------------------------
bool DiscoveryEngine::isEligible(const classification::ClassificationResult& result) const {
    return result.label != classification::Label::FalsePositive &&
           result.probability > m_config.discovery.storage_probability_threshold;
}

// -----------------------------------------------------------------------
// Naming
// -----------------------------------------------------------------------
std::string DiscoveryEngine::signalName(const std::optional<std::string>& targetId,
                                        const std::string& stamp, std::size_t index) {
    if (!targetId) {
        return "Planet-" + stamp + "-" + std::to_string(index + 1);
    }

    const std::string prefix = catalog::HostCatalog::parseTicId(*targetId) ? "TIC-" + *targetId : *targetId;
    if (index < 25) {
        return prefix + " " + static_cast<char>('b' + index);
    }
    return prefix + " " + std::to_string(index + 1);
}

std::string DiscoveryEngine::hostName(const std::optional<std::string>& targetId) {
    if (!targetId) return std::string(kUnknownHost);
    if (catalog::HostCatalog::parseTicId(*targetId)) return "TIC " + *targetId;
    return *targetId;
}

std::optional<std::string> DiscoveryEngine::normalizeTargetId(std::optional<std::string> id) {
    if (!id) return std::nullopt;
    const std::string_view trimmed = core::text::trim(*id);
    if (trimmed.empty()) return std::nullopt;
    if (auto tic = catalog::HostCatalog::parseTicId(trimmed)) return std::to_string(*tic);
    return std::string(trimmed);
}

} // namespace transitscan::discovery
