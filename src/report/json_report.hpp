#pragma once

/// @file json_report.hpp
/// @brief JSON rendering of analysis reports and stored records.

#include "discovery/discovery_engine.hpp"
#include "storage/discovery_store.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace transitscan::report
{
    /// @brief Request-level JSON:
    /// {planets:[...], totalDetected, storedCount, hostStar, hostStarInfo, message}.
    [[nodiscard]] nlohmann::json to_json(const discovery::AnalysisReport& report);

    /// @brief One planet entry: features, classification, plotData:[{x,y}],
    /// stored, planetName, planetType.
    [[nodiscard]] nlohmann::json to_json(const discovery::SignalReport& signal);

    [[nodiscard]] nlohmann::json to_json(const catalog::HostMetadata& host);

    [[nodiscard]] nlohmann::json to_json(const std::vector<storage::DiscoveredObject>& records);

} // namespace transitscan::report
