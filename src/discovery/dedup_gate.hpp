#pragma once
// discovery/dedup_gate.hpp - Duplicate check before a discovery is persisted
//
// A proposal is a duplicate when its name already exists, or when its host is
// known and a stored record of that host has a period within the relative
// tolerance. Host-less ("Unknown") proposals are only checked by name.

#include "storage/discovery_store.hpp"
#include <optional>
#include <string_view>

namespace transitscan::discovery {

inline constexpr std::string_view kUnknownHost = "Unknown";

class DedupGate {
public:
    explicit DedupGate(const storage::DiscoveryStore& store, double periodTolerance = 0.01)
        : m_store(store), m_periodTolerance(periodTolerance) {}

    /// True if the proposal duplicates a stored record.
    bool isDuplicate(std::string_view name, std::string_view host,
                     std::optional<double> periodDays) const;

    double periodTolerance() const { return m_periodTolerance; }

private:
    const storage::DiscoveryStore& m_store;
    double m_periodTolerance;
};

} // namespace transitscan::discovery
