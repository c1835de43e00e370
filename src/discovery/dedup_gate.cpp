// discovery/dedup_gate.cpp
#include "discovery/dedup_gate.hpp"
#include "core/logger.hpp"

namespace transitscan::discovery {

bool DedupGate::isDuplicate(std::string_view name, std::string_view host,
                            std::optional<double> periodDays) const {
    if (m_store.exists(name)) {
        TSC_DEBUG("DedupGate: '{}' already stored", name);
        return true;
    }
    if (host.empty() || host == kUnknownHost || !periodDays) return false;

    if (m_store.exists(host, *periodDays, m_periodTolerance)) {
        TSC_DEBUG("DedupGate: {} already has a record near P = {:.4f} d", host, *periodDays);
        return true;
    }
    return false;
}

} // namespace transitscan::discovery
