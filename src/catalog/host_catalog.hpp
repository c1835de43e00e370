#pragma once
// catalog/host_catalog.hpp - In-memory host-star catalog
//
// Holds HostMetadata loaded from a local CSV and answers HostLookup queries by
// TIC number ("50365310", "TIC 50365310", "TIC-50365310") or by star name.

#include "catalog/host_lookup.hpp"
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace transitscan::catalog {

// -----------------------------------------------------------------------
// HostCatalog
// -----------------------------------------------------------------------
class HostCatalog final : public HostLookup {
public:
    HostCatalog() = default;
    explicit HostCatalog(std::vector<HostMetadata> hosts);

    /// Add a host; a later entry with the same TIC replaces the earlier one.
    void addHost(HostMetadata host);

    /// Retrieve a host by TIC number (nullptr if not found).
    const HostMetadata* findById(uint64_t tic) const;

    /// Retrieve a host by name (case-insensitive, first match).
    const HostMetadata* findByName(std::string_view name) const;

    std::optional<HostMetadata> lookup(std::string_view identifier) const override;

    std::size_t size() const { return m_hosts.size(); }

    /// Parse "TIC 123", "tic-123", "TIC123" or "123" into a TIC number.
    static std::optional<uint64_t> parseTicId(std::string_view identifier);

private:
    std::vector<HostMetadata> m_hosts;
    std::unordered_map<uint64_t, std::size_t> m_byId;
};

} // namespace transitscan::catalog
