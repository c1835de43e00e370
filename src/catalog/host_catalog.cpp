// catalog/host_catalog.cpp
#include "catalog/host_catalog.hpp"
#include "core/logger.hpp"
#include "core/text.hpp"
#include <cctype>
#include <charconv>
#include <utility>

namespace transitscan::catalog {

HostCatalog::HostCatalog(std::vector<HostMetadata> hosts) {
    for (auto& h : hosts) addHost(std::move(h));
}

// -----------------------------------------------------------------------
// addHost
// -----------------------------------------------------------------------
void HostCatalog::addHost(HostMetadata host) {
    auto it = m_byId.find(host.identifier);
    if (it != m_byId.end()) {
        m_hosts[it->second] = std::move(host);
        return;
    }
    m_byId.emplace(host.identifier, m_hosts.size());
    m_hosts.push_back(std::move(host));
}

// -----------------------------------------------------------------------
// findById
// -----------------------------------------------------------------------
const HostMetadata* HostCatalog::findById(uint64_t tic) const {
    auto it = m_byId.find(tic);
    return it == m_byId.end() ? nullptr : &m_hosts[it->second];
}

// -----------------------------------------------------------------------
// findByName
// -----------------------------------------------------------------------
const HostMetadata* HostCatalog::findByName(std::string_view name) const {
    for (const auto& h : m_hosts) {
        if (!h.name.empty() && core::text::iequals(h.name, name)) return &h;
    }
    return nullptr;
}

// -----------------------------------------------------------------------
// lookup
// -----------------------------------------------------------------------
std::optional<HostMetadata> HostCatalog::lookup(std::string_view identifier) const {
    identifier = core::text::trim(identifier);

    const HostMetadata* found = nullptr;
    if (auto tic = parseTicId(identifier)) found = findById(*tic);
    if (!found) found = findByName(identifier);

    if (!found) {
        TSC_CORE_WARN("HostCatalog: No metadata for '{}'", identifier);
        return std::nullopt;
    }
    return *found;
}

// -----------------------------------------------------------------------
// parseTicId
// -----------------------------------------------------------------------
std::optional<uint64_t> HostCatalog::parseTicId(std::string_view identifier) {
    identifier = core::text::trim(identifier);
    if (identifier.size() >= 3 && core::text::iequals(identifier.substr(0, 3), "tic")) {
        identifier.remove_prefix(3);
        while (!identifier.empty() &&
               (identifier.front() == ' ' || identifier.front() == '-' || identifier.front() == '_')) {
            identifier.remove_prefix(1);
        }
    }
    if (identifier.empty()) return std::nullopt;

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(identifier.data(), identifier.data() + identifier.size(), value);
    if (ec != std::errc{} || ptr != identifier.data() + identifier.size()) return std::nullopt;
    return value;
}

} // namespace transitscan::catalog
