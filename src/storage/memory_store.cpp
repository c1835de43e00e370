/// @file memory_store.cpp
/// @brief MemoryDiscoveryStore implementation.

#include "storage/memory_store.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

namespace transitscan::storage
{

DiscoveredObject MemoryDiscoveryStore::insert(const DiscoveredObject& record)
{
    std::lock_guard lock(m_mutex);

    if (record.name.empty())
    {
        throw StorageError("Record name must not be empty");
    }
    if (!m_names.insert(record.name).second)
    {
        throw StorageError("Record '" + record.name + "' already exists");
    }
    m_records.push_back(record);
    TSC_CORE_DEBUG("MemoryDiscoveryStore: Inserted '{}' ({} records)", record.name, m_records.size());
    return record;
}

std::vector<DiscoveredObject> MemoryDiscoveryStore::query(const RecordFilter& filter) const
{
    std::lock_guard lock(m_mutex);

    std::vector<DiscoveredObject> result;
    for (auto it = m_records.rbegin(); it != m_records.rend(); ++it)
    {
        if (filter.host && it->host != *filter.host)
        {
            continue;
        }
        if (filter.label && it->label != *filter.label)
        {
            continue;
        }
        result.push_back(*it);
        if (filter.limit != 0 && result.size() >= filter.limit)
        {
            break;
        }
    }
    return result;
}

bool MemoryDiscoveryStore::exists(std::string_view name) const
{
    std::lock_guard lock(m_mutex);
    return m_names.contains(std::string(name));
}

bool MemoryDiscoveryStore::exists(std::string_view host, f64 period_days, f64 rel_tol) const
{
    std::lock_guard lock(m_mutex);
    for (const auto& r : m_records)
    {
        if (r.host == host && periods_match(period_days, r.period_days, rel_tol))
        {
            return true;
        }
    }
    return false;
}

std::size_t MemoryDiscoveryStore::size() const
{
    std::lock_guard lock(m_mutex);
    return m_records.size();
}

} // namespace transitscan::storage
