/// @file sqlite_store.cpp
/// @brief SqliteDiscoveryStore implementation.

#include "storage/sqlite_store.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <sqlite3.h>

#include <string>

namespace transitscan::storage
{

namespace
{

constexpr const char* kSchema = R"SQL(
    PRAGMA journal_mode=WAL;

    CREATE TABLE IF NOT EXISTS discoveries (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        name TEXT NOT NULL UNIQUE,
        host TEXT NOT NULL,
        period_days REAL NOT NULL,
        radius_earth REAL,
        depth_ppm REAL,
        label TEXT NOT NULL,
        probability REAL NOT NULL,
        discovered_at TEXT,
        dataset TEXT
    );

    CREATE INDEX IF NOT EXISTS idx_discoveries_host ON discoveries(host);
)SQL";

constexpr const char* kSelectColumns =
    "SELECT name, host, period_days, radius_earth, depth_ppm, label, probability, "
    "discovered_at, dataset FROM discoveries";

std::string column_text(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

void bind_text(sqlite3_stmt* stmt, int index, std::string_view value)
{
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

} // anonymous namespace

void SqliteDiscoveryStore::StatementDeleter::operator()(sqlite3_stmt* stmt) const
{
    sqlite3_finalize(stmt);
}

SqliteDiscoveryStore::SqliteDiscoveryStore(const std::filesystem::path& path)
{
    if (sqlite3_open(path.string().c_str(), &m_db) != SQLITE_OK)
    {
        std::string message = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw StorageError("Failed to open SQLite database at " + path.string() + ": " + message);
    }

    try
    {
        initialize_schema();
    }
    catch (const StorageError&)
    {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
    TSC_CORE_INFO("SqliteDiscoveryStore: Opened {}", path.string());
}

SqliteDiscoveryStore::~SqliteDiscoveryStore()
{
    if (m_db)
    {
        sqlite3_close(m_db);
    }
}

void SqliteDiscoveryStore::initialize_schema()
{
    exec(kSchema);
}

void SqliteDiscoveryStore::exec(const char* sql)
{
    char* err = nullptr;
    if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err) != SQLITE_OK)
    {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        throw StorageError(message);
    }
}

SqliteDiscoveryStore::Statement SqliteDiscoveryStore::prepare(const std::string& sql) const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        throw StorageError(sqlite3_errmsg(m_db));
    }
    return Statement(stmt);
}

// -----------------------------------------------------------------
// Insert
// -----------------------------------------------------------------

DiscoveredObject SqliteDiscoveryStore::insert(const DiscoveredObject& record)
{
    std::lock_guard lock(m_mutex);

    if (record.name.empty())
    {
        throw StorageError("Record name must not be empty");
    }

    auto stmt = prepare(
        "INSERT INTO discoveries (name, host, period_days, radius_earth, depth_ppm, label, "
        "probability, discovered_at, dataset) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");

    bind_text(stmt.get(), 1, record.name);
    bind_text(stmt.get(), 2, record.host);
    sqlite3_bind_double(stmt.get(), 3, record.period_days);
    sqlite3_bind_double(stmt.get(), 4, record.radius_earth);
    sqlite3_bind_double(stmt.get(), 5, record.depth_ppm);
    bind_text(stmt.get(), 6, classification::label_name(record.label));
    sqlite3_bind_double(stmt.get(), 7, record.probability);
    bind_text(stmt.get(), 8, record.discovered_at);
    bind_text(stmt.get(), 9, record.dataset);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_CONSTRAINT)
    {
        throw StorageError("Record '" + record.name + "' already exists");
    }
    if (rc != SQLITE_DONE)
    {
        throw StorageError("Insert of '" + record.name + "' failed: " + sqlite3_errmsg(m_db));
    }

    TSC_CORE_DEBUG("SqliteDiscoveryStore: Inserted '{}'", record.name);
    return record;
}

// -----------------------------------------------------------------
// Queries
// -----------------------------------------------------------------

std::vector<DiscoveredObject> SqliteDiscoveryStore::query(const RecordFilter& filter) const
{
    std::lock_guard lock(m_mutex);

    std::string sql = kSelectColumns;
    std::string where;
    if (filter.host)
    {
        where += " host = ?";
    }
    if (filter.label)
    {
        where += where.empty() ? " label = ?" : " AND label = ?";
    }
    if (!where.empty())
    {
        sql += " WHERE" + where;
    }
    sql += " ORDER BY id DESC";
    if (filter.limit != 0)
    {
        sql += " LIMIT " + std::to_string(filter.limit);
    }
    sql += ";";

    auto stmt = prepare(sql);
    int index = 1;
    if (filter.host)
    {
        bind_text(stmt.get(), index++, *filter.host);
    }
    if (filter.label)
    {
        bind_text(stmt.get(), index++, classification::label_name(*filter.label));
    }

    std::vector<DiscoveredObject> records;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
        const std::string label_text = column_text(stmt.get(), 5);
        const auto label = classification::parse_label(label_text);
        if (!label)
        {
            TSC_CORE_WARN("SqliteDiscoveryStore: Skipping row with unknown label '{}'", label_text);
            continue;
        }

        records.push_back(DiscoveredObject{
            .name          = column_text(stmt.get(), 0),
            .host          = column_text(stmt.get(), 1),
            .period_days   = sqlite3_column_double(stmt.get(), 2),
            .radius_earth  = sqlite3_column_double(stmt.get(), 3),
            .depth_ppm     = sqlite3_column_double(stmt.get(), 4),
            .label         = *label,
            .probability   = sqlite3_column_double(stmt.get(), 6),
            .discovered_at = column_text(stmt.get(), 7),
            .dataset       = column_text(stmt.get(), 8),
        });
    }
    if (rc != SQLITE_DONE)
    {
        throw StorageError(std::string("Query failed: ") + sqlite3_errmsg(m_db));
    }
    return records;
}

bool SqliteDiscoveryStore::exists(std::string_view name) const
{
    std::lock_guard lock(m_mutex);

    auto stmt = prepare("SELECT 1 FROM discoveries WHERE name = ? LIMIT 1;");
    bind_text(stmt.get(), 1, name);
    const int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW && rc != SQLITE_DONE)
    {
        throw StorageError(std::string("Name lookup failed: ") + sqlite3_errmsg(m_db));
    }
    return rc == SQLITE_ROW;
}

bool SqliteDiscoveryStore::exists(std::string_view host, f64 period_days, f64 rel_tol) const
{
    std::lock_guard lock(m_mutex);

    auto stmt = prepare("SELECT period_days FROM discoveries WHERE host = ?;");
    bind_text(stmt.get(), 1, host);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
        if (periods_match(period_days, sqlite3_column_double(stmt.get(), 0), rel_tol))
        {
            return true;
        }
    }
    if (rc != SQLITE_DONE)
    {
        throw StorageError(std::string("Period lookup failed: ") + sqlite3_errmsg(m_db));
    }
    return false;
}

} // namespace transitscan::storage
