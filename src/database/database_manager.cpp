#include "database/database_manager.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

using json = nlohmann::json;

namespace
{
    std::string columnText(sqlite3_stmt *stmt, int column)
    {
        if (sqlite3_column_type(stmt, column) == SQLITE_NULL)
            return "";
        return reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
    }

    // Finalizes a prepared statement when leaving scope
    class Statement
    {
    public:
        Statement(sqlite3 *db, const std::string &sql) : stmt_(nullptr)
        {
            rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
        }
        ~Statement() { sqlite3_finalize(stmt_); }

        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;

        bool ok() const { return rc_ == SQLITE_OK; }
        sqlite3_stmt *get() const { return stmt_; }

        void bind(int index, const std::string &value)
        {
            sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
        }

    private:
        sqlite3_stmt *stmt_;
        int rc_;
    };
}

DatabaseManager::DatabaseManager(const std::string &db_path)
    : db_(nullptr), db_path_(db_path), schema_ready_(false)
{
    Logger::info("DatabaseManager constructor called for: " + db_path);

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to open database: " + std::string(sqlite3_errmsg(db_)));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    Logger::info("Database opened successfully: " + db_path);

    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK)
        Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(db_)));
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 30000);

    initialize();
}

DatabaseManager::~DatabaseManager()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
        Logger::debug("Database closed: " + db_path_);
    }
}

bool DatabaseManager::isValid() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr && schema_ready_;
}

void DatabaseManager::initialize()
{
    Logger::info("Initializing database tables");
    bool groups_ok = createDuplicateGroupsTable();
    if (!groups_ok)
        Logger::error("Failed to create duplicate_groups table");
    bool audit_ok = createDeletionAuditTable();
    if (!audit_ok)
        Logger::error("Failed to create deletion_audit table");
    schema_ready_ = groups_ok && audit_ok;
    Logger::info("Database tables initialization completed");
}

bool DatabaseManager::createDuplicateGroupsTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS duplicate_groups (
            collection_id TEXT PRIMARY KEY,
            groups_json TEXT NOT NULL,
            group_count INTEGER NOT NULL DEFAULT 0,
            updated_at TEXT NOT NULL
        )
    )";
    return executeStatement(sql).success;
}

bool DatabaseManager::createDeletionAuditTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS deletion_audit (
            record_id TEXT PRIMARY KEY,
            month_key TEXT NOT NULL,
            timestamp TEXT NOT NULL,
            record_json TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_deletion_audit_month ON deletion_audit(month_key, timestamp);
        CREATE INDEX IF NOT EXISTS idx_deletion_audit_timestamp ON deletion_audit(timestamp);
    )";
    return executeStatement(sql).success;
}

DBOpResult DatabaseManager::executeStatement(const std::string &sql)
{
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        std::string error_msg = "SQL execution failed: " + std::string(err_msg ? err_msg : sqlite3_errmsg(db_));
        Logger::error(error_msg);
        sqlite3_free(err_msg);
        return DBOpResult(false, error_msg);
    }
    return DBOpResult(true);
}

DBOpResult DatabaseManager::saveDuplicateGroups(const std::string &collection_id,
                                                const std::vector<DuplicateGroup> &groups)
{
    json document = json::array();
    for (const auto &group : groups)
    {
        if (!group.isValid())
        {
            Logger::warn("Not storing invalid group " + group.group_id + " with " +
                         std::to_string(group.versions.size()) + " versions");
            continue;
        }
        document.push_back(json(group));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    DBOpResult result = writeGroupDocument(collection_id, document);
    if (result.success)
        Logger::info("Stored " + std::to_string(document.size()) + " duplicate groups for collection " +
                     collection_id);
    return result;
}

std::vector<DuplicateGroup> DatabaseManager::loadDuplicateGroups(const std::string &collection_id)
{
    std::vector<DuplicateGroup> groups;

    std::lock_guard<std::mutex> lock(mutex_);
    auto document = readGroupDocument(collection_id);
    if (!document)
        return groups;

    try
    {
        groups = json::parse(*document).get<std::vector<DuplicateGroup>>();
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to parse stored groups of collection " + collection_id + ": " + e.what());
        groups.clear();
    }
    return groups;
}

std::vector<std::string> DatabaseManager::getCollectionsWithGroups()
{
    std::vector<std::string> collections;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return collections;

    Statement stmt(db_, "SELECT collection_id FROM duplicate_groups ORDER BY collection_id");
    if (!stmt.ok())
    {
        Logger::error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_)));
        return collections;
    }

    while (sqlite3_step(stmt.get()) == SQLITE_ROW)
        collections.push_back(columnText(stmt.get(), 0));
    return collections;
}

DBOpResult DatabaseManager::updateGroupReview(const std::string &collection_id, const std::string &group_id,
                                              const std::string &status, Timestamp reviewed_at)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return modifyStoredGroup(collection_id, group_id,
                             [&status, &reviewed_at](DuplicateGroup &group)
                             {
                                 group.status = status;
                                 group.last_reviewed_timestamp = reviewed_at;
                                 return DBOpResult(true);
                             });
}

DBOpResult DatabaseManager::setPrimaryVersion(const std::string &collection_id, const std::string &group_id,
                                              const std::string &item_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return modifyStoredGroup(collection_id, group_id,
                             [&item_id](DuplicateGroup &group)
                             {
                                 if (!group.setPrimaryVersion(item_id))
                                     return DBOpResult(false, "Item " + item_id + " is not a version of group " +
                                                                  group.group_id);
                                 return DBOpResult(true);
                             });
}

DBOpResult DatabaseManager::logDeletion(const DeletionAuditRecord &record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    Statement stmt(db_, "INSERT INTO deletion_audit (record_id, month_key, timestamp, record_json) VALUES (?, ?, ?, ?)");
    if (!stmt.ok())
    {
        std::string msg = "Failed to prepare insert statement: " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        return DBOpResult(false, msg);
    }

    stmt.bind(1, record.record_id);
    stmt.bind(2, TimeUtils::monthKey(record.timestamp));
    stmt.bind(3, TimeUtils::toIso8601(record.timestamp));
    stmt.bind(4, json(record).dump());

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        std::string msg = "Failed to insert audit record " + record.record_id + ": " + sqlite3_errmsg(db_);
        Logger::error(msg);
        return DBOpResult(false, msg);
    }

    Logger::debug("Logged deletion of item " + record.item_id + " (group " + record.group_id + ")");
    return DBOpResult(true);
}

std::vector<DeletionAuditRecord> DatabaseManager::getAuditRecords(const std::optional<Timestamp> &start,
                                                                  const std::optional<Timestamp> &end)
{
    std::vector<DeletionAuditRecord> records;

    std::string sql = "SELECT record_id, record_json FROM deletion_audit WHERE 1=1";
    if (start)
        sql += " AND timestamp >= ?";
    if (end)
        sql += " AND timestamp <= ?";
    sql += " ORDER BY timestamp DESC, rowid DESC";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return records;

    Statement stmt(db_, sql);
    if (!stmt.ok())
    {
        Logger::error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_)));
        return records;
    }

    int index = 1;
    if (start)
        stmt.bind(index++, TimeUtils::toIso8601(*start));
    if (end)
        stmt.bind(index++, TimeUtils::toIso8601(*end));

    while (sqlite3_step(stmt.get()) == SQLITE_ROW)
    {
        std::string record_id = columnText(stmt.get(), 0);
        try
        {
            records.push_back(json::parse(columnText(stmt.get(), 1)).get<DeletionAuditRecord>());
        }
        catch (const std::exception &e)
        {
            Logger::warn("Skipping unreadable audit record " + record_id + ": " + e.what());
        }
    }
    return records;
}

DBOpResult DatabaseManager::exportAuditMonth(const std::string &month, const std::string &output_path)
{
    std::vector<std::string> lines;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_)
            return DBOpResult(false, "Database not initialized");

        Statement stmt(db_, "SELECT record_json FROM deletion_audit WHERE month_key = ? ORDER BY timestamp ASC, rowid ASC");
        if (!stmt.ok())
        {
            std::string msg = "Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_));
            Logger::error(msg);
            return DBOpResult(false, msg);
        }
        stmt.bind(1, month);

        while (sqlite3_step(stmt.get()) == SQLITE_ROW)
            lines.push_back(columnText(stmt.get(), 0));
    }

    std::ofstream out(output_path, std::ios::trunc);
    if (!out.is_open())
    {
        std::string msg = "Cannot open audit export file: " + output_path;
        Logger::error(msg);
        return DBOpResult(false, msg);
    }

    for (const auto &line : lines)
        out << line << '\n';
    out.flush();
    if (!out)
    {
        std::string msg = "Failed writing audit export file: " + output_path;
        Logger::error(msg);
        return DBOpResult(false, msg);
    }

    Logger::info("Exported " + std::to_string(lines.size()) + " audit records for " + month + " to " + output_path);
    return DBOpResult(true);
}

std::pair<DBOpResult, size_t> DatabaseManager::purgeAuditRecordsOlderThan(int days)
{
    if (days < 0)
        return {DBOpResult(false, "Retention days must not be negative"), 0};

    Timestamp cutoff = TimeUtils::now() - std::chrono::hours(24) * days;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return {DBOpResult(false, "Database not initialized"), 0};

    Statement stmt(db_, "DELETE FROM deletion_audit WHERE timestamp < ?");
    if (!stmt.ok())
    {
        std::string msg = "Failed to prepare delete statement: " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        return {DBOpResult(false, msg), 0};
    }
    stmt.bind(1, TimeUtils::toIso8601(cutoff));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        std::string msg = "Failed to purge audit records: " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        return {DBOpResult(false, msg), 0};
    }

    size_t removed = static_cast<size_t>(sqlite3_changes(db_));
    Logger::info("Purged " + std::to_string(removed) + " audit records older than " + std::to_string(days) + " days");
    return {DBOpResult(true), removed};
}

std::optional<std::string> DatabaseManager::readGroupDocument(const std::string &collection_id)
{
    if (!db_)
        return std::nullopt;

    Statement stmt(db_, "SELECT groups_json FROM duplicate_groups WHERE collection_id = ?");
    if (!stmt.ok())
    {
        Logger::error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_)));
        return std::nullopt;
    }
    stmt.bind(1, collection_id);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW)
        return std::nullopt;
    return columnText(stmt.get(), 0);
}

DBOpResult DatabaseManager::writeGroupDocument(const std::string &collection_id, const nlohmann::json &document)
{
    if (!db_)
        return DBOpResult(false, "Database not initialized");

    Statement stmt(db_, R"(
        INSERT OR REPLACE INTO duplicate_groups (collection_id, groups_json, group_count, updated_at)
        VALUES (?, ?, ?, ?)
    )");
    if (!stmt.ok())
    {
        std::string msg = "Failed to prepare insert statement: " + std::string(sqlite3_errmsg(db_));
        Logger::error(msg);
        return DBOpResult(false, msg);
    }

    stmt.bind(1, collection_id);
    stmt.bind(2, document.dump());
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(document.size()));
    stmt.bind(4, TimeUtils::toIso8601(TimeUtils::now()));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        std::string msg = "Failed to store groups of collection " + collection_id + ": " + sqlite3_errmsg(db_);
        Logger::error(msg);
        return DBOpResult(false, msg);
    }
    return DBOpResult(true);
}

DBOpResult DatabaseManager::modifyStoredGroup(const std::string &collection_id, const std::string &group_id,
                                              const std::function<DBOpResult(DuplicateGroup &)> &change)
{
    auto document = readGroupDocument(collection_id);
    if (!document)
        return DBOpResult(false, "No stored groups for collection " + collection_id);

    std::vector<DuplicateGroup> groups;
    try
    {
        groups = json::parse(*document).get<std::vector<DuplicateGroup>>();
    }
    catch (const std::exception &e)
    {
        std::string msg = "Failed to parse stored groups of collection " + collection_id + ": " + e.what();
        Logger::error(msg);
        return DBOpResult(false, msg);
    }

    auto it = std::find_if(groups.begin(), groups.end(),
                           [&group_id](const DuplicateGroup &group)
                           { return group.group_id == group_id; });
    if (it == groups.end())
        return DBOpResult(false, "Group " + group_id + " not found in collection " + collection_id);

    DBOpResult changed = change(*it);
    if (!changed.success)
    {
        Logger::warn(changed.error_message);
        return changed;
    }

    return writeGroupDocument(collection_id, json(groups));
}
