#pragma once

#include "core/deletion_audit_record.hpp"
#include "core/duplicate_group.hpp"
#include "core/time_utils.hpp"
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <sqlite3.h>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief SQLite store for detection output and the deletion audit trail
 *
 * Each collection's groups are kept as one JSON document (an array of
 * DuplicateGroup objects). Audit records are appended one JSON object per
 * row, keyed by their yyyy_MM month.
 */
class DatabaseManager
{
public:
    /**
     * @brief Open (or create) the database and its tables
     * @param db_path File path, or ":memory:"
     */
    explicit DatabaseManager(const std::string &db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager &) = delete;
    DatabaseManager &operator=(const DatabaseManager &) = delete;

    /**
     * @brief True when the connection is open and the schema exists
     */
    bool isValid() const;

    const std::string &getPath() const { return db_path_; }

    /**
     * @brief Replace the stored groups of a collection
     *
     * Groups that fail DuplicateGroup::isValid() are not stored.
     */
    DBOpResult saveDuplicateGroups(const std::string &collection_id, const std::vector<DuplicateGroup> &groups);

    /**
     * @brief Stored groups of a collection
     * @return Empty when nothing is stored or the document cannot be parsed
     */
    std::vector<DuplicateGroup> loadDuplicateGroups(const std::string &collection_id);

    /**
     * @brief Collections that have a stored group document
     */
    std::vector<std::string> getCollectionsWithGroups();

    /**
     * @brief Set review status and last-reviewed time of one stored group
     */
    DBOpResult updateGroupReview(const std::string &collection_id, const std::string &group_id,
                                 const std::string &status, Timestamp reviewed_at);

    /**
     * @brief Change the primary version of one stored group
     * @return Failure when the group is unknown or item_id is not one of its versions
     */
    DBOpResult setPrimaryVersion(const std::string &collection_id, const std::string &group_id,
                                 const std::string &item_id);

    /**
     * @brief Append one deletion audit record
     */
    DBOpResult logDeletion(const DeletionAuditRecord &record);

    /**
     * @brief Audit records with start <= timestamp <= end, newest first
     *
     * Either bound may be omitted. Rows that cannot be parsed are skipped.
     */
    std::vector<DeletionAuditRecord> getAuditRecords(const std::optional<Timestamp> &start = std::nullopt,
                                                     const std::optional<Timestamp> &end = std::nullopt);

    /**
     * @brief Write one month of the audit trail as JSON Lines, oldest first
     * @param month Month key in yyyy_MM form
     * @param output_path Destination file, overwritten
     */
    DBOpResult exportAuditMonth(const std::string &month, const std::string &output_path);

    /**
     * @brief Remove audit records older than the retention window
     * @return Operation result and number of removed records
     */
    std::pair<DBOpResult, size_t> purgeAuditRecordsOlderThan(int days);

private:
    void initialize();
    bool createDuplicateGroupsTable();
    bool createDeletionAuditTable();
    DBOpResult executeStatement(const std::string &sql);

    // Callers hold mutex_
    std::optional<std::string> readGroupDocument(const std::string &collection_id);
    DBOpResult writeGroupDocument(const std::string &collection_id, const nlohmann::json &document);
    DBOpResult modifyStoredGroup(const std::string &collection_id, const std::string &group_id,
                                 const std::function<DBOpResult(DuplicateGroup &)> &change);

    sqlite3 *db_;
    std::string db_path_;
    bool schema_ready_;
    mutable std::mutex mutex_;
};
