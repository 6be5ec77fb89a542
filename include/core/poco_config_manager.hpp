#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/grouping_modes.hpp"
#include "core/library_preferences.hpp"

/**
 * @brief JSON configuration file for the scanner
 *
 * Instances are created by the caller and passed down explicitly; nothing in
 * the detection pipeline reads configuration on its own.
 */
class PocoConfigManager
{
public:
    static constexpr int DEFAULT_SCAN_THREADS = 2;
    static constexpr int MIN_SCAN_THREADS = 1;
    static constexpr int MAX_SCAN_THREADS = 8;
    static constexpr int DEFAULT_AUDIT_RETENTION_DAYS = 30;
    static constexpr int MAX_SIMILARITY_THRESHOLD = 140;

    PocoConfigManager();
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    bool hasKey(const std::string &key) const;

    // Scanner settings
    bool isEnabled() const;
    int getScanThreads() const; // clamped to 1..8
    std::string getLogLevel() const;
    int getAuditRetentionDays() const;
    bool isDryRunMode() const;
    GroupingMode getGroupingMode() const;
    std::string getDatabasePath() const;

    /**
     * @brief Preferences of one collection
     *
     * Reads library_preferences.<collection_id>. Fields missing from the
     * stored object, or a missing object, keep the LibraryPreferences defaults.
     */
    LibraryPreferences getLibraryPreferences(const std::string &collection_id) const;

    /**
     * @brief Check value ranges
     * @return One message per problem, empty when the configuration is usable
     */
    std::vector<std::string> validate() const;

    void initializeDefaultConfig();

private:
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
