#pragma once

#include "core/duplicate_group.hpp"
#include "core/grouping_modes.hpp"
#include "core/library_preferences.hpp"
#include "core/processing_result.hpp"
#include "core/scan_job.hpp"
#include <functional>
#include <string>

class CancellationToken;
class DatabaseManager;
class MediaCatalog;
class PocoConfigManager;

/**
 * @brief Runs detection, ranking and merge over catalog collections and persists the result.
 *
 * Error Handling Policy:
 * - Unresolvable items and stat failures are logged and skipped inside the pipeline.
 * - A collection whose catalog access throws is reported as FAILED and the scan moves on.
 * - A cancelled collection hands nothing to persistence.
 * - Only one scan runs per process at a time (ScanLock).
 */
class DuplicateScanOrchestrator
{
public:
    struct Options
    {
        int worker_count = 2; // 1..8
        GroupingMode grouping_mode = GroupingMode::EDGE;
        bool dry_run = false;
    };

    /**
     * @brief Called after each collection with overall percent and a status line
     */
    using ProgressCallback = std::function<void(int, const std::string &)>;

    DuplicateScanOrchestrator(const MediaCatalog &catalog, DatabaseManager &store, const Options &options);

    /**
     * @brief Options taken from scan_threads, grouping_mode and dry_run_mode
     */
    static Options optionsFromConfig(const PocoConfigManager &config);

    /**
     * @brief Detect, rank and merge the duplicates of one collection without persisting
     *
     * Ranking and merge run in parallel across groups. Cancellation is checked
     * between groups; a cancelled scan returns no groups.
     */
    CollectionScanResult scanCollection(const std::string &collection_id, const LibraryPreferences &preferences,
                                        const CancellationToken &token) const;

    /**
     * @brief Scan one collection, or every catalog collection when collection_id is empty
     *
     * Completed collections are persisted unless running dry. The returned
     * job is Skipped when another scan holds the lock or scanning is disabled.
     */
    ScanJob runScan(const PocoConfigManager &config, const CancellationToken &token,
                    const std::string &collection_id = "", ProgressCallback progress = nullptr) const;

    const Options &getOptions() const { return options_; }

private:
    /**
     * @return false when fewer than two members could be resolved
     */
    bool processGroup(DuplicateGroup &group, const LibraryPreferences &preferences) const;

    const MediaCatalog &catalog_;
    DatabaseManager &store_;
    Options options_;
};
