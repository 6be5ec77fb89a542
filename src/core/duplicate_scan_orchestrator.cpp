#include "core/duplicate_scan_orchestrator.hpp"
#include "core/cancellation_token.hpp"
#include "core/duplicate_grouper.hpp"
#include "core/id_generator.hpp"
#include "core/media_catalog.hpp"
#include "core/metadata_merger.hpp"
#include "core/poco_config_manager.hpp"
#include "core/quality_scorer.hpp"
#include "core/scan_lock.hpp"
#include "database/database_manager.hpp"
#include "logging/logger.hpp"
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <algorithm>
#include <exception>
#include <vector>

DuplicateScanOrchestrator::DuplicateScanOrchestrator(const MediaCatalog &catalog, DatabaseManager &store,
                                                     const Options &options)
    : catalog_(catalog), store_(store), options_(options)
{
    options_.worker_count = std::max(PocoConfigManager::MIN_SCAN_THREADS,
                                     std::min(PocoConfigManager::MAX_SCAN_THREADS, options_.worker_count));
}

DuplicateScanOrchestrator::Options DuplicateScanOrchestrator::optionsFromConfig(const PocoConfigManager &config)
{
    Options options;
    options.worker_count = config.getScanThreads();
    options.grouping_mode = config.getGroupingMode();
    options.dry_run = config.isDryRunMode();
    return options;
}

CollectionScanResult DuplicateScanOrchestrator::scanCollection(const std::string &collection_id,
                                                               const LibraryPreferences &preferences,
                                                               const CancellationToken &token) const
{
    CollectionScanResult result(ScanOutcome::FAILED, collection_id);

    try
    {
        if (token.isCancellationRequested())
            return CollectionScanResult(ScanOutcome::CANCELLED, collection_id, token.getReason());

        auto items = catalog_.listItems(collection_id);
        result.items_scanned = items.size();
        Logger::info("Scanning collection " + collection_id + ": " + std::to_string(items.size()) + " items");

        DuplicateGrouper grouper(options_.grouping_mode);
        auto groups = grouper.findDuplicateGroups(collection_id, items, preferences.similarity_threshold, &token);
        if (token.isCancellationRequested())
        {
            Logger::info("Scan of collection " + collection_id + " cancelled during detection, discarding " +
                         std::to_string(groups.size()) + " groups");
            result.outcome = ScanOutcome::CANCELLED;
            result.error_message = token.getReason();
            return result;
        }

        std::vector<char> keep(groups.size(), 0);
        {
            tbb::global_control control(tbb::global_control::max_allowed_parallelism,
                                        static_cast<size_t>(options_.worker_count));
            tbb::parallel_for(tbb::blocked_range<size_t>(0, groups.size()),
                              [&](const tbb::blocked_range<size_t> &range)
                              {
                                  for (size_t i = range.begin(); i != range.end(); ++i)
                                  {
                                      if (token.isCancellationRequested())
                                          return;
                                      keep[i] = processGroup(groups[i], preferences) ? 1 : 0;
                                  }
                              });
        }

        if (token.isCancellationRequested())
        {
            Logger::info("Scan of collection " + collection_id + " cancelled, discarding partial results");
            result.outcome = ScanOutcome::CANCELLED;
            result.error_message = token.getReason();
            return result;
        }

        for (size_t i = 0; i < groups.size(); ++i)
        {
            if (!keep[i])
                continue;
            if (!groups[i].isValid())
            {
                Logger::warn("Dropping invalid group " + groups[i].group_id + " in collection " + collection_id);
                continue;
            }
            result.groups.push_back(std::move(groups[i]));
        }

        result.outcome = ScanOutcome::COMPLETED;
        Logger::info("Collection " + collection_id + " scanned: " + std::to_string(result.groups.size()) +
                     " duplicate groups from " + std::to_string(result.items_scanned) + " items");
    }
    catch (const std::exception &e)
    {
        result.outcome = ScanOutcome::FAILED;
        result.groups.clear();
        result.error_message = e.what();
        Logger::error("Scan of collection " + collection_id + " failed: " + result.error_message);
    }

    return result;
}

bool DuplicateScanOrchestrator::processGroup(DuplicateGroup &group, const LibraryPreferences &preferences) const
{
    QualityScorer::analyzeGroup(group, preferences, catalog_);

    MergeResult merge = MetadataMerger::merge(group, catalog_);
    if (merge.resolved < 2)
    {
        Logger::warn("Dropping group " + group.group_id + ": only " + std::to_string(merge.resolved) +
                     " of " + std::to_string(group.versions.size()) + " members resolved");
        return false;
    }
    return true;
}

ScanJob DuplicateScanOrchestrator::runScan(const PocoConfigManager &config, const CancellationToken &token,
                                           const std::string &collection_id, ProgressCallback progress) const
{
    ScanJob job;
    job.job_id = IdGenerator::newUuid();
    job.library_id = collection_id;
    job.start_time = TimeUtils::now();

    auto finish = [&job](const std::string &status, const std::string &message)
    {
        job.status = status;
        job.status_message = message;
        job.end_time = TimeUtils::now();
        return job;
    };

    Logger::info("Starting duplicate scan job " + job.job_id);

    auto guard = ScanLock::getInstance().tryAcquire();
    if (!guard)
    {
        Logger::warn("Another scan is already in progress, skipping job " + job.job_id);
        return finish("Skipped", "Another scan is already in progress");
    }

    if (!config.isEnabled())
    {
        Logger::info("Scanning is disabled, skipping job " + job.job_id);
        return finish("Skipped", "Scanning is disabled");
    }

    job.status = "Running";
    bool dry_run = options_.dry_run || config.isDryRunMode();

    std::vector<std::string> collection_ids;
    if (!collection_id.empty())
    {
        collection_ids.push_back(collection_id);
    }
    else
    {
        try
        {
            for (const auto &collection : catalog_.listCollections())
                collection_ids.push_back(collection.id);
        }
        catch (const std::exception &e)
        {
            Logger::error("Failed to list catalog collections: " + std::string(e.what()));
            return finish("Failed", std::string("Failed to list collections: ") + e.what());
        }
    }

    if (collection_ids.empty())
    {
        Logger::info("No collections found");
        job.progress_percentage = 100;
        return finish("Completed", "No collections found");
    }

    bool cancelled = false;
    for (size_t i = 0; i < collection_ids.size(); ++i)
    {
        const auto &id = collection_ids[i];
        if (token.isCancellationRequested())
        {
            cancelled = true;
            break;
        }

        LibraryPreferences preferences = config.getLibraryPreferences(id);
        CollectionScanResult result = scanCollection(id, preferences, token);

        if (result.outcome == ScanOutcome::CANCELLED)
        {
            cancelled = true;
            break;
        }

        if (result.outcome == ScanOutcome::FAILED)
        {
            ++job.collections_failed;
        }
        else
        {
            job.items_processed += static_cast<int>(result.items_scanned);
            job.duplicates_found += static_cast<int>(result.groups.size());

            if (dry_run)
            {
                Logger::info("Dry run: not storing " + std::to_string(result.groups.size()) +
                             " groups for collection " + id);
            }
            else
            {
                DBOpResult stored = store_.saveDuplicateGroups(id, result.groups);
                if (!stored.success)
                {
                    Logger::error("Failed to store groups for collection " + id + ": " + stored.error_message);
                    ++job.collections_failed;
                }
            }
        }

        job.progress_percentage = static_cast<int>((i + 1) * 100 / collection_ids.size());
        if (progress)
            progress(job.progress_percentage, "Scanned collection " + id + " (" + scanOutcomeName(result.outcome) + ")");
    }

    if (cancelled)
    {
        Logger::info("Duplicate scan job " + job.job_id + " cancelled: " + token.getReason());
        return finish("Cancelled", "Cancelled: " + token.getReason());
    }

    std::string summary = std::to_string(job.duplicates_found) + " duplicate groups in " +
                          std::to_string(job.items_processed) + " items";
    if (job.collections_failed == static_cast<int>(collection_ids.size()))
    {
        Logger::error("Duplicate scan job " + job.job_id + " failed for every collection");
        return finish("Failed", "All collections failed");
    }

    if (job.collections_failed > 0)
        summary += ", " + std::to_string(job.collections_failed) + " collections failed";
    if (dry_run)
        summary += " (dry run)";

    Logger::info("Duplicate scan job " + job.job_id + " completed: " + summary);
    return finish("Completed", summary);
}
