#pragma once

#include "core/duplicate_group.hpp"
#include <cstddef>
#include <string>
#include <vector>

enum class MergeStatus
{
    MERGED,             // every member resolved
    PARTIAL,            // some members skipped, metadata merged from the rest
    NO_RESOLVED_MEMBERS // nothing resolved, merged metadata left untouched
};

/**
 * @brief Outcome of merging one group's metadata
 */
struct MergeResult
{
    MergeStatus status;
    size_t resolved;
    size_t skipped;
    std::string error_message;

    MergeResult() : status(MergeStatus::NO_RESOLVED_MEMBERS), resolved(0), skipped(0) {}
    MergeResult(MergeStatus s, size_t r, size_t k, const std::string &msg = "")
        : status(s), resolved(r), skipped(k), error_message(msg) {}

    bool merged() const { return status != MergeStatus::NO_RESOLVED_MEMBERS; }
};

enum class ScanOutcome
{
    COMPLETED,
    CANCELLED,
    FAILED
};

/**
 * @brief Outcome of scanning one collection
 *
 * groups is only populated for COMPLETED scans; cancelled and failed scans
 * never hand partial results to persistence.
 */
struct CollectionScanResult
{
    ScanOutcome outcome;
    std::string collection_id;
    std::vector<DuplicateGroup> groups;
    size_t items_scanned;
    std::string error_message;

    CollectionScanResult() : outcome(ScanOutcome::FAILED), items_scanned(0) {}
    CollectionScanResult(ScanOutcome o, const std::string &id, const std::string &msg = "")
        : outcome(o), collection_id(id), items_scanned(0), error_message(msg) {}

    bool success() const { return outcome == ScanOutcome::COMPLETED; }
};

inline std::string scanOutcomeName(ScanOutcome outcome)
{
    switch (outcome)
    {
    case ScanOutcome::COMPLETED:
        return "COMPLETED";
    case ScanOutcome::CANCELLED:
        return "CANCELLED";
    case ScanOutcome::FAILED:
        return "FAILED";
    default:
        return "UNKNOWN";
    }
}
