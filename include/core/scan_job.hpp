#pragma once

#include "core/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

/**
 * @brief Summary of one scan run across one or more collections
 */
struct ScanJob
{
    std::string job_id;
    std::string library_id; // empty when every collection was scanned
    std::string status = "Pending"; // Pending, Running, Completed, Cancelled, Failed, Skipped
    int progress_percentage = 0;
    std::string status_message;
    Timestamp start_time{};
    std::optional<Timestamp> end_time;
    int duplicates_found = 0;
    int items_processed = 0;
    int collections_failed = 0;
};

void to_json(nlohmann::json &j, const ScanJob &job);
