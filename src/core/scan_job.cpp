#include "core/scan_job.hpp"

using json = nlohmann::json;

void to_json(json &j, const ScanJob &job)
{
    j = json{
        {"job_id", job.job_id},
        {"library_id", job.library_id},
        {"status", job.status},
        {"progress_percentage", job.progress_percentage},
        {"status_message", job.status_message},
        {"start_time", TimeUtils::toIso8601(job.start_time)},
        {"end_time", job.end_time ? json(TimeUtils::toIso8601(*job.end_time)) : json(nullptr)},
        {"duplicates_found", job.duplicates_found},
        {"items_processed", job.items_processed},
        {"collections_failed", job.collections_failed}};
}
