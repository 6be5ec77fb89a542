#pragma once

#include "core/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

/**
 * @brief Append-only record of one deletion attempt, written by the deletion workflow
 */
struct DeletionAuditRecord
{
    std::string record_id;
    std::string group_id;
    std::string item_id;
    std::string file_path;
    int quality_score = 0;
    std::string deletion_reason;
    bool user_initiated = false;
    std::optional<std::string> user_id;
    Timestamp timestamp{};
    bool success = false;
    std::optional<std::string> error_message;

    /**
     * @brief New record with a fresh identifier stamped with the current time
     */
    static DeletionAuditRecord create();
};

void to_json(nlohmann::json &j, const DeletionAuditRecord &r);
void from_json(const nlohmann::json &j, DeletionAuditRecord &r);
