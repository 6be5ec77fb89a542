#include "core/deletion_audit_record.hpp"
#include "core/id_generator.hpp"
#include <stdexcept>

using json = nlohmann::json;

DeletionAuditRecord DeletionAuditRecord::create()
{
    DeletionAuditRecord record;
    record.record_id = IdGenerator::newUuid();
    record.timestamp = TimeUtils::now();
    return record;
}

void to_json(json &j, const DeletionAuditRecord &r)
{
    j = json{
        {"record_id", r.record_id},
        {"group_id", r.group_id},
        {"item_id", r.item_id},
        {"file_path", r.file_path},
        {"quality_score", r.quality_score},
        {"deletion_reason", r.deletion_reason},
        {"user_initiated", r.user_initiated},
        {"user_id", r.user_id ? json(*r.user_id) : json(nullptr)},
        {"timestamp", TimeUtils::toIso8601(r.timestamp)},
        {"success", r.success},
        {"error_message", r.error_message ? json(*r.error_message) : json(nullptr)}};
}

void from_json(const json &j, DeletionAuditRecord &r)
{
    j.at("record_id").get_to(r.record_id);
    j.at("group_id").get_to(r.group_id);
    j.at("item_id").get_to(r.item_id);
    r.file_path = j.value("file_path", "");
    r.quality_score = j.value("quality_score", 0);
    r.deletion_reason = j.value("deletion_reason", "");
    r.user_initiated = j.value("user_initiated", false);
    r.success = j.value("success", false);

    if (j.contains("user_id") && !j.at("user_id").is_null())
        r.user_id = j.at("user_id").get<std::string>();
    else
        r.user_id.reset();
    if (j.contains("error_message") && !j.at("error_message").is_null())
        r.error_message = j.at("error_message").get<std::string>();
    else
        r.error_message.reset();

    auto ts = TimeUtils::fromIso8601(j.at("timestamp").get<std::string>());
    if (!ts)
        throw std::invalid_argument("Invalid audit timestamp: " + j.at("timestamp").get<std::string>());
    r.timestamp = *ts;
}
