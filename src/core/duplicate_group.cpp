#include "core/duplicate_group.hpp"
#include "core/id_generator.hpp"
#include <algorithm>
#include <unordered_set>

using json = nlohmann::json;

namespace
{
    json optionalTimestamp(const std::optional<Timestamp> &ts)
    {
        if (!ts)
            return nullptr;
        return TimeUtils::toIso8601(*ts);
    }

    std::optional<Timestamp> readOptionalTimestamp(const json &j, const char *key)
    {
        if (!j.contains(key) || j.at(key).is_null())
            return std::nullopt;
        return TimeUtils::fromIso8601(j.at(key).get<std::string>());
    }

    template <typename T>
    void readIfPresent(const json &j, const char *key, T &target)
    {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null())
            it->get_to(target);
    }
}

DuplicateGroup DuplicateGroup::create(const std::string &library_id)
{
    DuplicateGroup group;
    group.group_id = IdGenerator::newUuid();
    group.library_id = library_id;
    group.detection_timestamp = TimeUtils::now();
    return group;
}

bool DuplicateGroup::containsItem(const std::string &item_id) const
{
    return std::any_of(versions.begin(), versions.end(), [&item_id](const VersionRecord &v)
                       { return v.item_id == item_id; });
}

bool DuplicateGroup::setPrimaryVersion(const std::string &item_id)
{
    if (!containsItem(item_id))
        return false;
    primary_version_id = item_id;
    return true;
}

bool DuplicateGroup::isValid() const
{
    std::unordered_set<std::string> ids;
    for (const auto &v : versions)
        ids.insert(v.item_id);
    if (ids.size() < 2 || ids.size() != versions.size())
        return false;
    return !primary_version_id.empty() && ids.count(primary_version_id) == 1;
}

void to_json(json &j, const VersionRecord &v)
{
    j = json{
        {"item_id", v.item_id},
        {"file_path", v.file_path},
        {"quality_score", v.quality_score},
        {"resolution", v.resolution},
        {"codec", v.codec},
        {"dynamic_range", v.dynamic_range},
        {"audio_codec", v.audio_codec},
        {"audio_channels", v.audio_channels},
        {"source_type", v.source_type},
        {"file_size", v.file_size},
        {"bitrate", v.bitrate},
        {"metadata_contribution", v.metadata_contribution}};
}

void from_json(const json &j, VersionRecord &v)
{
    j.at("item_id").get_to(v.item_id);
    readIfPresent(j, "file_path", v.file_path);
    readIfPresent(j, "quality_score", v.quality_score);
    readIfPresent(j, "resolution", v.resolution);
    readIfPresent(j, "codec", v.codec);
    readIfPresent(j, "dynamic_range", v.dynamic_range);
    readIfPresent(j, "audio_codec", v.audio_codec);
    readIfPresent(j, "audio_channels", v.audio_channels);
    readIfPresent(j, "source_type", v.source_type);
    readIfPresent(j, "file_size", v.file_size);
    readIfPresent(j, "bitrate", v.bitrate);
    readIfPresent(j, "metadata_contribution", v.metadata_contribution);
}

void to_json(json &j, const MergedMetadata &m)
{
    j = json{
        {"title", m.title},
        {"genres", m.genres},
        {"tags", m.tags},
        {"people", m.people},
        {"average_rating", m.average_rating},
        {"release_date", optionalTimestamp(m.release_date)},
        {"studios", m.studios},
        {"external_ids", m.external_ids},
        {"descriptions", m.descriptions}};
}

void from_json(const json &j, MergedMetadata &m)
{
    readIfPresent(j, "title", m.title);
    readIfPresent(j, "genres", m.genres);
    readIfPresent(j, "tags", m.tags);
    readIfPresent(j, "people", m.people);
    readIfPresent(j, "average_rating", m.average_rating);
    m.release_date = readOptionalTimestamp(j, "release_date");
    readIfPresent(j, "studios", m.studios);
    readIfPresent(j, "external_ids", m.external_ids);
    readIfPresent(j, "descriptions", m.descriptions);
}

void to_json(json &j, const DuplicateGroup &g)
{
    j = json{
        {"group_id", g.group_id},
        {"library_id", g.library_id},
        {"primary_version_id", g.primary_version_id},
        {"versions", g.versions},
        {"merged_metadata", g.merged_metadata},
        {"detection_timestamp", TimeUtils::toIso8601(g.detection_timestamp)},
        {"last_reviewed_timestamp", optionalTimestamp(g.last_reviewed_timestamp)},
        {"status", g.status}};
}

void from_json(const json &j, DuplicateGroup &g)
{
    j.at("group_id").get_to(g.group_id);
    readIfPresent(j, "library_id", g.library_id);
    readIfPresent(j, "primary_version_id", g.primary_version_id);
    readIfPresent(j, "versions", g.versions);
    readIfPresent(j, "merged_metadata", g.merged_metadata);
    g.detection_timestamp = readOptionalTimestamp(j, "detection_timestamp").value_or(Timestamp{});
    g.last_reviewed_timestamp = readOptionalTimestamp(j, "last_reviewed_timestamp");
    readIfPresent(j, "status", g.status);
}
