#pragma once

#include "core/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One member of a duplicate group
 *
 * Identity (item_id) is fixed at creation. Technical labels and the score
 * are filled by the quality scorer, contribution tags by the merger.
 */
struct VersionRecord
{
    std::string item_id;
    std::string file_path;
    int quality_score = 0;
    std::string resolution;     // bucket label, e.g. "2160p"
    std::string codec;          // normalized, e.g. "HEVC"
    std::string dynamic_range;  // e.g. "HDR10", "SDR"
    std::string audio_codec;    // as reported by the catalog
    std::string audio_channels; // e.g. "7.1", "Stereo"
    std::string source_type;    // inferred from the file name, e.g. "Remux"
    int64_t file_size = 0;
    int bitrate = 0; // kbps
    std::vector<std::string> metadata_contribution;
};

/**
 * @brief Consolidated metadata across all resolvable members of a group
 *
 * Entirely recomputed on every merge.
 */
struct MergedMetadata
{
    std::string title;
    std::vector<std::string> genres;
    std::vector<std::string> tags;
    std::vector<std::string> people;
    double average_rating = 0.0;
    std::optional<Timestamp> release_date;
    std::vector<std::string> studios;
    std::map<std::string, std::string> external_ids;
    std::vector<std::string> descriptions;
};

/**
 * @brief A set of at least two items judged to be the same title
 */
struct DuplicateGroup
{
    std::string group_id;
    std::string library_id;
    std::string primary_version_id;
    std::vector<VersionRecord> versions;
    MergedMetadata merged_metadata;
    Timestamp detection_timestamp{};
    std::optional<Timestamp> last_reviewed_timestamp;
    std::string status = "Pending";

    /**
     * @brief Create an empty group with a fresh identifier and detection time
     */
    static DuplicateGroup create(const std::string &library_id);

    bool containsItem(const std::string &item_id) const;

    /**
     * @brief Designate the primary version
     * @return false (group unchanged) when item_id is not a member
     */
    bool setPrimaryVersion(const std::string &item_id);

    /**
     * @brief Persistable groups hold at least two distinct members and a valid primary
     */
    bool isValid() const;
};

void to_json(nlohmann::json &j, const VersionRecord &v);
void from_json(const nlohmann::json &j, VersionRecord &v);
void to_json(nlohmann::json &j, const MergedMetadata &m);
void from_json(const nlohmann::json &j, MergedMetadata &m);
void to_json(nlohmann::json &j, const DuplicateGroup &g);
void from_json(const nlohmann::json &j, DuplicateGroup &g);
