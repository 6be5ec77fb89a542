#include "core/quality_scorer.hpp"
#include "core/media_catalog.hpp"
#include "core/media_info_extractor.hpp"
#include "core/string_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <exception>

int QualityScorer::priorityScore(const std::string &value, const std::vector<std::string> &priorities)
{
    if (value.empty() || priorities.empty())
        return 0;

    for (size_t index = 0; index < priorities.size(); ++index)
    {
        if (StringUtils::equalsIgnoreCase(priorities[index], value))
        {
            double n = static_cast<double>(priorities.size());
            return static_cast<int>(std::nearbyint((n - static_cast<double>(index)) / n * 100.0));
        }
    }
    return 0;
}

int QualityScorer::score(const VersionRecord &version, const LibraryPreferences &preferences)
{
    std::string audio_format = MediaInfoExtractor::audioFormatLabel(version.audio_codec, version.audio_channels);

    double total = RESOLUTION_WEIGHT * priorityScore(version.resolution, preferences.resolution_priority) +
                   DYNAMIC_RANGE_WEIGHT * priorityScore(version.dynamic_range, preferences.dynamic_range_priority) +
                   CODEC_WEIGHT * priorityScore(version.codec, preferences.codec_priority) +
                   AUDIO_WEIGHT * priorityScore(audio_format, preferences.audio_priority) +
                   SOURCE_TYPE_WEIGHT * priorityScore(version.source_type, preferences.source_type_priority);

    return static_cast<int>(std::nearbyint(total));
}

size_t QualityScorer::analyzeGroup(DuplicateGroup &group, const LibraryPreferences &preferences,
                                   const MediaCatalog &catalog)
{
    size_t scored = 0;
    // The grouper's default primary is the first member; anything else was chosen explicitly
    bool default_primary = group.primary_version_id.empty() ||
                           (!group.versions.empty() && group.primary_version_id == group.versions.front().item_id);

    for (auto &version : group.versions)
    {
        std::optional<MediaItem> item;
        try
        {
            item = catalog.resolveItem(version.item_id);
        }
        catch (const std::exception &e)
        {
            Logger::warn("Failed to resolve item " + version.item_id + " for scoring: " + e.what());
            continue;
        }

        if (!item)
        {
            Logger::warn("Item " + version.item_id + " not found, leaving it unscored in group " + group.group_id);
            continue;
        }

        MediaInfoExtractor::extract(version, *item);
        version.quality_score = score(version, preferences);
        ++scored;

        Logger::trace("Version " + version.item_id + " [" + version.resolution + ", " + version.dynamic_range +
                      ", " + version.codec + ", " + version.source_type + "] scored " +
                      std::to_string(version.quality_score));
    }

    std::stable_sort(group.versions.begin(), group.versions.end(),
                     [](const VersionRecord &a, const VersionRecord &b)
                     { return a.quality_score > b.quality_score; });

    if (default_primary && !group.versions.empty())
        group.primary_version_id = group.versions.front().item_id;

    Logger::debug("Scored " + std::to_string(scored) + "/" + std::to_string(group.versions.size()) +
                  " versions of group " + group.group_id);
    return scored;
}
