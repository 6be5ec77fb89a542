#pragma once

#include "core/duplicate_group.hpp"
#include "core/library_preferences.hpp"
#include <string>
#include <vector>

class MediaCatalog;

/**
 * @brief Ranks the versions of a duplicate group against collection preferences
 *
 * Category weights: resolution 0.30, dynamic range 0.25, codec 0.20,
 * audio 0.15, source type 0.10.
 */
class QualityScorer
{
public:
    static constexpr double RESOLUTION_WEIGHT = 0.30;
    static constexpr double DYNAMIC_RANGE_WEIGHT = 0.25;
    static constexpr double CODEC_WEIGHT = 0.20;
    static constexpr double AUDIO_WEIGHT = 0.15;
    static constexpr double SOURCE_TYPE_WEIGHT = 0.10;

    /**
     * @brief Position score of a label in a most-preferred-first list
     * @return round((n - index) / n * 100), or 0 when the label is empty or not listed
     */
    static int priorityScore(const std::string &value, const std::vector<std::string> &priorities);

    /**
     * @brief Weighted quality score of one version from its technical labels
     */
    static int score(const VersionRecord &version, const LibraryPreferences &preferences);

    /**
     * @brief Extract labels, score and rank every version of a group
     *
     * Versions whose item cannot be resolved keep empty labels and a score of 0.
     * The version list is stable-sorted by descending score. A primary that is
     * empty or still the creation default (the first listed version) is
     * replaced by the top-ranked member; any other primary is kept. The group
     * does not record how its primary was set, so a setPrimaryVersion() that
     * names the first listed version is indistinguishable from the default
     * and is replaced as well.
     *
     * @return Number of versions that were resolved and scored
     */
    static size_t analyzeGroup(DuplicateGroup &group, const LibraryPreferences &preferences,
                               const MediaCatalog &catalog);
};
