#pragma once

#include "core/duplicate_group.hpp"
#include "core/media_item.hpp"
#include "core/processing_result.hpp"
#include <string>
#include <vector>

class MediaCatalog;

/**
 * @brief Consolidates descriptive metadata across the members of a group
 *
 * Field rules:
 * - title: longest non-empty member title (first on ties)
 * - genres, tags, studios, people: case-insensitive unions
 * - average_rating: mean of the rated members, 0 when none is rated
 * - release_date: earliest premiere date, null when none
 * - external_ids: first non-empty value seen per provider key; an empty
 *   value never claims the key
 * - descriptions: non-blank overviews, de-duplicated case-insensitively
 *
 * Each version that supplied a value is tagged in metadata_contribution with
 * the field name ("title", "genres", "tags", "people", "rating",
 * "release_date", "studios", "external_ids", "descriptions").
 */
class MetadataMerger
{
public:
    /**
     * @brief Resolve the group's members through the catalog and merge them
     *
     * Unresolvable members are skipped with a warning. When nothing resolves
     * the group's merged metadata is left untouched.
     */
    static MergeResult merge(DuplicateGroup &group, const MediaCatalog &catalog);

    /**
     * @brief Merge already resolved items
     * @param items Resolved members in group order
     * @param people Names per item, parallel to items
     * @param contributions Receives the field names each item contributed, parallel to items
     */
    static MergedMetadata mergeItems(const std::vector<MediaItem> &items,
                                     const std::vector<std::vector<std::string>> &people,
                                     std::vector<std::vector<std::string>> *contributions = nullptr);
};
