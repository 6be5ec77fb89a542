#pragma once

#include "core/duplicate_group.hpp"
#include "core/grouping_modes.hpp"
#include "core/media_item.hpp"
#include <string>
#include <vector>

class CancellationToken;

/**
 * @brief Items sharing one normalized title key
 */
struct TitleBucket
{
    std::string key;
    std::vector<const MediaItem *> items;
};

/**
 * @brief Partitions a collection's items into duplicate groups
 *
 * Items are bucketed by normalized title, every unordered pair inside a
 * bucket is scored, and pairs at or above the threshold form the edges
 * that decide membership (see GroupingMode).
 */
class DuplicateGrouper
{
public:
    explicit DuplicateGrouper(GroupingMode mode = GroupingMode::EDGE) : mode_(mode) {}

    /**
     * @brief Detect all duplicate groups of one collection
     * @param collection_id Collection stamped on every group
     * @param items Snapshot of the collection's items
     * @param similarity_threshold Minimum pair score for an edge
     * @param token Checked between buckets; on cancellation the groups built so far are returned
     * @return Groups with at least two members, versions carrying id, path and file size only
     */
    std::vector<DuplicateGroup> findDuplicateGroups(const std::string &collection_id,
                                                    const std::vector<MediaItem> &items,
                                                    int similarity_threshold,
                                                    const CancellationToken *token = nullptr) const;

    /**
     * @brief Bucket items by normalized title in order of first appearance
     *
     * Items whose normalized title is empty are left out.
     */
    static std::vector<TitleBucket> bucketByTitle(const std::vector<MediaItem> &items);

    /**
     * @brief Member sets of one bucket under the configured grouping mode
     */
    std::vector<std::vector<const MediaItem *>> detectInBucket(const std::vector<const MediaItem *> &bucket,
                                                               int similarity_threshold) const;

    /**
     * @brief Wrap members as version records; the first member becomes primary
     */
    static DuplicateGroup buildGroup(const std::string &collection_id,
                                     const std::vector<const MediaItem *> &members);

    GroupingMode getMode() const { return mode_; }

private:
    std::vector<std::vector<const MediaItem *>> edgeMembers(const std::vector<const MediaItem *> &bucket,
                                                            int similarity_threshold) const;
    std::vector<std::vector<const MediaItem *>> componentMembers(const std::vector<const MediaItem *> &bucket,
                                                                 int similarity_threshold) const;

    GroupingMode mode_;
};
