#include "core/duplicate_grouper.hpp"
#include "core/cancellation_token.hpp"
#include "core/file_utils.hpp"
#include "core/similarity_scorer.hpp"
#include "core/title_normalizer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <numeric>
#include <unordered_map>

std::vector<DuplicateGroup> DuplicateGrouper::findDuplicateGroups(const std::string &collection_id,
                                                                  const std::vector<MediaItem> &items,
                                                                  int similarity_threshold,
                                                                  const CancellationToken *token) const
{
    std::vector<DuplicateGroup> groups;

    auto buckets = bucketByTitle(items);
    Logger::info("DuplicateGrouper: " + std::to_string(items.size()) + " items in " +
                 std::to_string(buckets.size()) + " title buckets for collection " + collection_id +
                 " (mode: " + GroupingModes::getModeName(mode_) + ", threshold: " +
                 std::to_string(similarity_threshold) + ")");
    Logger::debug("DuplicateGrouper: " + GroupingModes::getModeName(mode_) + " mode, " +
                  GroupingModes::getModeDescription(mode_));

    for (const auto &bucket : buckets)
    {
        if (token && token->isCancellationRequested())
        {
            Logger::info("DuplicateGrouper: cancelled after " + std::to_string(groups.size()) + " groups");
            break;
        }

        if (bucket.items.size() < 2)
            continue;

        for (const auto &members : detectInBucket(bucket.items, similarity_threshold))
        {
            if (members.size() < 2)
                continue;
            groups.push_back(buildGroup(collection_id, members));
            Logger::debug("DuplicateGrouper: group of " + std::to_string(members.size()) +
                          " versions for title \"" + bucket.key + "\"");
        }
    }

    Logger::info("DuplicateGrouper found " + std::to_string(groups.size()) + " duplicate groups in collection " +
                 collection_id);
    return groups;
}

std::vector<TitleBucket> DuplicateGrouper::bucketByTitle(const std::vector<MediaItem> &items)
{
    std::vector<TitleBucket> buckets;
    std::unordered_map<std::string, size_t> index; // normalized title -> bucket position

    for (const auto &item : items)
    {
        std::string key = TitleNormalizer::normalize(item.name);
        if (key.empty())
        {
            Logger::trace("Skipping item without usable title: " + item.id);
            continue;
        }

        auto it = index.find(key);
        if (it == index.end())
        {
            index.emplace(key, buckets.size());
            buckets.push_back(TitleBucket{key, {&item}});
        }
        else
        {
            buckets[it->second].items.push_back(&item);
        }
    }
    return buckets;
}

std::vector<std::vector<const MediaItem *>> DuplicateGrouper::detectInBucket(const std::vector<const MediaItem *> &bucket,
                                                                             int similarity_threshold) const
{
    if (bucket.size() < 2)
        return {};
    if (mode_ == GroupingMode::COMPONENT)
        return componentMembers(bucket, similarity_threshold);
    return edgeMembers(bucket, similarity_threshold);
}

std::vector<std::vector<const MediaItem *>> DuplicateGrouper::edgeMembers(const std::vector<const MediaItem *> &bucket,
                                                                          int similarity_threshold) const
{
    std::vector<const MediaItem *> members;
    std::vector<bool> added(bucket.size(), false);

    for (size_t i = 0; i < bucket.size(); ++i)
    {
        for (size_t j = i + 1; j < bucket.size(); ++j)
        {
            int score = SimilarityScorer::score(*bucket[i], *bucket[j]);
            if (score < similarity_threshold)
                continue;

            Logger::trace("Match " + bucket[i]->id + " ~ " + bucket[j]->id + " score " + std::to_string(score));
            if (!added[i])
            {
                added[i] = true;
                members.push_back(bucket[i]);
            }
            if (!added[j])
            {
                added[j] = true;
                members.push_back(bucket[j]);
            }
        }
    }

    if (members.size() < 2)
        return {};
    return {members};
}

std::vector<std::vector<const MediaItem *>> DuplicateGrouper::componentMembers(const std::vector<const MediaItem *> &bucket,
                                                                               int similarity_threshold) const
{
    std::vector<size_t> parent(bucket.size());
    std::iota(parent.begin(), parent.end(), 0);

    auto find = [&parent](size_t x)
    {
        while (parent[x] != x)
        {
            parent[x] = parent[parent[x]];
            x = parent[x];
        }
        return x;
    };

    std::vector<bool> has_edge(bucket.size(), false);
    for (size_t i = 0; i < bucket.size(); ++i)
    {
        for (size_t j = i + 1; j < bucket.size(); ++j)
        {
            if (SimilarityScorer::score(*bucket[i], *bucket[j]) < similarity_threshold)
                continue;

            has_edge[i] = has_edge[j] = true;
            size_t root_i = find(i);
            size_t root_j = find(j);
            if (root_i != root_j)
                parent[std::max(root_i, root_j)] = std::min(root_i, root_j);
        }
    }

    // Components in order of their earliest member
    std::vector<std::vector<const MediaItem *>> components;
    std::unordered_map<size_t, size_t> component_of_root;
    for (size_t i = 0; i < bucket.size(); ++i)
    {
        if (!has_edge[i])
            continue;

        size_t root = find(i);
        auto it = component_of_root.find(root);
        if (it == component_of_root.end())
        {
            component_of_root.emplace(root, components.size());
            components.push_back({bucket[i]});
        }
        else
        {
            components[it->second].push_back(bucket[i]);
        }
    }
    return components;
}

DuplicateGroup DuplicateGrouper::buildGroup(const std::string &collection_id,
                                            const std::vector<const MediaItem *> &members)
{
    DuplicateGroup group = DuplicateGroup::create(collection_id);
    group.versions.reserve(members.size());

    for (const auto *item : members)
    {
        VersionRecord version;
        version.item_id = item->id;
        version.file_path = item->path;
        version.file_size = FileUtils::getFileSize(item->path);
        group.versions.push_back(version);
    }

    if (!group.versions.empty())
        group.primary_version_id = group.versions.front().item_id;
    return group;
}
