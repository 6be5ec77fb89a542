#include "core/metadata_merger.hpp"
#include "core/media_catalog.hpp"
#include "core/string_utils.hpp"
#include "logging/logger.hpp"
#include <exception>

namespace
{
    void tag(std::vector<std::vector<std::string>> *contributions, size_t index, const std::string &field)
    {
        if (contributions)
            (*contributions)[index].push_back(field);
    }
}

MergeResult MetadataMerger::merge(DuplicateGroup &group, const MediaCatalog &catalog)
{
    std::vector<MediaItem> items;
    std::vector<std::vector<std::string>> people;
    std::vector<size_t> version_index; // resolved item -> position in group.versions
    size_t skipped = 0;

    for (size_t i = 0; i < group.versions.size(); ++i)
    {
        const auto &item_id = group.versions[i].item_id;
        std::optional<MediaItem> item;
        try
        {
            item = catalog.resolveItem(item_id);
        }
        catch (const std::exception &e)
        {
            Logger::warn("Failed to resolve item " + item_id + " for merge: " + e.what());
        }

        if (!item)
        {
            Logger::warn("Skipping unresolvable item " + item_id + " in group " + group.group_id);
            ++skipped;
            continue;
        }

        std::vector<std::string> names;
        try
        {
            names = catalog.getPeople(*item);
        }
        catch (const std::exception &e)
        {
            Logger::warn("Failed to load people for item " + item_id + ": " + e.what());
        }

        items.push_back(std::move(*item));
        people.push_back(std::move(names));
        version_index.push_back(i);
    }

    if (items.empty())
    {
        Logger::warn("No items found for duplicate group " + group.group_id + ", merged metadata unchanged");
        return MergeResult(MergeStatus::NO_RESOLVED_MEMBERS, 0, skipped,
                           "no member of group " + group.group_id + " could be resolved");
    }

    std::vector<std::vector<std::string>> contributions(items.size());
    group.merged_metadata = mergeItems(items, people, &contributions);

    for (auto &version : group.versions)
        version.metadata_contribution.clear();
    for (size_t k = 0; k < items.size(); ++k)
        group.versions[version_index[k]].metadata_contribution = contributions[k];

    Logger::info("Merged metadata for duplicate group " + group.group_id + " from " +
                 std::to_string(items.size()) + " members" +
                 (skipped > 0 ? " (" + std::to_string(skipped) + " skipped)" : ""));

    return MergeResult(skipped == 0 ? MergeStatus::MERGED : MergeStatus::PARTIAL, items.size(), skipped);
}

MergedMetadata MetadataMerger::mergeItems(const std::vector<MediaItem> &items,
                                          const std::vector<std::vector<std::string>> &people,
                                          std::vector<std::vector<std::string>> *contributions)
{
    MergedMetadata merged;
    if (contributions)
        contributions->assign(items.size(), {});

    // Title
    size_t title_source = items.size();
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (!items[i].name.empty() && items[i].name.size() > merged.title.size())
        {
            merged.title = items[i].name;
            title_source = i;
        }
    }
    if (title_source < items.size())
        tag(contributions, title_source, "title");

    // Unions
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (StringUtils::appendUniqueIgnoreCase(merged.genres, items[i].genres) > 0)
            tag(contributions, i, "genres");
        if (StringUtils::appendUniqueIgnoreCase(merged.tags, items[i].tags) > 0)
            tag(contributions, i, "tags");
        if (i < people.size() && StringUtils::appendUniqueIgnoreCase(merged.people, people[i]) > 0)
            tag(contributions, i, "people");
        if (StringUtils::appendUniqueIgnoreCase(merged.studios, items[i].studios) > 0)
            tag(contributions, i, "studios");
    }

    // Rating
    double rating_sum = 0.0;
    size_t rated = 0;
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (!items[i].community_rating)
            continue;
        rating_sum += *items[i].community_rating;
        ++rated;
        tag(contributions, i, "rating");
    }
    merged.average_rating = rated > 0 ? rating_sum / static_cast<double>(rated) : 0.0;

    // Release date
    size_t date_source = items.size();
    for (size_t i = 0; i < items.size(); ++i)
    {
        const auto &date = items[i].premiere_date;
        if (date && (!merged.release_date || *date < *merged.release_date))
        {
            merged.release_date = date;
            date_source = i;
        }
    }
    if (date_source < items.size())
        tag(contributions, date_source, "release_date");

    // External ids, first value wins
    for (size_t i = 0; i < items.size(); ++i)
    {
        bool contributed = false;
        for (const auto &entry : items[i].provider_ids)
        {
            if (entry.second.empty())
                continue;
            if (merged.external_ids.emplace(entry.first, entry.second).second)
                contributed = true;
        }
        if (contributed)
            tag(contributions, i, "external_ids");
    }

    // Descriptions
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (StringUtils::isBlank(items[i].overview))
            continue;
        if (StringUtils::appendUniqueIgnoreCase(merged.descriptions, {items[i].overview}) > 0)
            tag(contributions, i, "descriptions");
    }

    return merged;
}
