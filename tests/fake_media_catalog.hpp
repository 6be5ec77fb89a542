#pragma once

#include "core/media_catalog.hpp"
#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief In-memory MediaCatalog for tests
 */
class FakeMediaCatalog : public MediaCatalog
{
public:
    void addItem(const std::string &collection_id, const MediaItem &item)
    {
        if (collections_.find(collection_id) == collections_.end())
            order_.push_back(collection_id);
        collections_[collection_id].push_back(item.id);
        items_[item.id] = item;
    }

    void addCollection(const std::string &collection_id)
    {
        if (collections_.find(collection_id) == collections_.end())
        {
            order_.push_back(collection_id);
            collections_[collection_id];
        }
    }

    // listItems() throws for this collection
    void failCollection(const std::string &collection_id) { failing_.insert(collection_id); }

    // resolveItem() reports the item as missing
    void hideItem(const std::string &item_id) { hidden_.insert(item_id); }

    // Invoked at the start of every listItems() call
    std::function<void(const std::string &)> on_list_items;

    std::vector<CollectionInfo> listCollections() const override
    {
        std::vector<CollectionInfo> result;
        for (const auto &id : order_)
            result.push_back(CollectionInfo{id, "Collection " + id});
        return result;
    }

    std::vector<MediaItem> listItems(const std::string &collection_id) const override
    {
        if (on_list_items)
            on_list_items(collection_id);
        if (failing_.count(collection_id))
            throw std::runtime_error("catalog unreachable for " + collection_id);

        std::vector<MediaItem> result;
        auto it = collections_.find(collection_id);
        if (it == collections_.end())
            throw std::runtime_error("unknown collection " + collection_id);
        for (const auto &id : it->second)
            result.push_back(items_.at(id));
        return result;
    }

    std::optional<MediaItem> resolveItem(const std::string &item_id) const override
    {
        if (hidden_.count(item_id))
            return std::nullopt;
        auto it = items_.find(item_id);
        if (it == items_.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<std::string> getPeople(const MediaItem &item) const override
    {
        std::vector<std::string> names;
        for (const auto &person : item.people)
            names.push_back(person.name);
        return names;
    }

private:
    std::vector<std::string> order_;
    std::map<std::string, std::vector<std::string>> collections_;
    std::map<std::string, MediaItem> items_;
    std::set<std::string> failing_;
    std::set<std::string> hidden_;
};
