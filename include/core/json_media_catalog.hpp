#pragma once

#include "core/media_catalog.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief MediaCatalog backed by a JSON catalog export
 *
 * Expected document:
 * {"collections": [{"id": "...", "name": "...", "items": [ {MediaItem}, ... ]}]}
 */
class JsonMediaCatalog : public MediaCatalog
{
public:
    explicit JsonMediaCatalog(const nlohmann::json &document);

    /**
     * @brief Load a catalog document from disk
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static JsonMediaCatalog fromFile(const std::string &path);

    std::vector<CollectionInfo> listCollections() const override;
    std::vector<MediaItem> listItems(const std::string &collection_id) const override;
    std::optional<MediaItem> resolveItem(const std::string &item_id) const override;
    std::vector<std::string> getPeople(const MediaItem &item) const override;

    size_t itemCount() const { return items_.size(); }

private:
    std::vector<CollectionInfo> collections_;
    std::unordered_map<std::string, std::vector<std::string>> collection_items_; // collection id -> item ids
    std::unordered_map<std::string, MediaItem> items_;
};
