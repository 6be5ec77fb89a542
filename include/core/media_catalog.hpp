#pragma once

#include "core/media_item.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief A collection as listed by the catalog
 */
struct CollectionInfo
{
    std::string id;
    std::string name;
};

/**
 * @brief Narrow read-only view of the host media catalog
 *
 * Implementations may throw std::exception when the catalog is unreachable;
 * callers treat that as a failure of the whole collection.
 */
class MediaCatalog
{
public:
    virtual ~MediaCatalog() = default;

    virtual std::vector<CollectionInfo> listCollections() const = 0;

    /**
     * @brief Movies and episodes found recursively under the collection
     */
    virtual std::vector<MediaItem> listItems(const std::string &collection_id) const = 0;

    /**
     * @return Empty when the item is unknown
     */
    virtual std::optional<MediaItem> resolveItem(const std::string &item_id) const = 0;

    /**
     * @brief Names of cast and crew attached to the item
     */
    virtual std::vector<std::string> getPeople(const MediaItem &item) const = 0;
};
