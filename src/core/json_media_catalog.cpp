#include "core/json_media_catalog.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

JsonMediaCatalog::JsonMediaCatalog(const json &document)
{
    if (!document.contains("collections") || !document.at("collections").is_array())
    {
        throw std::invalid_argument("Catalog document has no \"collections\" array");
    }

    for (const auto &c : document.at("collections"))
    {
        CollectionInfo info;
        c.at("id").get_to(info.id);
        info.name = c.value("name", info.id);

        auto &ids = collection_items_[info.id];
        if (c.contains("items"))
        {
            for (const auto &entry : c.at("items"))
            {
                MediaItem item = entry.get<MediaItem>();
                if (items_.count(item.id))
                {
                    Logger::warn("Catalog item " + item.id + " listed more than once, keeping first entry");
                }
                else
                {
                    items_.emplace(item.id, item);
                }
                ids.push_back(item.id);
            }
        }
        collections_.push_back(info);
    }

    Logger::debug("JsonMediaCatalog loaded " + std::to_string(collections_.size()) + " collections, " +
                  std::to_string(items_.size()) + " items");
}

JsonMediaCatalog JsonMediaCatalog::fromFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        throw std::runtime_error("Cannot open catalog file: " + path);
    }

    json document;
    try
    {
        in >> document;
    }
    catch (const json::parse_error &e)
    {
        throw std::runtime_error("Cannot parse catalog file " + path + ": " + e.what());
    }
    return JsonMediaCatalog(document);
}

std::vector<CollectionInfo> JsonMediaCatalog::listCollections() const
{
    return collections_;
}

std::vector<MediaItem> JsonMediaCatalog::listItems(const std::string &collection_id) const
{
    auto it = collection_items_.find(collection_id);
    if (it == collection_items_.end())
    {
        throw std::runtime_error("Collection not found: " + collection_id);
    }

    std::vector<MediaItem> result;
    result.reserve(it->second.size());
    for (const auto &id : it->second)
        result.push_back(items_.at(id));
    return result;
}

std::optional<MediaItem> JsonMediaCatalog::resolveItem(const std::string &item_id) const
{
    auto it = items_.find(item_id);
    if (it == items_.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> JsonMediaCatalog::getPeople(const MediaItem &item) const
{
    std::vector<std::string> names;
    names.reserve(item.people.size());
    for (const auto &person : item.people)
    {
        if (!person.name.empty())
            names.push_back(person.name);
    }
    return names;
}
