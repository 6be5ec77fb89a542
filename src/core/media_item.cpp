#include "core/media_item.hpp"
#include "core/string_utils.hpp"

using json = nlohmann::json;

std::string MediaItem::getProviderId(const std::string &provider) const
{
    auto exact = provider_ids.find(provider);
    if (exact != provider_ids.end())
        return exact->second;

    for (const auto &[key, value] : provider_ids)
    {
        if (StringUtils::equalsIgnoreCase(key, provider))
            return value;
    }
    return "";
}

namespace
{
    template <typename T>
    std::optional<T> optionalField(const json &j, const char *key)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return std::nullopt;
        return it->get<T>();
    }

    template <typename T>
    json optionalJson(const std::optional<T> &value)
    {
        return value ? json(*value) : json(nullptr);
    }
}

void from_json(const json &j, MediaItem &item)
{
    j.at("id").get_to(item.id);
    item.name = j.value("name", "");
    item.production_year = optionalField<int>(j, "production_year");
    item.provider_ids = j.value("provider_ids", std::map<std::string, std::string>{});
    item.runtime_minutes = optionalField<double>(j, "runtime_minutes");
    item.genres = j.value("genres", std::vector<std::string>{});
    item.tags = j.value("tags", std::vector<std::string>{});
    item.community_rating = optionalField<double>(j, "community_rating");
    item.studios = j.value("studios", std::vector<std::string>{});
    item.overview = j.value("overview", "");
    item.path = j.value("path", "");

    item.people.clear();
    if (j.contains("people") && j.at("people").is_array())
    {
        // Either plain names or {"name": ..., "role": ...} objects
        for (const auto &p : j.at("people"))
        {
            PersonInfo person;
            if (p.is_string())
            {
                person.name = p.get<std::string>();
            }
            else
            {
                person.name = p.value("name", "");
                person.role = p.value("role", "");
            }
            item.people.push_back(person);
        }
    }

    item.premiere_date.reset();
    if (auto date = optionalField<std::string>(j, "premiere_date"))
        item.premiere_date = TimeUtils::fromIso8601(*date);

    item.video.reset();
    if (j.contains("video") && j.at("video").is_object())
    {
        const auto &v = j.at("video");
        VideoStreamInfo video;
        video.width = optionalField<int>(v, "width");
        video.height = optionalField<int>(v, "height");
        video.codec = v.value("codec", "");
        video.profile = v.value("profile", "");
        video.range_type = v.value("range_type", "");
        video.bit_rate = optionalField<int>(v, "bit_rate");
        item.video = video;
    }

    item.audio.reset();
    if (j.contains("audio") && j.at("audio").is_object())
    {
        const auto &a = j.at("audio");
        AudioStreamInfo audio;
        audio.codec = a.value("codec", "");
        audio.channels = optionalField<int>(a, "channels");
        item.audio = audio;
    }
}

void to_json(json &j, const MediaItem &item)
{
    json people = json::array();
    for (const auto &p : item.people)
        people.push_back({{"name", p.name}, {"role", p.role}});

    j = json{
        {"id", item.id},
        {"name", item.name},
        {"production_year", optionalJson(item.production_year)},
        {"provider_ids", item.provider_ids},
        {"runtime_minutes", optionalJson(item.runtime_minutes)},
        {"genres", item.genres},
        {"tags", item.tags},
        {"people", people},
        {"community_rating", optionalJson(item.community_rating)},
        {"premiere_date", item.premiere_date ? json(TimeUtils::toIso8601(*item.premiere_date)) : json(nullptr)},
        {"studios", item.studios},
        {"overview", item.overview},
        {"path", item.path}};

    if (item.video)
    {
        j["video"] = {
            {"width", optionalJson(item.video->width)},
            {"height", optionalJson(item.video->height)},
            {"codec", item.video->codec},
            {"profile", item.video->profile},
            {"range_type", item.video->range_type},
            {"bit_rate", optionalJson(item.video->bit_rate)}};
    }
    if (item.audio)
    {
        j["audio"] = {
            {"codec", item.audio->codec},
            {"channels", optionalJson(item.audio->channels)}};
    }
}
