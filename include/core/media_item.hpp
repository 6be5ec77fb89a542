#pragma once

#include "core/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Primary video stream as reported by the catalog
 */
struct VideoStreamInfo
{
    std::optional<int> width;
    std::optional<int> height;
    std::string codec;
    std::string profile;     // e.g. "Main 10", "Dolby Vision Profile 8"
    std::string range_type;  // catalog range classifier, e.g. "SDR", "HDR10", "HLG"
    std::optional<int> bit_rate; // bits per second
};

/**
 * @brief Primary audio stream as reported by the catalog
 */
struct AudioStreamInfo
{
    std::string codec;
    std::optional<int> channels;
};

struct PersonInfo
{
    std::string name;
    std::string role;
};

/**
 * @brief Read-only snapshot of one movie or episode owned by the catalog
 *
 * Absent values are modelled as empty optionals or empty strings; none of
 * them is an error for the matching and scoring code.
 */
struct MediaItem
{
    std::string id;
    std::string name;
    std::optional<int> production_year;
    std::map<std::string, std::string> provider_ids; // provider name -> id, e.g. "Imdb" -> "tt0133093"
    std::optional<double> runtime_minutes;
    std::vector<std::string> genres;
    std::vector<std::string> tags;
    std::vector<PersonInfo> people;
    std::optional<double> community_rating;
    std::optional<Timestamp> premiere_date;
    std::vector<std::string> studios;
    std::string overview;
    std::string path;
    std::optional<VideoStreamInfo> video;
    std::optional<AudioStreamInfo> audio;

    /**
     * @brief Provider id lookup with case-insensitive provider name
     * @return Empty string when the provider is not present
     */
    std::string getProviderId(const std::string &provider) const;
};

void from_json(const nlohmann::json &j, MediaItem &item);
void to_json(nlohmann::json &j, const MediaItem &item);
