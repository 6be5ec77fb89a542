#pragma once

#include "core/duplicate_group.hpp"
#include "core/media_item.hpp"
#include <string>

/**
 * @brief Reduces raw stream data to the categorical labels used for ranking
 *
 * All classifiers are pure functions of their inputs. Missing stream data
 * leaves the corresponding label empty.
 */
class MediaInfoExtractor
{
public:
    /**
     * @brief Fill the technical labels, bit rate and source type of a version
     *
     * The source type is inferred from version.file_path, so it is set even
     * when the item carries no stream information.
     */
    static void extract(VersionRecord &version, const MediaItem &item);

    /**
     * @brief Height bucket: "2160p", "1440p", "1080p", "720p", "576p", "480p" or empty
     */
    static std::string resolutionLabel(int height);

    /**
     * @brief "Dolby Vision", "HDR10+", "HDR10", "HLG" or "SDR"
     * @param profile Codec profile text
     * @param range_type Stream range classifier
     */
    static std::string dynamicRangeLabel(const std::string &profile, const std::string &range_type);

    /**
     * @brief AV1, HEVC, H.264, VP9 or MPEG-4; other names pass through upper-cased
     */
    static std::string codecLabel(const std::string &codec);

    /**
     * @brief Audio format used for ranking, e.g. "Dolby Atmos", "TrueHD 7.1", "AAC Stereo"
     * @param codec Raw audio codec name
     * @param channels Channel label from channelLabel()
     */
    static std::string audioFormatLabel(const std::string &codec, const std::string &channels);

    /**
     * @brief 8 -> "7.1", 6 -> "5.1", 2 -> "Stereo", 1 -> "Mono", otherwise the number
     */
    static std::string channelLabel(int channels);

    /**
     * @brief Release source guessed from the file name, "Unknown" when nothing matches
     */
    static std::string sourceTypeLabel(const std::string &file_path);
};
