#pragma once

#include <string>
#include <vector>

/**
 * @brief Per-collection ranking preferences and detection threshold
 *
 * Each priority list is ordered most-preferred first. The deletion policy
 * fields are carried for the deletion workflow and are not interpreted by
 * detection, scoring or merge.
 */
struct LibraryPreferences
{
    std::string library_id;

    std::vector<std::string> resolution_priority{"4320p", "2160p", "1440p", "1080p", "720p", "576p", "480p"};
    std::vector<std::string> dynamic_range_priority{"HDR10+", "Dolby Vision", "HDR10", "HLG", "SDR"};
    std::vector<std::string> codec_priority{"AV1", "HEVC", "H.264", "VP9", "MPEG-4"};
    std::vector<std::string> audio_priority{"Dolby Atmos", "DTS:X", "TrueHD 7.1", "DTS-HD MA 7.1",
                                            "DTS-HD MA 5.1", "AC3 5.1", "AAC Stereo"};
    std::vector<std::string> source_type_priority{"Remux", "BluRay", "WEB-DL", "WEBRip", "HDTV", "DVDRip"};

    int similarity_threshold = 50;

    bool auto_delete_enabled = false;
    std::string minimum_quality_threshold;
    bool require_manual_review = true;
};
