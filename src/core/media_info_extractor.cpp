#include "core/media_info_extractor.hpp"
#include "core/file_utils.hpp"
#include "core/string_utils.hpp"
#include <initializer_list>

namespace
{
    bool containsAny(const std::string &upper, std::initializer_list<const char *> needles)
    {
        for (const char *needle : needles)
        {
            if (upper.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }
}

void MediaInfoExtractor::extract(VersionRecord &version, const MediaItem &item)
{
    if (item.video)
    {
        const auto &video = *item.video;
        if (video.height)
            version.resolution = resolutionLabel(*video.height);
        version.codec = codecLabel(video.codec);
        version.dynamic_range = dynamicRangeLabel(video.profile, video.range_type);
        if (video.bit_rate)
            version.bitrate = *video.bit_rate / 1000;
    }

    if (item.audio)
    {
        version.audio_codec = item.audio->codec;
        if (item.audio->channels)
            version.audio_channels = channelLabel(*item.audio->channels);
    }

    version.source_type = sourceTypeLabel(version.file_path);
}

std::string MediaInfoExtractor::resolutionLabel(int height)
{
    if (height >= 2160)
        return "2160p";
    if (height >= 1440)
        return "1440p";
    if (height >= 1080)
        return "1080p";
    if (height >= 720)
        return "720p";
    if (height >= 576)
        return "576p";
    if (height >= 480)
        return "480p";
    return "";
}

std::string MediaInfoExtractor::dynamicRangeLabel(const std::string &profile, const std::string &range_type)
{
    if (StringUtils::containsIgnoreCase(profile, "Dolby Vision"))
        return "Dolby Vision";
    if (StringUtils::containsIgnoreCase(profile, "HDR10+") || StringUtils::containsIgnoreCase(profile, "HDR10Plus"))
        return "HDR10+";

    if (StringUtils::containsIgnoreCase(range_type, "HDR"))
        return "HDR10";
    if (StringUtils::containsIgnoreCase(range_type, "HLG"))
        return "HLG";
    return "SDR";
}

std::string MediaInfoExtractor::codecLabel(const std::string &codec)
{
    if (codec.empty())
        return "";

    std::string upper = StringUtils::toUpper(codec);
    if (containsAny(upper, {"HEVC", "H265", "H.265"}))
        return "HEVC";
    if (containsAny(upper, {"H264", "H.264", "AVC"}))
        return "H.264";
    if (containsAny(upper, {"AV1"}))
        return "AV1";
    if (containsAny(upper, {"VP9"}))
        return "VP9";
    if (containsAny(upper, {"MPEG"}))
        return "MPEG-4";
    return upper;
}

std::string MediaInfoExtractor::audioFormatLabel(const std::string &codec, const std::string &channels)
{
    if (codec.empty())
        return "";

    std::string upper = StringUtils::toUpper(codec);
    if (containsAny(upper, {"ATMOS"}))
        return "Dolby Atmos";
    if (containsAny(upper, {"DTS:X", "DTSX"}))
        return "DTS:X";
    if (containsAny(upper, {"TRUEHD"}))
        return channels == "7.1" ? "TrueHD 7.1" : "TrueHD 5.1";
    if (containsAny(upper, {"DTS-HD", "DTSHD"}))
        return channels == "7.1" ? "DTS-HD MA 7.1" : "DTS-HD MA 5.1";
    if (containsAny(upper, {"AC3", "DD"}))
        return "AC3 5.1";
    if (containsAny(upper, {"AAC"}))
        return "AAC Stereo";
    return upper + " " + channels;
}

std::string MediaInfoExtractor::channelLabel(int channels)
{
    switch (channels)
    {
    case 8:
        return "7.1";
    case 6:
        return "5.1";
    case 2:
        return "Stereo";
    case 1:
        return "Mono";
    default:
        return std::to_string(channels);
    }
}

std::string MediaInfoExtractor::sourceTypeLabel(const std::string &file_path)
{
    std::string name = StringUtils::toUpper(FileUtils::getFileName(file_path));

    if (containsAny(name, {"REMUX"}))
        return "Remux";
    if (containsAny(name, {"BLURAY", "BLU-RAY"}))
        return "BluRay";
    if (containsAny(name, {"WEB-DL", "WEBDL"}))
        return "WEB-DL";
    if (containsAny(name, {"WEBRIP"}))
        return "WEBRip";
    if (containsAny(name, {"HDTV"}))
        return "HDTV";
    if (containsAny(name, {"DVDRIP", "DVD-RIP"}))
        return "DVDRip";
    return "Unknown";
}
