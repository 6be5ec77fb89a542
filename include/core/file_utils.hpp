#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Size of a media file on disk
 */
struct FileMetadata
{
    std::string file_path;
    uint64_t file_size;
};

/**
 * @brief File helpers for version records
 */
class FileUtils
{
public:
    /**
     * @brief Stat a regular file without reading its contents
     * @param file_path Path to the file
     * @return Empty when the path is missing, not a regular file or unreadable
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * @brief File size in bytes, 0 when the file cannot be reached
     *
     * Unreachable files are logged as warnings and never fail the caller.
     */
    static int64_t getFileSize(const std::string &file_path);

    /**
     * @brief Final path component, platform separators only
     */
    static std::string getFileName(const std::string &file_path);
};
