#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <system_error>

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    std::error_code ec;
    fs::path path(file_path);
    if (!fs::is_regular_file(path, ec) || ec)
    {
        return std::nullopt;
    }

    FileMetadata metadata;
    metadata.file_path = file_path;
    metadata.file_size = fs::file_size(path, ec);
    if (ec)
    {
        Logger::warn("Error reading file size for " + file_path + ": " + ec.message());
        return std::nullopt;
    }
    return metadata;
}

int64_t FileUtils::getFileSize(const std::string &file_path)
{
    if (file_path.empty())
    {
        return 0;
    }

    auto metadata = getFileMetadata(file_path);
    if (!metadata)
    {
        Logger::warn("File not reachable, recording size 0: " + file_path);
        return 0;
    }
    return static_cast<int64_t>(metadata->file_size);
}

std::string FileUtils::getFileName(const std::string &file_path)
{
    return fs::path(file_path).filename().string();
}
