#include <gtest/gtest.h>
#include "core/file_utils.hpp"
#include "test_base.hpp"
#include <filesystem>

class FileUtilsTest : public TestBase
{
};

TEST_F(FileUtilsTest, MetadataOfRegularFile)
{
    std::string path = writeFile("movie.mkv", "twelve bytes");

    auto metadata = FileUtils::getFileMetadata(path);
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->file_path, path);
    EXPECT_EQ(metadata->file_size, 12u);
    EXPECT_EQ(FileUtils::getFileSize(path), 12);
}

TEST_F(FileUtilsTest, MissingFileHasNoMetadata)
{
    std::string path = pathInTestDir("missing.mkv");

    EXPECT_FALSE(FileUtils::getFileMetadata(path).has_value());
    EXPECT_EQ(FileUtils::getFileSize(path), 0);
    EXPECT_EQ(FileUtils::getFileSize(""), 0);
}

TEST_F(FileUtilsTest, DirectoryIsNotAMediaFile)
{
    fs::create_directories(pathInTestDir("subdir"));

    EXPECT_FALSE(FileUtils::getFileMetadata(pathInTestDir("subdir")).has_value());
    EXPECT_EQ(FileUtils::getFileSize(pathInTestDir("subdir")), 0);
}

TEST_F(FileUtilsTest, FileNameIsLastComponent)
{
    EXPECT_EQ(FileUtils::getFileName("/media/movies/Heat.1995.mkv"), "Heat.1995.mkv");
    EXPECT_EQ(FileUtils::getFileName("Heat.1995.mkv"), "Heat.1995.mkv");
    EXPECT_EQ(FileUtils::getFileName(""), "");
}
