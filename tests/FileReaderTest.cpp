#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "input/FileReader.hpp"
#include "TestSupport.hpp"

using IpSift::Input::FileReader;
using IpSift::Testing::TempDir;

TEST(FileReaderTest, ReadsFixedSizeChunksWithShortTail)
{
    TempDir dir;
    FileReader reader(dir.write("log", "abcdefghij"));
    ASSERT_TRUE(reader.isOpen());

    EXPECT_EQ(reader.nextChunk(4), std::optional<std::string>("abcd"));
    EXPECT_EQ(reader.nextChunk(4), std::optional<std::string>("efgh"));
    EXPECT_EQ(reader.nextChunk(4), std::optional<std::string>("ij"));
    EXPECT_FALSE(reader.nextChunk(4).has_value());
    EXPECT_EQ(reader.bytesRead(), 10u);
}

TEST(FileReaderTest, ExactMultipleHasNoEmptyTrailingChunk)
{
    TempDir dir;
    FileReader reader(dir.write("log", "abcdef"));
    EXPECT_EQ(reader.nextChunk(3), std::optional<std::string>("abc"));
    EXPECT_EQ(reader.nextChunk(3), std::optional<std::string>("def"));
    EXPECT_FALSE(reader.nextChunk(3).has_value());
}

TEST(FileReaderTest, BinaryModeKeepsBytesIntact)
{
    TempDir dir;
    std::string content = "line1\r\nline2";
    content.push_back('\0');
    content += "\xff";
    FileReader reader(dir.write("log", content));

    const auto chunk = reader.nextChunk(1024);
    ASSERT_TRUE(chunk.has_value());
    EXPECT_EQ(*chunk, content);
}

TEST(FileReaderTest, MissingFileIsNotOpen)
{
    TempDir dir;
    FileReader reader(dir.file("does-not-exist"));
    EXPECT_FALSE(reader.isOpen());
    EXPECT_TRUE(reader.filePath().empty());
    EXPECT_THROW(reader.nextChunk(16), std::runtime_error);
}

TEST(FileReaderTest, ZeroChunkSizeThrows)
{
    TempDir dir;
    FileReader reader(dir.write("log", "abc"));
    EXPECT_THROW(reader.nextChunk(0), std::runtime_error);
}

TEST(FileReaderTest, MoveTransfersHandle)
{
    TempDir dir;
    const std::string path = dir.write("log", "abcdef");
    FileReader first(path);
    EXPECT_EQ(first.nextChunk(2), std::optional<std::string>("ab"));

    FileReader second(std::move(first));
    EXPECT_TRUE(second.isOpen());
    EXPECT_EQ(second.filePath(), path);
    EXPECT_EQ(second.nextChunk(10), std::optional<std::string>("cdef"));

    second.close();
    EXPECT_FALSE(second.isOpen());
}
