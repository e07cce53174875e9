// =============================================================================
// linkx - Block Sink Tests
// =============================================================================
// Unit tests for output naming and the directory sink.
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <utility>

#include "linkx/common/error.h"
#include "linkx/io/block_sink.h"
#include "linkx/io/data_file.h"
#include "test_support.h"

namespace linkx::io::test {

using linkx::test::bytesOf;
using linkx::test::TempPathGuard;

// =============================================================================
// paddingWidth
// =============================================================================

TEST(PaddingWidthTest, DigitCountOfRecordCount) {
    EXPECT_EQ(paddingWidth(0), 1U);
    EXPECT_EQ(paddingWidth(1), 1U);
    EXPECT_EQ(paddingWidth(9), 1U);
    EXPECT_EQ(paddingWidth(10), 2U);
    EXPECT_EQ(paddingWidth(99), 2U);
    EXPECT_EQ(paddingWidth(100), 3U);
    EXPECT_EQ(paddingWidth(250), 3U);
    EXPECT_EQ(paddingWidth(1000), 4U);
}

static_assert(paddingWidth(12345) == 5);

// =============================================================================
// DirectoryBlockSink
// =============================================================================

TEST(DirectoryBlockSinkTest, FileNamesAreZeroPadded) {
    DirectoryBlockSink sink("out", 3);
    EXPECT_EQ(sink.fileNameFor(7), "007.bin");
    EXPECT_EQ(sink.fileNameFor(250), "250.bin");
    EXPECT_EQ(sink.pathFor(12), std::filesystem::path("out") / "012.bin");
}

TEST(DirectoryBlockSinkTest, CustomExtension) {
    DirectoryBlockSink sink("out", 2, ".dat");
    EXPECT_EQ(sink.fileNameFor(4), "04.dat");
}

TEST(DirectoryBlockSinkTest, WiderIdsAreNotTruncated) {
    DirectoryBlockSink sink("out", 1);
    EXPECT_EQ(sink.fileNameFor(123), "123.bin");
}

TEST(DirectoryBlockSinkTest, PrepareCreatesNestedDirectories) {
    TempPathGuard root(linkx::test::tempPath("sink"));
    const auto nested = root.path() / "a" / "b";

    DirectoryBlockSink sink(nested, 1);
    sink.prepare();
    EXPECT_TRUE(std::filesystem::is_directory(nested));

    // Existing directory is accepted
    EXPECT_NO_THROW(sink.prepare());
}

TEST(DirectoryBlockSinkTest, PrepareFailsWhenPathIsAFile) {
    TempPathGuard file(linkx::test::tempPath("not_a_dir"));
    linkx::test::writeFile(file.path(), bytesOf("x"));

    DirectoryBlockSink sink(file.path(), 1);
    EXPECT_THROW(sink.prepare(), IOError);
}

TEST(DirectoryBlockSinkTest, WriteReplacesExistingFile) {
    TempPathGuard root(linkx::test::tempPath("sink"));
    DirectoryBlockSink sink(root.path(), 2);
    sink.prepare();

    const auto first = bytesOf("a longer first payload");
    const auto second = bytesOf("short");
    sink.write(3, first);
    sink.write(3, second);

    EXPECT_EQ(linkx::test::readFile(root.path() / "03.bin"), second);
}

TEST(DirectoryBlockSinkTest, WriteEmptyBlockCreatesEmptyFile) {
    TempPathGuard root(linkx::test::tempPath("sink"));
    DirectoryBlockSink sink(root.path(), 1);
    sink.prepare();

    sink.write(1, ByteSpan{});

    ASSERT_TRUE(std::filesystem::exists(root.path() / "1.bin"));
    EXPECT_EQ(std::filesystem::file_size(root.path() / "1.bin"), 0U);
}

TEST(DirectoryBlockSinkTest, WriteWithoutDirectoryThrows) {
    TempPathGuard root(linkx::test::tempPath("missing"));
    DirectoryBlockSink sink(root.path() / "never_created", 1);
    EXPECT_THROW(sink.write(1, bytesOf("data")), IOError);
}

// =============================================================================
// DataFile
// =============================================================================

TEST(DataFileTest, OpenMissingFileThrows) {
    DataFile data(linkx::test::tempPath("missing_data"));
    EXPECT_THROW(data.open(), IOError);
    EXPECT_FALSE(data.isOpen());
}

TEST(DataFileTest, ReadAtReturnsExactRange) {
    TempPathGuard file(linkx::test::tempPath("data"));
    linkx::test::writeFile(file.path(), bytesOf("0123456789"));

    DataFile data(file.path());
    data.open();
    EXPECT_EQ(data.size(), 10U);

    auto middle = data.readAt(3, 4);
    ASSERT_TRUE(middle.has_value());
    EXPECT_EQ(*middle, bytesOf("3456"));

    auto empty = data.readAt(10, 0);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(DataFileTest, ShortReadIsAnError) {
    TempPathGuard file(linkx::test::tempPath("data"));
    linkx::test::writeFile(file.path(), bytesOf("0123456789"));

    DataFile data(file.path());
    data.open();

    auto result = data.readAt(8, 5);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kIOError);
}

TEST(DataFileTest, MoveTransfersOwnership) {
    TempPathGuard file(linkx::test::tempPath("data"));
    linkx::test::writeFile(file.path(), bytesOf("abc"));

    DataFile original(file.path());
    original.open();
    DataFile moved(std::move(original));

    EXPECT_FALSE(original.isOpen());
    ASSERT_TRUE(moved.isOpen());
    EXPECT_EQ(*moved.readAt(0, 3), bytesOf("abc"));
}

}  // namespace linkx::io::test
