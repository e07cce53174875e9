// =============================================================================
// linkx - Index Reader Tests
// =============================================================================
// Unit and property tests for index parsing.
//
// **Property: complete index**
// *For any* N records with no trailing bytes, readIndex returns exactly N
// records equal to the input and reports no truncation.
//
// **Property: truncated index**
// *For any* N >= 1 records whose last record is cut short by k bytes
// (0 < k < 40), readIndex returns the first N-1 records and reports
// truncation.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <vector>

#include "linkx/common/error.h"
#include "linkx/format/index_reader.h"
#include "linkx/format/link_format.h"
#include "test_support.h"

namespace linkx::format::test {

using linkx::test::buildIndex;

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

[[nodiscard]] rc::Gen<std::array<std::uint8_t, 4>> tag() {
    return rc::gen::map(rc::gen::arbitrary<std::uint32_t>(), [](std::uint32_t v) {
        return std::array<std::uint8_t, 4>{
            static_cast<std::uint8_t>(v), static_cast<std::uint8_t>(v >> 8),
            static_cast<std::uint8_t>(v >> 16), static_cast<std::uint8_t>(v >> 24)};
    });
}

[[nodiscard]] rc::Gen<IndexRecord> indexRecord() {
    return rc::gen::map(
        rc::gen::tuple(rc::gen::arbitrary<std::uint64_t>(), rc::gen::arbitrary<std::uint64_t>(),
                       rc::gen::arbitrary<std::uint64_t>(), rc::gen::arbitrary<std::uint64_t>(),
                       tag(), tag()),
        [](const auto& tuple) {
            auto [offset, uncompressed, compressed, method, t0, t1] = tuple;
            IndexRecord record;
            record.offset = offset;
            record.uncompressedSize = uncompressed;
            record.compressedSize = compressed;
            record.methodSlot = method;
            record.tag0 = t0;
            record.tag1 = t1;
            return record;
        });
}

[[nodiscard]] rc::Gen<std::vector<IndexRecord>> indexRecords() {
    return rc::gen::container<std::vector<IndexRecord>>(indexRecord());
}

}  // namespace gen

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(IndexReaderProperty, CompleteIndexReturnsEveryRecord, ()) {
    const auto records = *gen::indexRecords();
    const auto bytes = buildIndex(records);

    const auto result = readIndex(bytes);

    RC_ASSERT(result.records == records);
    RC_ASSERT(!result.truncated());
    RC_ASSERT(result.totalSize == bytes.size());
}

RC_GTEST_PROP(IndexReaderProperty, TruncatedTailKeepsCompleteRecords, ()) {
    const auto records = *rc::gen::nonEmpty(gen::indexRecords());
    const auto cut = *rc::gen::inRange<std::size_t>(1, IndexRecord::kSize);

    auto bytes = buildIndex(records);
    bytes.resize(bytes.size() - cut);

    const auto result = readIndex(bytes);

    RC_ASSERT(result.truncated());
    RC_ASSERT(result.trailingBytes == IndexRecord::kSize - cut);
    RC_ASSERT(result.records.size() == records.size() - 1);
    RC_ASSERT(std::equal(result.records.begin(), result.records.end(), records.begin()));
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(IndexReaderTest, EmptyInput) {
    const auto result = readIndex(ByteSpan{});
    EXPECT_TRUE(result.records.empty());
    EXPECT_FALSE(result.truncated());
    EXPECT_EQ(result.totalSize, 0U);
}

TEST(IndexReaderTest, InputShorterThanOneRecord) {
    ByteBuffer bytes(IndexRecord::kSize - 1, 0x11);
    const auto result = readIndex(bytes);
    EXPECT_TRUE(result.records.empty());
    EXPECT_TRUE(result.truncated());
    EXPECT_EQ(result.trailingBytes, IndexRecord::kSize - 1);
}

TEST(IndexReaderTest, DecodesLittleEndianLayout) {
    ByteBuffer bytes(IndexRecord::kSize, 0);
    storeLE<std::uint64_t>(bytes.data(), 0x0102030405060708ULL);
    storeLE<std::uint64_t>(bytes.data() + 8, 4096);
    storeLE<std::uint64_t>(bytes.data() + 16, 1234);
    // Method byte 1 with reserved bytes set
    bytes[24] = 0x01;
    bytes[25] = 0xAB;
    bytes[26] = 0xCD;
    bytes[32] = 'T';
    bytes[33] = 'A';
    bytes[34] = 'G';
    bytes[35] = '0';
    bytes[36] = 0xFF;
    bytes[39] = 0x7F;

    const auto result = readIndex(bytes);
    ASSERT_EQ(result.records.size(), 1U);

    const auto& record = result.records.front();
    EXPECT_EQ(record.offset, 0x0102030405060708ULL);
    EXPECT_EQ(record.uncompressedSize, 4096U);
    EXPECT_EQ(record.compressedSize, 1234U);
    EXPECT_EQ(record.methodCode(), 1);
    EXPECT_TRUE(record.isDeflate());
    EXPECT_EQ(record.methodReserved(), 0xCDABU);
    EXPECT_EQ(record.tag0, (std::array<std::uint8_t, 4>{'T', 'A', 'G', '0'}));
    EXPECT_EQ(record.tag1, (std::array<std::uint8_t, 4>{0xFF, 0, 0, 0x7F}));
}

TEST(IndexReaderTest, FitsWithinRejectsWrappingRange) {
    IndexRecord record;
    record.offset = 16;
    record.compressedSize = std::numeric_limits<std::uint64_t>::max() - 8;
    EXPECT_FALSE(record.fitsWithin(1024));

    record.compressedSize = 1008;
    EXPECT_TRUE(record.fitsWithin(1024));

    record.compressedSize = 1009;
    EXPECT_FALSE(record.fitsWithin(1024));
}

TEST(IndexReaderTest, ReadIndexFileMissingFileThrows) {
    const auto path = linkx::test::tempPath("missing_index");
    EXPECT_THROW((void)readIndexFile(path), IOError);
}

TEST(IndexReaderTest, ReadIndexFileMatchesBuffer) {
    linkx::test::TempPathGuard guard(linkx::test::tempPath("index"));

    std::vector<IndexRecord> records(3);
    for (std::size_t i = 0; i < records.size(); ++i) {
        records[i].offset = i * 100;
        records[i].compressedSize = 100;
        records[i].uncompressedSize = 250;
        records[i].methodSlot = i % 2;
    }
    auto bytes = buildIndex(records);
    bytes.push_back(0x42);  // one stray trailing byte
    linkx::test::writeFile(guard.path(), bytes);

    const auto result = readIndexFile(guard.path());
    EXPECT_EQ(result.records, records);
    EXPECT_TRUE(result.truncated());
    EXPECT_EQ(result.trailingBytes, 1U);
    EXPECT_EQ(result.totalSize, bytes.size());
}

}  // namespace linkx::format::test
