// =============================================================================
// linkx - Block Decoder Property Tests
// =============================================================================
// Property-based and unit tests for deflate block decoding.
//
// **Property: field reassembly**
// *For any* 1..29 payloads compressed into 128-byte aligned fields behind a
// correct sub-header, decode returns the exact concatenation of the payloads.
//
// **Property: field count overflow**
// *For any* block whose declared field count exceeds the number of non-zero
// size slots, decode fails with kFieldCountOverflow.
//
// **Property: advisory inner size**
// *For any* block with one wrong inner size prefix, decode still returns the
// original payloads and counts exactly one mismatch.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "linkx/algo/block_decoder.h"
#include "linkx/common/error.h"
#include "linkx/format/link_format.h"
#include "test_support.h"

namespace linkx::algo::test {

using linkx::test::BlockSpec;
using linkx::test::buildDeflateBlock;
using linkx::test::bytesOf;
using linkx::test::zlibCompress;

namespace {

/// @brief Maximum number of fields a sub-header can describe.
constexpr std::size_t kMaxFields = format::kSubHeaderSlotCount - format::kFirstFieldSizeSlot;

ByteBuffer concat(const std::vector<ByteBuffer>& parts) {
    ByteBuffer out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

}  // namespace

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Payloads of mixed compressibility, 0..3000 bytes each.
[[nodiscard]] rc::Gen<ByteBuffer> payload() {
    return rc::gen::oneOf(
        rc::gen::container<ByteBuffer>(rc::gen::arbitrary<std::uint8_t>()),
        rc::gen::map(rc::gen::tuple(rc::gen::inRange<std::size_t>(0, 3000),
                                    rc::gen::arbitrary<std::uint8_t>()),
                     [](const auto& tuple) {
                         auto [size, value] = tuple;
                         return ByteBuffer(size, value);
                     }));
}

[[nodiscard]] rc::Gen<std::vector<ByteBuffer>> payloads() {
    return rc::gen::mapcat(rc::gen::inRange<std::size_t>(1, kMaxFields + 1),
                           [](std::size_t count) {
                               return rc::gen::container<std::vector<ByteBuffer>>(count,
                                                                                  payload());
                           });
}

}  // namespace gen

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(BlockDecoderProperty, ReassemblesAlignedFields, ()) {
    const auto parts = *gen::payloads();
    const auto block = buildDeflateBlock(parts);

    BlockDecoder decoder;
    auto result = decoder.decode(block, 1);

    RC_ASSERT(result.has_value());
    RC_ASSERT(result->data == concat(parts));
    RC_ASSERT(result->fieldCount == parts.size());
    RC_ASSERT(result->sizeMismatches == 0U);
}

RC_GTEST_PROP(BlockDecoderProperty, DeclaredCountAboveSlotsOverflows, ()) {
    const auto parts = *gen::payloads();
    const auto excess = *rc::gen::inRange<std::int64_t>(1, 1000);

    BlockSpec spec;
    spec.declaredFieldCount = static_cast<std::int64_t>(parts.size()) + excess;
    const auto block = buildDeflateBlock(parts, spec);

    BlockDecoder decoder;
    auto result = decoder.decode(block, 7);

    RC_ASSERT(!result.has_value());
    RC_ASSERT(result.error().code() == ErrorCode::kFieldCountOverflow);
}

RC_GTEST_PROP(BlockDecoderProperty, WrongInnerSizeIsAdvisory, ()) {
    const auto parts = *gen::payloads();
    const auto wrong = *rc::gen::inRange<std::size_t>(0, parts.size());

    BlockSpec spec;
    spec.wrongInnerSizeField = static_cast<int>(wrong);
    const auto block = buildDeflateBlock(parts, spec);

    BlockDecoder decoder;
    auto result = decoder.decode(block, 3);

    RC_ASSERT(result.has_value());
    RC_ASSERT(result->data == concat(parts));
    RC_ASSERT(result->sizeMismatches == 1U);
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(BlockDecoderTest, ShortBlockIsMalformedHeader) {
    ByteBuffer block(format::kSubHeaderSize - 1, 0);
    BlockDecoder decoder;
    auto result = decoder.decode(block, 4);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kMalformedHeader);
}

TEST(BlockDecoderTest, HeaderOnlyBlockDecodesToEmpty) {
    ByteBuffer block(format::kSubHeaderSize, 0);
    BlockDecoder decoder;
    auto result = decoder.decode(block, 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->data.empty());
    EXPECT_EQ(result->fieldCount, 0U);
}

TEST(BlockDecoderTest, DeclaredCountBelowSlotsDecodesEveryField) {
    const std::vector<ByteBuffer> parts = {bytesOf("alpha"), bytesOf("beta"), bytesOf("gamma")};
    BlockSpec spec;
    spec.declaredFieldCount = 1;

    BlockDecoder decoder;
    auto result = decoder.decode(buildDeflateBlock(parts, spec), 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->data, bytesOf("alphabetagamma"));
    EXPECT_EQ(result->fieldCount, 3U);
}

TEST(BlockDecoderTest, ZeroSlotsBetweenSizesAreIgnored) {
    const std::vector<ByteBuffer> parts = {bytesOf("first"), bytesOf("second")};
    BlockSpec spec;
    spec.slotPositions = {5, 20};

    BlockDecoder decoder;
    auto result = decoder.decode(buildDeflateBlock(parts, spec), 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->data, bytesOf("firstsecond"));
    EXPECT_EQ(result->header.declaredFieldCount(), 2U);
}

TEST(BlockDecoderTest, OpaqueSlotsArePreserved) {
    BlockSpec spec;
    spec.opaque0 = 0x11223344;
    spec.opaque2 = 0xCAFEBABE;

    BlockDecoder decoder;
    auto result = decoder.decode(buildDeflateBlock({bytesOf("x")}, spec), 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->header.opaque0(), 0x11223344U);
    EXPECT_EQ(result->header.opaque2(), 0xCAFEBABEU);
}

TEST(BlockDecoderTest, CorruptFieldRejectsWholeBlock) {
    const std::vector<ByteBuffer> parts = {bytesOf("intact payload"), bytesOf("broken payload"),
                                           bytesOf("never reached")};
    BlockSpec spec;
    spec.corruptField = 1;

    BlockDecoder decoder;
    auto result = decoder.decode(buildDeflateBlock(parts, spec), 9);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kDecompressionFailed);
    EXPECT_NE(result.error().message().find("block 9"), std::string::npos);
}

TEST(BlockDecoderTest, FieldPastEndOfBlockIsOutOfBounds) {
    auto block = buildDeflateBlock({bytesOf("payload that gets cut off")});
    block.resize(block.size() - 3);

    BlockDecoder decoder;
    auto result = decoder.decode(block, 2);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFieldOutOfBounds);
}

TEST(BlockDecoderTest, FieldSmallerThanPrefixIsOutOfBounds) {
    ByteBuffer block(format::kSubHeaderSize + 16, 0);
    format::BlockSubHeader header;
    header.slots[format::kFirstFieldSizeSlot] = 3;
    header.serialize(block.data());

    BlockDecoder decoder;
    auto result = decoder.decode(block, 2);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFieldOutOfBounds);
}

TEST(BlockDecoderTest, CursorRoundsUpToFieldAlignment) {
    // A 130-byte first field ends at 258, so the second field must start at 384
    const std::vector<ByteBuffer> parts = {bytesOf("one"), bytesOf("two")};
    auto first = zlibCompress(parts[0]);
    auto second = zlibCompress(parts[1]);
    first.resize(126, 0);  // zlib ignores bytes after the end of the stream

    ByteBuffer block(384 + 4 + second.size(), 0xEE);
    format::BlockSubHeader header;
    header.slots[1] = 2;
    header.slots[3] = 130;
    header.slots[4] = static_cast<std::uint32_t>(second.size() + 4);
    header.serialize(block.data());

    format::storeLE<std::uint32_t>(block.data() + 128, 126);
    std::copy(first.begin(), first.end(), block.begin() + 132);
    format::storeLE<std::uint32_t>(block.data() + 384, static_cast<std::uint32_t>(second.size()));
    std::copy(second.begin(), second.end(), block.begin() + 388);

    BlockDecoder decoder;
    auto result = decoder.decode(block, 1);
    ASSERT_TRUE(result.has_value()) << result.error().message();
    EXPECT_EQ(result->data, bytesOf("onetwo"));
}

TEST(InflateZlibTest, EmptyInputFails) {
    auto result = inflateZlib(ByteSpan{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kDecompressionFailed);
}

TEST(InflateZlibTest, TruncatedStreamFails) {
    ByteBuffer payload(10000);
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<std::uint8_t>((i * 31) ^ (i >> 3));
    }
    auto compressed = zlibCompress(payload);
    compressed.resize(compressed.size() / 2);

    auto result = inflateZlib(compressed);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kDecompressionFailed);
}

TEST(InflateZlibTest, OutputLargerThanOneChunk) {
    ByteBuffer payload(kInflateChunkSize * 3 + 17, 0x5A);
    auto result = inflateZlib(zlibCompress(payload));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, payload);
}

}  // namespace linkx::algo::test
