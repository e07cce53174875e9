// =============================================================================
// linkx - Block Decoder Implementation
// =============================================================================

#include "linkx/algo/block_decoder.h"

#include <fmt/format.h>
#include <zlib.h>

#include <limits>
#include <string>

#include "linkx/common/logger.h"

namespace linkx::algo {

namespace {

/// @brief Releases zlib inflate state on scope exit.
class InflateGuard {
public:
    explicit InflateGuard(z_stream* stream) noexcept : stream_(stream) {}
    ~InflateGuard() { inflateEnd(stream_); }

    InflateGuard(const InflateGuard&) = delete;
    InflateGuard& operator=(const InflateGuard&) = delete;

private:
    z_stream* stream_;
};

[[nodiscard]] std::string zlibMessage(const z_stream& stream, int ret) {
    return stream.msg != nullptr ? std::string(stream.msg) : std::string(zError(ret));
}

}  // namespace

// =============================================================================
// Zlib Helpers
// =============================================================================

Result<ByteBuffer> inflateZlib(ByteSpan input) {
    if (input.size() > std::numeric_limits<uInt>::max()) {
        return makeError<ByteBuffer>(ErrorCode::kDecompressionFailed,
                                     fmt::format("deflate stream of {} bytes is too large",
                                                 input.size()));
    }

    z_stream stream{};
    int ret = inflateInit(&stream);
    if (ret != Z_OK) {
        return makeError<ByteBuffer>(ErrorCode::kDecompressionFailed,
                                     fmt::format("Failed to initialize zlib: {}", zError(ret)));
    }
    InflateGuard guard(&stream);

    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());

    ByteBuffer output;
    ByteBuffer chunk(kInflateChunkSize);

    do {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<uInt>(chunk.size());

        ret = inflate(&stream, Z_NO_FLUSH);
        switch (ret) {
            case Z_OK:
            case Z_STREAM_END:
                break;
            case Z_BUF_ERROR:
                // Output space was available, so the input ran out first
                return makeError<ByteBuffer>(ErrorCode::kDecompressionFailed,
                                             "incomplete or truncated deflate stream");
            default:
                return makeError<ByteBuffer>(ErrorCode::kDecompressionFailed,
                                             zlibMessage(stream, ret));
        }

        output.insert(output.end(), chunk.data(),
                      chunk.data() + (chunk.size() - stream.avail_out));
    } while (ret != Z_STREAM_END);

    return output;
}

// =============================================================================
// BlockDecoder Implementation
// =============================================================================

Result<DecodedBlock> BlockDecoder::decode(ByteSpan block, BlockId blockId) const {
    if (block.size() < format::kSubHeaderSize) {
        return makeError<DecodedBlock>(
            ErrorCode::kMalformedHeader,
            fmt::format("block {} is {} bytes, shorter than the {}-byte sub-header", blockId,
                        block.size(), format::kSubHeaderSize));
    }

    DecodedBlock decoded;
    decoded.header = format::BlockSubHeader::parse(block.data());

    const auto fieldSizes = decoded.header.fieldSizes();
    if (decoded.header.declaredFieldCount() > fieldSizes.size()) {
        return makeError<DecodedBlock>(
            ErrorCode::kFieldCountOverflow,
            fmt::format("block {} declares {} fields but only {} size slots are set", blockId,
                        decoded.header.declaredFieldCount(), fieldSizes.size()));
    }

    std::size_t cursor = format::kSubHeaderSize;

    for (std::size_t index = 0; index < fieldSizes.size(); ++index) {
        const std::size_t fieldSize = fieldSizes[index];

        if (fieldSize < format::kFieldPrefixSize || cursor > block.size() ||
            fieldSize > block.size() - cursor) {
            return makeError<DecodedBlock>(
                ErrorCode::kFieldOutOfBounds,
                fmt::format("field {} of block {} ({} bytes at {}) does not fit in {} bytes",
                            index, blockId, fieldSize, cursor, block.size()));
        }

        const auto field = block.subspan(cursor, fieldSize);
        const auto innerSize = format::loadLE<std::uint32_t>(field.data());
        const std::size_t payloadSize = fieldSize - format::kFieldPrefixSize;

        if (innerSize != payloadSize) {
            LINKX_LOG_WARNING("Mismatch in field size ({} != {}) in block {}", innerSize,
                              payloadSize, blockId);
            ++decoded.sizeMismatches;
        }

        auto inflated = inflateZlib(field.subspan(format::kFieldPrefixSize, payloadSize));
        if (!inflated) {
            return makeError<DecodedBlock>(
                ErrorCode::kDecompressionFailed,
                fmt::format("field {} of block {}: {}", index, blockId,
                            inflated.error().message()));
        }

        decoded.data.insert(decoded.data.end(), inflated->begin(), inflated->end());
        ++decoded.fieldCount;

        cursor = format::alignToField(cursor + fieldSize);
    }

    LINKX_LOG_TRACE("Block {} decoded: {} fields, {} bytes", blockId, decoded.fieldCount,
                    decoded.data.size());
    return decoded;
}

}  // namespace linkx::algo
