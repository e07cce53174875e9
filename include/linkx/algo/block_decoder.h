// =============================================================================
// linkx - Block Decoder
// =============================================================================
// Turns the raw bytes of one deflate block into its uncompressed payload.
//
// Algorithm:
// 1. Parse the 128-byte BlockSubHeader.
// 2. Derive the effective field list (non-zero size slots 3..31) once.
// 3. Reject the block if the declared field count exceeds that list.
// 4. For each field: check the u32 inner size prefix (advisory), inflate
//    the zlib stream that follows it, append the output, and move the
//    cursor to the next 128-byte boundary.
//
// Any structural failure rejects the whole block; a partial buffer is
// never returned.
//
// Thread Safety:
// - BlockDecoder holds no mutable state; one instance may be shared by
//   every extractor worker.
// =============================================================================

#ifndef LINKX_ALGO_BLOCK_DECODER_H
#define LINKX_ALGO_BLOCK_DECODER_H

#include <cstddef>
#include <cstdint>

#include "linkx/common/error.h"
#include "linkx/common/types.h"
#include "linkx/format/link_format.h"

namespace linkx::algo {

// =============================================================================
// Decoder Output
// =============================================================================

/// @brief Successfully decoded block.
struct DecodedBlock {
    /// @brief Concatenated decompressed fields, in field order.
    ByteBuffer data;

    /// @brief Sub-header as read, including the opaque slots.
    format::BlockSubHeader header;

    /// @brief Number of fields decoded.
    std::size_t fieldCount = 0;

    /// @brief Fields whose inner declared size disagreed with the slot size.
    std::size_t sizeMismatches = 0;
};

// =============================================================================
// Zlib Helpers
// =============================================================================

/// @brief Output buffer growth step while inflating.
inline constexpr std::size_t kInflateChunkSize = 64 * 1024;

/// @brief Inflate one complete zlib-wrapped deflate stream.
/// @param input Compressed bytes. Data after the end of the stream is ignored.
/// @return Decompressed bytes, or kDecompressionFailed for a corrupt or
///         incomplete stream.
[[nodiscard]] Result<ByteBuffer> inflateZlib(ByteSpan input);

// =============================================================================
// BlockDecoder Class
// =============================================================================

/// @brief Decoder for deflate blocks.
class BlockDecoder {
public:
    BlockDecoder() = default;

    /// @brief Decode one block.
    /// @param block Raw block bytes exactly as read from the data file.
    /// @param blockId 1-based id used in diagnostics.
    /// @return Decoded block, or one of kMalformedHeader, kFieldCountOverflow,
    ///         kFieldOutOfBounds, kDecompressionFailed.
    [[nodiscard]] Result<DecodedBlock> decode(ByteSpan block, BlockId blockId) const;
};

}  // namespace linkx::algo

#endif  // LINKX_ALGO_BLOCK_DECODER_H
