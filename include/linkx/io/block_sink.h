// =============================================================================
// linkx - Block Output Sinks
// =============================================================================
// Destinations for finished block buffers.
//
// This module provides:
// - BlockSink: interface the extractor hands each finished block to
// - DirectoryBlockSink: one file per block, zero-padded sequential names
// - paddingWidth(): file name width derived from the record count
//
// Naming:
//   With 250 records, block 7 is written as "007.bin". The width is the
//   number of decimal digits in the record count, so lexicographic and
//   numeric order of the file names agree.
// =============================================================================

#ifndef LINKX_IO_BLOCK_SINK_H
#define LINKX_IO_BLOCK_SINK_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "linkx/common/types.h"

namespace linkx::io {

/// @brief Number of decimal digits used for block file names.
/// @param recordCount Total number of index records.
/// @return Digit count of recordCount, at least 1.
[[nodiscard]] constexpr std::size_t paddingWidth(std::size_t recordCount) noexcept {
    std::size_t width = 1;
    while (recordCount >= 10) {
        recordCount /= 10;
        ++width;
    }
    return width;
}

// =============================================================================
// BlockSink Interface
// =============================================================================

/// @brief Receives one buffer per successfully produced block.
/// @note Implementations must accept concurrent write() calls for distinct
///       block ids when the extractor runs with more than one thread.
class BlockSink {
public:
    virtual ~BlockSink() = default;

    /// @brief Consume the payload of one block.
    /// @param blockId 1-based block id (index record position).
    /// @param data Block payload.
    /// @throws IOError if the payload cannot be stored.
    virtual void write(BlockId blockId, ByteSpan data) = 0;
};

// =============================================================================
// DirectoryBlockSink
// =============================================================================

/// @brief Writes each block to "<dir>/<zero-padded id><extension>".
class DirectoryBlockSink final : public BlockSink {
public:
    /// @brief Construct a sink.
    /// @param directory Output directory (created by prepare()).
    /// @param width Zero-padding width for file names.
    /// @param extension File name suffix, including the dot.
    DirectoryBlockSink(std::filesystem::path directory, std::size_t width,
                       std::string extension = kDefaultOutputExtension);

    /// @brief Create the output directory if it does not exist.
    /// @throws IOError if the directory cannot be created.
    void prepare();

    /// @brief Write one block file, replacing any existing file.
    /// @throws IOError on open or write failure.
    void write(BlockId blockId, ByteSpan data) override;

    /// @brief File name (without directory) used for a block id.
    [[nodiscard]] std::string fileNameFor(BlockId blockId) const;

    /// @brief Full path used for a block id.
    [[nodiscard]] std::filesystem::path pathFor(BlockId blockId) const {
        return directory_ / fileNameFor(blockId);
    }

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

    [[nodiscard]] std::size_t width() const noexcept { return width_; }

private:
    std::filesystem::path directory_;
    std::size_t width_;
    std::string extension_;
};

}  // namespace linkx::io

#endif  // LINKX_IO_BLOCK_SINK_H
