// =============================================================================
// linkx - Block Extractor
// =============================================================================
// Drives the index records through the data file, the block decoder and an
// output sink.
//
// For each record, in index order, with 1-based block ids:
// - a range outside the data file is reported and skipped
// - exactly compressedSize bytes are read at offset
// - deflate blocks go through BlockDecoder; a failed block is skipped whole
// - stored blocks (and unknown methods, with a warning) pass through raw
// - the resulting buffer is handed to the sink under the block id
//
// One bad record never aborts the run. Only sink failures (the output
// cannot be written) propagate as exceptions.
//
// Concurrency:
//   ExtractOptions::threads > 1 (or 0 for auto) processes blocks with
//   tbb::parallel_for inside a task_arena of that width. Blocks share no
//   mutable state: each worker reads its own range with DataFile::readAt
//   and the sink receives distinct block ids. Diagnostics may interleave
//   but always name their block id.
// =============================================================================

#ifndef LINKX_PIPELINE_EXTRACTOR_H
#define LINKX_PIPELINE_EXTRACTOR_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "linkx/algo/block_decoder.h"
#include "linkx/common/types.h"
#include "linkx/format/link_format.h"
#include "linkx/io/block_sink.h"
#include "linkx/io/data_file.h"

namespace linkx::pipeline {

// =============================================================================
// Options
// =============================================================================

/// @brief Extraction configuration.
struct ExtractOptions {
    /// @brief Worker threads. 1 = sequential, 0 = TBB default concurrency.
    int threads = 1;

    /// @brief Warn when a decoded block's length differs from the record's
    ///        uncompressed size. Never causes a block to be skipped.
    bool checkUncompressedSize = false;
};

// =============================================================================
// Per-Block Outcome
// =============================================================================

/// @brief What happened to one record.
enum class BlockStatus : std::uint8_t {
    /// @brief Stored block handed to the sink unchanged.
    kWrittenStored,

    /// @brief Deflate block decoded and handed to the sink.
    kWrittenDecoded,

    /// @brief Unknown method; raw bytes handed to the sink.
    kWrittenUnknownMethod,

    /// @brief offset + compressedSize exceeds the data file.
    kSkippedInvalidRange,

    /// @brief The range could not be read from the data file.
    kSkippedReadFailed,

    /// @brief BlockDecoder rejected the block.
    kSkippedDecodeFailed
};

/// @brief Human-readable status name.
[[nodiscard]] std::string_view blockStatusToString(BlockStatus status) noexcept;

/// @brief True for every status that produced sink output.
[[nodiscard]] constexpr bool isWritten(BlockStatus status) noexcept {
    return status == BlockStatus::kWrittenStored || status == BlockStatus::kWrittenDecoded ||
           status == BlockStatus::kWrittenUnknownMethod;
}

/// @brief Result of processing one record.
struct BlockOutcome {
    BlockId blockId = kInvalidBlockId;
    BlockStatus status = BlockStatus::kSkippedInvalidRange;

    /// @brief Error code for skipped blocks, kSuccess otherwise.
    ErrorCode error = ErrorCode::kSuccess;

    /// @brief Bytes read from the data file.
    std::uint64_t inputBytes = 0;

    /// @brief Bytes handed to the sink.
    std::uint64_t outputBytes = 0;

    /// @brief Fields whose inner declared size was wrong.
    std::size_t fieldSizeMismatches = 0;

    /// @brief Decoded length differed from the record (only when checked).
    bool uncompressedSizeMismatch = false;
};

// =============================================================================
// Statistics
// =============================================================================

/// @brief Aggregate statistics of one extraction run.
struct ExtractionStats {
    std::uint64_t recordCount = 0;
    std::uint64_t storedBlocks = 0;
    std::uint64_t decodedBlocks = 0;
    std::uint64_t unknownMethodBlocks = 0;
    std::uint64_t invalidRangeBlocks = 0;
    std::uint64_t readFailedBlocks = 0;
    std::uint64_t decodeFailedBlocks = 0;
    std::uint64_t fieldSizeMismatches = 0;
    std::uint64_t uncompressedSizeMismatches = 0;
    std::uint64_t inputBytes = 0;
    std::uint64_t outputBytes = 0;
    double elapsedSeconds = 0.0;

    /// @brief Blocks handed to the sink.
    [[nodiscard]] std::uint64_t blocksWritten() const noexcept {
        return storedBlocks + decodedBlocks + unknownMethodBlocks;
    }

    /// @brief Blocks that produced no output.
    [[nodiscard]] std::uint64_t blocksSkipped() const noexcept {
        return invalidRangeBlocks + readFailedBlocks + decodeFailedBlocks;
    }

    /// @brief Fold one block outcome into the totals.
    void add(const BlockOutcome& outcome) noexcept;

    /// @brief Merge totals gathered by another worker.
    ExtractionStats& operator+=(const ExtractionStats& other) noexcept;
};

// =============================================================================
// Extractor Class
// =============================================================================

/// @brief Orchestrates index records, data file, decoder and sink.
class Extractor {
public:
    explicit Extractor(ExtractOptions options = {});

    /// @brief Process every record and hand finished blocks to the sink.
    /// @param records Index records in file order; record i gets block id i+1.
    /// @param data Open data file.
    /// @param sink Output destination.
    /// @return Aggregate statistics.
    /// @throws IOError if the sink fails.
    [[nodiscard]] ExtractionStats extract(std::span<const format::IndexRecord> records,
                                          const io::DataFile& data, io::BlockSink& sink) const;

    /// @brief Process a single record.
    /// @throws IOError if the sink fails.
    [[nodiscard]] BlockOutcome processRecord(const format::IndexRecord& record, BlockId blockId,
                                             const io::DataFile& data,
                                             io::BlockSink& sink) const;

    [[nodiscard]] const ExtractOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] ExtractionStats extractSequential(std::span<const format::IndexRecord> records,
                                                    const io::DataFile& data,
                                                    io::BlockSink& sink) const;

    [[nodiscard]] ExtractionStats extractParallel(std::span<const format::IndexRecord> records,
                                                  const io::DataFile& data,
                                                  io::BlockSink& sink) const;

    ExtractOptions options_;
    algo::BlockDecoder decoder_;
};

}  // namespace linkx::pipeline

#endif  // LINKX_PIPELINE_EXTRACTOR_H
