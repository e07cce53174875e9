// =============================================================================
// linkx - Block Extractor Implementation
// =============================================================================

#include "linkx/pipeline/extractor.h"

#include <chrono>
#include <utility>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/spin_mutex.h>
#include <tbb/task_arena.h>

#include "linkx/common/logger.h"

namespace linkx::pipeline {

std::string_view blockStatusToString(BlockStatus status) noexcept {
    switch (status) {
        case BlockStatus::kWrittenStored:
            return "stored";
        case BlockStatus::kWrittenDecoded:
            return "decoded";
        case BlockStatus::kWrittenUnknownMethod:
            return "unknown method (raw)";
        case BlockStatus::kSkippedInvalidRange:
            return "skipped: invalid range";
        case BlockStatus::kSkippedReadFailed:
            return "skipped: read failed";
        case BlockStatus::kSkippedDecodeFailed:
            return "skipped: decode failed";
    }
    return "unknown";
}

// =============================================================================
// ExtractionStats Implementation
// =============================================================================

void ExtractionStats::add(const BlockOutcome& outcome) noexcept {
    ++recordCount;
    switch (outcome.status) {
        case BlockStatus::kWrittenStored:
            ++storedBlocks;
            break;
        case BlockStatus::kWrittenDecoded:
            ++decodedBlocks;
            break;
        case BlockStatus::kWrittenUnknownMethod:
            ++unknownMethodBlocks;
            break;
        case BlockStatus::kSkippedInvalidRange:
            ++invalidRangeBlocks;
            break;
        case BlockStatus::kSkippedReadFailed:
            ++readFailedBlocks;
            break;
        case BlockStatus::kSkippedDecodeFailed:
            ++decodeFailedBlocks;
            break;
    }
    fieldSizeMismatches += outcome.fieldSizeMismatches;
    if (outcome.uncompressedSizeMismatch) {
        ++uncompressedSizeMismatches;
    }
    inputBytes += outcome.inputBytes;
    outputBytes += outcome.outputBytes;
}

ExtractionStats& ExtractionStats::operator+=(const ExtractionStats& other) noexcept {
    recordCount += other.recordCount;
    storedBlocks += other.storedBlocks;
    decodedBlocks += other.decodedBlocks;
    unknownMethodBlocks += other.unknownMethodBlocks;
    invalidRangeBlocks += other.invalidRangeBlocks;
    readFailedBlocks += other.readFailedBlocks;
    decodeFailedBlocks += other.decodeFailedBlocks;
    fieldSizeMismatches += other.fieldSizeMismatches;
    uncompressedSizeMismatches += other.uncompressedSizeMismatches;
    inputBytes += other.inputBytes;
    outputBytes += other.outputBytes;
    return *this;
}

// =============================================================================
// Extractor Implementation
// =============================================================================

Extractor::Extractor(ExtractOptions options) : options_(std::move(options)) {}

ExtractionStats Extractor::extract(std::span<const format::IndexRecord> records,
                                   const io::DataFile& data, io::BlockSink& sink) const {
    auto startTime = std::chrono::steady_clock::now();

    LINKX_LOG_DEBUG("Extracting {} records from {} ({} bytes), threads={}", records.size(),
                    data.path().string(), data.size(), options_.threads);

    ExtractionStats stats = options_.threads == 1 ? extractSequential(records, data, sink)
                                                  : extractParallel(records, data, sink);

    stats.elapsedSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    return stats;
}

ExtractionStats Extractor::extractSequential(std::span<const format::IndexRecord> records,
                                             const io::DataFile& data,
                                             io::BlockSink& sink) const {
    ExtractionStats stats;
    for (std::size_t i = 0; i < records.size(); ++i) {
        stats.add(processRecord(records[i], static_cast<BlockId>(i + kFirstBlockId), data, sink));
    }
    return stats;
}

ExtractionStats Extractor::extractParallel(std::span<const format::IndexRecord> records,
                                           const io::DataFile& data,
                                           io::BlockSink& sink) const {
    ExtractionStats stats;
    tbb::spin_mutex statsMutex;

    const int concurrency =
        options_.threads > 0 ? options_.threads : tbb::task_arena::automatic;
    tbb::task_arena arena(concurrency);

    arena.execute([&] {
        tbb::parallel_for(
            tbb::blocked_range<std::size_t>(0, records.size()),
            [&](const tbb::blocked_range<std::size_t>& range) {
                ExtractionStats local;
                for (std::size_t i = range.begin(); i < range.end(); ++i) {
                    local.add(processRecord(records[i], static_cast<BlockId>(i + kFirstBlockId),
                                            data, sink));
                }
                tbb::spin_mutex::scoped_lock lock(statsMutex);
                stats += local;
            });
    });

    return stats;
}

BlockOutcome Extractor::processRecord(const format::IndexRecord& record, BlockId blockId,
                                      const io::DataFile& data, io::BlockSink& sink) const {
    BlockOutcome outcome;
    outcome.blockId = blockId;

    if (!record.fitsWithin(data.size())) {
        LINKX_LOG_ERROR(
            "Invalid entry at block {}: offset {} + compressed_size {} exceeds data file size {}",
            blockId, record.offset, record.compressedSize, data.size());
        outcome.status = BlockStatus::kSkippedInvalidRange;
        outcome.error = ErrorCode::kInvalidRange;
        return outcome;
    }

    auto raw = data.readAt(record.offset, record.compressedSize);
    if (!raw) {
        LINKX_LOG_ERROR("Failed to read block {}: {}", blockId, raw.error().message());
        outcome.status = BlockStatus::kSkippedReadFailed;
        outcome.error = raw.error().code();
        return outcome;
    }
    outcome.inputBytes = raw->size();

    if (record.isStored()) {
        sink.write(blockId, *raw);
        outcome.status = BlockStatus::kWrittenStored;
        outcome.outputBytes = raw->size();
        return outcome;
    }

    if (!record.isDeflate()) {
        LINKX_LOG_WARNING("Unknown compression method {} in block {}, writing raw bytes",
                          record.methodCode(), blockId);
        sink.write(blockId, *raw);
        outcome.status = BlockStatus::kWrittenUnknownMethod;
        outcome.outputBytes = raw->size();
        return outcome;
    }

    auto decoded = decoder_.decode(*raw, blockId);
    if (!decoded) {
        LINKX_LOG_ERROR("Skipping block {}: [{}] {}", blockId,
                        errorCodeToString(decoded.error().code()), decoded.error().message());
        outcome.status = BlockStatus::kSkippedDecodeFailed;
        outcome.error = decoded.error().code();
        return outcome;
    }

    outcome.fieldSizeMismatches = decoded->sizeMismatches;

    if (options_.checkUncompressedSize && decoded->data.size() != record.uncompressedSize) {
        LINKX_LOG_WARNING("Block {} decoded to {} bytes, index records {}", blockId,
                          decoded->data.size(), record.uncompressedSize);
        outcome.uncompressedSizeMismatch = true;
    }

    sink.write(blockId, decoded->data);
    outcome.status = BlockStatus::kWrittenDecoded;
    outcome.outputBytes = decoded->data.size();
    return outcome;
}

}  // namespace linkx::pipeline
