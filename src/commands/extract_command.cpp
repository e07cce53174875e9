// =============================================================================
// linkx - Extract Command Implementation
// =============================================================================

#include "extract_command.h"

#include <utility>

#include "linkx/common/logger.h"
#include "linkx/format/index_reader.h"
#include "linkx/io/block_sink.h"
#include "linkx/io/data_file.h"

namespace linkx::commands {

ExtractCommand::ExtractCommand(ExtractCommandOptions options) : options_(std::move(options)) {}

ExtractCommand::~ExtractCommand() = default;

ExtractCommand::ExtractCommand(ExtractCommand&&) noexcept = default;
ExtractCommand& ExtractCommand::operator=(ExtractCommand&&) noexcept = default;

int ExtractCommand::execute() {
    try {
        LINKX_LOG_DEBUG("Extract options:");
        LINKX_LOG_DEBUG("  Index: {}", options_.indexPath.string());
        LINKX_LOG_DEBUG("  Data: {}", options_.dataPath.string());
        LINKX_LOG_DEBUG("  Output: {}", options_.outputPath.string());
        LINKX_LOG_DEBUG("  Threads: {}", options_.threads);

        auto index = format::readIndexFile(options_.indexPath);

        io::DataFile data(options_.dataPath);
        data.open();

        io::DirectoryBlockSink sink(options_.outputPath, io::paddingWidth(index.records.size()),
                                    options_.extension);
        sink.prepare();

        pipeline::ExtractOptions extractOptions;
        extractOptions.threads = options_.threads;
        extractOptions.checkUncompressedSize = options_.checkUncompressedSize;

        pipeline::Extractor extractor(extractOptions);
        stats_ = extractor.extract(index.records, data, sink);

        if (options_.showSummary) {
            printSummary();
        }
        return 0;

    } catch (const LinkxException& e) {
        LINKX_LOG_ERROR("Extraction failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        LINKX_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void ExtractCommand::printSummary() const {
    LINKX_LOG_INFO("Extracted {} of {} blocks to {} ({} skipped) in {:.2f}s",
                   stats_.blocksWritten(), stats_.recordCount, options_.outputPath.string(),
                   stats_.blocksSkipped(), stats_.elapsedSeconds);
    LINKX_LOG_INFO("  stored={} decoded={} unknown-method={}", stats_.storedBlocks,
                   stats_.decodedBlocks, stats_.unknownMethodBlocks);
    if (stats_.blocksSkipped() > 0) {
        LINKX_LOG_INFO("  invalid-range={} read-failed={} decode-failed={}",
                       stats_.invalidRangeBlocks, stats_.readFailedBlocks,
                       stats_.decodeFailedBlocks);
    }
    if (stats_.fieldSizeMismatches > 0 || stats_.uncompressedSizeMismatches > 0) {
        LINKX_LOG_INFO("  field-size-mismatches={} uncompressed-size-mismatches={}",
                       stats_.fieldSizeMismatches, stats_.uncompressedSizeMismatches);
    }
    LINKX_LOG_INFO("  {} bytes in, {} bytes out", stats_.inputBytes, stats_.outputBytes);
}

}  // namespace linkx::commands
