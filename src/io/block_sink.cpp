// =============================================================================
// linkx - Block Output Sinks Implementation
// =============================================================================

#include "linkx/io/block_sink.h"

#include <fstream>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "linkx/common/error.h"
#include "linkx/common/logger.h"

namespace linkx::io {

DirectoryBlockSink::DirectoryBlockSink(std::filesystem::path directory, std::size_t width,
                                       std::string extension)
    : directory_(std::move(directory)), width_(width == 0 ? 1 : width),
      extension_(std::move(extension)) {}

void DirectoryBlockSink::prepare() {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw IOError("Failed to create output directory", ec,
                      ErrorContext(directory_.string()));
    }
    if (!std::filesystem::is_directory(directory_, ec)) {
        throw IOError("Output path is not a directory", ErrorContext(directory_.string()));
    }
    LINKX_LOG_DEBUG("Output directory ready: {}", directory_.string());
}

std::string DirectoryBlockSink::fileNameFor(BlockId blockId) const {
    return fmt::format("{:0{}}{}", blockId, width_, extension_);
}

void DirectoryBlockSink::write(BlockId blockId, ByteSpan data) {
    const auto path = pathFor(blockId);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IOError("Failed to open output file", ErrorContext(path.string()).withBlock(blockId));
    }

    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        throw IOError("Failed to write output file",
                      ErrorContext(path.string()).withBlock(blockId));
    }

    LINKX_LOG_TRACE("Block {} written to {} ({} bytes)", blockId, path.string(), data.size());
}

}  // namespace linkx::io
