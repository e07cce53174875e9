// =============================================================================
// linkx - Index File Reader Implementation
// =============================================================================

#include "linkx/format/index_reader.h"

#include <fstream>
#include <system_error>

#include "linkx/common/error.h"
#include "linkx/common/logger.h"

namespace linkx::format {

IndexReadResult readIndex(ByteSpan bytes) {
    IndexReadResult result;
    result.totalSize = bytes.size();
    result.records.reserve(bytes.size() / IndexRecord::kSize);

    std::size_t position = 0;
    while (bytes.size() - position >= IndexRecord::kSize) {
        result.records.push_back(IndexRecord::parse(bytes.data() + position));
        position += IndexRecord::kSize;
    }

    result.trailingBytes = bytes.size() - position;
    if (result.truncated()) {
        LINKX_LOG_WARNING(
            "Truncated index entry at position {} ({} of {} bytes present), keeping {} records",
            position, result.trailingBytes, IndexRecord::kSize, result.records.size());
    }

    return result;
}

IndexReadResult readIndexFile(const std::filesystem::path& path) {
    std::error_code ec;
    auto fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        throw IOError("Failed to stat index file", ec, ErrorContext(path.string()));
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw IOError("Failed to open index file", ErrorContext(path.string()));
    }

    ByteBuffer bytes(static_cast<std::size_t>(fileSize));
    if (!bytes.empty()) {
        stream.read(reinterpret_cast<char*>(bytes.data()),
                    static_cast<std::streamsize>(bytes.size()));
        if (static_cast<std::uint64_t>(stream.gcount()) != fileSize) {
            throw IOError("Failed to read index file", ErrorContext(path.string()));
        }
    }

    auto result = readIndex(bytes);
    LINKX_LOG_DEBUG("Index {}: {} bytes, {} records", path.string(), result.totalSize,
                    result.records.size());
    return result;
}

}  // namespace linkx::format
