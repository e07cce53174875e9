// =============================================================================
// linkx - Index File Reader
// =============================================================================
// Parses the index file into an ordered sequence of IndexRecords.
//
// A short final record is recoverable: reading stops, every complete record
// is kept and the result is flagged as truncated. Only failing to open or
// read the file itself is fatal.
//
// Usage:
//   auto index = linkx::format::readIndexFile("LinkInfo.bin");
//   for (const auto& record : index.records) { ... }
// =============================================================================

#ifndef LINKX_FORMAT_INDEX_READER_H
#define LINKX_FORMAT_INDEX_READER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "linkx/common/types.h"
#include "linkx/format/link_format.h"

namespace linkx::format {

/// @brief Outcome of parsing an index file.
struct IndexReadResult {
    /// @brief Complete records in file order.
    std::vector<IndexRecord> records;

    /// @brief Total size of the index input in bytes.
    std::uint64_t totalSize = 0;

    /// @brief Number of bytes left over after the last complete record.
    std::size_t trailingBytes = 0;

    /// @brief True when the input ended mid-record.
    [[nodiscard]] bool truncated() const noexcept { return trailingBytes != 0; }
};

/// @brief Parse index records from an in-memory buffer.
/// @note Emits a warning when the buffer ends mid-record.
[[nodiscard]] IndexReadResult readIndex(ByteSpan bytes);

/// @brief Load and parse an index file.
/// @throws IOError if the file cannot be opened or read.
[[nodiscard]] IndexReadResult readIndexFile(const std::filesystem::path& path);

}  // namespace linkx::format

#endif  // LINKX_FORMAT_INDEX_READER_H
