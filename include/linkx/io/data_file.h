// =============================================================================
// linkx - Data File Access
// =============================================================================
// Read-only, positional access to the container's data file.
//
// Reads go through pread(2) so concurrent extractor workers can fetch their
// own block ranges from one shared DataFile without a shared file cursor.
//
// Usage:
//   DataFile data("LinkData.bin");
//   data.open();
//   auto bytes = data.readAt(record.offset, record.compressedSize);
// =============================================================================

#ifndef LINKX_IO_DATA_FILE_H
#define LINKX_IO_DATA_FILE_H

#include <cstdint>
#include <filesystem>

#include "linkx/common/error.h"
#include "linkx/common/types.h"

namespace linkx::io {

/// @brief Read-only random access file.
///
/// Thread Safety:
/// - readAt() may be called concurrently once open() has returned
/// - open() and close() must not race with readers
class DataFile {
public:
    explicit DataFile(std::filesystem::path path);

    ~DataFile();

    // Non-copyable, movable
    DataFile(const DataFile&) = delete;
    DataFile& operator=(const DataFile&) = delete;
    DataFile(DataFile&& other) noexcept;
    DataFile& operator=(DataFile&& other) noexcept;

    /// @brief Open the file and record its size.
    /// @throws IOError if the file cannot be opened or stat'ed.
    void open();

    /// @brief Close the file.
    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief Total file size in bytes, captured at open().
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }

    /// @brief Read exactly length bytes starting at offset.
    /// @return The bytes, or kIOError on a short or failed read.
    [[nodiscard]] Result<ByteBuffer> readAt(std::uint64_t offset, std::uint64_t length) const;

private:
    std::filesystem::path path_;
    int fd_ = -1;
    std::uint64_t size_ = 0;
};

}  // namespace linkx::io

#endif  // LINKX_IO_DATA_FILE_H
