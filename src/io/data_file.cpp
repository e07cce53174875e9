// =============================================================================
// linkx - Data File Access Implementation
// =============================================================================

#include "linkx/io/data_file.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <limits>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "linkx/common/logger.h"

namespace linkx::io {

DataFile::DataFile(std::filesystem::path path) : path_(std::move(path)) {}

DataFile::~DataFile() {
    close();
}

DataFile::DataFile(DataFile&& other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_), size_(other.size_) {
    other.fd_ = -1;
    other.size_ = 0;
}

DataFile& DataFile::operator=(DataFile&& other) noexcept {
    if (this != &other) {
        close();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        size_ = other.size_;
        other.fd_ = -1;
        other.size_ = 0;
    }
    return *this;
}

void DataFile::open() {
    if (isOpen()) {
        return;
    }

    int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        std::error_code ec(errno, std::generic_category());
        throw IOError("Failed to open data file", ec, ErrorContext(path_.string()));
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        std::error_code ec(errno, std::generic_category());
        ::close(fd);
        throw IOError("Failed to stat data file", ec, ErrorContext(path_.string()));
    }

    fd_ = fd;
    size_ = static_cast<std::uint64_t>(st.st_size);

    LINKX_LOG_DEBUG("Data file opened: {}, {} bytes", path_.string(), size_);
}

void DataFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<ByteBuffer> DataFile::readAt(std::uint64_t offset, std::uint64_t length) const {
    if (!isOpen()) {
        return makeError<ByteBuffer>(ErrorCode::kIOError,
                                     fmt::format("Data file is not open: {}", path_.string()));
    }
    if (length > static_cast<std::uint64_t>(std::numeric_limits<off_t>::max()) ||
        offset > static_cast<std::uint64_t>(std::numeric_limits<off_t>::max())) {
        return makeError<ByteBuffer>(ErrorCode::kIOError,
                                     fmt::format("Read of {} bytes at {} is out of range",
                                                 length, offset));
    }

    ByteBuffer buffer(static_cast<std::size_t>(length));
    std::size_t done = 0;

    while (done < buffer.size()) {
        ssize_t n = ::pread(fd_, buffer.data() + done, buffer.size() - done,
                            static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return makeError<ByteBuffer>(
                ErrorCode::kIOError,
                fmt::format("Failed to read {} bytes at offset {}: {}", length, offset,
                            std::error_code(errno, std::generic_category()).message()));
        }
        if (n == 0) {
            return makeError<ByteBuffer>(
                ErrorCode::kIOError,
                fmt::format("Unexpected end of file after {} of {} bytes at offset {}", done,
                            length, offset));
        }
        done += static_cast<std::size_t>(n);
    }

    return buffer;
}

}  // namespace linkx::io
