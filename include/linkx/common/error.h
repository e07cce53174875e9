// =============================================================================
// linkx - Error Handling Framework
// =============================================================================
// Error handling for the linkx library.
//
// Two channels:
// - IOError (a LinkxException) for fatal conditions: an input that cannot be
//   opened or read, an output directory or file that cannot be written
// - Result<T> (std::expected<T, Error>) for per-block failures that the
//   extractor logs before moving on to the next record
//
// Exit Code Convention:
// - 0: Success (including runs that skipped damaged blocks)
// - 1: Unexpected failure or command line error
// - 2: I/O error
//
// Per-block codes (kDecompressionFailed, kMalformedHeader and above) never
// reach the process exit code.
// =============================================================================

#ifndef LINKX_COMMON_ERROR_H
#define LINKX_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace linkx {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes. kSuccess and kIOError double as exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief I/O error.
    /// @note File not found, read/write failure, directory creation failure.
    kIOError = 2,

    /// @brief A deflate stream inside a field is corrupt.
    kDecompressionFailed = 4,

    /// @brief Block is shorter than the 128-byte sub-header.
    kMalformedHeader = 10,

    /// @brief Declared field count exceeds the non-zero size slots.
    kFieldCountOverflow = 11,

    /// @brief A field extends past the end of its block.
    kFieldOutOfBounds = 12,

    /// @brief Record range exceeds the data file.
    kInvalidRange = 13
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Short name of an error code, used in log lines.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kDecompressionFailed:
            return "decompression failed";
        case ErrorCode::kMalformedHeader:
            return "malformed header";
        case ErrorCode::kFieldCountOverflow:
            return "field count overflow";
        case ErrorCode::kFieldOutOfBounds:
            return "field out of bounds";
        case ErrorCode::kInvalidRange:
            return "invalid range";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Where a fatal error happened.
struct ErrorContext {
    /// @brief File the failing operation touched (may be empty).
    std::string filePath;

    /// @brief Block being written when the error occurred (1-based).
    std::optional<std::uint32_t> blockId;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the block ID.
    ErrorContext& withBlock(std::uint32_t id) {
        blockId = id;
        return *this;
    }

    /// @brief "file: <path>, block: <id>", plus the source location in debug builds.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Exceptions
// =============================================================================

/// @brief Base exception class for fatal linkx errors.
class LinkxException : public std::exception {
public:
    LinkxException(ErrorCode code, std::string message, std::optional<ErrorContext> context = {})
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Process exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief The error message without context.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

/// @brief Fatal I/O failure (exit code 2).
class IOError : public LinkxException {
public:
    explicit IOError(std::string message)
        : LinkxException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : LinkxException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Append the system error text to the message.
    IOError(const std::string& message, std::error_code ec)
        : LinkxException(ErrorCode::kIOError, withSystemError(message, ec)) {}

    IOError(const std::string& message, std::error_code ec, ErrorContext context)
        : LinkxException(ErrorCode::kIOError, withSystemError(message, ec), std::move(context)) {}

private:
    static std::string withSystemError(const std::string& message, std::error_code ec);
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for per-block operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

}  // namespace linkx

#endif  // LINKX_COMMON_ERROR_H
