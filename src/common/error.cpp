// =============================================================================
// linkx - Error Handling Framework Implementation
// =============================================================================

#include "linkx/common/error.h"

#include <format>

namespace linkx {

std::string ErrorContext::format() const {
    std::string text;
    if (!filePath.empty()) {
        text = std::format("file: {}", filePath);
    }
    if (blockId) {
        text += std::format("{}block: {}", text.empty() ? "" : ", ", *blockId);
    }

#ifndef NDEBUG
    if (!text.empty()) {
        text += std::format(" (at {}:{})", location.file_name(), location.line());
    }
#endif

    return text;
}

void LinkxException::formatWhat() {
    what_ = std::format("[{}] {}", errorCodeToString(code_), message_);
    if (context_) {
        if (auto contextText = context_->format(); !contextText.empty()) {
            what_ += std::format(" ({})", contextText);
        }
    }
}

std::string IOError::withSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (errno {})", message, ec.message(), ec.value());
}

}  // namespace linkx
