// =============================================================================
// ziso - Error Handling Framework Implementation
// =============================================================================

#include "ziso/common/error.h"

#include <format>
#include <sstream>

namespace ziso {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    // "<file>, block <n>, offset 0x<hex>" with absent parts skipped
    std::ostringstream oss;
    const char* separator = "";
    const auto part = [&]() -> std::ostringstream& {
        oss << separator;
        separator = ", ";
        return oss;
    };

    if (!filePath.empty()) {
        part() << filePath;
    }
    if (blockId) {
        part() << "block " << *blockId;
    }
    if (byteOffset) {
        part() << "offset 0x" << std::hex << *byteOffset << std::dec;
    }

#ifndef NDEBUG
    if (*separator != '\0') {
        oss << " [" << location.file_name() << ":" << location.line() << "]";
    }
#endif

    return oss.str();
}

// =============================================================================
// ZisoException Implementation
// =============================================================================

void ZisoException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string ChecksumError::formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual) {
    return std::format("digest mismatch: expected 0x{:016x}, got 0x{:016x}", expected, actual);
}

}  // namespace ziso
