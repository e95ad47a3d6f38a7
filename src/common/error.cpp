// =============================================================================
// wfgen - Error Handling Framework Implementation
// =============================================================================

#include "wfg/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace wfg {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (!storageKey.empty()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "key: " << storageKey;
        hasContent = true;
    }

    if (subjectId.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "subject: " << *subjectId;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: 0x" << std::hex << *byteOffset;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// WfgException Implementation
// =============================================================================

void WfgException::formatWhat() {
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

// =============================================================================
// IOError / ChecksumError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string ChecksumError::formatChecksumMismatch(std::uint32_t expected, std::uint32_t actual) {
    return fmt::format("CRC-32 mismatch: expected 0x{:08x}, got 0x{:08x}", expected, actual);
}

// =============================================================================
// Error Implementation
// =============================================================================

WfgException Error::toException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            return UsageError(message_);
        case ErrorCode::kIOError:
            return IOError(message_);
        case ErrorCode::kFormatError:
            return FormatError(message_);
        case ErrorCode::kChecksumError:
            return ChecksumError(message_);
        case ErrorCode::kStorageError:
            return StorageError(message_);
        case ErrorCode::kPersistenceError:
            return PersistenceError(message_);
        default:
            break;
    }
    return WfgException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kChecksumError:
            throw ChecksumError(message_);
        case ErrorCode::kStorageError:
            throw StorageError(message_);
        case ErrorCode::kPersistenceError:
            throw PersistenceError(message_);
        default:
            break;
    }
    throw WfgException(code_, message_);
}

}  // namespace wfg
