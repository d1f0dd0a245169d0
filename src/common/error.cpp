// =============================================================================
// srf - Error Handling Framework Implementation
// =============================================================================

#include "srf/common/error.h"

#include <sstream>

namespace srf {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (recordIndex.has_value()) {
        oss << "record: " << *recordIndex;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: 0x" << std::hex << *byteOffset;
    }

    return oss.str();
}

// =============================================================================
// SRFException Implementation
// =============================================================================

void SRFException::formatWhat() {
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
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kEndOfStream:
            throw EndOfStreamError(message_);
        case ErrorCode::kInvalidHeader:
        case ErrorCode::kInvalidReservedBits:
        case ErrorCode::kTruncated:
            throw FormatError(code_, message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kInvalidStartOffset:
        case ErrorCode::kInvalidCount:
        case ErrorCode::kInvalidArgument:
            throw UsageError(code_, message_);
        case ErrorCode::kCorruptFrame:
        case ErrorCode::kCompressionFailed:
            throw CompressionError(code_, message_);
        case ErrorCode::kJsonError:
            throw JsonError(message_);
        case ErrorCode::kSuccess:
            // Should not happen, but throw base exception
            throw SRFException(ErrorCode::kSuccess, message_);
    }
    throw SRFException(code_, message_);
}

}  // namespace srf
