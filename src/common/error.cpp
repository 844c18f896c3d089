// =============================================================================
// gzchunk - Error Handling Framework Implementation
// =============================================================================

#include "gzc/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace gzc {

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

    if (sequence.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "chunk: " << *sequence;
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
// GZCException Implementation
// =============================================================================

void GZCException::formatWhat() {
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
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Error Implementation
// =============================================================================

Error::Error(const GZCException& ex) : code_(ex.code()), message_(ex.message()) {
    if (ex.hasContext()) {
        std::string contextStr = ex.context()->format();
        if (!contextStr.empty()) {
            message_ += fmt::format(" ({})", contextStr);
        }
    }
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kCodecError:
            throw CodecError(message_);
        case ErrorCode::kInvalidArgument:
            throw ArgumentError(message_);
        case ErrorCode::kFileNotFound:
            throw FileNotFoundError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kInvalidState:
            break;
    }
    throw GZCException(code_, message_);
}

}  // namespace gzc
