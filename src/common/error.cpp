// =============================================================================
// cidc-upload - Error Handling Framework Implementation
// =============================================================================

#include "cidc/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace cidc {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto separate = [&]() {
        if (hasContent) {
            oss << ", ";
        }
        hasContent = true;
    };

    if (!filePath.empty()) {
        separate();
        oss << "file: " << filePath;
    }

    if (lineNumber.has_value()) {
        separate();
        oss << "line: " << *lineNumber;
    }

    if (!sampleId.empty()) {
        separate();
        oss << "sample: " << sampleId;
    }

    if (httpStatus.has_value()) {
        separate();
        oss << "http status: " << *httpStatus;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// CidcException Implementation
// =============================================================================

void CidcException::formatWhat() {
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
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string TransportError::formatUnexpectedStatus(unsigned expected, unsigned actual,
                                                   const std::string& target) {
    return fmt::format("{} returned HTTP {} (expected {})", target, actual, expected);
}

// =============================================================================
// Error Implementation
// =============================================================================

CidcException Error::toException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            return UsageError(message_);
        case ErrorCode::kIOError:
            return IOError(message_);
        case ErrorCode::kManifestFormat:
            return ManifestFormatError(message_);
        case ErrorCode::kRecordShape:
            return RecordShapeError(message_);
        case ErrorCode::kSampleId:
            return SampleIdError(message_);
        case ErrorCode::kFileNotFound:
            return FileNotFoundError(message_);
        case ErrorCode::kTransferFailed:
            return TransferError(message_);
        case ErrorCode::kStatusUpdateFailed:
            return StatusUpdateError(message_);
        case ErrorCode::kTransportError:
            return TransportError(message_);
        case ErrorCode::kJobAborted:
            return JobAbortedError(message_);
        case ErrorCode::kAuthError:
            return AuthError(message_);
        default:
            break;
    }
    return CidcException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kManifestFormat:
            throw ManifestFormatError(message_);
        case ErrorCode::kRecordShape:
            throw RecordShapeError(message_);
        case ErrorCode::kSampleId:
            throw SampleIdError(message_);
        case ErrorCode::kFileNotFound:
            throw FileNotFoundError(message_);
        case ErrorCode::kTransferFailed:
            throw TransferError(message_);
        case ErrorCode::kStatusUpdateFailed:
            throw StatusUpdateError(message_);
        case ErrorCode::kTransportError:
            throw TransportError(message_);
        case ErrorCode::kJobAborted:
            throw JobAbortedError(message_);
        case ErrorCode::kAuthError:
            throw AuthError(message_);
        default:
            break;
    }
    throw CidcException(code_, message_);
}

}  // namespace cidc
