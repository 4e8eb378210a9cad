// =============================================================================
// cidc-upload - Error Handling Framework
// =============================================================================
// Error handling for the cidc-upload library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - CidcException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Pipeline stages return Result values; only the command layer turns an
// Error into user-facing text and an exit code.
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error
// - 3..7: Manifest and batch validation failures
// - 8..12: Transfer, backend and job tracking failures
// - 13: Authentication error
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef CIDC_COMMON_ERROR_H
#define CIDC_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace cidc {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error (unreadable manifest, session file, etc.).
    kIOError = 2,

    /// @brief Manifest header could not be split into the expected columns.
    kManifestFormat = 3,

    /// @brief A manifest data row has a different column count than the header.
    kRecordShape = 4,

    /// @brief One or more sample ids are not part of the selected trial.
    kSampleId = 5,

    /// @brief One or more referenced files could not be found.
    kFileNotFound = 6,

    /// @brief A referenced file has an unrecognized extension.
    kUnsupportedFormat = 7,

    /// @brief The bulk transfer tool failed.
    kTransferFailed = 8,

    /// @brief The backend rejected a status update.
    kStatusUpdateFailed = 9,

    /// @brief Transport-level or unexpected HTTP response.
    kTransportError = 10,

    /// @brief The backend reported the job as aborted.
    kJobAborted = 11,

    /// @brief Polling ran out of iterations before a terminal state.
    kJobTimedOut = 12,

    /// @brief Missing or expired session.
    kAuthError = 13,

    /// @brief Invalid argument value.
    kInvalidArgument = 14,

    /// @brief Invalid state for operation.
    kInvalidState = 15
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kManifestFormat:
            return "manifest format error";
        case ErrorCode::kRecordShape:
            return "record shape error";
        case ErrorCode::kSampleId:
            return "sample id error";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kUnsupportedFormat:
            return "unsupported format";
        case ErrorCode::kTransferFailed:
            return "transfer failed";
        case ErrorCode::kStatusUpdateFailed:
            return "status update failed";
        case ErrorCode::kTransportError:
            return "transport error";
        case ErrorCode::kJobAborted:
            return "job aborted";
        case ErrorCode::kJobTimedOut:
            return "job timed out";
        case ErrorCode::kAuthError:
            return "authentication error";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Manifest line where the error occurred (1-based, if applicable).
    std::optional<std::uint64_t> lineNumber;

    /// @brief Sample id involved in the error (if applicable).
    std::string sampleId;

    /// @brief HTTP status associated with the error (if applicable).
    std::optional<unsigned> httpStatus;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    ErrorContext& withSample(std::string id) {
        sampleId = std::move(id);
        return *this;
    }

    ErrorContext& withHttpStatus(unsigned status) {
        httpStatus = status;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all cidc-upload errors.
/// @note Provides error code, message, and optional context.
class CidcException : public std::exception {
public:
    CidcException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    CidcException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~CidcException() override = default;

    CidcException(const CidcException&) = default;
    CidcException(CidcException&&) noexcept = default;
    CidcException& operator=(const CidcException&) = default;
    CidcException& operator=(CidcException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for invalid command-line arguments or option values (exit code 1).
class UsageError : public CidcException {
public:
    /// @brief Construct with message.
    /// @param message Descriptive error message.
    explicit UsageError(std::string message)
        : CidcException(ErrorCode::kUsageError, std::move(message)) {}

    /// @brief Construct with message and context.
    /// @param message Descriptive error message.
    /// @param context Additional error context.
    UsageError(std::string message, ErrorContext context)
        : CidcException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for a manifest header that cannot be split into the expected columns.
class ManifestFormatError : public CidcException {
public:
    /// @brief Construct with message.
    /// @param message Descriptive error message.
    explicit ManifestFormatError(std::string message)
        : CidcException(ErrorCode::kManifestFormat, std::move(message)) {}

    /// @brief Construct with message and context.
    /// @param message Descriptive error message.
    /// @param context Additional error context.
    ManifestFormatError(std::string message, ErrorContext context)
        : CidcException(ErrorCode::kManifestFormat, std::move(message), std::move(context)) {}
};

/// @brief Exception for a manifest row whose length does not match the header.
class RecordShapeError : public CidcException {
public:
    explicit RecordShapeError(std::string message)
        : CidcException(ErrorCode::kRecordShape, std::move(message)) {}

    RecordShapeError(std::string message, ErrorContext context)
        : CidcException(ErrorCode::kRecordShape, std::move(message), std::move(context)) {}
};

/// @brief Exception for sample ids not registered for the selected trial.
class SampleIdError : public CidcException {
public:
    explicit SampleIdError(std::string message)
        : CidcException(ErrorCode::kSampleId, std::move(message)) {}

    SampleIdError(std::string message, ErrorContext context)
        : CidcException(ErrorCode::kSampleId, std::move(message), std::move(context)) {}
};

/// @brief Exception for a referenced upload file that does not exist.
class FileNotFoundError : public CidcException {
public:
    /// @brief Construct with message.
    /// @param message Descriptive error message.
    explicit FileNotFoundError(std::string message)
        : CidcException(ErrorCode::kFileNotFound, std::move(message)) {}

    /// @brief Construct with message and context.
    /// @param message Descriptive error message.
    /// @param context Additional error context.
    FileNotFoundError(std::string message, ErrorContext context)
        : CidcException(ErrorCode::kFileNotFound, std::move(message), std::move(context)) {}
};

/// @brief Exception for a failed bulk transfer.
class TransferError : public CidcException {
public:
    explicit TransferError(std::string message)
        : CidcException(ErrorCode::kTransferFailed, std::move(message)) {}

    TransferError(std::string message, ErrorContext context)
        : CidcException(ErrorCode::kTransferFailed, std::move(message), std::move(context)) {}
};

/// @brief Exception for a status patch the backend rejected.
class StatusUpdateError : public CidcException {
public:
    explicit StatusUpdateError(std::string message)
        : CidcException(ErrorCode::kStatusUpdateFailed, std::move(message)) {}

    StatusUpdateError(std::string message, ErrorContext context)
        : CidcException(ErrorCode::kStatusUpdateFailed, std::move(message), std::move(context)) {}
};

/// @brief Exception for a job the backend reported as aborted.
class JobAbortedError : public CidcException {
public:
    explicit JobAbortedError(std::string message)
        : CidcException(ErrorCode::kJobAborted, std::move(message)) {}

    JobAbortedError(std::string message, ErrorContext context)
        : CidcException(ErrorCode::kJobAborted, std::move(message), std::move(context)) {}
};

/// @brief Exception for missing or expired credentials.
class AuthError : public CidcException {
public:
    explicit AuthError(std::string message)
        : CidcException(ErrorCode::kAuthError, std::move(message)) {}

    AuthError(std::string message, ErrorContext context)
        : CidcException(ErrorCode::kAuthError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
class IOError : public CidcException {
public:
    explicit IOError(std::string message)
        : CidcException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : CidcException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : CidcException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for transport failures and unexpected HTTP responses.
class TransportError : public CidcException {
public:
    explicit TransportError(std::string message)
        : CidcException(ErrorCode::kTransportError, std::move(message)) {}

    TransportError(std::string message, ErrorContext context)
        : CidcException(ErrorCode::kTransportError, std::move(message), std::move(context)) {}

    /// @brief Construct from an unexpected HTTP status.
    TransportError(unsigned expected, unsigned actual, std::string target)
        : CidcException(ErrorCode::kTransportError,
                        formatUnexpectedStatus(expected, actual, target),
                        ErrorContext{}.withHttpStatus(actual)),
          status_(actual) {}

    /// @brief HTTP status that caused the failure (if any).
    [[nodiscard]] std::optional<unsigned> status() const noexcept { return status_; }

private:
    static std::string formatUnexpectedStatus(unsigned expected, unsigned actual,
                                              const std::string& target);

    std::optional<unsigned> status_;
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a CidcException.
    explicit Error(const CidcException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Convert to the appropriate exception type.
    [[nodiscard]] CidcException toException() const;

    /// @brief Throw the appropriate exception.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

template <typename T>
[[nodiscard]] Result<T> makeError(const CidcException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws CidcException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Try to execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<std::conditional_t<
    std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const CidcException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace cidc

#endif  // CIDC_COMMON_ERROR_H
