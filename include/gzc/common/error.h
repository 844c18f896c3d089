// =============================================================================
// gzchunk - Error Handling Framework
// =============================================================================
// Error handling for the gzchunk library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - GZCException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (read/write failure)
// - 3: Format error (wrong file extension)
// - 4: Codec error (malformed or truncated compressed data)
// - 5: Invalid argument (blank path, bad configuration)
// - 6: File not found
// - 7: Invalid state
// =============================================================================

#ifndef GZC_COMMON_ERROR_H
#define GZC_COMMON_ERROR_H

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

namespace gzc {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage error (invalid command line).
    kUsageError = 1,

    /// @brief I/O error.
    /// @note Read/write failure, permission denied, disk full, etc.
    kIOError = 2,

    /// @brief Source file does not carry the expected extension.
    kFormatError = 3,

    /// @brief Malformed, truncated or oversized compressed data.
    kCodecError = 4,

    /// @brief Invalid argument value (blank path, bad configuration).
    kInvalidArgument = 5,

    /// @brief Source file does not exist.
    kFileNotFound = 6,

    /// @brief Invalid state for operation.
    kInvalidState = 7
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
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kCodecError:
            return "codec error";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Provides detailed information about where and why an error occurred.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Chunk sequence number where the error occurred (if applicable).
    std::optional<std::int64_t> sequence;

    /// @brief Byte offset in file where error occurred (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the file path.
    /// @return Reference to this for method chaining.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the chunk sequence number.
    /// @return Reference to this for method chaining.
    ErrorContext& withSequence(std::int64_t seq) {
        sequence = seq;
        return *this;
    }

    /// @brief Set the byte offset.
    /// @return Reference to this for method chaining.
    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all gzchunk errors.
/// @note Provides error code, message, and optional context.
class GZCException : public std::exception {
public:
    /// @brief Construct with error code and message.
    GZCException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    GZCException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~GZCException() override = default;

    GZCException(const GZCException&) = default;
    GZCException(GZCException&&) noexcept = default;
    GZCException& operator=(const GZCException&) = default;
    GZCException& operator=(GZCException&&) noexcept = default;

    /// @brief Get the formatted error message (code, message and context).
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
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

/// @brief Exception for command-line usage errors (exit code 1).
class UsageError : public GZCException {
public:
    explicit UsageError(std::string message)
        : GZCException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : GZCException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for read/write failures, permission denied, disk full, etc.
class IOError : public GZCException {
public:
    explicit IOError(std::string message)
        : GZCException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : GZCException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : GZCException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : GZCException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                       std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for a source file with the wrong extension (exit code 3).
class FormatError : public GZCException {
public:
    explicit FormatError(std::string message)
        : GZCException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : GZCException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for malformed or truncated compressed data (exit code 4).
/// @note Covers invalid frame headers, truncated frames and zlib failures.
class CodecError : public GZCException {
public:
    explicit CodecError(std::string message)
        : GZCException(ErrorCode::kCodecError, std::move(message)) {}

    CodecError(std::string message, ErrorContext context)
        : GZCException(ErrorCode::kCodecError, std::move(message), std::move(context)) {}
};

/// @brief Exception for invalid argument values (exit code 5).
class ArgumentError : public GZCException {
public:
    explicit ArgumentError(std::string message)
        : GZCException(ErrorCode::kInvalidArgument, std::move(message)) {}

    ArgumentError(std::string message, ErrorContext context)
        : GZCException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

/// @brief Exception for a missing source file (exit code 6).
class FileNotFoundError : public GZCException {
public:
    explicit FileNotFoundError(std::string message)
        : GZCException(ErrorCode::kFileNotFound, std::move(message)) {}

    FileNotFoundError(std::string message, ErrorContext context)
        : GZCException(ErrorCode::kFileNotFound, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
/// @note Lightweight error type for use with std::expected.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a GZCException, keeping its context in the message.
    explicit Error(const GZCException& ex);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const GZCException& ex) {
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
/// @throws GZCException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
/// @note Non-gzchunk exceptions are reported as I/O errors.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const GZCException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace gzc

#endif  // GZC_COMMON_ERROR_H
