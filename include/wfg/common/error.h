// =============================================================================
// wfgen - Error Handling Framework
// =============================================================================
// Error handling for the wfgen library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - WfgException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure, decoder spawn failure)
// - 3: Format error (malformed PNG, compressor failure)
// - 4: Checksum verification failure
// - 5: Object storage failure
// - 6: Subject record persistence failure
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef WFG_COMMON_ERROR_H
#define WFG_COMMON_ERROR_H

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

namespace wfg {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    /// @note Invalid command-line arguments, missing required options, etc.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, process spawn failure, etc.
    kIOError = 2,

    /// @brief Format error.
    /// @note Malformed PNG stream, unsupported header, compressor failure.
    kFormatError = 3,

    /// @brief Checksum verification failure.
    /// @note Chunk CRC-32 mismatch.
    kChecksumError = 4,

    /// @brief Object storage failure (download or upload).
    kStorageError = 5,

    /// @brief Subject record update failure.
    kPersistenceError = 6,

    /// @brief Invalid argument value.
    kInvalidArgument = 7,

    /// @brief File not found.
    kFileNotFound = 8,

    /// @brief Storage backend is not configured.
    kNotConfigured = 9
};

/// @brief Convert ErrorCode to its integer exit code value.
/// @param code The error code.
/// @return Integer exit code suitable for process exit.
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
        case ErrorCode::kChecksumError:
            return "checksum error";
        case ErrorCode::kStorageError:
            return "storage error";
        case ErrorCode::kPersistenceError:
            return "persistence error";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kNotConfigured:
            return "not configured";
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

    /// @brief Object storage key associated with the error (if applicable).
    std::string storageKey;

    /// @brief Subject record the job was working for (if applicable).
    std::optional<std::int64_t> subjectId;

    /// @brief Byte offset in the stream where the error occurred (if applicable).
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

    /// @brief Set the storage key.
    /// @return Reference to this for method chaining.
    ErrorContext& withKey(std::string key) {
        storageKey = std::move(key);
        return *this;
    }

    /// @brief Set the subject ID.
    /// @return Reference to this for method chaining.
    ErrorContext& withSubject(std::int64_t id) {
        subjectId = id;
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

/// @brief Base exception class for all wfgen errors.
/// @note Provides error code, message, and optional context.
class WfgException : public std::exception {
public:
    /// @brief Construct with error code and message.
    WfgException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    WfgException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~WfgException() override = default;

    WfgException(const WfgException&) = default;
    WfgException(WfgException&&) noexcept = default;
    WfgException& operator=(const WfgException&) = default;
    WfgException& operator=(WfgException&&) noexcept = default;

    /// @brief Get the formatted error message.
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

/// @brief Exception for usage and argument errors (exit code 1).
/// @note Thrown for invalid command-line arguments and violated preconditions
///       such as a non-positive sample count.
class UsageError : public WfgException {
public:
    explicit UsageError(std::string message)
        : WfgException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : WfgException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
class IOError : public WfgException {
public:
    explicit IOError(std::string message)
        : WfgException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : WfgException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : WfgException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : WfgException(ErrorCode::kIOError, formatWithSystemError(message, ec),
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

/// @brief Exception for format errors (exit code 3).
/// @note Thrown for malformed PNG streams and compressor failures.
class FormatError : public WfgException {
public:
    explicit FormatError(std::string message)
        : WfgException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : WfgException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for checksum verification failures (exit code 4).
class ChecksumError : public WfgException {
public:
    explicit ChecksumError(std::string message)
        : WfgException(ErrorCode::kChecksumError, std::move(message)) {}

    ChecksumError(std::string message, ErrorContext context)
        : WfgException(ErrorCode::kChecksumError, std::move(message), std::move(context)) {}

    /// @brief Construct with expected and actual CRC-32 values.
    ChecksumError(std::uint32_t expected, std::uint32_t actual, ErrorContext context)
        : WfgException(ErrorCode::kChecksumError,
                       formatChecksumMismatch(expected, actual),
                       std::move(context)),
          expected_(expected),
          actual_(actual) {}

    /// @brief Get the expected checksum value (if available).
    [[nodiscard]] std::optional<std::uint32_t> expected() const noexcept { return expected_; }

    /// @brief Get the actual checksum value (if available).
    [[nodiscard]] std::optional<std::uint32_t> actual() const noexcept { return actual_; }

private:
    static std::string formatChecksumMismatch(std::uint32_t expected, std::uint32_t actual);

    std::optional<std::uint32_t> expected_;
    std::optional<std::uint32_t> actual_;
};

/// @brief Exception for object storage failures (exit code 5).
class StorageError : public WfgException {
public:
    explicit StorageError(std::string message)
        : WfgException(ErrorCode::kStorageError, std::move(message)) {}

    StorageError(std::string message, ErrorContext context)
        : WfgException(ErrorCode::kStorageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for subject record update failures (exit code 6).
class PersistenceError : public WfgException {
public:
    explicit PersistenceError(std::string message)
        : WfgException(ErrorCode::kPersistenceError, std::move(message)) {}

    PersistenceError(std::string message, ErrorContext context)
        : WfgException(ErrorCode::kPersistenceError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a WfgException.
    explicit Error(const WfgException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Convert to the appropriate exception type.
    [[nodiscard]] WfgException toException() const;

    /// @brief Throw the appropriate exception.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create a success result.
template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const WfgException& ex) {
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
/// @throws WfgException (or derived) if the result contains an error.
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
/// @param fallbackCode Code used for non-wfgen exceptions.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func, ErrorCode fallbackCode = ErrorCode::kIOError)
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
    } catch (const WfgException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{fallbackCode, ex.what()});
    }
}

}  // namespace wfg

#endif  // WFG_COMMON_ERROR_H
