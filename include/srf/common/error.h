// =============================================================================
// srf - Error Handling Framework
// =============================================================================
// Error handling for the srf record library.
//
// This module provides:
// - ErrorCode enum covering every failure the record codec can report
// - SRFException hierarchy for callers that prefer exceptions
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Core codec operations never throw on stream or format errors; they return a
// Result. unwrapOrThrow() converts a failed Result into the matching exception.
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef SRF_COMMON_ERROR_H
#define SRF_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace srf {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes reported by the record codec.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Clean end of input at a record boundary.
    /// @note The only condition positional operations may treat as a terminator.
    kEndOfStream = 1,

    /// @brief Record header magic does not match "SRF0".
    kInvalidHeader = 2,

    /// @brief Reserved header bits are not zero.
    /// @note Signals format-version skew or corruption.
    kInvalidReservedBits = 3,

    /// @brief Fewer bytes available than a declared length requires.
    kTruncated = 4,

    /// @brief Underlying stream reported a hard read/write failure.
    kIOError = 5,

    /// @brief Negative start offset passed to a positional operation.
    kInvalidStartOffset = 6,

    /// @brief Record count below 1 passed to a positional operation.
    kInvalidCount = 7,

    /// @brief Compression engine rejected a malformed frame.
    kCorruptFrame = 8,

    /// @brief Compression engine failed to produce a frame.
    kCompressionFailed = 9,

    /// @brief Invalid argument or configuration value.
    kInvalidArgument = 10,

    /// @brief Metadata or body is not valid JSON.
    kJsonError = 11
};

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kEndOfStream:
            return "end of stream";
        case ErrorCode::kInvalidHeader:
            return "invalid header";
        case ErrorCode::kInvalidReservedBits:
            return "invalid reserved bits";
        case ErrorCode::kTruncated:
            return "truncated";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kInvalidStartOffset:
            return "invalid start offset";
        case ErrorCode::kInvalidCount:
            return "invalid count";
        case ErrorCode::kCorruptFrame:
            return "corrupt frame";
        case ErrorCode::kCompressionFailed:
            return "compression failed";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kJsonError:
            return "JSON error";
    }
    return "unknown error";
}

/// @brief Check if an error code marks a clean end of input.
[[nodiscard]] constexpr bool isEndOfStream(ErrorCode code) noexcept {
    return code == ErrorCode::kEndOfStream;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief Zero-based index of the record being processed (if applicable).
    std::optional<std::uint64_t> recordIndex;

    /// @brief Byte offset in the stream (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Set the record index.
    /// @return Reference to this for method chaining.
    ErrorContext& withRecord(std::uint64_t index) {
        recordIndex = index;
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

/// @brief Base exception class for all srf errors.
class SRFException : public std::exception {
public:
    SRFException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    SRFException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~SRFException() override = default;

    SRFException(const SRFException&) = default;
    SRFException(SRFException&&) noexcept = default;
    SRFException& operator=(const SRFException&) = default;
    SRFException& operator=(SRFException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

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

/// @brief Clean end of input reached where a record was expected.
class EndOfStreamError : public SRFException {
public:
    explicit EndOfStreamError(std::string message)
        : SRFException(ErrorCode::kEndOfStream, std::move(message)) {}

    EndOfStreamError(std::string message, ErrorContext context)
        : SRFException(ErrorCode::kEndOfStream, std::move(message), std::move(context)) {}
};

/// @brief Malformed record on the wire.
/// @note Covers kInvalidHeader, kInvalidReservedBits and kTruncated.
class FormatError : public SRFException {
public:
    explicit FormatError(std::string message)
        : SRFException(ErrorCode::kInvalidHeader, std::move(message)) {}

    FormatError(ErrorCode code, std::string message)
        : SRFException(code, std::move(message)) {}

    FormatError(ErrorCode code, std::string message, ErrorContext context)
        : SRFException(code, std::move(message), std::move(context)) {}
};

/// @brief Exception for stream I/O failures.
class IOError : public SRFException {
public:
    explicit IOError(std::string message)
        : SRFException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : SRFException(ErrorCode::kIOError, std::move(message), std::move(context)) {}
};

/// @brief Caller misuse: bad window or configuration values.
/// @note Covers kInvalidStartOffset, kInvalidCount and kInvalidArgument.
class UsageError : public SRFException {
public:
    explicit UsageError(std::string message)
        : SRFException(ErrorCode::kInvalidArgument, std::move(message)) {}

    UsageError(ErrorCode code, std::string message)
        : SRFException(code, std::move(message)) {}
};

/// @brief Compression engine failure.
/// @note Covers kCorruptFrame and kCompressionFailed.
class CompressionError : public SRFException {
public:
    CompressionError(ErrorCode code, std::string message)
        : SRFException(code, std::move(message)) {}
};

/// @brief Metadata or body could not be encoded to or decoded from JSON.
class JsonError : public SRFException {
public:
    explicit JsonError(std::string message)
        : SRFException(ErrorCode::kJsonError, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from an SRFException.
    explicit Error(const SRFException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Check if this error is a clean end of input.
    [[nodiscard]] bool isEndOfStream() const noexcept { return srf::isEndOfStream(code_); }

    /// @brief Throw the exception class matching the error code.
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

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
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
/// @throws SRFException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Void version of unwrapOrThrow().
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Try to execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<
    std::conditional_t<std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const SRFException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace srf

#endif  // SRF_COMMON_ERROR_H
