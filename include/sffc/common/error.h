// =============================================================================
// sff-codec - Error Handling Framework
// =============================================================================
// Structured error reporting for the SFF codec.
//
// This module provides:
// - ErrorCode enum with process-exit-code style categories
// - FormatErrorKind enum naming every structural violation the codec detects
// - SffException hierarchy carrying the kind, byte offset and read number
// - Result<T, E> type for functional error handling (using std::expected)
//
// Exit Code Convention:
// - 0: Success
// - 2: I/O error (file not found, read/write failure, unseekable source)
// - 3: Format error (structural violation in the SFF byte stream)
// - 4: Unsupported format (version, flowgram code or index flavour)
// - 5: Invalid argument (records rejected by the writer)
// - 6: Invalid state (reader used before open, writer reused)
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// =============================================================================

#ifndef SFFC_COMMON_ERROR_H
#define SFFC_COMMON_ERROR_H

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

namespace sffc {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Broad error categories, usable as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief I/O error.
    /// @note File not found, read/write failure, seek on a sequential source.
    kIOError = 2,

    /// @brief Structural violation in the SFF byte stream.
    kFormatError = 3,

    /// @brief Well-formed input using a version or variant the codec rejects.
    kUnsupportedFormat = 4,

    /// @brief Caller supplied data that cannot be encoded.
    kInvalidArgument = 5,

    /// @brief Operation not valid in the object's current state.
    kInvalidState = 6
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
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kUnsupportedFormat:
            return "unsupported format";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

// =============================================================================
// Format Error Kinds
// =============================================================================

/// @brief Every structural violation the decoders and the writer report.
enum class FormatErrorKind : std::uint8_t {
    // Global header
    kEmptyFile,
    kTooSmall,
    kBadMagic,
    kAtIndexBlock,
    kUnsupportedVersion,
    kUnsupportedFlowgramFormat,
    kInconsistentIndex,
    kMalformedHeader,

    // Read records
    kMalformedRecordHeader,
    kBadPadding,
    kPrematureEOF,

    // Index block
    kUnknownIndexFormat,
    kUnsupportedIndexVersion,
    kManifestHeaderSizeMismatch,
    kMissingNullTerminator,
    kIndexLengthMismatch,
    kNoIndexPresent,
    kNoXmlManifest,

    // Stream layout
    kIndexBeforeRecordsExhausted,
    kUnexpectedGapBeforeIndex,
    kCorruptIndexPointer,
    kConcatenatedFilesDetected,
    kTrailingPaddingLooksLikeConcatenation,
    kTrailingGarbage,

    // Writer input
    kInvalidRecord
};

/// @brief Stable name of a format error kind (e.g. "BadPadding").
[[nodiscard]] std::string_view formatErrorKindToString(FormatErrorKind kind) noexcept;

/// @brief Error category a format error kind belongs to.
/// @note Version and variant rejections map to kUnsupportedFormat, writer
///       input rejections to kInvalidArgument, everything else to kFormatError.
[[nodiscard]] constexpr ErrorCode errorCodeForKind(FormatErrorKind kind) noexcept {
    switch (kind) {
        case FormatErrorKind::kUnsupportedVersion:
        case FormatErrorKind::kUnsupportedFlowgramFormat:
        case FormatErrorKind::kUnknownIndexFormat:
        case FormatErrorKind::kUnsupportedIndexVersion:
            return ErrorCode::kUnsupportedFormat;
        case FormatErrorKind::kInvalidRecord:
            return ErrorCode::kInvalidArgument;
        default:
            return ErrorCode::kFormatError;
    }
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Where an error was detected and the values that disagreed.
struct ErrorContext {
    /// @brief File path or source label (if known).
    std::string filePath;

    /// @brief Zero-based number of the read record being processed.
    std::optional<std::uint64_t> readIndex;

    /// @brief Absolute byte offset of the offending data.
    std::optional<std::uint64_t> byteOffset;

    /// @brief Value the format required (length, offset, count).
    std::optional<std::uint64_t> expectedValue;

    /// @brief Value actually found in the stream.
    std::optional<std::uint64_t> actualValue;

    /// @brief Raw bytes observed, for magic and trailer errors.
    std::string observedBytes;

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

    ErrorContext& withRead(std::uint64_t index) {
        readIndex = index;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Record the required and the observed value.
    ErrorContext& withValues(std::uint64_t expected, std::uint64_t actual) {
        expectedValue = expected;
        actualValue = actual;
        return *this;
    }

    ErrorContext& withObserved(std::string bytes) {
        observedBytes = std::move(bytes);
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all sff-codec errors.
class SffException : public std::exception {
public:
    SffException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    SffException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~SffException() override = default;

    SffException(const SffException&) = default;
    SffException(SffException&&) noexcept = default;
    SffException& operator=(const SffException&) = default;
    SffException& operator=(SffException&&) noexcept = default;

    /// @brief Full message including category and context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Message without category prefix or context.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// @brief Byte offset from the context, if one was recorded.
    [[nodiscard]] std::optional<std::uint64_t> byteOffset() const noexcept {
        return context_.has_value() ? context_->byteOffset : std::nullopt;
    }

protected:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for I/O errors (exit code 2).
class IOError : public SffException {
public:
    explicit IOError(std::string message)
        : SffException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : SffException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : SffException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : SffException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                       std::move(context)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for structural violations in SFF data.
/// @note The category is derived from the kind, so version rejections
///       report kUnsupportedFormat and writer rejections kInvalidArgument.
class FormatError : public SffException {
public:
    FormatError(FormatErrorKind kind, std::string message)
        : SffException(errorCodeForKind(kind), std::move(message)), kind_(kind) {}

    FormatError(FormatErrorKind kind, std::string message, ErrorContext context)
        : SffException(errorCodeForKind(kind), std::move(message), std::move(context)),
          kind_(kind) {}

    /// @brief Which structural invariant was violated.
    [[nodiscard]] FormatErrorKind kind() const noexcept { return kind_; }

private:
    FormatErrorKind kind_;
};

/// @brief Exception for API misuse such as reading before open (exit code 6).
class StateError : public SffException {
public:
    explicit StateError(std::string message)
        : SffException(ErrorCode::kInvalidState, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode, kind and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from an SffException.
    explicit Error(const SffException& ex)
        : code_(ex.code()), message_(ex.message()), byteOffset_(ex.byteOffset()) {}

    /// @brief Construct from a FormatError, keeping its kind.
    explicit Error(const FormatError& ex)
        : code_(ex.code()), kind_(ex.kind()), message_(ex.message()),
          byteOffset_(ex.byteOffset()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Format error kind, when the error came from a decoder.
    [[nodiscard]] std::optional<FormatErrorKind> kind() const noexcept { return kind_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] std::optional<std::uint64_t> byteOffset() const noexcept { return byteOffset_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

private:
    ErrorCode code_;
    std::optional<FormatErrorKind> kind_;
    std::string message_;
    std::optional<std::uint64_t> byteOffset_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Run a function and convert thrown codec exceptions to a Result.
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
    } catch (const FormatError& ex) {
        return std::unexpected(Error{ex});
    } catch (const SffException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace sffc

#endif  // SFFC_COMMON_ERROR_H
