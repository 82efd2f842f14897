// =============================================================================
// ziso - Error Handling Framework
// =============================================================================
// Error handling for the ziso library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - ZisoException hierarchy for structured error handling
// - Kind enums for the codec's format, index and transform failures
// - Result<T, E> type for functional error handling (using std::expected)
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure)
// - 3: Format error or version incompatibility
// - 4: Checksum verification failure (--verify)
// - 5: Index table error (offset overflow, out-of-range block)
// - 6: Corrupted block data
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef ZISO_COMMON_ERROR_H
#define ZISO_COMMON_ERROR_H

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

namespace ziso {

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

    /// @brief I/O error.
    /// @note File not found, read/write failure, permission denied, etc.
    kIOError = 2,

    /// @brief Format error or version incompatibility.
    /// @note Bad magic, unsupported version, invalid block size, etc.
    kFormatError = 3,

    /// @brief Round-trip digest mismatch.
    kChecksumError = 4,

    /// @brief Index table error.
    /// @note Offset not representable, block number out of range.
    kIndexError = 5,

    /// @brief Corrupted block data detected.
    kCorruptedData = 6,

    /// @brief Invalid argument value.
    kInvalidArgument = 7,

    /// @brief File not found.
    kFileNotFound = 8,

    /// @brief File already exists.
    kFileExists = 9,

    /// @brief Failed to open file.
    kFileOpenFailed = 10,

    /// @brief Seek operation failed.
    kSeekFailed = 11,

    /// @brief Invalid state for operation.
    kInvalidState = 12
};

/// @brief Convert ErrorCode to its process exit code.
/// @note Detailed codes collapse into their family: argument errors exit 1,
///       file and stream errors exit 2.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kInvalidArgument:
            return static_cast<int>(ErrorCode::kUsageError);
        case ErrorCode::kFileNotFound:
        case ErrorCode::kFileExists:
        case ErrorCode::kFileOpenFailed:
        case ErrorCode::kSeekFailed:
        case ErrorCode::kInvalidState:
            return static_cast<int>(ErrorCode::kIOError);
        default:
            return static_cast<int>(code);
    }
}

/// @brief Convert ErrorCode to string representation.
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
        case ErrorCode::kIndexError:
            return "index error";
        case ErrorCode::kCorruptedData:
            return "corrupted data";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kFileExists:
            return "file exists";
        case ErrorCode::kFileOpenFailed:
            return "file open failed";
        case ErrorCode::kSeekFailed:
            return "seek failed";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

// =============================================================================
// Error Kinds
// =============================================================================

/// @brief Reasons a ZSO header cannot be built or parsed.
enum class FormatErrorKind : std::uint8_t {
    kGeneric = 0,
    kBadMagic,
    kUnsupportedVersion,
    kInvalidBlockSize,
    kInvalidAlignment,
    kBadHeaderSize,
    kTruncated,
    kInvalidTotalSize
};

/// @brief Reasons an index table operation fails.
enum class IndexErrorKind : std::uint8_t {
    /// @brief Offset has low alignment bits set or exceeds 31 bits after shifting.
    kOffsetTooLarge = 0,
    kOutOfRange,
    /// @brief Entry i+1 precedes entry i (corrupt table).
    kNonMonotonic
};

/// @brief Reasons a block transform fails.
enum class TransformErrorKind : std::uint8_t {
    kCorruptStream = 0,
    kCompressorFailure
};

[[nodiscard]] constexpr std::string_view formatErrorKindToString(FormatErrorKind kind) noexcept {
    switch (kind) {
        case FormatErrorKind::kGeneric:
            return "format";
        case FormatErrorKind::kBadMagic:
            return "bad magic";
        case FormatErrorKind::kUnsupportedVersion:
            return "unsupported version";
        case FormatErrorKind::kInvalidBlockSize:
            return "invalid block size";
        case FormatErrorKind::kInvalidAlignment:
            return "invalid alignment";
        case FormatErrorKind::kBadHeaderSize:
            return "bad header size";
        case FormatErrorKind::kTruncated:
            return "truncated";
        case FormatErrorKind::kInvalidTotalSize:
            return "invalid total size";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view indexErrorKindToString(IndexErrorKind kind) noexcept {
    switch (kind) {
        case IndexErrorKind::kOffsetTooLarge:
            return "offset too large";
        case IndexErrorKind::kOutOfRange:
            return "out of range";
        case IndexErrorKind::kNonMonotonic:
            return "non-monotonic";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view transformErrorKindToString(
    TransformErrorKind kind) noexcept {
    switch (kind) {
        case TransformErrorKind::kCorruptStream:
            return "corrupt stream";
        case TransformErrorKind::kCompressorFailure:
            return "compressor failure";
    }
    return "unknown";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Block number where the error occurred (if applicable).
    std::optional<std::uint64_t> blockId;

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

    ErrorContext& withBlock(std::uint64_t id) {
        blockId = id;
        return *this;
    }

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

/// @brief Base exception class for all ziso errors.
/// @note Provides error code, message, and optional context.
class ZisoException : public std::exception {
public:
    ZisoException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    ZisoException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~ZisoException() override = default;

    ZisoException(const ZisoException&) = default;
    ZisoException(ZisoException&&) noexcept = default;
    ZisoException& operator=(const ZisoException&) = default;
    ZisoException& operator=(ZisoException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

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

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public ZisoException {
public:
    explicit UsageError(std::string message)
        : ZisoException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(ErrorCode code, std::string message)
        : ZisoException(code, std::move(message)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for file not found, read/write failures, short reads, etc.
class IOError : public ZisoException {
public:
    explicit IOError(std::string message)
        : ZisoException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : ZisoException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct with a more specific I/O error code.
    IOError(ErrorCode code, std::string message)
        : ZisoException(code, std::move(message)) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : ZisoException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                        std::move(context)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for format errors (exit code 3).
/// @note Thrown for invalid magic, unsupported version, invalid block size,
///       out-of-range alignment shift and truncated headers.
class FormatError : public ZisoException {
public:
    explicit FormatError(std::string message)
        : ZisoException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(FormatErrorKind kind, std::string message)
        : ZisoException(ErrorCode::kFormatError, std::move(message)), kind_(kind) {}

    FormatError(FormatErrorKind kind, std::string message, ErrorContext context)
        : ZisoException(ErrorCode::kFormatError, std::move(message), std::move(context)),
          kind_(kind) {}

    [[nodiscard]] FormatErrorKind kind() const noexcept { return kind_; }

private:
    FormatErrorKind kind_ = FormatErrorKind::kGeneric;
};

/// @brief Exception for index table errors (exit code 5).
/// @note An OffsetTooLarge during encode means the chosen block size and
///       alignment cannot represent the image.
class IndexError : public ZisoException {
public:
    IndexError(IndexErrorKind kind, std::string message)
        : ZisoException(ErrorCode::kIndexError, std::move(message)), kind_(kind) {}

    IndexError(IndexErrorKind kind, std::string message, ErrorContext context)
        : ZisoException(ErrorCode::kIndexError, std::move(message), std::move(context)),
          kind_(kind) {}

    [[nodiscard]] IndexErrorKind kind() const noexcept { return kind_; }

private:
    IndexErrorKind kind_;
};

/// @brief Exception for block transform failures (exit code 6).
class TransformError : public ZisoException {
public:
    TransformError(TransformErrorKind kind, std::string message)
        : ZisoException(ErrorCode::kCorruptedData, std::move(message)), kind_(kind) {}

    TransformError(TransformErrorKind kind, std::string message, ErrorContext context)
        : ZisoException(ErrorCode::kCorruptedData, std::move(message), std::move(context)),
          kind_(kind) {}

    [[nodiscard]] TransformErrorKind kind() const noexcept { return kind_; }

private:
    TransformErrorKind kind_;
};

/// @brief Exception for round-trip verification failures (exit code 4).
class ChecksumError : public ZisoException {
public:
    explicit ChecksumError(std::string message)
        : ZisoException(ErrorCode::kChecksumError, std::move(message)) {}

    /// @brief Construct with expected and actual digest values.
    ChecksumError(std::uint64_t expected, std::uint64_t actual, ErrorContext context)
        : ZisoException(ErrorCode::kChecksumError,
                        formatChecksumMismatch(expected, actual),
                        std::move(context)),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] std::optional<std::uint64_t> expected() const noexcept { return expected_; }

    [[nodiscard]] std::optional<std::uint64_t> actual() const noexcept { return actual_; }

private:
    static std::string formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual);

    std::optional<std::uint64_t> expected_;
    std::optional<std::uint64_t> actual_;
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a ZisoException.
    /// @note Keeps the formatted what() text so context survives the conversion.
    explicit Error(const ZisoException& ex) : code_(ex.code()), message_(ex.what()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

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

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

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
    } catch (const ZisoException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace ziso

#endif  // ZISO_COMMON_ERROR_H
