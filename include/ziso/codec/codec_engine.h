// =============================================================================
// ziso - Codec Engine
// =============================================================================
// Whole-image ISO <-> ZSO conversion.
//
// encode() reads a raw image block by block, compresses each block with
// BlockTransform and hands the payload to ZsoWriter. decode() walks the index
// of a ZSO image with ZsoReader and writes the restored raw bytes.
//
// A conversion moves through
//   kInit -> kHeaderDone -> kTableDone -> kStreaming -> kDone
// and ends in kFailed when any step throws. The exception is propagated
// unchanged; the engine never retries.
//
// Usage:
//   std::ifstream iso(isoPath, std::ios::binary);
//   std::ofstream zso(zsoPath, std::ios::binary);
//   auto stats = ziso::codec::encode(iso, zso, EncodeOptions{});
// =============================================================================

#ifndef ZISO_CODEC_CODEC_ENGINE_H
#define ZISO_CODEC_CODEC_ENGINE_H

#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "ziso/common/error.h"
#include "ziso/common/types.h"

namespace ziso::codec {

// =============================================================================
// Conversion State
// =============================================================================

/// @brief Lifecycle of one conversion.
enum class State : std::uint8_t {
    kInit = 0,
    kHeaderDone = 1,
    kTableDone = 2,
    kStreaming = 3,
    kDone = 4,
    kFailed = 5
};

[[nodiscard]] std::string_view stateToString(State state) noexcept;

// =============================================================================
// Options
// =============================================================================

/// @brief Progress callback: (blocks processed, total blocks).
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

/// @brief Options for ISO -> ZSO conversion.
struct EncodeOptions {
    /// @brief Block size in bytes (power of two).
    std::uint32_t blockSize = kDefaultBlockSize;

    /// @brief Offset alignment shift (0-6). Unset picks the smallest shift
    ///        able to address the whole image.
    std::optional<std::uint8_t> alignShift;

    /// @brief Deflate level (1-9).
    CompressionLevel compressionLevel = kDefaultCompressionLevel;

    /// @brief Keep a compressed block only below this size ratio (1-100).
    int thresholdPercent = kDefaultThresholdPercent;

    /// @brief Byte used to fill alignment gaps.
    std::uint8_t paddingByte = kDefaultPaddingByte;

    /// @brief Optional progress reporting.
    ProgressCallback progress;

    /// @brief Names used in error context.
    std::string sourceName;
    std::string sinkName;

    /// @brief Validate option ranges.
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Options for ZSO -> ISO conversion.
struct DecodeOptions {
    ProgressCallback progress;
    std::string sourceName;
};

// =============================================================================
// Statistics
// =============================================================================

/// @brief Result of an encode.
struct EncodeStats {
    std::uint64_t blockCount = 0;
    std::uint64_t compressedBlocks = 0;
    std::uint64_t storedBlocks = 0;

    /// @brief Raw image size.
    std::uint64_t inputBytes = 0;

    /// @brief ZSO image size.
    std::uint64_t outputBytes = 0;

    std::uint32_t blockSize = 0;
    std::uint8_t alignShift = 0;

    /// @brief XXH64 of the raw image.
    Checksum digest = 0;

    double elapsedSeconds = 0.0;

    /// @brief Output size as a fraction of the input size.
    [[nodiscard]] double compressionRatio() const noexcept {
        return inputBytes > 0 ? static_cast<double>(outputBytes) / static_cast<double>(inputBytes)
                              : 0.0;
    }
};

/// @brief Result of a decode.
struct DecodeStats {
    std::uint64_t blockCount = 0;
    std::uint64_t compressedBlocks = 0;
    std::uint64_t storedBlocks = 0;

    /// @brief ZSO image size.
    std::uint64_t inputBytes = 0;

    /// @brief Restored raw image size.
    std::uint64_t outputBytes = 0;

    /// @brief XXH64 of the restored raw image.
    Checksum digest = 0;

    double elapsedSeconds = 0.0;
};

// =============================================================================
// CodecEngine Class
// =============================================================================

/// @brief Runs conversions and tracks the state of the latest one.
///
/// Error Handling:
/// - UsageError for invalid options
/// - IndexError (kOffsetTooLarge) before any byte is written when the
///   image cannot be addressed with the chosen block size and alignment
/// - FormatError, IndexError, TransformError and IOError as raised by the
///   reader, writer and transform
class CodecEngine {
public:
    CodecEngine() = default;

    /// @brief Convert a raw image into a ZSO image.
    /// @param source Seekable raw image stream (its length is the image size).
    /// @param sink Seekable output stream.
    EncodeStats encode(std::istream& source, std::ostream& sink, const EncodeOptions& options);

    /// @brief Convert a ZSO image back into the raw image.
    DecodeStats decode(std::istream& source, std::ostream& sink, const DecodeOptions& options);

    /// @brief Decode without writing, for digest comparison.
    DecodeStats verify(std::istream& source, const DecodeOptions& options);

    [[nodiscard]] State state() const noexcept { return state_; }

private:
    DecodeStats runDecode(std::istream& source, std::ostream* sink, const DecodeOptions& options);

    void transition(State next) noexcept;

    State state_ = State::kInit;
};

// =============================================================================
// Convenience Functions
// =============================================================================

/// @brief Encode with a one-shot engine.
EncodeStats encode(std::istream& source, std::ostream& sink, const EncodeOptions& options = {});

/// @brief Decode with a one-shot engine.
DecodeStats decode(std::istream& source, std::ostream& sink, const DecodeOptions& options = {});

/// @brief Length of a seekable stream, leaving it at its starting position.
/// @throws IOError (kSeekFailed) if the stream cannot be measured.
[[nodiscard]] std::uint64_t streamLength(std::istream& stream);

}  // namespace ziso::codec

#endif  // ZISO_CODEC_CODEC_ENGINE_H
