// =============================================================================
// ziso - Block Transform
// =============================================================================
// Per-block compression for ZSO images.
//
// Each block is compressed independently as a raw deflate stream (no zlib or
// gzip wrapper). When compression does not pay off, the block is stored
// verbatim so a stored payload is never larger than the raw block.
//
// The transform is a pure function of its inputs: compress() decides the
// payload and flag, and offset assignment is left to the writer. A parallel
// compress phase could therefore feed the sequential writer unchanged.
//
// Usage:
//   BlockTransform transform({.level = 9});
//   auto block = transform.compress(raw);
//   auto restored = transform.decompress(block.payload, block.usedCompression, raw.size());
// =============================================================================

#ifndef ZISO_ALGO_BLOCK_TRANSFORM_H
#define ZISO_ALGO_BLOCK_TRANSFORM_H

#include <cstddef>
#include <cstdint>
#include <span>

#include "ziso/common/error.h"
#include "ziso/common/types.h"

namespace ziso::algo {

// =============================================================================
// Configuration
// =============================================================================

/// @brief Block transform configuration.
struct BlockTransformConfig {
    /// @brief Deflate compression level (1-9).
    CompressionLevel level = kDefaultCompressionLevel;

    /// @brief Keep the compressed payload only if compressed*100 < raw*threshold.
    /// @note 100 keeps any payload strictly smaller than the raw block.
    int thresholdPercent = kDefaultThresholdPercent;

    /// @brief Validate configuration.
    /// @return VoidResult with a kInvalidArgument error on out-of-range values.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// CompressedBlock Structure
// =============================================================================

/// @brief Result of compressing one block.
struct CompressedBlock {
    /// @brief Bytes to store: deflate stream, or the raw block itself.
    ByteBuffer payload;

    /// @brief true if payload is a deflate stream, false if stored verbatim.
    bool usedCompression = false;
};

// =============================================================================
// BlockTransform Class
// =============================================================================

/// @brief Raw-deflate block compressor / decompressor with stored fallback.
/// @note Reuses one deflate and one inflate state across blocks.
///
/// Thread Safety:
/// - Not thread-safe; use one instance per thread
class BlockTransform {
public:
    /// @brief Construct with configuration.
    /// @throws UsageError if the configuration is invalid.
    explicit BlockTransform(BlockTransformConfig config = {});

    ~BlockTransform();

    // Non-copyable, movable
    BlockTransform(const BlockTransform&) = delete;
    BlockTransform& operator=(const BlockTransform&) = delete;
    BlockTransform(BlockTransform&& other) noexcept;
    BlockTransform& operator=(BlockTransform&& other) noexcept;

    /// @brief Compress a raw block.
    /// @param raw Raw block bytes at their true length (the final block may be short).
    /// @return Payload no longer than raw, and whether it is compressed.
    /// @throws TransformError (kCompressorFailure) if zlib fails internally.
    [[nodiscard]] CompressedBlock compress(std::span<const std::uint8_t> raw);

    /// @brief Restore a raw block.
    /// @param payload Stored bytes. Bytes after the end of a deflate stream are ignored.
    /// @param compressed Whether payload is a deflate stream.
    /// @param expectedLen Exact raw length of the block.
    /// @throws TransformError (kCorruptStream) on invalid deflate data or a length mismatch.
    [[nodiscard]] ByteBuffer decompress(std::span<const std::uint8_t> payload,
                                        bool compressed,
                                        std::size_t expectedLen);

    [[nodiscard]] const BlockTransformConfig& config() const noexcept { return config_; }

private:
    void initDeflate();
    void initInflate();
    void cleanup() noexcept;

    BlockTransformConfig config_;

    /// @brief zlib deflate state (opaque pointer).
    void* deflateStream_ = nullptr;

    /// @brief zlib inflate state (opaque pointer).
    void* inflateStream_ = nullptr;
};

}  // namespace ziso::algo

#endif  // ZISO_ALGO_BLOCK_TRANSFORM_H
