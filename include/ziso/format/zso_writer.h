// =============================================================================
// ziso - ZSO Image Writer
// =============================================================================
// Sequential writer for ZSO images.
//
// The writer owns offset assignment and I/O; it never compresses. Callers hand
// it payloads produced by BlockTransform in block order.
//
// Layout produced:
//   [Header 24B] [Index table (blockCount+1) x 4B] [pad] [Block 0] [pad] ... [Block N-1] [pad]
//
// The header and table are reserved by begin() and rewritten by finalize()
// once every offset is known, so the sink must be seekable.
//
// Usage:
//   ZsoWriter writer(sink);
//   writer.begin(header);
//   for (...) writer.appendBlock(block.payload, block.usedCompression);
//   writer.finalize();
// =============================================================================

#ifndef ZISO_FORMAT_ZSO_WRITER_H
#define ZISO_FORMAT_ZSO_WRITER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>

#include "ziso/common/error.h"
#include "ziso/common/types.h"
#include "ziso/format/block_index.h"
#include "ziso/format/zso_format.h"

namespace ziso::format {

// =============================================================================
// ZsoWriter Class
// =============================================================================

/// @brief Writes a ZSO image to a seekable output stream.
///
/// Thread Safety:
/// - Not thread-safe; blocks must be appended in order from one thread
///
/// Error Handling:
/// - Throws IOError on write or seek failures
/// - Throws IndexError when an offset cannot be represented
/// - Throws ZisoException (kInvalidState) on out-of-order calls
class ZsoWriter {
public:
    /// @brief Construct a writer over a sink.
    /// @param sink Seekable output stream, positioned where the image starts.
    /// @param paddingByte Byte used to fill alignment gaps.
    /// @param sinkName Name used in error context (usually the output path).
    explicit ZsoWriter(std::ostream& sink,
                       std::uint8_t paddingByte = kDefaultPaddingByte,
                       std::string sinkName = {});

    ZsoWriter(const ZsoWriter&) = delete;
    ZsoWriter& operator=(const ZsoWriter&) = delete;

    /// @brief Write the header and reserve the index table.
    /// @note Pads up to header.payloadStart() so the first payload is aligned.
    void begin(const ContainerHeader& header);

    /// @brief Append the payload of the next block.
    /// @param payload Bytes produced by BlockTransform::compress.
    /// @param compressed Whether payload is a deflate stream.
    /// @return Byte offset at which the payload was written.
    FileOffset appendBlock(std::span<const std::uint8_t> payload, bool compressed);

    /// @brief Record the sentinel and rewrite header and table in place.
    /// @note Leaves the sink positioned at the end of the image.
    void finalize();

    /// @brief Current write position relative to the image start.
    [[nodiscard]] FileOffset cursor() const noexcept { return cursor_; }

    [[nodiscard]] std::uint64_t blocksWritten() const noexcept { return nextBlock_; }

    [[nodiscard]] bool isStarted() const noexcept { return header_.has_value(); }

    [[nodiscard]] bool isFinalized() const noexcept { return finalized_; }

    /// @brief Header passed to begin().
    /// @throws ZisoException (kInvalidState) before begin().
    [[nodiscard]] const ContainerHeader& header() const;

    /// @brief Index built so far.
    /// @throws ZisoException (kInvalidState) before begin().
    [[nodiscard]] const BlockIndex& index() const;

private:
    void writeBytes(const void* data, std::size_t size);
    void writePadding();
    void seekTo(FileOffset position);

    std::ostream& sink_;
    std::uint8_t paddingByte_;
    std::string sinkName_;

    std::optional<ContainerHeader> header_;
    std::optional<BlockIndex> index_;

    /// @brief Absolute stream position of the image start.
    std::streamoff base_ = 0;

    FileOffset cursor_ = 0;
    BlockId nextBlock_ = 0;
    bool finalized_ = false;
};

}  // namespace ziso::format

#endif  // ZISO_FORMAT_ZSO_WRITER_H
