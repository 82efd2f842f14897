// =============================================================================
// ziso - ZSO Block Index Table
// =============================================================================
// In-memory index table mapping block numbers to payload byte ranges.
//
// The table holds block_count + 1 entries. Entry i and entry i+1 bound the
// bytes occupied by block i; the trailing sentinel holds the end-of-data
// offset so the last block's range is computed like every other block's.
//
// Usage (encode):
//   BlockIndex index(blockCount, alignShift);
//   index.record(0, payloadStart, true);
//   ...
//   index.finalize(endOffset);
//   auto bytes = index.serialize();
//
// Usage (decode):
//   auto index = BlockIndex::parse(tableBytes, blockCount, alignShift);
//   auto location = index.lookup(blockId);
// =============================================================================

#ifndef ZISO_FORMAT_BLOCK_INDEX_H
#define ZISO_FORMAT_BLOCK_INDEX_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "ziso/common/types.h"
#include "ziso/format/zso_format.h"

namespace ziso::format {

// =============================================================================
// BlockLocation Structure
// =============================================================================

/// @brief Byte range and storage mode of one block payload.
/// @note [start, end) may include trailing alignment padding.
struct BlockLocation {
    FileOffset start = 0;
    FileOffset end = 0;
    bool compressed = false;

    [[nodiscard]] std::uint64_t size() const noexcept { return end - start; }
};

// =============================================================================
// Offset Range Helpers
// =============================================================================

/// @brief Largest byte offset an index entry can address with alignShift.
[[nodiscard]] constexpr std::uint64_t maxRepresentableOffset(std::uint8_t alignShift) noexcept {
    return std::uint64_t{kStoredOffsetMask} << alignShift;
}

/// @brief Upper bound on the ZSO size for an image of totalBytes.
/// @note Every stored payload is at most its raw length, plus per-block padding.
[[nodiscard]] std::uint64_t worstCaseImageSize(std::uint64_t totalBytes,
                                               std::uint32_t blockSize,
                                               std::uint8_t alignShift) noexcept;

/// @brief Verify that every offset of the encoded image will be representable.
/// @throws IndexError (kOffsetTooLarge) when the worst case overflows 31 bits.
void checkEncodable(std::uint64_t totalBytes, std::uint32_t blockSize, std::uint8_t alignShift);

/// @brief Smallest alignment shift able to represent an image of totalBytes.
/// @throws IndexError (kOffsetTooLarge) when even kMaxAlignShift is insufficient.
[[nodiscard]] std::uint8_t minimumAlignShift(std::uint64_t totalBytes, std::uint32_t blockSize);

// =============================================================================
// BlockIndex Class
// =============================================================================

/// @brief Index table of a ZSO image.
///
/// Thread Safety:
/// - Not thread-safe; owned by one conversion at a time
///
/// Error Handling:
/// - Throws IndexError for unrepresentable offsets and out-of-range blocks
/// - Throws FormatError when a serialized table is truncated
class BlockIndex {
public:
    /// @brief Pre-allocate blockCount + 1 zeroed entries.
    BlockIndex(std::uint64_t blockCount, std::uint8_t alignShift);

    /// @brief Parse a serialized table read from a ZSO image.
    /// @param bytes At least (blockCount + 1) * 4 bytes.
    /// @throws FormatError (kTruncated) if bytes is too short.
    [[nodiscard]] static BlockIndex parse(std::span<const std::uint8_t> bytes,
                                          std::uint64_t blockCount,
                                          std::uint8_t alignShift);

    /// @brief Record the payload position of a block.
    /// @param blockId Block number (0-based).
    /// @param actualOffset Byte offset of the payload in the ZSO image.
    /// @param compressed Whether the payload is deflate-compressed.
    /// @throws IndexError kOffsetTooLarge if the offset is misaligned or too large,
    ///         kOutOfRange if blockId >= blockCount, kNonMonotonic if it precedes
    ///         the previous block.
    void record(BlockId blockId, FileOffset actualOffset, bool compressed);

    /// @brief Write the sentinel entry holding the end-of-data offset.
    /// @throws IndexError as record().
    void finalize(FileOffset endOffset);

    /// @brief Byte range and flag of a block.
    /// @throws IndexError kOutOfRange if blockId >= blockCount, kNonMonotonic
    ///         if the next entry precedes this one.
    [[nodiscard]] BlockLocation lookup(BlockId blockId) const;

    /// @brief Serialize the table as (blockCount + 1) little-endian words.
    [[nodiscard]] ByteBuffer serialize() const;

    /// @brief Decoded entry at a slot (sentinel is slot blockCount).
    [[nodiscard]] IndexEntry entry(std::size_t slot) const { return entries_.at(slot); }

    [[nodiscard]] std::uint64_t blockCount() const noexcept { return blockCount_; }

    [[nodiscard]] std::uint8_t alignShift() const noexcept { return alignShift_; }

    [[nodiscard]] bool isFinalized() const noexcept { return finalized_; }

    /// @brief Actual byte offset of the sentinel.
    [[nodiscard]] FileOffset endOffset() const noexcept { return toActualOffset(entries_.back()); }

    /// @brief Number of blocks stored compressed.
    [[nodiscard]] std::uint64_t compressedBlockCount() const noexcept;

private:
    /// @brief Validate an offset and convert it into a tagged entry.
    [[nodiscard]] IndexEntry makeEntry(std::size_t slot, FileOffset actualOffset,
                                       bool compressed) const;

    [[nodiscard]] FileOffset toActualOffset(IndexEntry entry) const noexcept {
        return static_cast<FileOffset>(entry.storedOffset) << alignShift_;
    }

    std::vector<IndexEntry> entries_;
    std::uint64_t blockCount_ = 0;
    std::uint8_t alignShift_ = 0;
    bool finalized_ = false;
};

}  // namespace ziso::format

#endif  // ZISO_FORMAT_BLOCK_INDEX_H
