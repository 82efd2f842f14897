// =============================================================================
// ziso - ZSO Container Format Definitions
// =============================================================================
// Binary format definitions for the .zso block-compressed disc image.
//
// This module defines:
// - Magic tag, header size and version constants
// - ContainerHeader structure (24 bytes) and its build/serialize/parse
// - IndexEntry tagged value and its packed 32-bit on-disk encoding
// - Little-endian load/store helpers shared by the format layer
//
// File Layout:
// +----------------------+  0
// |  Container Header    |  (24 bytes)
// +----------------------+  24
// |  Index Table         |  ((block_count + 1) x u32 LE)
// +----------------------+  aligned to 2^align_shift
// |  Block 0 payload     |
// |  (padding)           |
// |  Block 1 payload     |
// |  ...                 |
// |  Block N-1 payload   |
// +----------------------+  sentinel offset
//
// Header layout (little-endian):
//   0  magic         "ZISO"
//   4  header_size   u32 (24)
//   8  total_bytes   u64
//   16 block_size    u32 (power of two)
//   20 version       u8
//   21 align_shift   u8
//   22 reserved      2 bytes (0)
//
// Index entry: bit 31 = compressed flag, bits 30..0 = offset >> align_shift.
// =============================================================================

#ifndef ZISO_FORMAT_ZSO_FORMAT_H
#define ZISO_FORMAT_ZSO_FORMAT_H

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>

#include "ziso/common/types.h"

namespace ziso::format {

// =============================================================================
// Format Constants
// =============================================================================

/// @brief Magic tag as the little-endian u32 stored at offset 0.
inline constexpr std::uint32_t kMagic = 0x4F53495A;

/// @brief Fixed container header size.
inline constexpr std::size_t kHeaderSize = 24;

/// @brief Newest format version this implementation understands.
inline constexpr std::uint8_t kCurrentVersion = 1;

/// @brief Largest supported alignment shift.
/// @note With 31 offset bits this addresses up to 2^37 bytes (128 GiB).
inline constexpr std::uint8_t kMaxAlignShift = 6;

/// @brief Size of one on-disk index entry.
inline constexpr std::size_t kIndexEntrySize = 4;

/// @brief Bit 31 of an index word: block payload is deflate-compressed.
inline constexpr std::uint32_t kCompressedFlag = 0x80000000U;

/// @brief Bits 30..0 of an index word: stored (pre-shift) offset.
inline constexpr std::uint32_t kStoredOffsetMask = 0x7FFFFFFFU;

// =============================================================================
// Little-Endian Helpers
// =============================================================================

/// @brief Store an integer at dst in little-endian byte order.
template <typename T>
inline void storeLE(std::uint8_t* dst, T value) noexcept {
    static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");

    if constexpr (std::endian::native == std::endian::big) {
        if constexpr (sizeof(T) == 2) {
            value = static_cast<T>(__builtin_bswap16(static_cast<std::uint16_t>(value)));
        } else if constexpr (sizeof(T) == 4) {
            value = static_cast<T>(__builtin_bswap32(static_cast<std::uint32_t>(value)));
        } else if constexpr (sizeof(T) == 8) {
            value = static_cast<T>(__builtin_bswap64(static_cast<std::uint64_t>(value)));
        }
    }

    std::memcpy(dst, &value, sizeof(T));
}

/// @brief Load a little-endian integer from src.
template <typename T>
[[nodiscard]] inline T loadLE(const std::uint8_t* src) noexcept {
    static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");

    T value{};
    std::memcpy(&value, src, sizeof(T));

    if constexpr (std::endian::native == std::endian::big) {
        if constexpr (sizeof(T) == 2) {
            value = static_cast<T>(__builtin_bswap16(static_cast<std::uint16_t>(value)));
        } else if constexpr (sizeof(T) == 4) {
            value = static_cast<T>(__builtin_bswap32(static_cast<std::uint32_t>(value)));
        } else if constexpr (sizeof(T) == 8) {
            value = static_cast<T>(__builtin_bswap64(static_cast<std::uint64_t>(value)));
        }
    }

    return value;
}

// =============================================================================
// Geometry Helpers
// =============================================================================

/// @brief Check that a block size is a non-zero power of two.
[[nodiscard]] constexpr bool isValidBlockSize(std::uint32_t blockSize) noexcept {
    return blockSize != 0 && std::has_single_bit(blockSize);
}

/// @brief Round value up to the next multiple of 2^alignShift.
[[nodiscard]] constexpr std::uint64_t alignUp(std::uint64_t value,
                                              std::uint8_t alignShift) noexcept {
    const std::uint64_t mask = (std::uint64_t{1} << alignShift) - 1;
    return (value + mask) & ~mask;
}

/// @brief Number of blocks covering totalBytes (last block may be short).
[[nodiscard]] constexpr std::uint64_t computeBlockCount(std::uint64_t totalBytes,
                                                        std::uint32_t blockSize) noexcept {
    return blockSize == 0 ? 0 : totalBytes / blockSize + (totalBytes % blockSize != 0 ? 1 : 0);
}

/// @brief Size of the on-disk index table, sentinel included.
[[nodiscard]] constexpr std::uint64_t computeTableSize(std::uint64_t blockCount) noexcept {
    return (blockCount + 1) * kIndexEntrySize;
}

// =============================================================================
// ContainerHeader Structure
// =============================================================================

/// @brief Fixed-size ZSO container header.
/// @note Built once at encode start, parsed once at decode start.
struct ContainerHeader {
    /// @brief Magic tag (kMagic).
    std::uint32_t magic = kMagic;

    /// @brief Header size in bytes (always kHeaderSize).
    std::uint32_t headerSize = static_cast<std::uint32_t>(kHeaderSize);

    /// @brief Total uncompressed image size in bytes.
    std::uint64_t totalBytes = 0;

    /// @brief Block size in bytes (power of two).
    std::uint32_t blockSize = kDefaultBlockSize;

    /// @brief Format version.
    std::uint8_t version = kCurrentVersion;

    /// @brief Number of low offset bits that are always zero.
    std::uint8_t alignShift = 0;

    /// @brief Reserved (must be 0).
    std::uint16_t reserved = 0;

    /// @brief Number of blocks, the final partial block included.
    [[nodiscard]] std::uint64_t blockCount() const noexcept {
        return computeBlockCount(totalBytes, blockSize);
    }

    /// @brief Uncompressed length of block i (shorter for the final block).
    [[nodiscard]] std::uint32_t blockLength(BlockId blockId) const noexcept {
        const std::uint64_t start = blockId * blockSize;
        if (start >= totalBytes) {
            return 0;
        }
        const std::uint64_t remaining = totalBytes - start;
        return remaining < blockSize ? static_cast<std::uint32_t>(remaining) : blockSize;
    }

    /// @brief Size of the index table that follows the header.
    [[nodiscard]] std::uint64_t tableSize() const noexcept {
        return computeTableSize(blockCount());
    }

    /// @brief Offset of the first block payload.
    [[nodiscard]] std::uint64_t payloadStart() const noexcept {
        return alignUp(headerSize + tableSize(), alignShift);
    }

    /// @brief Alignment in bytes (2^alignShift).
    [[nodiscard]] std::uint64_t alignment() const noexcept {
        return std::uint64_t{1} << alignShift;
    }
};

static_assert(sizeof(ContainerHeader) == kHeaderSize, "ContainerHeader must be exactly 24 bytes");

/// @brief Build a header for a new ZSO image.
/// @throws FormatError (kInvalidBlockSize) if blockSize is zero or not a power of two.
/// @throws FormatError (kInvalidAlignment) if alignShift exceeds kMaxAlignShift.
[[nodiscard]] ContainerHeader buildHeader(std::uint64_t totalBytes,
                                          std::uint32_t blockSize,
                                          std::uint8_t alignShift);

/// @brief Serialize a header into its fixed little-endian layout.
[[nodiscard]] std::array<std::uint8_t, kHeaderSize> serializeHeader(const ContainerHeader& header);

/// @brief Parse and validate a header.
/// @throws FormatError with kTruncated, kBadMagic, kBadHeaderSize,
///         kUnsupportedVersion, kInvalidBlockSize, kInvalidAlignment or
///         kInvalidTotalSize (index table not addressable at alignShift).
[[nodiscard]] ContainerHeader parseHeader(std::span<const std::uint8_t> bytes);

// =============================================================================
// IndexEntry Tagged Value
// =============================================================================

/// @brief Decoded index table entry.
/// @note storedOffset is the pre-shift offset (31 bits).
struct IndexEntry {
    std::uint32_t storedOffset = 0;
    bool compressed = false;

    [[nodiscard]] bool operator==(const IndexEntry&) const noexcept = default;
};

/// @brief Pack an entry into its on-disk word.
/// @note The offset must already fit kStoredOffsetMask; BlockIndex checks this.
[[nodiscard]] constexpr std::uint32_t packIndexEntry(IndexEntry entry) noexcept {
    return (entry.storedOffset & kStoredOffsetMask) | (entry.compressed ? kCompressedFlag : 0U);
}

/// @brief Unpack an on-disk word into an entry.
[[nodiscard]] constexpr IndexEntry unpackIndexEntry(std::uint32_t word) noexcept {
    return IndexEntry{word & kStoredOffsetMask, (word & kCompressedFlag) != 0};
}

}  // namespace ziso::format

#endif  // ZISO_FORMAT_ZSO_FORMAT_H
