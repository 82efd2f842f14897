// =============================================================================
// ziso - Common Type Definitions
// =============================================================================
// Core type definitions shared by the codec, format and command layers.
//
// This module defines:
// - ByteBuffer, BlockId, FileOffset, Checksum type aliases
// - Compression level / threshold limits
// - Block size and alignment defaults
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef ZISO_COMMON_TYPES_H
#define ZISO_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ziso {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Owned byte sequence (raw block, compressed payload, serialized table).
using ByteBuffer = std::vector<std::uint8_t>;

/// @brief Type alias for block numbers (0-based).
/// @note 64-bit because block count is derived from a 64-bit image size.
using BlockId = std::uint64_t;

/// @brief Type alias for file offsets.
using FileOffset = std::uint64_t;

/// @brief Type alias for image digests (xxHash64).
using Checksum = std::uint64_t;

/// @brief Type alias for deflate compression level (1-9).
using CompressionLevel = int;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default ZSO block size (one CD/DVD sector).
inline constexpr std::uint32_t kDefaultBlockSize = 0x800;

/// @brief Default deflate level.
inline constexpr CompressionLevel kDefaultCompressionLevel = 9;

inline constexpr CompressionLevel kMinCompressionLevel = 1;
inline constexpr CompressionLevel kMaxCompressionLevel = 9;

/// @brief Default compression threshold in percent.
/// @note A block is stored compressed only when compressed*100/raw is below
///       the threshold; 100 means "compressed output must be smaller".
inline constexpr int kDefaultThresholdPercent = 100;

inline constexpr int kMinThresholdPercent = 1;
inline constexpr int kMaxThresholdPercent = 100;

/// @brief Default alignment padding byte.
inline constexpr std::uint8_t kDefaultPaddingByte = 'X';

static_assert(sizeof(FileOffset) == 8, "FileOffset must be 8 bytes");
static_assert(sizeof(Checksum) == 8, "Checksum must be 8 bytes");

}  // namespace ziso

#endif  // ZISO_COMMON_TYPES_H
