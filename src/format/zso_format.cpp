// =============================================================================
// ziso - ZSO Container Header Implementation
// =============================================================================

#include "ziso/format/zso_format.h"

#include <string>

#include "ziso/common/error.h"

namespace ziso::format {

namespace {

void validateGeometry(std::uint32_t blockSize, std::uint8_t alignShift) {
    if (!isValidBlockSize(blockSize)) {
        throw FormatError(FormatErrorKind::kInvalidBlockSize,
                          "Block size must be a non-zero power of two, got " +
                              std::to_string(blockSize));
    }

    if (alignShift > kMaxAlignShift) {
        throw FormatError(FormatErrorKind::kInvalidAlignment,
                          "Alignment shift " + std::to_string(alignShift) +
                              " exceeds maximum " + std::to_string(kMaxAlignShift));
    }
}

}  // namespace

ContainerHeader buildHeader(std::uint64_t totalBytes,
                            std::uint32_t blockSize,
                            std::uint8_t alignShift) {
    validateGeometry(blockSize, alignShift);

    ContainerHeader header;
    header.totalBytes = totalBytes;
    header.blockSize = blockSize;
    header.alignShift = alignShift;
    return header;
}

std::array<std::uint8_t, kHeaderSize> serializeHeader(const ContainerHeader& header) {
    std::array<std::uint8_t, kHeaderSize> bytes{};

    storeLE(bytes.data() + 0, header.magic);
    storeLE(bytes.data() + 4, header.headerSize);
    storeLE(bytes.data() + 8, header.totalBytes);
    storeLE(bytes.data() + 16, header.blockSize);
    bytes[20] = header.version;
    bytes[21] = header.alignShift;
    storeLE(bytes.data() + 22, header.reserved);

    return bytes;
}

ContainerHeader parseHeader(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < kHeaderSize) {
        throw FormatError(FormatErrorKind::kTruncated,
                          "ZSO header truncated: " + std::to_string(bytes.size()) + " of " +
                              std::to_string(kHeaderSize) + " bytes");
    }

    ContainerHeader header;
    header.magic = loadLE<std::uint32_t>(bytes.data() + 0);
    header.headerSize = loadLE<std::uint32_t>(bytes.data() + 4);
    header.totalBytes = loadLE<std::uint64_t>(bytes.data() + 8);
    header.blockSize = loadLE<std::uint32_t>(bytes.data() + 16);
    header.version = bytes[20];
    header.alignShift = bytes[21];
    header.reserved = loadLE<std::uint16_t>(bytes.data() + 22);

    if (header.magic != kMagic) {
        throw FormatError(FormatErrorKind::kBadMagic, "Invalid magic tag - not a ZSO image");
    }

    if (header.headerSize != kHeaderSize) {
        throw FormatError(FormatErrorKind::kBadHeaderSize,
                          "Unexpected header size " + std::to_string(header.headerSize));
    }

    if (header.version > kCurrentVersion) {
        throw FormatError(FormatErrorKind::kUnsupportedVersion,
                          "Unsupported ZSO version " + std::to_string(header.version) +
                              " (newest supported: " + std::to_string(kCurrentVersion) + ")");
    }

    validateGeometry(header.blockSize, header.alignShift);

    // The sentinel entry sits past the table, so the table must fit the index range
    const std::uint64_t addressable = std::uint64_t{kStoredOffsetMask} << header.alignShift;
    if (header.blockCount() >= (addressable - kHeaderSize) / kIndexEntrySize) {
        throw FormatError(FormatErrorKind::kInvalidTotalSize,
                          "Total size " + std::to_string(header.totalBytes) + " needs " +
                              std::to_string(header.blockCount()) +
                              " blocks, more than the index can address");
    }

    return header;
}

}  // namespace ziso::format
