// =============================================================================
// ziso - ZSO Block Index Table Implementation
// =============================================================================

#include "ziso/format/block_index.h"

#include <algorithm>
#include <string>

#include "ziso/common/error.h"

namespace ziso::format {

// =============================================================================
// Offset Range Helpers
// =============================================================================

std::uint64_t worstCaseImageSize(std::uint64_t totalBytes,
                                 std::uint32_t blockSize,
                                 std::uint8_t alignShift) noexcept {
    const std::uint64_t blockCount = computeBlockCount(totalBytes, blockSize);
    const std::uint64_t payloadStart = alignUp(kHeaderSize + computeTableSize(blockCount),
                                               alignShift);
    const std::uint64_t padding = blockCount * ((std::uint64_t{1} << alignShift) - 1);
    return payloadStart + totalBytes + padding;
}

void checkEncodable(std::uint64_t totalBytes, std::uint32_t blockSize, std::uint8_t alignShift) {
    const std::uint64_t limit = maxRepresentableOffset(alignShift);

    // Checked first so the worst-case sum below cannot wrap
    if (totalBytes > limit) {
        throw IndexError(IndexErrorKind::kOffsetTooLarge,
                         "Image of " + std::to_string(totalBytes) +
                             " bytes exceeds the index range at alignment shift " +
                             std::to_string(alignShift));
    }

    const std::uint64_t worstCase = worstCaseImageSize(totalBytes, blockSize, alignShift);
    if (worstCase > limit) {
        throw IndexError(IndexErrorKind::kOffsetTooLarge,
                         "Worst-case ZSO size " + std::to_string(worstCase) +
                             " exceeds the index range " + std::to_string(limit) +
                             " at alignment shift " + std::to_string(alignShift) +
                             "; increase the alignment");
    }
}

std::uint8_t minimumAlignShift(std::uint64_t totalBytes, std::uint32_t blockSize) {
    for (std::uint8_t shift = 0; shift <= kMaxAlignShift; ++shift) {
        if (totalBytes <= maxRepresentableOffset(shift) &&
            worstCaseImageSize(totalBytes, blockSize, shift) <= maxRepresentableOffset(shift)) {
            return shift;
        }
    }
    throw IndexError(IndexErrorKind::kOffsetTooLarge,
                     "Image of " + std::to_string(totalBytes) +
                         " bytes is too large for any supported alignment");
}

// =============================================================================
// BlockIndex Implementation
// =============================================================================

BlockIndex::BlockIndex(std::uint64_t blockCount, std::uint8_t alignShift)
    : entries_(blockCount + 1), blockCount_(blockCount), alignShift_(alignShift) {}

BlockIndex BlockIndex::parse(std::span<const std::uint8_t> bytes,
                             std::uint64_t blockCount,
                             std::uint8_t alignShift) {
    const std::uint64_t tableSize = computeTableSize(blockCount);
    if (bytes.size() < tableSize) {
        throw FormatError(FormatErrorKind::kTruncated,
                          "Index table truncated: " + std::to_string(bytes.size()) + " of " +
                              std::to_string(tableSize) + " bytes");
    }

    BlockIndex index(blockCount, alignShift);
    for (std::size_t slot = 0; slot < index.entries_.size(); ++slot) {
        index.entries_[slot] = unpackIndexEntry(
            loadLE<std::uint32_t>(bytes.data() + slot * kIndexEntrySize));
    }
    index.finalized_ = true;

    return index;
}

IndexEntry BlockIndex::makeEntry(std::size_t slot, FileOffset actualOffset,
                                 bool compressed) const {
    const FileOffset alignMask = (FileOffset{1} << alignShift_) - 1;
    if ((actualOffset & alignMask) != 0) {
        throw IndexError(IndexErrorKind::kOffsetTooLarge,
                         "Offset is not aligned to 2^" + std::to_string(alignShift_),
                         ErrorContext().withBlock(slot).withOffset(actualOffset));
    }

    const FileOffset stored = actualOffset >> alignShift_;
    if (stored > kStoredOffsetMask) {
        throw IndexError(IndexErrorKind::kOffsetTooLarge,
                         "Offset does not fit in 31 bits at alignment shift " +
                             std::to_string(alignShift_),
                         ErrorContext().withBlock(slot).withOffset(actualOffset));
    }

    if (slot > 0 && actualOffset < toActualOffset(entries_[slot - 1])) {
        throw IndexError(IndexErrorKind::kNonMonotonic,
                         "Offset precedes the previous block",
                         ErrorContext().withBlock(slot).withOffset(actualOffset));
    }

    return IndexEntry{static_cast<std::uint32_t>(stored), compressed};
}

void BlockIndex::record(BlockId blockId, FileOffset actualOffset, bool compressed) {
    if (blockId >= blockCount_) {
        throw IndexError(IndexErrorKind::kOutOfRange,
                         "Block " + std::to_string(blockId) + " out of range (block count " +
                             std::to_string(blockCount_) + ")");
    }

    entries_[blockId] = makeEntry(blockId, actualOffset, compressed);
}

void BlockIndex::finalize(FileOffset endOffset) {
    entries_[blockCount_] = makeEntry(blockCount_, endOffset, false);
    finalized_ = true;
}

BlockLocation BlockIndex::lookup(BlockId blockId) const {
    if (blockId >= blockCount_) {
        throw IndexError(IndexErrorKind::kOutOfRange,
                         "Block " + std::to_string(blockId) + " out of range (block count " +
                             std::to_string(blockCount_) + ")");
    }

    const IndexEntry current = entries_[blockId];
    const IndexEntry next = entries_[blockId + 1];

    BlockLocation location;
    location.start = toActualOffset(current);
    location.end = toActualOffset(next);
    location.compressed = current.compressed;

    if (location.end < location.start) {
        throw IndexError(IndexErrorKind::kNonMonotonic,
                         "Index entry " + std::to_string(blockId + 1) + " precedes entry " +
                             std::to_string(blockId),
                         ErrorContext().withBlock(blockId).withOffset(location.start));
    }

    return location;
}

ByteBuffer BlockIndex::serialize() const {
    ByteBuffer bytes(entries_.size() * kIndexEntrySize);
    for (std::size_t slot = 0; slot < entries_.size(); ++slot) {
        storeLE(bytes.data() + slot * kIndexEntrySize, packIndexEntry(entries_[slot]));
    }
    return bytes;
}

std::uint64_t BlockIndex::compressedBlockCount() const noexcept {
    return static_cast<std::uint64_t>(std::count_if(
        entries_.begin(), entries_.end() - 1, [](const IndexEntry& e) { return e.compressed; }));
}

}  // namespace ziso::format
