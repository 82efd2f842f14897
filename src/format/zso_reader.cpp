// =============================================================================
// ziso - ZSO Image Reader Implementation
// =============================================================================

#include "ziso/format/zso_reader.h"

#include <array>
#include <utility>

#include "ziso/common/logger.h"

namespace ziso::format {

// =============================================================================
// ZsoReader Implementation
// =============================================================================

ZsoReader::ZsoReader(std::istream& source, std::string sourceName)
    : source_(source), sourceName_(std::move(sourceName)) {}

void ZsoReader::requireOpen() const {
    if (!header_) {
        throw ZisoException(ErrorCode::kInvalidState, "ZSO image is not open");
    }
}

const ContainerHeader& ZsoReader::header() const {
    requireOpen();
    return *header_;
}

const BlockIndex& ZsoReader::index() const {
    requireOpen();
    return *index_;
}

void ZsoReader::open() {
    base_ = source_.tellg();
    if (base_ < 0) {
        throw IOError(ErrorCode::kSeekFailed, "Input stream is not seekable");
    }

    source_.seekg(0, std::ios::end);
    const std::streamoff end = source_.tellg();
    if (!source_.good() || end < base_) {
        throw IOError(ErrorCode::kSeekFailed, "Failed to determine ZSO image size");
    }
    imageSize_ = static_cast<std::uint64_t>(end - base_);
    seekTo(0);

    if (imageSize_ < kHeaderSize) {
        throw FormatError(FormatErrorKind::kTruncated,
                          "File too small to be a ZSO image: " + std::to_string(imageSize_) +
                              " bytes",
                          ErrorContext(sourceName_));
    }

    std::array<std::uint8_t, kHeaderSize> headerBytes{};
    readBytes(headerBytes.data(), headerBytes.size());
    ContainerHeader header = parseHeader(headerBytes);

    // Compared by entry count so a corrupt total size cannot overflow the table size
    if (header.blockCount() >= (imageSize_ - kHeaderSize) / kIndexEntrySize) {
        throw FormatError(FormatErrorKind::kTruncated,
                          "Index table of " + std::to_string(header.blockCount() + 1) +
                              " entries extends past the end of the image",
                          ErrorContext(sourceName_).withOffset(kHeaderSize));
    }

    ByteBuffer tableBytes(header.tableSize());
    readBytes(tableBytes.data(), tableBytes.size());

    index_.emplace(BlockIndex::parse(tableBytes, header.blockCount(), header.alignShift));
    header_ = header;

    ZISO_LOG_DEBUG("ZSO image opened: {} ({} bytes, {} blocks, alignShift={})", sourceName_,
                   imageSize_, header.blockCount(), header.alignShift);
}

BlockLocation ZsoReader::blockLocation(BlockId blockId) const {
    requireOpen();
    return index_->lookup(blockId);
}

ByteBuffer ZsoReader::readPayload(BlockId blockId) {
    const BlockLocation location = blockLocation(blockId);

    if (location.end > imageSize_) {
        throw FormatError(FormatErrorKind::kTruncated,
                          "Block range ends at " + std::to_string(location.end) +
                              " past the end of the image",
                          ErrorContext(sourceName_).withBlock(blockId).withOffset(location.start));
    }

    ByteBuffer payload(location.size());
    seekTo(location.start);
    if (!payload.empty()) {
        readBytes(payload.data(), payload.size());
    }
    return payload;
}

ByteBuffer ZsoReader::readBlock(BlockId blockId) {
    const BlockLocation location = blockLocation(blockId);
    const std::size_t expectedLen = header_->blockLength(blockId);

    ByteBuffer payload = readPayload(blockId);

    try {
        if (!location.compressed) {
            if (payload.size() < expectedLen) {
                throw TransformError(TransformErrorKind::kCorruptStream,
                                     "Stored block range holds " + std::to_string(payload.size()) +
                                         " bytes, expected " + std::to_string(expectedLen));
            }
            // Trailing alignment padding is not part of the block
            payload.resize(expectedLen);
        }
        return transform_.decompress(payload, location.compressed, expectedLen);
    } catch (const TransformError& e) {
        throw TransformError(e.kind(), e.message(),
                             ErrorContext(sourceName_).withBlock(blockId).withOffset(
                                 location.start));
    }
}

// =============================================================================
// Private Helpers
// =============================================================================

void ZsoReader::readBytes(void* buffer, std::size_t size) {
    source_.read(static_cast<char*>(buffer), static_cast<std::streamsize>(size));
    if (!source_.good()) {
        throw IOError("Failed to read from file", ErrorContext(sourceName_));
    }
}

void ZsoReader::seekTo(FileOffset position) {
    source_.clear();
    source_.seekg(base_ + static_cast<std::streamoff>(position), std::ios::beg);
    if (!source_.good()) {
        throw IOError(ErrorCode::kSeekFailed, "Failed to seek in input stream");
    }
}

}  // namespace ziso::format
