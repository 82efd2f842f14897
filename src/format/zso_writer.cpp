// =============================================================================
// ziso - ZSO Image Writer Implementation
// =============================================================================

#include "ziso/format/zso_writer.h"

#include <algorithm>
#include <array>
#include <utility>

#include "ziso/common/logger.h"

namespace ziso::format {

namespace {

/// @brief Largest alignment gap: 2^kMaxAlignShift - 1 bytes.
constexpr std::size_t kMaxPadding = (std::size_t{1} << kMaxAlignShift) - 1;

}  // namespace

// =============================================================================
// ZsoWriter Implementation
// =============================================================================

ZsoWriter::ZsoWriter(std::ostream& sink, std::uint8_t paddingByte, std::string sinkName)
    : sink_(sink), paddingByte_(paddingByte), sinkName_(std::move(sinkName)) {}

const ContainerHeader& ZsoWriter::header() const {
    if (!header_) {
        throw ZisoException(ErrorCode::kInvalidState, "ZSO writer has not been started");
    }
    return *header_;
}

const BlockIndex& ZsoWriter::index() const {
    if (!index_) {
        throw ZisoException(ErrorCode::kInvalidState, "ZSO writer has not been started");
    }
    return *index_;
}

void ZsoWriter::begin(const ContainerHeader& header) {
    if (header_) {
        throw ZisoException(ErrorCode::kInvalidState, "ZSO header already written");
    }

    base_ = sink_.tellp();
    if (base_ < 0) {
        throw IOError(ErrorCode::kSeekFailed, "Output stream is not seekable");
    }

    header_ = header;
    index_.emplace(header.blockCount(), header.alignShift);

    const auto headerBytes = serializeHeader(header);
    writeBytes(headerBytes.data(), headerBytes.size());

    // Zeroed table placeholder; filled in by finalize()
    const ByteBuffer placeholder(header.tableSize(), 0);
    writeBytes(placeholder.data(), placeholder.size());

    writePadding();

    ZISO_LOG_DEBUG("ZSO header written: totalBytes={}, blockSize={}, alignShift={}, blocks={}",
                   header.totalBytes, header.blockSize, header.alignShift, header.blockCount());
}

FileOffset ZsoWriter::appendBlock(std::span<const std::uint8_t> payload, bool compressed) {
    if (!header_) {
        throw ZisoException(ErrorCode::kInvalidState, "ZSO header must be written before blocks");
    }
    if (finalized_) {
        throw ZisoException(ErrorCode::kInvalidState, "ZSO writer is already finalized");
    }

    const BlockId blockId = nextBlock_;
    const FileOffset offset = cursor_;

    index_->record(blockId, offset, compressed);

    if (!payload.empty()) {
        writeBytes(payload.data(), payload.size());
    }
    writePadding();
    ++nextBlock_;

    ZISO_LOG_TRACE("Block {} written: offset={}, size={}, compressed={}", blockId, offset,
                   payload.size(), compressed);

    return offset;
}

void ZsoWriter::finalize() {
    if (!header_) {
        throw ZisoException(ErrorCode::kInvalidState, "ZSO header must be written before finalize");
    }
    if (finalized_) {
        return;
    }
    if (nextBlock_ != index_->blockCount()) {
        throw ZisoException(ErrorCode::kInvalidState,
                            "Finalize after " + std::to_string(nextBlock_) + " of " +
                                std::to_string(index_->blockCount()) + " blocks");
    }

    const FileOffset endOffset = cursor_;
    index_->finalize(endOffset);

    seekTo(0);
    const auto headerBytes = serializeHeader(*header_);
    writeBytes(headerBytes.data(), headerBytes.size());
    const ByteBuffer table = index_->serialize();
    writeBytes(table.data(), table.size());

    seekTo(endOffset);
    sink_.flush();
    if (!sink_.good()) {
        throw IOError("Failed to flush ZSO image", ErrorContext(sinkName_));
    }

    finalized_ = true;

    ZISO_LOG_DEBUG("ZSO index finalized: blocks={}, compressed={}, endOffset={}",
                   index_->blockCount(), index_->compressedBlockCount(), endOffset);
}

// =============================================================================
// Private Helpers
// =============================================================================

void ZsoWriter::writeBytes(const void* data, std::size_t size) {
    sink_.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!sink_.good()) {
        throw IOError("Failed to write to file",
                      ErrorContext(sinkName_).withOffset(cursor_));
    }
    cursor_ += size;
}

void ZsoWriter::writePadding() {
    const FileOffset aligned = alignUp(cursor_, header_->alignShift);
    const auto gap = static_cast<std::size_t>(aligned - cursor_);
    if (gap == 0) {
        return;
    }

    std::array<std::uint8_t, kMaxPadding> padding{};
    padding.fill(paddingByte_);
    writeBytes(padding.data(), std::min(gap, padding.size()));
}

void ZsoWriter::seekTo(FileOffset position) {
    sink_.seekp(base_ + static_cast<std::streamoff>(position), std::ios::beg);
    if (!sink_.good()) {
        throw IOError(ErrorCode::kSeekFailed, "Failed to seek in output stream");
    }
    cursor_ = position;
}

}  // namespace ziso::format
