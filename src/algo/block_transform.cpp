// =============================================================================
// ziso - Block Transform Implementation
// =============================================================================
// Raw deflate (windowBits = -15) through zlib, one stream per block.
// =============================================================================

#include "ziso/algo/block_transform.h"

#include <zlib.h>

#include <cstring>
#include <string>
#include <utility>

#include "ziso/common/logger.h"

namespace ziso::algo {

namespace {

/// @brief Negative window bits select a raw deflate stream without header.
constexpr int kRawDeflateWindowBits = -15;

constexpr int kMemLevel = 8;

}  // namespace

// =============================================================================
// BlockTransformConfig Implementation
// =============================================================================

VoidResult BlockTransformConfig::validate() const {
    if (level < kMinCompressionLevel || level > kMaxCompressionLevel) {
        return std::unexpected(Error{ErrorCode::kInvalidArgument,
                                     "Compression level must be 1-9, got " +
                                         std::to_string(level)});
    }
    if (thresholdPercent < kMinThresholdPercent || thresholdPercent > kMaxThresholdPercent) {
        return std::unexpected(Error{ErrorCode::kInvalidArgument,
                                     "Compression threshold must be 1-100, got " +
                                         std::to_string(thresholdPercent)});
    }
    return std::monostate{};
}

// =============================================================================
// BlockTransform Implementation
// =============================================================================

BlockTransform::BlockTransform(BlockTransformConfig config) : config_(config) {
    if (auto valid = config_.validate(); !valid) {
        throw UsageError(valid.error().code(), valid.error().message());
    }
    initDeflate();
    initInflate();
}

BlockTransform::~BlockTransform() {
    cleanup();
}

BlockTransform::BlockTransform(BlockTransform&& other) noexcept
    : config_(other.config_),
      deflateStream_(std::exchange(other.deflateStream_, nullptr)),
      inflateStream_(std::exchange(other.inflateStream_, nullptr)) {}

BlockTransform& BlockTransform::operator=(BlockTransform&& other) noexcept {
    if (this != &other) {
        cleanup();
        config_ = other.config_;
        deflateStream_ = std::exchange(other.deflateStream_, nullptr);
        inflateStream_ = std::exchange(other.inflateStream_, nullptr);
    }
    return *this;
}

void BlockTransform::initDeflate() {
    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    int ret = deflateInit2(stream, config_.level, Z_DEFLATED, kRawDeflateWindowBits, kMemLevel,
                           Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        delete stream;
        throw TransformError(TransformErrorKind::kCompressorFailure,
                             "Failed to initialize deflate: " + std::to_string(ret));
    }
    deflateStream_ = stream;
}

void BlockTransform::initInflate() {
    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    int ret = inflateInit2(stream, kRawDeflateWindowBits);
    if (ret != Z_OK) {
        delete stream;
        throw TransformError(TransformErrorKind::kCompressorFailure,
                             "Failed to initialize inflate: " + std::to_string(ret));
    }
    inflateStream_ = stream;
}

void BlockTransform::cleanup() noexcept {
    if (deflateStream_ != nullptr) {
        auto* stream = static_cast<z_stream*>(deflateStream_);
        deflateEnd(stream);
        delete stream;
        deflateStream_ = nullptr;
    }
    if (inflateStream_ != nullptr) {
        auto* stream = static_cast<z_stream*>(inflateStream_);
        inflateEnd(stream);
        delete stream;
        inflateStream_ = nullptr;
    }
}

CompressedBlock BlockTransform::compress(std::span<const std::uint8_t> raw) {
    auto* stream = static_cast<z_stream*>(deflateStream_);
    if (stream == nullptr) {
        throw TransformError(TransformErrorKind::kCompressorFailure,
                             "Block transform has been moved from");
    }

    int ret = deflateReset(stream);
    if (ret != Z_OK) {
        throw TransformError(TransformErrorKind::kCompressorFailure,
                             "deflateReset failed: " + std::to_string(ret));
    }

    ByteBuffer compressed(deflateBound(stream, static_cast<uLong>(raw.size())));
    stream->next_in = const_cast<Bytef*>(raw.data());
    stream->avail_in = static_cast<uInt>(raw.size());
    stream->next_out = compressed.data();
    stream->avail_out = static_cast<uInt>(compressed.size());

    ret = deflate(stream, Z_FINISH);
    if (ret != Z_STREAM_END) {
        throw TransformError(TransformErrorKind::kCompressorFailure,
                             "deflate did not finish: " + std::to_string(ret));
    }
    compressed.resize(stream->total_out);

    CompressedBlock block;
    if (compressed.size() * 100 < raw.size() * static_cast<std::size_t>(config_.thresholdPercent)) {
        block.payload = std::move(compressed);
        block.usedCompression = true;
    } else {
        block.payload.assign(raw.begin(), raw.end());
        block.usedCompression = false;
    }

    return block;
}

ByteBuffer BlockTransform::decompress(std::span<const std::uint8_t> payload,
                                      bool compressed,
                                      std::size_t expectedLen) {
    if (!compressed) {
        if (payload.size() != expectedLen) {
            throw TransformError(TransformErrorKind::kCorruptStream,
                                 "Stored block is " + std::to_string(payload.size()) +
                                     " bytes, expected " + std::to_string(expectedLen));
        }
        return ByteBuffer(payload.begin(), payload.end());
    }

    auto* stream = static_cast<z_stream*>(inflateStream_);
    if (stream == nullptr) {
        throw TransformError(TransformErrorKind::kCompressorFailure,
                             "Block transform has been moved from");
    }

    int ret = inflateReset(stream);
    if (ret != Z_OK) {
        throw TransformError(TransformErrorKind::kCompressorFailure,
                             "inflateReset failed: " + std::to_string(ret));
    }

    // One spare byte makes an over-long stream visible as a length mismatch
    ByteBuffer output(expectedLen + 1);
    stream->next_in = const_cast<Bytef*>(payload.data());
    stream->avail_in = static_cast<uInt>(payload.size());
    stream->next_out = output.data();
    stream->avail_out = static_cast<uInt>(output.size());

    ret = inflate(stream, Z_FINISH);
    if (ret != Z_STREAM_END) {
        const char* reason = stream->msg != nullptr ? stream->msg : "stream ended early";
        throw TransformError(TransformErrorKind::kCorruptStream,
                             std::string("Invalid deflate data: ") + reason);
    }

    if (stream->total_out != expectedLen) {
        throw TransformError(TransformErrorKind::kCorruptStream,
                             "Inflated " + std::to_string(stream->total_out) +
                                 " bytes, expected " + std::to_string(expectedLen));
    }

    if (stream->avail_in != 0) {
        ZISO_LOG_TRACE("Ignoring {} trailing bytes after deflate stream", stream->avail_in);
    }

    output.resize(expectedLen);
    return output;
}

}  // namespace ziso::algo
