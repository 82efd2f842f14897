// =============================================================================
// ziso - Codec Engine Implementation
// =============================================================================

#include "ziso/codec/codec_engine.h"

#include <chrono>
#include <memory>
#include <span>
#include <string>

#include <xxhash.h>

#include "ziso/algo/block_transform.h"
#include "ziso/common/logger.h"
#include "ziso/format/block_index.h"
#include "ziso/format/zso_format.h"
#include "ziso/format/zso_reader.h"
#include "ziso/format/zso_writer.h"

namespace ziso::codec {

namespace {

using Clock = std::chrono::steady_clock;

/// @brief Owning handle for an XXH64 streaming state.
using HashState = std::unique_ptr<XXH64_state_t, decltype(&XXH64_freeState)>;

HashState makeHashState() {
    HashState state(XXH64_createState(), &XXH64_freeState);
    if (!state || XXH64_reset(state.get(), 0) != XXH_OK) {
        throw IOError("Failed to create xxHash64 state");
    }
    return state;
}

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

}  // namespace

std::string_view stateToString(State state) noexcept {
    switch (state) {
        case State::kInit:
            return "init";
        case State::kHeaderDone:
            return "header-done";
        case State::kTableDone:
            return "table-done";
        case State::kStreaming:
            return "streaming";
        case State::kDone:
            return "done";
        case State::kFailed:
            return "failed";
    }
    return "unknown";
}

// =============================================================================
// EncodeOptions Implementation
// =============================================================================

VoidResult EncodeOptions::validate() const {
    if (!format::isValidBlockSize(blockSize)) {
        return std::unexpected(Error{ErrorCode::kInvalidArgument,
                                     "Block size must be a non-zero power of two, got " +
                                         std::to_string(blockSize)});
    }
    if (alignShift && *alignShift > format::kMaxAlignShift) {
        return std::unexpected(Error{ErrorCode::kInvalidArgument,
                                     "Alignment shift must be 0-" +
                                         std::to_string(format::kMaxAlignShift) + ", got " +
                                         std::to_string(*alignShift)});
    }
    algo::BlockTransformConfig transformConfig;
    transformConfig.level = compressionLevel;
    transformConfig.thresholdPercent = thresholdPercent;
    return transformConfig.validate();
}

// =============================================================================
// CodecEngine Implementation
// =============================================================================

void CodecEngine::transition(State next) noexcept {
    ZISO_LOG_TRACE("Codec state {} -> {}", stateToString(state_), stateToString(next));
    state_ = next;
}

EncodeStats CodecEngine::encode(std::istream& source,
                                std::ostream& sink,
                                const EncodeOptions& options) {
    state_ = State::kInit;
    const auto start = Clock::now();

    try {
        if (auto valid = options.validate(); !valid) {
            throw UsageError(valid.error().code(), valid.error().message());
        }

        const std::uint64_t totalBytes = streamLength(source);
        const std::uint8_t alignShift =
            options.alignShift ? *options.alignShift
                               : format::minimumAlignShift(totalBytes, options.blockSize);

        const format::ContainerHeader header =
            format::buildHeader(totalBytes, options.blockSize, alignShift);

        // Fails before the first byte reaches the sink
        format::checkEncodable(totalBytes, options.blockSize, alignShift);

        algo::BlockTransform transform(algo::BlockTransformConfig{
            .level = options.compressionLevel, .thresholdPercent = options.thresholdPercent});
        format::ZsoWriter writer(sink, options.paddingByte, options.sinkName);
        HashState hash = makeHashState();

        writer.begin(header);
        transition(State::kHeaderDone);
        transition(State::kTableDone);

        EncodeStats stats;
        stats.blockCount = header.blockCount();
        stats.inputBytes = totalBytes;
        stats.blockSize = header.blockSize;
        stats.alignShift = alignShift;

        ZISO_LOG_DEBUG("Encoding {} bytes: blockSize={}, alignShift={}, blocks={}", totalBytes,
                       header.blockSize, alignShift, stats.blockCount);

        transition(State::kStreaming);
        ByteBuffer raw(header.blockSize);
        for (BlockId blockId = 0; blockId < stats.blockCount; ++blockId) {
            const std::size_t length = header.blockLength(blockId);
            source.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(length));
            if (static_cast<std::size_t>(source.gcount()) != length) {
                throw IOError("Source ended early while reading block " + std::to_string(blockId),
                              ErrorContext(options.sourceName)
                                  .withBlock(blockId)
                                  .withOffset(blockId * header.blockSize));
            }

            const std::span<const std::uint8_t> block(raw.data(), length);
            XXH64_update(hash.get(), block.data(), block.size());

            const algo::CompressedBlock compressed = transform.compress(block);
            writer.appendBlock(compressed.payload, compressed.usedCompression);

            if (compressed.usedCompression) {
                ++stats.compressedBlocks;
            } else {
                ++stats.storedBlocks;
            }

            if (options.progress) {
                options.progress(blockId + 1, stats.blockCount);
            }
        }

        writer.finalize();
        transition(State::kDone);

        stats.outputBytes = writer.cursor();
        stats.digest = XXH64_digest(hash.get());
        stats.elapsedSeconds = secondsSince(start);

        ZISO_LOG_DEBUG("Encode finished: {} -> {} bytes ({} compressed, {} stored blocks)",
                       stats.inputBytes, stats.outputBytes, stats.compressedBlocks,
                       stats.storedBlocks);
        return stats;
    } catch (...) {
        transition(State::kFailed);
        throw;
    }
}

DecodeStats CodecEngine::decode(std::istream& source,
                                std::ostream& sink,
                                const DecodeOptions& options) {
    return runDecode(source, &sink, options);
}

DecodeStats CodecEngine::verify(std::istream& source, const DecodeOptions& options) {
    return runDecode(source, nullptr, options);
}

DecodeStats CodecEngine::runDecode(std::istream& source,
                                   std::ostream* sink,
                                   const DecodeOptions& options) {
    state_ = State::kInit;
    const auto start = Clock::now();

    try {
        format::ZsoReader reader(source, options.sourceName);
        reader.open();
        transition(State::kHeaderDone);
        transition(State::kTableDone);

        const format::ContainerHeader& header = reader.header();
        HashState hash = makeHashState();

        DecodeStats stats;
        stats.blockCount = header.blockCount();
        stats.inputBytes = reader.imageSize();

        ZISO_LOG_DEBUG("Decoding {} blocks into {} bytes", stats.blockCount, header.totalBytes);

        transition(State::kStreaming);
        for (BlockId blockId = 0; blockId < stats.blockCount; ++blockId) {
            const ByteBuffer raw = reader.readBlock(blockId);
            XXH64_update(hash.get(), raw.data(), raw.size());

            if (sink != nullptr) {
                sink->write(reinterpret_cast<const char*>(raw.data()),
                            static_cast<std::streamsize>(raw.size()));
                if (!sink->good()) {
                    throw IOError("Failed to write restored block " + std::to_string(blockId),
                                  ErrorContext().withBlock(blockId).withOffset(stats.outputBytes));
                }
            }
            stats.outputBytes += raw.size();

            if (reader.index().entry(blockId).compressed) {
                ++stats.compressedBlocks;
            } else {
                ++stats.storedBlocks;
            }

            if (options.progress) {
                options.progress(blockId + 1, stats.blockCount);
            }
        }

        if (sink != nullptr) {
            sink->flush();
            if (!sink->good()) {
                throw IOError("Failed to flush restored image");
            }
        }
        transition(State::kDone);

        stats.digest = XXH64_digest(hash.get());
        stats.elapsedSeconds = secondsSince(start);

        ZISO_LOG_DEBUG("Decode finished: {} -> {} bytes", stats.inputBytes, stats.outputBytes);
        return stats;
    } catch (...) {
        transition(State::kFailed);
        throw;
    }
}

// =============================================================================
// Convenience Functions
// =============================================================================

EncodeStats encode(std::istream& source, std::ostream& sink, const EncodeOptions& options) {
    CodecEngine engine;
    return engine.encode(source, sink, options);
}

DecodeStats decode(std::istream& source, std::ostream& sink, const DecodeOptions& options) {
    CodecEngine engine;
    return engine.decode(source, sink, options);
}

std::uint64_t streamLength(std::istream& stream) {
    const std::streamoff start = stream.tellg();
    if (start < 0) {
        throw IOError(ErrorCode::kSeekFailed, "Input stream is not seekable");
    }

    stream.seekg(0, std::ios::end);
    const std::streamoff end = stream.tellg();
    stream.seekg(start, std::ios::beg);
    if (!stream.good() || end < start) {
        throw IOError(ErrorCode::kSeekFailed, "Failed to determine input stream length");
    }

    return static_cast<std::uint64_t>(end - start);
}

}  // namespace ziso::codec
