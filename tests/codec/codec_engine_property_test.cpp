// =============================================================================
// ziso - Codec Engine Property Tests
// =============================================================================
// Property-based tests for whole-image conversion.
//
// Properties:
// - decode(encode(image)) == image for any size, block size and alignment
// - encode and decode agree on the XXH64 digest of the raw image
// - every payload starts on the configured alignment
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <ios>
#include <span>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

#include "ziso/codec/codec_engine.h"
#include "ziso/common/error.h"
#include "ziso/format/zso_format.h"
#include "ziso/format/zso_reader.h"

namespace ziso::codec::test {

namespace {

std::stringstream makeSink() {
    return std::stringstream(std::ios::in | std::ios::out | std::ios::binary);
}

/// @brief Image made of runs, so some blocks compress and some do not.
rc::Gen<std::string> imageBytes() {
    return rc::gen::container<std::string>(rc::gen::oneOf(
        rc::gen::just('\0'), rc::gen::element('a', 'b'), rc::gen::arbitrary<char>()));
}

/// @brief Seekable input that reports a fixed size but holds no data.
class SizedOnlyBuffer : public std::streambuf {
public:
    explicit SizedOnlyBuffer(std::uint64_t size) : size_(static_cast<std::streamoff>(size)) {}

protected:
    pos_type seekoff(off_type off, std::ios_base::seekdir dir, std::ios_base::openmode) override {
        std::streamoff base = 0;
        if (dir == std::ios_base::cur) {
            base = pos_;
        } else if (dir == std::ios_base::end) {
            base = size_;
        }
        pos_ = base + off;
        return pos_type(pos_);
    }

    pos_type seekpos(pos_type pos, std::ios_base::openmode which) override {
        return seekoff(off_type(pos), std::ios_base::beg, which);
    }

private:
    std::streamoff size_;
    std::streamoff pos_ = 0;
};

}  // namespace

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(CodecEngineProperty, EncodeDecodeRoundTrip, ()) {
    const std::string image = *imageBytes();
    const auto blockShift = *rc::gen::inRange<std::uint32_t>(4, 13);
    const auto alignShift = *rc::gen::inRange<std::uint8_t>(0, format::kMaxAlignShift + 1);

    EncodeOptions options;
    options.blockSize = std::uint32_t{1} << blockShift;
    options.alignShift = alignShift;

    std::istringstream source(image, std::ios::binary);
    auto zso = makeSink();
    const EncodeStats encoded = encode(source, zso, options);

    RC_ASSERT(encoded.inputBytes == image.size());
    RC_ASSERT(encoded.outputBytes == zso.str().size());
    RC_ASSERT(encoded.compressedBlocks + encoded.storedBlocks == encoded.blockCount);

    std::istringstream packed(zso.str(), std::ios::binary);
    auto iso = makeSink();
    const DecodeStats decoded = decode(packed, iso, {});

    RC_ASSERT(iso.str() == image);
    RC_ASSERT(decoded.digest == encoded.digest);
    RC_ASSERT(decoded.outputBytes == image.size());
}

RC_GTEST_PROP(CodecEngineProperty, PayloadsAreAligned, ()) {
    const std::string image = *imageBytes();
    const auto alignShift = *rc::gen::inRange<std::uint8_t>(0, format::kMaxAlignShift + 1);

    EncodeOptions options;
    options.blockSize = 64;
    options.alignShift = alignShift;

    std::istringstream source(image, std::ios::binary);
    auto zso = makeSink();
    encode(source, zso, options);

    std::istringstream packed(zso.str(), std::ios::binary);
    format::ZsoReader reader(packed);
    reader.open();

    const std::uint64_t alignment = std::uint64_t{1} << alignShift;
    for (BlockId i = 0; i < reader.blockCount(); ++i) {
        const auto location = reader.blockLocation(i);
        RC_ASSERT(location.start % alignment == 0U);
        RC_ASSERT(location.end % alignment == 0U);
    }
    RC_ASSERT(reader.imageSize() % alignment == 0U);
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(CodecEngineTest, ShortFinalBlockRoundTrips) {
    const std::string image = std::string(2 * 2048, 'q') + std::string(500, '\0');

    std::istringstream source(image, std::ios::binary);
    auto zso = makeSink();
    const EncodeStats encoded = encode(source, zso, {});
    EXPECT_EQ(encoded.blockCount, 3U);

    std::istringstream packed(zso.str(), std::ios::binary);
    format::ZsoReader reader(packed);
    reader.open();
    EXPECT_EQ(reader.readBlock(2).size(), 500U);

    std::istringstream again(zso.str(), std::ios::binary);
    auto iso = makeSink();
    decode(again, iso, {});
    EXPECT_EQ(iso.str(), image);
}

TEST(CodecEngineTest, EmptyImageRoundTrips) {
    std::istringstream source(std::string{}, std::ios::binary);
    auto zso = makeSink();
    const EncodeStats encoded = encode(source, zso, {});

    EXPECT_EQ(encoded.blockCount, 0U);
    EXPECT_EQ(zso.str().size(), format::kHeaderSize + format::kIndexEntrySize);

    std::istringstream packed(zso.str(), std::ios::binary);
    auto iso = makeSink();
    const DecodeStats decoded = decode(packed, iso, {});
    EXPECT_EQ(decoded.outputBytes, 0U);
    EXPECT_TRUE(iso.str().empty());
}

TEST(CodecEngineTest, CorruptedMagicFailsDecode) {
    std::istringstream source(std::string(4096, '\0'), std::ios::binary);
    auto zso = makeSink();
    encode(source, zso, {});

    std::string image = zso.str();
    image[0] = 'Y';
    std::istringstream packed(image, std::ios::binary);
    auto iso = makeSink();

    CodecEngine engine;
    try {
        engine.decode(packed, iso, {});
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.kind(), FormatErrorKind::kBadMagic);
    }
    EXPECT_EQ(engine.state(), State::kFailed);
    EXPECT_TRUE(iso.str().empty());
}

TEST(CodecEngineTest, WrappedTotalSizeFailsDecode) {
    std::istringstream source(std::string{}, std::ios::binary);
    auto zso = makeSink();
    encode(source, zso, {});

    std::string image = zso.str();
    ASSERT_EQ(image.size(), format::kHeaderSize + format::kIndexEntrySize);
    format::storeLE<std::uint64_t>(reinterpret_cast<std::uint8_t*>(image.data()) + 8, UINT64_MAX);
    std::istringstream packed(image, std::ios::binary);
    auto iso = makeSink();

    CodecEngine engine;
    EXPECT_THROW(engine.decode(packed, iso, {}), FormatError);
    EXPECT_EQ(engine.state(), State::kFailed);
    EXPECT_TRUE(iso.str().empty());
}

TEST(CodecEngineTest, CorruptedPayloadFailsDecode) {
    std::istringstream source(std::string(4096, '\0'), std::ios::binary);
    auto zso = makeSink();
    encode(source, zso, {});

    std::string image = zso.str();
    const auto header = format::parseHeader(
        std::span(reinterpret_cast<const std::uint8_t*>(image.data()), format::kHeaderSize));
    for (std::size_t i = header.payloadStart(); i < image.size(); ++i) {
        image[i] = static_cast<char>(0xFF);
    }

    std::istringstream packed(image, std::ios::binary);
    auto iso = makeSink();
    EXPECT_THROW(decode(packed, iso, {}), TransformError);
}

TEST(CodecEngineTest, OversizedImageFailsBeforeAnyWrite) {
    SizedOnlyBuffer buffer(std::uint64_t{8} << 30);
    std::istream source(&buffer);
    auto zso = makeSink();

    EncodeOptions options;
    options.alignShift = 0;

    CodecEngine engine;
    try {
        engine.encode(source, zso, options);
        FAIL() << "expected IndexError";
    } catch (const IndexError& e) {
        EXPECT_EQ(e.kind(), IndexErrorKind::kOffsetTooLarge);
    }
    EXPECT_EQ(engine.state(), State::kFailed);
    EXPECT_TRUE(zso.str().empty());
}

TEST(CodecEngineTest, ExplicitAlignmentIsCheckedAsGiven) {
    SizedOnlyBuffer buffer(std::uint64_t{200} << 30);
    std::istream source(&buffer);
    auto zso = makeSink();

    EncodeOptions options;
    options.alignShift = 2;

    try {
        static_cast<void>(encode(source, zso, options));
        FAIL() << "expected IndexError";
    } catch (const IndexError& e) {
        EXPECT_EQ(e.kind(), IndexErrorKind::kOffsetTooLarge);
        EXPECT_NE(std::string(e.what()).find("alignment shift 2"), std::string::npos) << e.what();
    }
    EXPECT_TRUE(zso.str().empty());
}

TEST(CodecEngineTest, InvalidOptionsAreUsageErrors) {
    std::istringstream source(std::string(16, 'a'), std::ios::binary);
    auto zso = makeSink();

    EncodeOptions options;
    options.compressionLevel = 12;
    EXPECT_THROW(encode(source, zso, options), UsageError);

    options = {};
    options.blockSize = 1000;
    EXPECT_THROW(encode(source, zso, options), UsageError);

    EXPECT_TRUE(zso.str().empty());
}

TEST(CodecEngineTest, UnreadableSourceIsIOError) {
    // A stream already in a failed state cannot be measured
    std::istringstream source(std::string(4096, 'a'), std::ios::binary);
    source.setstate(std::ios::failbit);
    auto zso = makeSink();

    EXPECT_THROW(encode(source, zso, {}), IOError);
}

TEST(CodecEngineTest, SuccessfulRunEndsDone) {
    std::istringstream source(std::string(5000, 'k'), std::ios::binary);
    auto zso = makeSink();

    std::vector<std::uint64_t> reported;
    EncodeOptions options;
    options.progress = [&](std::uint64_t done, std::uint64_t total) {
        EXPECT_EQ(total, 3U);
        reported.push_back(done);
    };

    CodecEngine engine;
    EXPECT_EQ(engine.state(), State::kInit);
    const EncodeStats stats = engine.encode(source, zso, options);

    EXPECT_EQ(engine.state(), State::kDone);
    EXPECT_EQ(reported, (std::vector<std::uint64_t>{1, 2, 3}));
    EXPECT_EQ(stats.compressedBlocks, 3U);
    EXPECT_LT(stats.compressionRatio(), 1.0);
}

TEST(CodecEngineTest, VerifyMatchesEncodeDigest) {
    const std::string image(10000, 'v');
    std::istringstream source(image, std::ios::binary);
    auto zso = makeSink();
    const EncodeStats encoded = encode(source, zso, {});

    std::istringstream packed(zso.str(), std::ios::binary);
    CodecEngine engine;
    const DecodeStats verified = engine.verify(packed, {});

    EXPECT_EQ(verified.digest, encoded.digest);
    EXPECT_EQ(verified.outputBytes, image.size());
    EXPECT_EQ(engine.state(), State::kDone);
}

TEST(CodecEngineTest, AutomaticAlignmentIsRecorded) {
    std::istringstream source(std::string(3000, 'r'), std::ios::binary);
    auto zso = makeSink();
    const EncodeStats stats = encode(source, zso, {});

    EXPECT_EQ(stats.alignShift, 0U);
    EXPECT_EQ(static_cast<std::uint8_t>(zso.str()[21]), 0U);
}

}  // namespace ziso::codec::test
