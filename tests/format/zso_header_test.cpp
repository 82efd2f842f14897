// =============================================================================
// ziso - ZSO Container Header Tests
// =============================================================================
// Unit and property tests for header construction, the fixed 24-byte layout
// and header validation.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <array>
#include <cstdint>
#include <span>

#include "ziso/common/error.h"
#include "ziso/format/zso_format.h"

namespace ziso::format::test {

namespace {

/// @brief Expect parseHeader to fail with the given kind.
void expectFormatError(std::span<const std::uint8_t> bytes, FormatErrorKind kind) {
    try {
        static_cast<void>(parseHeader(bytes));
        FAIL() << "expected FormatError (" << formatErrorKindToString(kind) << ")";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
    }
}

}  // namespace

// =============================================================================
// Layout Tests
// =============================================================================

TEST(ZsoHeaderTest, SerializedLayoutIsLittleEndian) {
    const ContainerHeader header = buildHeader(0x0102030405060708ULL, 0x800, 3);
    const auto bytes = serializeHeader(header);

    const std::array<std::uint8_t, kHeaderSize> expected = {
        'Z',  'I',  'S',  'O',                           // magic
        0x18, 0x00, 0x00, 0x00,                          // header size
        0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01,  // total bytes
        0x00, 0x08, 0x00, 0x00,                          // block size
        0x01,                                            // version
        0x03,                                            // align shift
        0x00, 0x00                                       // reserved
    };
    EXPECT_EQ(bytes, expected);
}

TEST(ZsoHeaderTest, GeometryHelpers) {
    const ContainerHeader header = buildHeader(4096 + 500, 2048, 0);

    EXPECT_EQ(header.blockCount(), 3U);
    EXPECT_EQ(header.blockLength(0), 2048U);
    EXPECT_EQ(header.blockLength(1), 2048U);
    EXPECT_EQ(header.blockLength(2), 500U);
    EXPECT_EQ(header.tableSize(), 16U);
    EXPECT_EQ(header.payloadStart(), 40U);
}

TEST(ZsoHeaderTest, PayloadStartIsAligned) {
    const ContainerHeader header = buildHeader(4096, 2048, 4);

    // 24 + 3 * 4 = 36, rounded up to 16
    EXPECT_EQ(header.payloadStart(), 48U);
    EXPECT_EQ(header.alignment(), 16U);
}

TEST(ZsoHeaderTest, EmptyImageHasOnlySentinel) {
    const ContainerHeader header = buildHeader(0, 2048, 0);

    EXPECT_EQ(header.blockCount(), 0U);
    EXPECT_EQ(header.tableSize(), kIndexEntrySize);
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST(ZsoHeaderTest, BuildRejectsInvalidGeometry) {
    EXPECT_THROW(static_cast<void>(buildHeader(1024, 0, 0)), FormatError);
    EXPECT_THROW(static_cast<void>(buildHeader(1024, 3000, 0)), FormatError);
    EXPECT_THROW(static_cast<void>(buildHeader(1024, 2048, kMaxAlignShift + 1)), FormatError);
}

TEST(ZsoHeaderTest, ParseRejectsTruncatedHeader) {
    const auto bytes = serializeHeader(buildHeader(4096, 2048, 0));
    expectFormatError(std::span(bytes).first(kHeaderSize - 1), FormatErrorKind::kTruncated);
}

TEST(ZsoHeaderTest, ParseRejectsBadMagic) {
    auto bytes = serializeHeader(buildHeader(4096, 2048, 0));
    bytes[0] ^= 0xFF;
    expectFormatError(bytes, FormatErrorKind::kBadMagic);
}

TEST(ZsoHeaderTest, ParseRejectsBadHeaderSize) {
    auto bytes = serializeHeader(buildHeader(4096, 2048, 0));
    bytes[4] = 0x20;
    expectFormatError(bytes, FormatErrorKind::kBadHeaderSize);
}

TEST(ZsoHeaderTest, ParseRejectsNewerVersion) {
    auto bytes = serializeHeader(buildHeader(4096, 2048, 0));
    bytes[20] = kCurrentVersion + 1;
    expectFormatError(bytes, FormatErrorKind::kUnsupportedVersion);
}

TEST(ZsoHeaderTest, ParseRejectsNonPowerOfTwoBlockSize) {
    auto bytes = serializeHeader(buildHeader(4096, 2048, 0));
    storeLE<std::uint32_t>(bytes.data() + 16, 3000);
    expectFormatError(bytes, FormatErrorKind::kInvalidBlockSize);
}

TEST(ZsoHeaderTest, ParseRejectsOversizedAlignShift) {
    auto bytes = serializeHeader(buildHeader(4096, 2048, 0));
    bytes[21] = kMaxAlignShift + 1;
    expectFormatError(bytes, FormatErrorKind::kInvalidAlignment);
}

TEST(ZsoHeaderTest, BlockCountDoesNotWrapNearMaximumSize) {
    EXPECT_EQ(computeBlockCount(UINT64_MAX, 2048), std::uint64_t{1} << 53);
    EXPECT_EQ(computeBlockCount(UINT64_MAX, 1), UINT64_MAX);
    EXPECT_EQ(computeBlockCount(4097, 2048), 3U);
}

TEST(ZsoHeaderTest, ParseRejectsUnaddressableTotalSize) {
    auto bytes = serializeHeader(buildHeader(4096, 2048, 0));
    storeLE<std::uint64_t>(bytes.data() + 8, UINT64_MAX);
    expectFormatError(bytes, FormatErrorKind::kInvalidTotalSize);

    // 2^29 one-byte blocks need a table larger than 31 offset bits at shift 0
    auto small = serializeHeader(buildHeader(4096, 1, 0));
    storeLE<std::uint64_t>(small.data() + 8, std::uint64_t{1} << 29);
    expectFormatError(small, FormatErrorKind::kInvalidTotalSize);

    // The same count is addressable with a wider alignment
    small[21] = 1;
    EXPECT_EQ(parseHeader(small).blockCount(), std::uint64_t{1} << 29);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(ZsoHeaderProperty, SerializeParseRoundTrip, ()) {
    const auto totalBytes = *rc::gen::inRange<std::uint64_t>(0, std::uint64_t{1} << 40);
    const auto blockShift = *rc::gen::inRange<std::uint32_t>(12, 31);
    const auto alignShift = *rc::gen::inRange<std::uint8_t>(0, kMaxAlignShift + 1);

    const ContainerHeader header =
        buildHeader(totalBytes, std::uint32_t{1} << blockShift, alignShift);
    const ContainerHeader parsed = parseHeader(serializeHeader(header));

    RC_ASSERT(parsed.magic == kMagic);
    RC_ASSERT(parsed.totalBytes == totalBytes);
    RC_ASSERT(parsed.blockSize == header.blockSize);
    RC_ASSERT(parsed.alignShift == alignShift);
    RC_ASSERT(parsed.version == kCurrentVersion);
}

RC_GTEST_PROP(ZsoHeaderProperty, BlockLengthsCoverImage, ()) {
    const auto totalBytes = *rc::gen::inRange<std::uint64_t>(0, 1 << 20);
    const auto blockShift = *rc::gen::inRange<std::uint32_t>(4, 16);

    const ContainerHeader header = buildHeader(totalBytes, std::uint32_t{1} << blockShift, 0);

    std::uint64_t covered = 0;
    for (BlockId i = 0; i < header.blockCount(); ++i) {
        const auto length = header.blockLength(i);
        RC_ASSERT(length > 0U);
        RC_ASSERT(length <= header.blockSize);
        if (i + 1 < header.blockCount()) {
            RC_ASSERT(length == header.blockSize);
        }
        covered += length;
    }
    RC_ASSERT(covered == totalBytes);
}

RC_GTEST_PROP(ZsoHeaderProperty, IndexEntryPackingPreservesFields, ()) {
    const auto offset = *rc::gen::inRange<std::uint32_t>(0, kStoredOffsetMask);
    const auto compressed = *rc::gen::arbitrary<bool>();

    const IndexEntry entry{offset, compressed};
    const std::uint32_t word = packIndexEntry(entry);

    RC_ASSERT(((word & kCompressedFlag) != 0) == compressed);
    RC_ASSERT(unpackIndexEntry(word) == entry);
}

}  // namespace ziso::format::test
