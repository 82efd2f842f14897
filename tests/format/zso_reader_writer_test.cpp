// =============================================================================
// ziso - ZSO Writer / Reader Tests
// =============================================================================
// Tests for the on-disk layout produced by ZsoWriter and random access
// through ZsoReader, using in-memory streams.
// =============================================================================

#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "ziso/algo/block_transform.h"
#include "ziso/common/error.h"
#include "ziso/format/zso_format.h"
#include "ziso/format/zso_reader.h"
#include "ziso/format/zso_writer.h"

namespace ziso::format::test {

namespace {

ByteBuffer bytesOf(const std::string& text) {
    return ByteBuffer(text.begin(), text.end());
}

}  // namespace

// =============================================================================
// Writer Tests
// =============================================================================

TEST(ZsoWriterTest, LayoutIsHeaderTablePayloads) {
    std::stringstream sink(std::ios::in | std::ios::out | std::ios::binary);
    ZsoWriter writer(sink);

    const ContainerHeader header = buildHeader(5, 4, 0);
    writer.begin(header);
    EXPECT_EQ(writer.cursor(), header.payloadStart());

    EXPECT_EQ(writer.appendBlock(bytesOf("abcd"), false), 36U);
    EXPECT_EQ(writer.appendBlock(bytesOf("e"), false), 40U);
    writer.finalize();

    const std::string image = sink.str();
    ASSERT_EQ(image.size(), 41U);
    EXPECT_EQ(image.substr(0, 4), "ZISO");
    EXPECT_EQ(image.substr(36), "abcde");

    const auto* raw = reinterpret_cast<const std::uint8_t*>(image.data());
    EXPECT_EQ(loadLE<std::uint32_t>(raw + 24), 36U);
    EXPECT_EQ(loadLE<std::uint32_t>(raw + 28), 40U);
    EXPECT_EQ(loadLE<std::uint32_t>(raw + 32), 41U);
}

TEST(ZsoWriterTest, PadsEveryPayloadToAlignment) {
    std::stringstream sink(std::ios::in | std::ios::out | std::ios::binary);
    ZsoWriter writer(sink, '#');

    writer.begin(buildHeader(6, 4, 3));
    EXPECT_EQ(writer.appendBlock(bytesOf("abcd"), false), 40U);
    EXPECT_EQ(writer.appendBlock(bytesOf("ef"), false), 48U);
    writer.finalize();

    const std::string image = sink.str();
    ASSERT_EQ(image.size(), 56U);
    EXPECT_EQ(image.substr(36, 4), "####");
    EXPECT_EQ(image.substr(40, 8), "abcd####");
    EXPECT_EQ(image.substr(48, 8), "ef######");
    EXPECT_EQ(writer.index().endOffset(), 56U);
}

TEST(ZsoWriterTest, RejectsBlocksBeforeBegin) {
    std::stringstream sink(std::ios::in | std::ios::out | std::ios::binary);
    ZsoWriter writer(sink);

    EXPECT_THROW(writer.appendBlock(bytesOf("x"), false), ZisoException);
}

TEST(ZsoWriterTest, RejectsFinalizeWithMissingBlocks) {
    std::stringstream sink(std::ios::in | std::ios::out | std::ios::binary);
    ZsoWriter writer(sink);
    writer.begin(buildHeader(8, 4, 0));
    writer.appendBlock(bytesOf("abcd"), false);

    EXPECT_THROW(writer.finalize(), ZisoException);
}

// =============================================================================
// Reader Tests
// =============================================================================

TEST(ZsoReaderTest, ReadsBlocksInAnyOrder) {
    const std::string text(10000, 'z');
    std::stringstream sink(std::ios::in | std::ios::out | std::ios::binary);
    {
        ZsoWriter writer(sink);
        algo::BlockTransform transform;
        const ContainerHeader header = buildHeader(text.size(), 2048, 2);
        writer.begin(header);
        for (BlockId i = 0; i < header.blockCount(); ++i) {
            const auto block = bytesOf(text.substr(i * 2048, header.blockLength(i)));
            const auto compressed = transform.compress(block);
            writer.appendBlock(compressed.payload, compressed.usedCompression);
        }
        writer.finalize();
    }

    std::istringstream source(sink.str(), std::ios::binary);
    ZsoReader reader(source, "memory");
    reader.open();

    ASSERT_EQ(reader.blockCount(), 5U);
    EXPECT_EQ(reader.header().totalBytes, text.size());
    EXPECT_EQ(reader.imageSize(), sink.str().size());

    const ByteBuffer last = reader.readBlock(4);
    EXPECT_EQ(last.size(), 10000U - 4 * 2048);
    const ByteBuffer first = reader.readBlock(0);
    EXPECT_EQ(first, bytesOf(text.substr(0, 2048)));
    EXPECT_TRUE(reader.blockLocation(2).compressed);
}

TEST(ZsoReaderTest, RejectsCorruptedMagic) {
    std::stringstream sink(std::ios::in | std::ios::out | std::ios::binary);
    {
        ZsoWriter writer(sink);
        writer.begin(buildHeader(4, 4, 0));
        writer.appendBlock(bytesOf("abcd"), false);
        writer.finalize();
    }

    std::string image = sink.str();
    image[1] = 'X';
    std::istringstream source(image, std::ios::binary);
    ZsoReader reader(source);

    try {
        reader.open();
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.kind(), FormatErrorKind::kBadMagic);
    }
}

TEST(ZsoReaderTest, RejectsTableBeyondEndOfFile) {
    const auto headerBytes = serializeHeader(buildHeader(1 << 20, 2048, 0));
    std::string image(headerBytes.begin(), headerBytes.end());
    image.append(16, '\0');

    std::istringstream source(image, std::ios::binary);
    ZsoReader reader(source);

    try {
        reader.open();
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.kind(), FormatErrorKind::kTruncated);
    }
}

TEST(ZsoReaderTest, RejectsHugeTotalSizeInSmallFile) {
    auto headerBytes = serializeHeader(buildHeader(0, 2048, 0));
    storeLE<std::uint64_t>(headerBytes.data() + 8, UINT64_MAX);
    std::string image(headerBytes.begin(), headerBytes.end());
    image.append(kIndexEntrySize, '\0');

    std::istringstream source(image, std::ios::binary);
    ZsoReader reader(source);

    try {
        reader.open();
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.kind(), FormatErrorKind::kInvalidTotalSize);
    }
    EXPECT_FALSE(reader.isOpen());
}

TEST(ZsoReaderTest, RejectsBlockRangePastEndOfFile) {
    std::stringstream sink(std::ios::in | std::ios::out | std::ios::binary);
    {
        ZsoWriter writer(sink);
        writer.begin(buildHeader(4, 4, 0));
        writer.appendBlock(bytesOf("abcd"), false);
        writer.finalize();
    }

    std::string image = sink.str();
    image.resize(image.size() - 2);
    std::istringstream source(image, std::ios::binary);
    ZsoReader reader(source);
    reader.open();

    EXPECT_THROW(static_cast<void>(reader.readBlock(0)), FormatError);
}

TEST(ZsoReaderTest, RejectsAccessBeforeOpen) {
    std::istringstream source(std::string{}, std::ios::binary);
    ZsoReader reader(source);

    EXPECT_FALSE(reader.isOpen());
    EXPECT_THROW(static_cast<void>(reader.header()), ZisoException);
}

}  // namespace ziso::format::test
