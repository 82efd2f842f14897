// =============================================================================
// ziso - ZSO Image Reader
// =============================================================================
// Random-access reader for ZSO images.
//
// open() parses the header and the index table; afterwards any block can be
// fetched independently through readBlock().
//
// Usage:
//   std::ifstream file(path, std::ios::binary);
//   ZsoReader reader(file, path.string());
//   reader.open();
//   for (BlockId i = 0; i < reader.blockCount(); ++i) {
//       auto raw = reader.readBlock(i);
//   }
// =============================================================================

#ifndef ZISO_FORMAT_ZSO_READER_H
#define ZISO_FORMAT_ZSO_READER_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

#include "ziso/algo/block_transform.h"
#include "ziso/common/error.h"
#include "ziso/common/types.h"
#include "ziso/format/block_index.h"
#include "ziso/format/zso_format.h"

namespace ziso::format {

// =============================================================================
// ZsoReader Class
// =============================================================================

/// @brief Reads a ZSO image from a seekable input stream.
///
/// Thread Safety:
/// - Not thread-safe; the underlying stream position is shared
///
/// Error Handling:
/// - Throws FormatError on header problems or ranges past the end of the image
/// - Throws IndexError on non-monotonic table entries
/// - Throws TransformError on corrupt block payloads
/// - Throws IOError on read or seek failures
class ZsoReader {
public:
    /// @brief Construct a reader over a source stream.
    /// @param source Seekable input stream positioned at the image start.
    /// @param sourceName Name used in error context (usually the input path).
    explicit ZsoReader(std::istream& source, std::string sourceName = {});

    ZsoReader(const ZsoReader&) = delete;
    ZsoReader& operator=(const ZsoReader&) = delete;

    /// @brief Parse the header and the index table.
    void open();

    [[nodiscard]] bool isOpen() const noexcept { return header_.has_value(); }

    /// @throws ZisoException (kInvalidState) if not open.
    [[nodiscard]] const ContainerHeader& header() const;

    /// @throws ZisoException (kInvalidState) if not open.
    [[nodiscard]] const BlockIndex& index() const;

    [[nodiscard]] std::uint64_t blockCount() const { return header().blockCount(); }

    /// @brief Size of the ZSO image in bytes.
    [[nodiscard]] std::uint64_t imageSize() const noexcept { return imageSize_; }

    /// @brief Byte range and flag of a block.
    /// @throws IndexError if blockId is out of range or the range is inverted.
    [[nodiscard]] BlockLocation blockLocation(BlockId blockId) const;

    /// @brief Stored bytes of a block, alignment padding included.
    [[nodiscard]] ByteBuffer readPayload(BlockId blockId);

    /// @brief Decoded raw bytes of a block.
    /// @note The final block is returned at its true, possibly short, length.
    [[nodiscard]] ByteBuffer readBlock(BlockId blockId);

private:
    void requireOpen() const;
    void readBytes(void* buffer, std::size_t size);
    void seekTo(FileOffset position);

    std::istream& source_;
    std::string sourceName_;

    std::optional<ContainerHeader> header_;
    std::optional<BlockIndex> index_;
    algo::BlockTransform transform_;

    std::streamoff base_ = 0;
    std::uint64_t imageSize_ = 0;
};

}  // namespace ziso::format

#endif  // ZISO_FORMAT_ZSO_READER_H
