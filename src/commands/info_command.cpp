// =============================================================================
// ziso - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "ziso/common/logger.h"
#include "ziso/format/zso_reader.h"

namespace ziso::commands {

namespace {

/// @brief Escape a string for a JSON string literal.
std::string jsonEscape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c);
                    escaped += hex.str();
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

}  // namespace

// =============================================================================
// Image Inspection
// =============================================================================

Result<ImageSummary> inspectImage(const std::filesystem::path& path, bool withBlocks) {
    return tryExecute([&]() {
        if (!std::filesystem::exists(path)) {
            throw IOError(ErrorCode::kFileNotFound, "Input file not found: " + path.string());
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw IOError(ErrorCode::kFileOpenFailed, "Failed to open file: " + path.string());
        }

        format::ZsoReader reader(file, path.string());
        reader.open();

        ImageSummary summary;
        summary.header = reader.header();
        summary.imageSize = reader.imageSize();
        summary.compressedBlocks = reader.index().compressedBlockCount();
        summary.storedBlocks = reader.blockCount() - summary.compressedBlocks;

        if (withBlocks) {
            summary.blocks.reserve(reader.blockCount());
            for (BlockId blockId = 0; blockId < reader.blockCount(); ++blockId) {
                summary.blocks.push_back(reader.blockLocation(blockId));
            }
        }

        return summary;
    });
}

// =============================================================================
// InfoCommand Implementation
// =============================================================================

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

InfoCommand::~InfoCommand() = default;

InfoCommand::InfoCommand(InfoCommand&&) noexcept = default;
InfoCommand& InfoCommand::operator=(InfoCommand&&) noexcept = default;

int InfoCommand::execute() {
    auto summary = inspectImage(options_.inputPath, options_.detailed);
    if (!summary) {
        ZISO_LOG_ERROR("Info command failed: {}", summary.error().message());
        return summary.error().exitCode();
    }

    if (options_.jsonOutput) {
        printJsonInfo(*summary);
    } else {
        printTextInfo(*summary);
    }

    return 0;
}

void InfoCommand::printTextInfo(const ImageSummary& summary) const {
    const auto& header = summary.header;

    std::cout << "=== ZSO Image Information ===" << std::endl;
    std::cout << std::endl;
    std::cout << "File:              " << options_.inputPath.string() << std::endl;
    std::cout << "Size:              " << summary.imageSize << " bytes" << std::endl;
    std::cout << "Version:           " << static_cast<int>(header.version) << std::endl;
    std::cout << "Original size:     " << header.totalBytes << " bytes" << std::endl;
    std::cout << "Block size:        " << header.blockSize << " bytes" << std::endl;
    std::cout << "Alignment:         " << header.alignment() << " bytes (shift "
              << static_cast<int>(header.alignShift) << ")" << std::endl;
    std::cout << "Blocks:            " << header.blockCount() << std::endl;
    std::cout << "Compressed blocks: " << summary.compressedBlocks << std::endl;
    std::cout << "Stored blocks:     " << summary.storedBlocks << std::endl;
    std::cout << "Compression ratio: " << std::fixed << std::setprecision(2)
              << summary.compressionRatio() * 100.0 << "%" << std::endl;

    if (options_.detailed) {
        printBlockDetails(summary);
    }

    std::cout << std::endl;
    std::cout << "=============================" << std::endl;
}

void InfoCommand::printJsonInfo(const ImageSummary& summary) const {
    const auto& header = summary.header;

    std::cout << "{" << std::endl;
    std::cout << "  \"file\": \"" << jsonEscape(options_.inputPath.string()) << "\","
              << std::endl;
    std::cout << "  \"size\": " << summary.imageSize << "," << std::endl;
    std::cout << "  \"version\": " << static_cast<int>(header.version) << "," << std::endl;
    std::cout << "  \"total_bytes\": " << header.totalBytes << "," << std::endl;
    std::cout << "  \"block_size\": " << header.blockSize << "," << std::endl;
    std::cout << "  \"align_shift\": " << static_cast<int>(header.alignShift) << ","
              << std::endl;
    std::cout << "  \"block_count\": " << header.blockCount() << "," << std::endl;
    std::cout << "  \"compressed_blocks\": " << summary.compressedBlocks << "," << std::endl;
    std::cout << "  \"stored_blocks\": " << summary.storedBlocks << "," << std::endl;
    std::cout << "  \"compression_ratio\": " << std::fixed << std::setprecision(4)
              << summary.compressionRatio();

    if (options_.detailed) {
        std::cout << "," << std::endl;
        std::cout << "  \"blocks\": [" << std::endl;
        for (std::size_t i = 0; i < summary.blocks.size(); ++i) {
            const auto& block = summary.blocks[i];
            std::cout << "    {\"id\": " << i << ", \"offset\": " << block.start
                      << ", \"size\": " << block.size()
                      << ", \"compressed\": " << (block.compressed ? "true" : "false") << "}"
                      << (i + 1 < summary.blocks.size() ? "," : "") << std::endl;
        }
        std::cout << "  ]" << std::endl;
    } else {
        std::cout << std::endl;
    }

    std::cout << "}" << std::endl;
}

void InfoCommand::printBlockDetails(const ImageSummary& summary) const {
    std::cout << std::endl;
    std::cout << "--- Block Details ---" << std::endl;
    std::cout << std::setw(10) << "Block" << std::setw(16) << "Offset" << std::setw(10)
              << "Size" << "  Mode" << std::endl;

    for (std::size_t i = 0; i < summary.blocks.size(); ++i) {
        const auto& block = summary.blocks[i];
        std::cout << std::setw(10) << i << std::setw(16) << block.start << std::setw(10)
                  << block.size() << "  " << (block.compressed ? "deflate" : "stored")
                  << std::endl;
    }
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<InfoCommand> createInfoCommand(
    const std::string& inputPath,
    bool jsonOutput,
    bool detailed) {

    InfoOptions opts;
    opts.inputPath = inputPath;
    opts.jsonOutput = jsonOutput;
    opts.detailed = detailed;

    return std::make_unique<InfoCommand>(std::move(opts));
}

}  // namespace ziso::commands
