// =============================================================================
// ziso - Info Command
// =============================================================================
// Command handler for displaying ZSO image information.
//
// This module provides:
// - InfoCommand: Display header fields and block statistics
// - Support for JSON output format
// - Detailed per-block ranges and storage mode
// =============================================================================

#ifndef ZISO_COMMANDS_INFO_COMMAND_H
#define ZISO_COMMANDS_INFO_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "ziso/common/error.h"
#include "ziso/format/block_index.h"
#include "ziso/format/zso_format.h"

namespace ziso::commands {

// =============================================================================
// Info Options
// =============================================================================

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Input ZSO path.
    std::filesystem::path inputPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief Show per-block information.
    bool detailed = false;
};

// =============================================================================
// Image Summary
// =============================================================================

/// @brief Everything the info command reports about one image.
struct ImageSummary {
    format::ContainerHeader header;
    std::uint64_t imageSize = 0;
    std::uint64_t compressedBlocks = 0;
    std::uint64_t storedBlocks = 0;

    /// @brief Per-block ranges (filled only for detailed output).
    std::vector<format::BlockLocation> blocks;

    /// @brief ZSO size as a fraction of the raw image size.
    [[nodiscard]] double compressionRatio() const noexcept {
        return header.totalBytes > 0
                   ? static_cast<double>(imageSize) / static_cast<double>(header.totalBytes)
                   : 0.0;
    }
};

/// @brief Read header and index of a ZSO image.
/// @return Summary, or the error that prevented reading it.
[[nodiscard]] Result<ImageSummary> inspectImage(const std::filesystem::path& path,
                                                bool withBlocks);

// =============================================================================
// InfoCommand Class
// =============================================================================

/// @brief Command handler for displaying image information.
class InfoCommand {
public:
    explicit InfoCommand(InfoOptions options);

    ~InfoCommand();

    // Non-copyable, movable
    InfoCommand(const InfoCommand&) = delete;
    InfoCommand& operator=(const InfoCommand&) = delete;
    InfoCommand(InfoCommand&&) noexcept;
    InfoCommand& operator=(InfoCommand&&) noexcept;

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    void printTextInfo(const ImageSummary& summary) const;

    void printJsonInfo(const ImageSummary& summary) const;

    void printBlockDetails(const ImageSummary& summary) const;

    InfoOptions options_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create an info command from CLI options.
[[nodiscard]] std::unique_ptr<InfoCommand> createInfoCommand(
    const std::string& inputPath,
    bool jsonOutput,
    bool detailed);

}  // namespace ziso::commands

#endif  // ZISO_COMMANDS_INFO_COMMAND_H
