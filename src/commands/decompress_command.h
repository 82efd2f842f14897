// =============================================================================
// ziso - Decompress Command
// =============================================================================
// Command handler for ZSO -> ISO conversion.
// =============================================================================

#ifndef ZISO_COMMANDS_DECOMPRESS_COMMAND_H
#define ZISO_COMMANDS_DECOMPRESS_COMMAND_H

#include <filesystem>
#include <memory>
#include <string>

#include "ziso/codec/codec_engine.h"
#include "ziso/common/error.h"

namespace ziso::commands {

// =============================================================================
// Decompression Options
// =============================================================================

/// @brief Configuration options for decompression.
struct DecompressOptions {
    /// @brief Input ZSO path.
    std::filesystem::path inputPath;

    /// @brief Output raw image path.
    std::filesystem::path outputPath;

    /// @brief Overwrite existing output file.
    bool forceOverwrite = false;

    /// @brief Show progress and summary.
    bool showProgress = true;
};

// =============================================================================
// DecompressCommand Class
// =============================================================================

/// @brief Command handler for ZSO -> ISO conversion.
class DecompressCommand {
public:
    explicit DecompressCommand(DecompressOptions options);

    ~DecompressCommand();

    // Non-copyable, movable
    DecompressCommand(const DecompressCommand&) = delete;
    DecompressCommand& operator=(const DecompressCommand&) = delete;
    DecompressCommand(DecompressCommand&&) noexcept;
    DecompressCommand& operator=(DecompressCommand&&) noexcept;

    /// @brief Execute the decompression.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const codec::DecodeStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const DecompressOptions& options() const noexcept { return options_; }

private:
    void validateOptions();

    void runDecompression();

    void printSummary() const;

    DecompressOptions options_;
    codec::DecodeStats stats_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create a decompress command from CLI options.
[[nodiscard]] std::unique_ptr<DecompressCommand> createDecompressCommand(
    const std::string& inputPath,
    const std::string& outputPath,
    bool force,
    bool showProgress);

}  // namespace ziso::commands

#endif  // ZISO_COMMANDS_DECOMPRESS_COMMAND_H
