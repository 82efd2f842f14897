// =============================================================================
// ziso - Compress Command
// =============================================================================
// Command handler for ISO -> ZSO conversion.
//
// This module provides:
// - CompressOptions: Configuration options for compression
// - CompressCommand: Runs the codec engine into an atomic output file
// - Optional round-trip verification of the written image
// =============================================================================

#ifndef ZISO_COMMANDS_COMPRESS_COMMAND_H
#define ZISO_COMMANDS_COMPRESS_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "ziso/codec/codec_engine.h"
#include "ziso/common/error.h"
#include "ziso/common/types.h"

namespace ziso::commands {

// =============================================================================
// Compression Options
// =============================================================================

/// @brief Configuration options for compression.
struct CompressOptions {
    /// @brief Input raw image path.
    std::filesystem::path inputPath;

    /// @brief Output ZSO path.
    std::filesystem::path outputPath;

    /// @brief Block size in bytes (power of two).
    std::uint32_t blockSize = kDefaultBlockSize;

    /// @brief Alignment shift (unset = automatic).
    std::optional<std::uint8_t> alignShift;

    /// @brief Deflate level (1-9).
    CompressionLevel compressionLevel = kDefaultCompressionLevel;

    /// @brief Compression threshold percent (1-100).
    int thresholdPercent = kDefaultThresholdPercent;

    /// @brief Alignment padding byte.
    std::uint8_t paddingByte = kDefaultPaddingByte;

    /// @brief Overwrite existing output file.
    bool forceOverwrite = false;

    /// @brief Decode the written image and compare digests.
    bool verify = false;

    /// @brief Show progress and summary.
    bool showProgress = true;
};

// =============================================================================
// CompressCommand Class
// =============================================================================

/// @brief Command handler for ISO -> ZSO conversion.
class CompressCommand {
public:
    explicit CompressCommand(CompressOptions options);

    ~CompressCommand();

    // Non-copyable, movable
    CompressCommand(const CompressCommand&) = delete;
    CompressCommand& operator=(const CompressCommand&) = delete;
    CompressCommand(CompressCommand&&) noexcept;
    CompressCommand& operator=(CompressCommand&&) noexcept;

    /// @brief Execute the compression.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const codec::EncodeStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const CompressOptions& options() const noexcept { return options_; }

private:
    /// @brief Validate options before execution.
    void validateOptions();

    /// @brief Run the codec engine into the output file.
    void runCompression();

    /// @brief Decode the output and compare its digest with the input's.
    void verifyOutput();

    void printSummary() const;

    CompressOptions options_;
    codec::EncodeStats stats_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create a compress command from CLI options.
/// @param alignShift Alignment shift, negative for automatic.
/// @param padding Padding character (exactly one byte).
/// @throws UsageError if padding is not a single byte.
[[nodiscard]] std::unique_ptr<CompressCommand> createCompressCommand(
    const std::string& inputPath,
    const std::string& outputPath,
    std::uint32_t blockSize,
    int alignShift,
    int level,
    int threshold,
    const std::string& padding,
    bool force,
    bool verify,
    bool showProgress);

}  // namespace ziso::commands

#endif  // ZISO_COMMANDS_COMPRESS_COMMAND_H
