// =============================================================================
// ziso - Decompress Command Implementation
// =============================================================================

#include "decompress_command.h"

#include <fstream>
#include <iomanip>
#include <iostream>

#include "progress.h"
#include "ziso/common/logger.h"
#include "ziso/io/atomic_file.h"

namespace ziso::commands {

// =============================================================================
// DecompressCommand Implementation
// =============================================================================

DecompressCommand::DecompressCommand(DecompressOptions options) : options_(std::move(options)) {}

DecompressCommand::~DecompressCommand() = default;

DecompressCommand::DecompressCommand(DecompressCommand&&) noexcept = default;
DecompressCommand& DecompressCommand::operator=(DecompressCommand&&) noexcept = default;

int DecompressCommand::execute() {
    try {
        validateOptions();

        runDecompression();

        if (options_.showProgress) {
            printSummary();
        }

        return 0;

    } catch (const ZisoException& e) {
        ZISO_LOG_ERROR("Decompression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        ZISO_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void DecompressCommand::validateOptions() {
    if (!std::filesystem::exists(options_.inputPath)) {
        throw IOError(ErrorCode::kFileNotFound,
                      "Input file not found: " + options_.inputPath.string());
    }

    if (!options_.forceOverwrite && std::filesystem::exists(options_.outputPath)) {
        throw IOError(ErrorCode::kFileExists,
                      "Output file already exists: " + options_.outputPath.string() +
                          " (use -f to overwrite)");
    }

    std::error_code ec;
    if (std::filesystem::equivalent(options_.inputPath, options_.outputPath, ec)) {
        throw UsageError("Input and output refer to the same file");
    }
}

void DecompressCommand::runDecompression() {
    std::ifstream input(options_.inputPath, std::ios::binary);
    if (!input) {
        throw IOError(ErrorCode::kFileOpenFailed,
                      "Failed to open input file: " + options_.inputPath.string());
    }

    codec::DecodeOptions decodeOptions;
    decodeOptions.sourceName = options_.inputPath.string();
    if (options_.showProgress) {
        decodeOptions.progress = makeProgressLogger("Decompressed");
    }

    ZISO_LOG_INFO("Decompressing {} -> {}", options_.inputPath.string(),
                  options_.outputPath.string());

    io::AtomicOutputFile output(options_.outputPath, options_.forceOverwrite);
    stats_ = codec::decode(input, output.stream(), decodeOptions);
    output.commit();

    ZISO_LOG_INFO("Decompression complete: {} blocks, {} -> {} bytes", stats_.blockCount,
                  stats_.inputBytes, stats_.outputBytes);
}

void DecompressCommand::printSummary() const {
    std::cout << "\n=== Decompression Summary ===" << std::endl;
    std::cout << "  Input size:        " << stats_.inputBytes << " bytes" << std::endl;
    std::cout << "  Output size:       " << stats_.outputBytes << " bytes" << std::endl;
    std::cout << "  Blocks:            " << stats_.blockCount << std::endl;
    std::cout << "  Compressed blocks: " << stats_.compressedBlocks << std::endl;
    std::cout << "  Stored blocks:     " << stats_.storedBlocks << std::endl;
    std::cout << "  XXH64:             " << std::hex << std::setw(16) << std::setfill('0')
              << stats_.digest << std::dec << std::setfill(' ') << std::endl;
    std::cout << "  Elapsed time:      " << std::fixed << std::setprecision(2)
              << stats_.elapsedSeconds << " s" << std::endl;
    std::cout << "=============================" << std::endl;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<DecompressCommand> createDecompressCommand(
    const std::string& inputPath,
    const std::string& outputPath,
    bool force,
    bool showProgress) {

    DecompressOptions opts;
    opts.inputPath = inputPath;
    opts.outputPath = outputPath;
    opts.forceOverwrite = force;
    opts.showProgress = showProgress;

    return std::make_unique<DecompressCommand>(std::move(opts));
}

}  // namespace ziso::commands
