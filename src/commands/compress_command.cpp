// =============================================================================
// ziso - Compress Command Implementation
// =============================================================================

#include "compress_command.h"

#include <fstream>
#include <iomanip>
#include <iostream>

#include "progress.h"
#include "ziso/common/logger.h"
#include "ziso/io/atomic_file.h"

namespace ziso::commands {

// =============================================================================
// CompressCommand Implementation
// =============================================================================

CompressCommand::CompressCommand(CompressOptions options) : options_(std::move(options)) {}

CompressCommand::~CompressCommand() = default;

CompressCommand::CompressCommand(CompressCommand&&) noexcept = default;
CompressCommand& CompressCommand::operator=(CompressCommand&&) noexcept = default;

int CompressCommand::execute() {
    try {
        validateOptions();

        runCompression();

        if (options_.verify) {
            verifyOutput();
        }

        if (options_.showProgress) {
            printSummary();
        }

        return 0;

    } catch (const ZisoException& e) {
        ZISO_LOG_ERROR("Compression failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        ZISO_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void CompressCommand::validateOptions() {
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

void CompressCommand::runCompression() {
    std::ifstream input(options_.inputPath, std::ios::binary);
    if (!input) {
        throw IOError(ErrorCode::kFileOpenFailed,
                      "Failed to open input file: " + options_.inputPath.string());
    }

    codec::EncodeOptions encodeOptions;
    encodeOptions.blockSize = options_.blockSize;
    encodeOptions.alignShift = options_.alignShift;
    encodeOptions.compressionLevel = options_.compressionLevel;
    encodeOptions.thresholdPercent = options_.thresholdPercent;
    encodeOptions.paddingByte = options_.paddingByte;
    encodeOptions.sourceName = options_.inputPath.string();
    encodeOptions.sinkName = options_.outputPath.string();
    if (options_.showProgress) {
        encodeOptions.progress = makeProgressLogger("Compressed");
    }

    ZISO_LOG_INFO("Compressing {} -> {}", options_.inputPath.string(),
                  options_.outputPath.string());

    io::AtomicOutputFile output(options_.outputPath, options_.forceOverwrite);
    stats_ = codec::encode(input, output.stream(), encodeOptions);
    output.commit();

    ZISO_LOG_INFO("Compression complete: {} blocks, {} -> {} bytes", stats_.blockCount,
                  stats_.inputBytes, stats_.outputBytes);
}

void CompressCommand::verifyOutput() {
    std::ifstream written(options_.outputPath, std::ios::binary);
    if (!written) {
        throw IOError(ErrorCode::kFileOpenFailed,
                      "Failed to reopen output for verification: " +
                          options_.outputPath.string());
    }

    codec::DecodeOptions decodeOptions;
    decodeOptions.sourceName = options_.outputPath.string();

    codec::CodecEngine engine;
    const codec::DecodeStats decoded = engine.verify(written, decodeOptions);

    if (decoded.digest != stats_.digest || decoded.outputBytes != stats_.inputBytes) {
        throw ChecksumError(stats_.digest, decoded.digest,
                            ErrorContext(options_.outputPath.string()));
    }

    ZISO_LOG_INFO("Verification passed: xxh64={:016x}", decoded.digest);
}

void CompressCommand::printSummary() const {
    std::cout << "\n=== Compression Summary ===" << std::endl;
    std::cout << "  Input size:        " << stats_.inputBytes << " bytes" << std::endl;
    std::cout << "  Output size:       " << stats_.outputBytes << " bytes" << std::endl;
    std::cout << "  Blocks:            " << stats_.blockCount << " x " << stats_.blockSize
              << " bytes" << std::endl;
    std::cout << "  Compressed blocks: " << stats_.compressedBlocks << std::endl;
    std::cout << "  Stored blocks:     " << stats_.storedBlocks << std::endl;
    std::cout << "  Alignment:         " << (1U << stats_.alignShift) << " bytes (shift "
              << static_cast<int>(stats_.alignShift) << ")" << std::endl;
    std::cout << "  Compression ratio: " << std::fixed << std::setprecision(2)
              << stats_.compressionRatio() * 100.0 << "%" << std::endl;
    std::cout << "  Elapsed time:      " << std::fixed << std::setprecision(2)
              << stats_.elapsedSeconds << " s" << std::endl;
    std::cout << "===========================" << std::endl;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<CompressCommand> createCompressCommand(
    const std::string& inputPath,
    const std::string& outputPath,
    std::uint32_t blockSize,
    int alignShift,
    int level,
    int threshold,
    const std::string& padding,
    bool force,
    bool verify,
    bool showProgress) {

    if (padding.size() != 1) {
        throw UsageError(ErrorCode::kInvalidArgument,
                         "Padding must be a single character, got '" + padding + "'");
    }

    CompressOptions opts;
    opts.inputPath = inputPath;
    opts.outputPath = outputPath;
    opts.blockSize = blockSize;
    if (alignShift >= 0) {
        opts.alignShift = static_cast<std::uint8_t>(alignShift);
    }
    opts.compressionLevel = level;
    opts.thresholdPercent = threshold;
    opts.paddingByte = static_cast<std::uint8_t>(padding.front());
    opts.forceOverwrite = force;
    opts.verify = verify;
    opts.showProgress = showProgress;

    return std::make_unique<CompressCommand>(std::move(opts));
}

}  // namespace ziso::commands
