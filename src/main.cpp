// =============================================================================
// ziso - ISO <-> ZSO Disc Image Converter
// =============================================================================
// Main entry point for the ziso command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: compress, decompress, info
// - Global options: verbose, quiet, log-file, no-progress
// - TTY detection for progress display
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include <unistd.h>

#include "ziso/common/error.h"
#include "ziso/common/logger.h"
#include "ziso/common/types.h"
#include "ziso/format/zso_format.h"

// Command implementations
#include "commands/compress_command.h"
#include "commands/decompress_command.h"
#include "commands/info_command.h"

namespace ziso::commands {
int runCompress();
int runDecompress();
int runInfo();
}  // namespace ziso::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "ziso: block-compressed disc image converter (ISO <-> ZSO)\n"
    "Each block is deflate-compressed independently, so readers can seek to any\n"
    "block without decompressing the blocks before it.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    bool noProgress = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// TTY Detection
// =============================================================================

/// @brief Check if stdout is a TTY.
[[nodiscard]] bool isStdoutTty() noexcept {
    return isatty(fileno(stdout)) != 0;
}

// =============================================================================
// Compress Command Options
// =============================================================================

struct CliCompressOptions {
    std::string input;
    std::string output;
    std::uint32_t blockSize = ziso::kDefaultBlockSize;
    int align = -1;  // -1 = automatic
    int level = ziso::kDefaultCompressionLevel;
    int threshold = ziso::kDefaultThresholdPercent;
    std::string padding = std::string(1, static_cast<char>(ziso::kDefaultPaddingByte));
    bool force = false;
    bool verify = false;
};

CliCompressOptions gCompressOpts;

// =============================================================================
// Decompress Command Options
// =============================================================================

struct CliDecompressOptions {
    std::string input;
    std::string output;
    bool force = false;
};

CliDecompressOptions gDecompressOpts;

// =============================================================================
// Info Command Options
// =============================================================================

struct CliInfoOptions {
    std::string input;
    bool json = false;
    bool detailed = false;
};

CliInfoOptions gInfoOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

/// @brief CLI11 validator for power-of-two block sizes.
const CLI::Validator kPowerOfTwo(
    [](std::string& value) -> std::string {
        try {
            const auto parsed = std::stoull(value);
            if (parsed > UINT32_MAX ||
                !ziso::format::isValidBlockSize(static_cast<std::uint32_t>(parsed))) {
                return "block size must be a power of two, got " + value;
            }
        } catch (const std::exception&) {
            return "invalid block size: " + value;
        }
        return {};
    },
    "POWER_OF_TWO");

void setupCompressCommand(CLI::App& app) {
    auto* compress = app.add_subcommand("compress", "Compress a raw disc image to .zso");
    compress->alias("c");

    compress->add_option("-i,--input", gCompressOpts.input, "Input raw image (.iso)")
        ->required()
        ->check(CLI::ExistingFile);

    compress->add_option("-o,--output", gCompressOpts.output, "Output .zso file")
        ->required();

    compress->add_option("-b,--block-size", gCompressOpts.blockSize, "Block size in bytes")
        ->default_val(ziso::kDefaultBlockSize)
        ->check(kPowerOfTwo);

    compress->add_option("-a,--align", gCompressOpts.align,
                         "Offset alignment shift (0-6, default: smallest that fits)")
        ->check(CLI::Range(0, static_cast<int>(ziso::format::kMaxAlignShift)));

    compress->add_option("-l,--level", gCompressOpts.level, "Compression level (1-9)")
        ->default_val(ziso::kDefaultCompressionLevel)
        ->check(CLI::Range(ziso::kMinCompressionLevel, ziso::kMaxCompressionLevel));

    compress->add_option("-t,--threshold", gCompressOpts.threshold,
                         "Store a block compressed only below this size percentage (1-100)")
        ->default_val(ziso::kDefaultThresholdPercent)
        ->check(CLI::Range(ziso::kMinThresholdPercent, ziso::kMaxThresholdPercent));

    compress->add_option("-p,--pad", gCompressOpts.padding, "Alignment padding character");

    compress->add_flag("-f,--force", gCompressOpts.force, "Overwrite existing output file");

    compress->add_flag("--verify", gCompressOpts.verify,
                       "Decode the written image and compare checksums");
}

void setupDecompressCommand(CLI::App& app) {
    auto* decompress = app.add_subcommand("decompress", "Decompress a .zso file to a raw image");
    decompress->alias("d");
    decompress->alias("x");

    decompress->add_option("-i,--input", gDecompressOpts.input, "Input .zso file")
        ->required()
        ->check(CLI::ExistingFile);

    decompress->add_option("-o,--output", gDecompressOpts.output, "Output raw image (.iso)")
        ->required();

    decompress->add_flag("-f,--force", gDecompressOpts.force, "Overwrite existing output file");
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Display .zso image information");
    info->alias("i");

    info->add_option("-i,--input", gInfoOpts.input, "Input .zso file")
        ->required()
        ->check(CLI::ExistingFile);

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");

    info->add_flag("--detailed", gInfoOpts.detailed, "Show per-block information");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    app.add_flag("--no-progress", gOptions.noProgress, "Disable progress display");

    setupCompressCommand(app);
    setupDecompressCommand(app);
    setupInfoCommand(app);

    app.require_subcommand(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and --version exit 0; every other parse failure is a usage error
        const int cliExit = app.exit(e);
        return cliExit == 0 ? EXIT_SUCCESS : ziso::toExitCode(ziso::ErrorCode::kUsageError);
    }

    // Initialize logger
    try {
        ziso::log::init(gOptions.logFile,
                         ziso::log::levelForVerbosity(gOptions.verbosity, gOptions.quiet));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return ziso::toExitCode(ziso::ErrorCode::kIOError);
    }

    // Auto-disable progress on non-TTY
    if (!isStdoutTty() && !gOptions.noProgress) {
        gOptions.noProgress = true;
        ZISO_LOG_DEBUG("stdout is not a TTY, disabling progress display");
    }

    int exitCode = EXIT_SUCCESS;
    if (app.got_subcommand("compress")) {
        exitCode = ziso::commands::runCompress();
    } else if (app.got_subcommand("decompress")) {
        exitCode = ziso::commands::runDecompress();
    } else if (app.got_subcommand("info")) {
        exitCode = ziso::commands::runInfo();
    }

    ziso::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace ziso::commands {

int runCompress() {
    try {
        auto cmd = createCompressCommand(gCompressOpts.input,
                                         gCompressOpts.output,
                                         gCompressOpts.blockSize,
                                         gCompressOpts.align,
                                         gCompressOpts.level,
                                         gCompressOpts.threshold,
                                         gCompressOpts.padding,
                                         gCompressOpts.force,
                                         gCompressOpts.verify,
                                         !gOptions.noProgress && !gOptions.quiet);
        return cmd->execute();
    } catch (const ZisoException& e) {
        ZISO_LOG_ERROR("Compression failed: {}", e.what());
        return e.exitCode();
    }
}

int runDecompress() {
    try {
        auto cmd = createDecompressCommand(gDecompressOpts.input,
                                           gDecompressOpts.output,
                                           gDecompressOpts.force,
                                           !gOptions.noProgress && !gOptions.quiet);
        return cmd->execute();
    } catch (const ZisoException& e) {
        ZISO_LOG_ERROR("Decompression failed: {}", e.what());
        return e.exitCode();
    }
}

int runInfo() {
    try {
        auto cmd = createInfoCommand(gInfoOpts.input, gInfoOpts.json, gInfoOpts.detailed);
        return cmd->execute();
    } catch (const ZisoException& e) {
        ZISO_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace ziso::commands
