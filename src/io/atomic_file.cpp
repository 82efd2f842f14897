// =============================================================================
// ziso - Atomic Output File Implementation
// =============================================================================

#include "ziso/io/atomic_file.h"

#include <unistd.h>

#include <array>
#include <csignal>
#include <utility>

#include "ziso/common/logger.h"

namespace ziso::io {

// =============================================================================
// Signal Handler Management
// =============================================================================

namespace {

/// @brief Most outputs open at once that a signal can clean up.
constexpr std::size_t kMaxCleanupSlots = 16;

/// @brief Temporary paths removed when a termination signal arrives.
/// @note Slots hold tempPath().c_str() of a live file; the handler only
///       reads and clears them, so no lock is taken there.
std::array<std::atomic<const char*>, kMaxCleanupSlots> gCleanupPaths{};

static_assert(std::atomic<const char*>::is_always_lock_free,
              "Signal cleanup slots must be lock-free");

std::atomic<bool> gSignalHandlersInstalled{false};

void (*gPreviousSigintHandler)(int) = nullptr;

void (*gPreviousSigtermHandler)(int) = nullptr;

void signalHandler(int signum) {
    removeRegisteredTempFiles();

    // Chain to the previous handler or fall back to the default action
    if (signum == SIGINT && gPreviousSigintHandler != nullptr &&
        gPreviousSigintHandler != SIG_DFL && gPreviousSigintHandler != SIG_IGN) {
        gPreviousSigintHandler(signum);
    } else if (signum == SIGTERM && gPreviousSigtermHandler != nullptr &&
               gPreviousSigtermHandler != SIG_DFL && gPreviousSigtermHandler != SIG_IGN) {
        gPreviousSigtermHandler(signum);
    } else {
        std::signal(signum, SIG_DFL);
        std::raise(signum);
    }
}

}  // namespace

void registerForCleanup(AtomicOutputFile* file) {
    const char* path = file->tempPath().c_str();
    for (auto& slot : gCleanupPaths) {
        const char* expected = nullptr;
        if (slot.compare_exchange_strong(expected, path)) {
            return;
        }
    }
    ZISO_LOG_WARNING("Too many open outputs; {} is not removed on interrupt",
                     file->tempPath().string());
}

void unregisterForCleanup(AtomicOutputFile* file) {
    const char* path = file->tempPath().c_str();
    for (auto& slot : gCleanupPaths) {
        const char* expected = path;
        if (slot.compare_exchange_strong(expected, nullptr)) {
            return;
        }
    }
}

void removeRegisteredTempFiles() noexcept {
    for (auto& slot : gCleanupPaths) {
        if (const char* path = slot.exchange(nullptr)) {
            ::unlink(path);
        }
    }
}

void installSignalHandlers() {
    bool expected = false;
    if (!gSignalHandlersInstalled.compare_exchange_strong(expected, true)) {
        return;
    }

    gPreviousSigintHandler = std::signal(SIGINT, signalHandler);
    if (gPreviousSigintHandler == SIG_ERR) {
        ZISO_LOG_WARNING("Failed to install SIGINT handler");
        gPreviousSigintHandler = nullptr;
    }

    gPreviousSigtermHandler = std::signal(SIGTERM, signalHandler);
    if (gPreviousSigtermHandler == SIG_ERR) {
        ZISO_LOG_WARNING("Failed to install SIGTERM handler");
        gPreviousSigtermHandler = nullptr;
    }

    ZISO_LOG_DEBUG("Signal handlers installed for SIGINT and SIGTERM");
}

// =============================================================================
// AtomicOutputFile Implementation
// =============================================================================

AtomicOutputFile::AtomicOutputFile(std::filesystem::path target, bool overwrite)
    : targetPath_(std::move(target)), tempPath_(targetPath_.string() + ".tmp") {
    std::error_code ec;
    if (!overwrite && std::filesystem::exists(targetPath_, ec)) {
        throw IOError(ErrorCode::kFileExists,
                      "Output file already exists: " + targetPath_.string() +
                          " (use --force to overwrite)");
    }

    installSignalHandlers();

    stream_.open(tempPath_, std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        throw IOError(ErrorCode::kFileOpenFailed,
                      "Failed to create temporary file: " + tempPath_.string());
    }

    registerForCleanup(this);

    ZISO_LOG_DEBUG("Atomic output opened: target={}, temp={}", targetPath_.string(),
                   tempPath_.string());
}

AtomicOutputFile::~AtomicOutputFile() {
    unregisterForCleanup(this);

    if (!committed_ && !aborted_) {
        abort();
    }
}

void AtomicOutputFile::commit() {
    if (committed_) {
        return;
    }
    if (aborted_) {
        throw ZisoException(ErrorCode::kInvalidState, "Output file was aborted");
    }

    stream_.flush();
    if (!stream_.good()) {
        abort();
        throw IOError("Failed to flush output file", ErrorContext(tempPath_.string()));
    }
    stream_.close();

    std::error_code ec;
    std::filesystem::rename(tempPath_, targetPath_, ec);
    if (ec) {
        abort();
        throw IOError("Failed to rename temporary file to final output", ec,
                      ErrorContext(targetPath_.string()));
    }

    committed_ = true;
    unregisterForCleanup(this);

    ZISO_LOG_DEBUG("Atomic output committed: {}", targetPath_.string());
}

void AtomicOutputFile::abort() noexcept {
    bool expected = false;
    if (!aborted_.compare_exchange_strong(expected, true)) {
        return;
    }

    cleanupTempFile();
}

void AtomicOutputFile::cleanupTempFile() noexcept {
    if (stream_.is_open()) {
        stream_.close();
    }

    std::error_code ec;
    if (std::filesystem::exists(tempPath_, ec)) {
        std::filesystem::remove(tempPath_, ec);
        if (ec) {
            ZISO_LOG_WARNING("Failed to remove temporary file: {}", tempPath_.string());
        }
    }
}

}  // namespace ziso::io
