// =============================================================================
// ziso - Atomic Output File
// =============================================================================
// Output file written through a temporary sibling and renamed on commit.
//
// Key features:
// - Data goes to "<target>.tmp"; the target appears only after commit()
// - The temporary file is removed on abort(), on destruction without
//   commit(), and on SIGINT/SIGTERM
//
// Usage:
//   AtomicOutputFile out(outputPath, overwrite);
//   codec::encode(in, out.stream(), options);
//   out.commit();
// =============================================================================

#ifndef ZISO_IO_ATOMIC_FILE_H
#define ZISO_IO_ATOMIC_FILE_H

#include <atomic>
#include <filesystem>
#include <fstream>

#include "ziso/common/error.h"

namespace ziso::io {

class AtomicOutputFile;

// =============================================================================
// Signal Cleanup Registry
// =============================================================================

/// @brief Register a file for cleanup on SIGINT/SIGTERM.
void registerForCleanup(AtomicOutputFile* file);

/// @brief Unregister a file from signal cleanup.
void unregisterForCleanup(AtomicOutputFile* file);

/// @brief Unlink every registered temporary file and clear the registry.
/// @note Async-signal-safe; this is what the SIGINT/SIGTERM handler runs.
void removeRegisteredTempFiles() noexcept;

/// @brief Install SIGINT/SIGTERM handlers (idempotent).
void installSignalHandlers();

// =============================================================================
// AtomicOutputFile Class
// =============================================================================

/// @brief Binary output file committed by rename.
///
/// Thread Safety:
/// - Not thread-safe
class AtomicOutputFile {
public:
    /// @brief Open "<target>.tmp" for writing.
    /// @param target Final output path.
    /// @param overwrite Replace an existing target on commit.
    /// @throws IOError (kFileExists) if target exists and overwrite is false.
    /// @throws IOError (kFileOpenFailed) if the temporary file cannot be created.
    explicit AtomicOutputFile(std::filesystem::path target, bool overwrite = false);

    /// @brief Removes the temporary file unless committed.
    ~AtomicOutputFile();

    AtomicOutputFile(const AtomicOutputFile&) = delete;
    AtomicOutputFile& operator=(const AtomicOutputFile&) = delete;
    AtomicOutputFile(AtomicOutputFile&&) = delete;
    AtomicOutputFile& operator=(AtomicOutputFile&&) = delete;

    /// @brief Seekable stream over the temporary file.
    [[nodiscard]] std::ofstream& stream() noexcept { return stream_; }

    /// @brief Flush, close and rename the temporary file onto the target.
    /// @throws IOError on flush or rename failure (the temporary file is removed).
    void commit();

    /// @brief Discard the temporary file.
    void abort() noexcept;

    [[nodiscard]] const std::filesystem::path& targetPath() const noexcept { return targetPath_; }

    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }

    [[nodiscard]] bool isCommitted() const noexcept { return committed_; }

    [[nodiscard]] bool isAborted() const noexcept { return aborted_.load(); }

private:
    void cleanupTempFile() noexcept;

    std::filesystem::path targetPath_;
    std::filesystem::path tempPath_;
    std::ofstream stream_;
    bool committed_ = false;
    std::atomic<bool> aborted_{false};
};

}  // namespace ziso::io

#endif  // ZISO_IO_ATOMIC_FILE_H
