// =============================================================================
// ziso - Command Progress Reporting
// =============================================================================

#ifndef ZISO_COMMANDS_PROGRESS_H
#define ZISO_COMMANDS_PROGRESS_H

#include <algorithm>
#include <cstdint>
#include <string>

#include "ziso/codec/codec_engine.h"
#include "ziso/common/logger.h"

namespace ziso::commands {

/// @brief Progress is logged about this many times per conversion.
inline constexpr std::uint64_t kProgressSteps = 20;

/// @brief Progress callback logging "<verb> done/total blocks" at info level.
[[nodiscard]] inline codec::ProgressCallback makeProgressLogger(std::string verb) {
    return [verb = std::move(verb)](std::uint64_t done, std::uint64_t total) {
        const std::uint64_t step = std::max<std::uint64_t>(total / kProgressSteps, 1);
        if (done % step == 0 || done == total) {
            ZISO_LOG_INFO("{} {}/{} blocks ({}%)", verb, done, total, done * 100 / total);
        }
    };
}

}  // namespace ziso::commands

#endif  // ZISO_COMMANDS_PROGRESS_H
