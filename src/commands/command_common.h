// =============================================================================
// gzchunk - Shared Command Helpers
// =============================================================================

#ifndef GZC_COMMANDS_COMMAND_COMMON_H
#define GZC_COMMANDS_COMMAND_COMMON_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "gzc/common/error.h"
#include "gzc/common/types.h"
#include "gzc/pipeline/pipeline.h"

namespace gzc::commands {

/// @brief Options shared by the compress and decompress commands.
struct TransferOptions {
    /// @brief File to read.
    std::filesystem::path inputPath;

    /// @brief File to create or truncate.
    std::filesystem::path outputPath;

    /// @brief Compression level (1-9).
    int compressionLevel = kDefaultCompressionLevel;

    /// @brief Worker count (0 = auto, 1 = direct-stream codec).
    std::size_t threads = 0;

    /// @brief Print progress lines on stdout.
    bool showProgress = true;

    /// @brief Print a statistics summary after success.
    bool showSummary = false;
};

/// @brief Format an elapsed time as hh:mm:ss.fff.
[[nodiscard]] std::string formatElapsed(std::chrono::steady_clock::duration elapsed);

/// @brief Build the pipeline configuration for a command.
/// @param stageErrorCount Incremented once per stage error reported during a run.
[[nodiscard]] pipeline::PipelineConfig makePipelineConfig(const TransferOptions& options,
                                                          std::size_t& stageErrorCount);

/// @brief Report a failed run and convert it to an exit code.
/// @param action "Compression" or "Decompression".
/// @param stageErrorCount Stage errors already printed by the error callback.
[[nodiscard]] int reportFailure(std::string_view action, const Error& error,
                                std::size_t stageErrorCount);

/// @brief Print the statistics of a successful run.
void printSummary(std::string_view title, const pipeline::PipelineStats& stats,
                  std::string_view compressorName);

}  // namespace gzc::commands

#endif  // GZC_COMMANDS_COMMAND_COMMON_H
