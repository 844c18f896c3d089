// =============================================================================
// gzchunk - Compress Command
// =============================================================================
// Command handler for file compression.
//
// Picks the chunked pipeline or the direct-stream codec from the worker
// count, runs it and reports the outcome on the console.
// =============================================================================

#ifndef GZC_COMMANDS_COMPRESS_COMMAND_H
#define GZC_COMMANDS_COMPRESS_COMMAND_H

#include <chrono>

#include "commands/command_common.h"
#include "gzc/pipeline/pipeline.h"

namespace gzc::commands {

/// @brief Configuration options for compression.
using CompressOptions = TransferOptions;

// =============================================================================
// CompressCommand Class
// =============================================================================

/// @brief Command handler for file compression.
class CompressCommand {
public:
    /// @brief Construct with options.
    explicit CompressCommand(CompressOptions options);

    /// @brief Execute the compression.
    /// @return Exit code (0 = success, otherwise the ErrorCode value).
    [[nodiscard]] int execute();

    /// @brief Get statistics of the last run.
    [[nodiscard]] const pipeline::PipelineStats& stats() const noexcept { return stats_; }

    /// @brief Get the options.
    [[nodiscard]] const CompressOptions& options() const noexcept { return options_; }

private:
    /// @brief Options.
    CompressOptions options_;

    /// @brief Statistics.
    pipeline::PipelineStats stats_;
};

}  // namespace gzc::commands

#endif  // GZC_COMMANDS_COMPRESS_COMMAND_H
