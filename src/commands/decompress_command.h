// =============================================================================
// gzchunk - Decompress Command
// =============================================================================
// Command handler for file decompression.
//
// The source must carry the ".gz" extension and must have been written by
// the same kind of compressor: chunked output with more than one worker,
// a plain gzip stream with exactly one.
// =============================================================================

#ifndef GZC_COMMANDS_DECOMPRESS_COMMAND_H
#define GZC_COMMANDS_DECOMPRESS_COMMAND_H

#include "commands/command_common.h"
#include "gzc/pipeline/pipeline.h"

namespace gzc::commands {

/// @brief Configuration options for decompression.
using DecompressOptions = TransferOptions;

// =============================================================================
// DecompressCommand Class
// =============================================================================

/// @brief Command handler for file decompression.
class DecompressCommand {
public:
    /// @brief Construct with options.
    explicit DecompressCommand(DecompressOptions options);

    /// @brief Execute the decompression.
    /// @return Exit code (0 = success, otherwise the ErrorCode value).
    [[nodiscard]] int execute();

    /// @brief Get statistics of the last run.
    [[nodiscard]] const pipeline::PipelineStats& stats() const noexcept { return stats_; }

    /// @brief Get the options.
    [[nodiscard]] const DecompressOptions& options() const noexcept { return options_; }

private:
    DecompressOptions options_;
    pipeline::PipelineStats stats_;
};

}  // namespace gzc::commands

#endif  // GZC_COMMANDS_DECOMPRESS_COMMAND_H
