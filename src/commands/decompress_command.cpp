// =============================================================================
// gzchunk - Decompress Command Implementation
// =============================================================================

#include "commands/decompress_command.h"

#include <chrono>
#include <iostream>

#include "gzc/common/logger.h"
#include "gzc/pipeline/compressor.h"

namespace gzc::commands {

DecompressCommand::DecompressCommand(DecompressOptions options)
    : options_(std::move(options)) {}

int DecompressCommand::execute() {
    std::size_t stageErrorCount = 0;
    auto compressor = pipeline::makeCompressor(makePipelineConfig(options_, stageErrorCount));

    GZC_LOG_DEBUG("Decompressing {} -> {} with the {} compressor", options_.inputPath.string(),
                  options_.outputPath.string(), compressor->name());
    if (options_.showProgress) {
        std::cout << "Decompressing..." << std::endl;
    }

    auto startTime = std::chrono::steady_clock::now();
    auto result = compressor->decompress(options_.inputPath, options_.outputPath);
    auto elapsed = std::chrono::steady_clock::now() - startTime;

    if (!result) {
        return reportFailure("Decompression", result.error(), stageErrorCount);
    }

    stats_ = compressor->stats();
    if (options_.showProgress) {
        std::cout << "Finished. Elapsed time: " << formatElapsed(elapsed) << std::endl;
    }
    if (options_.showSummary) {
        printSummary("Decompression", stats_, compressor->name());
    }
    return toExitCode(ErrorCode::kSuccess);
}

}  // namespace gzc::commands
