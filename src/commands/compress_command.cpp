// =============================================================================
// gzchunk - Compress Command Implementation
// =============================================================================

#include "commands/compress_command.h"

#include <iostream>

#include "gzc/common/logger.h"
#include "gzc/pipeline/compressor.h"

namespace gzc::commands {

CompressCommand::CompressCommand(CompressOptions options)
    : options_(std::move(options)) {}

int CompressCommand::execute() {
    std::size_t stageErrorCount = 0;
    auto compressor = pipeline::makeCompressor(makePipelineConfig(options_, stageErrorCount));

    GZC_LOG_DEBUG("Compressing {} -> {} with the {} compressor", options_.inputPath.string(),
                  options_.outputPath.string(), compressor->name());
    if (options_.showProgress) {
        std::cout << "Compressing..." << std::endl;
    }

    auto startTime = std::chrono::steady_clock::now();
    auto result = compressor->compress(options_.inputPath, options_.outputPath);
    auto elapsed = std::chrono::steady_clock::now() - startTime;

    if (!result) {
        return reportFailure("Compression", result.error(), stageErrorCount);
    }

    stats_ = compressor->stats();
    if (options_.showProgress) {
        std::cout << "Finished. Elapsed time: " << formatElapsed(elapsed) << std::endl;
    }
    if (options_.showSummary) {
        printSummary("Compression", stats_, compressor->name());
    }
    return toExitCode(ErrorCode::kSuccess);
}

}  // namespace gzc::commands
