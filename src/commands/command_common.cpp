// =============================================================================
// gzchunk - Shared Command Helpers Implementation
// =============================================================================

#include "commands/command_common.h"

#include <iostream>

#include <fmt/format.h>

#include "gzc/common/logger.h"

namespace gzc::commands {

std::string formatElapsed(std::chrono::steady_clock::duration elapsed) {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(elapsed).count();
    auto hours = ms / 3'600'000;
    ms %= 3'600'000;
    auto minutes = ms / 60'000;
    ms %= 60'000;
    auto seconds = ms / 1000;
    ms %= 1000;
    return fmt::format("{:02}:{:02}:{:02}.{:03}", hours, minutes, seconds, ms);
}

pipeline::PipelineConfig makePipelineConfig(const TransferOptions& options,
                                            std::size_t& stageErrorCount) {
    pipeline::PipelineConfig config;
    config.workers = options.threads;
    config.compressionLevel = options.compressionLevel;
    config.errorCallback = [&stageErrorCount](const pipeline::StageError& stageError) {
        ++stageErrorCount;
        GZC_LOG_ERROR("Error occurred in {} stage: {}", stageError.stage,
                      stageError.error.message());
        std::cerr << fmt::format("Error occurred: {}\nSource: {} stage\n",
                                 stageError.error.message(), stageError.stage);
    };
    return config;
}

int reportFailure(std::string_view action, const Error& error, std::size_t stageErrorCount) {
    GZC_LOG_ERROR("{} failed: {}", action, error.message());
    if (stageErrorCount == 0) {
        std::cerr << fmt::format("Error occurred: {}\n", error.message());
    }
    std::cerr << fmt::format("{} failed ({})\n", action, errorCodeToString(error.code()));
    return error.exitCode();
}

void printSummary(std::string_view title, const pipeline::PipelineStats& stats,
                  std::string_view compressorName) {
    std::cout << fmt::format("\n=== {} Summary ===\n", title);
    std::cout << fmt::format("  Mode:              {}\n", compressorName);
    if (stats.chunks > 0) {
        std::cout << fmt::format("  Chunks:            {}\n", stats.chunks);
    }
    std::cout << fmt::format("  Input size:        {} bytes\n", stats.inputBytes);
    std::cout << fmt::format("  Output size:       {} bytes\n", stats.outputBytes);
    std::cout << fmt::format("  Size ratio:        {:.3f}\n", stats.compressionRatio());
    std::cout << fmt::format("  Throughput:        {:.2f} MB/s\n", stats.throughputMBps());
    std::cout << "===========================" << std::endl;
}

}  // namespace gzc::commands
