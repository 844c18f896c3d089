// =============================================================================
// gzchunk - Compressor Implementations
// =============================================================================

#include "gzc/pipeline/compressor.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <system_error>

#include <fmt/format.h>

#include "gzc/common/logger.h"
#include "gzc/io/gzip_stream.h"

namespace gzc::pipeline {

namespace {

bool isBlank(const std::filesystem::path& path) {
    const std::string text = path.string();
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

// =============================================================================
// Validation
// =============================================================================

VoidResult checkPreconditions(OperationMode mode,
                              const std::filesystem::path& sourcePath,
                              const std::filesystem::path& targetPath) {
    if (isBlank(sourcePath)) {
        return makeVoidError(ErrorCode::kInvalidArgument, "Source path must not be blank");
    }
    if (isBlank(targetPath)) {
        return makeVoidError(ErrorCode::kInvalidArgument, "Target path must not be blank");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(sourcePath, ec)) {
        return makeVoidError(ErrorCode::kFileNotFound,
                             fmt::format("Source file not found: {}", sourcePath.string()));
    }

    if (mode == OperationMode::kDecompress &&
        sourcePath.extension().string() != kCompressedExtension) {
        return makeVoidError(ErrorCode::kFormatError,
                             fmt::format("Source file must have the '{}' extension: {}",
                                         kCompressedExtension, sourcePath.string()));
    }
    return makeVoidSuccess();
}

// =============================================================================
// ChunkedCompressor
// =============================================================================

ChunkedCompressor::ChunkedCompressor(PipelineConfig config)
    : pipeline_(std::move(config)) {}

VoidResult ChunkedCompressor::compress(const std::filesystem::path& sourcePath,
                                       const std::filesystem::path& targetPath) {
    if (auto valid = checkPreconditions(OperationMode::kCompress, sourcePath, targetPath);
        !valid) {
        return valid;
    }
    return pipeline_.run(OperationMode::kCompress, sourcePath, targetPath);
}

VoidResult ChunkedCompressor::decompress(const std::filesystem::path& sourcePath,
                                         const std::filesystem::path& targetPath) {
    if (auto valid = checkPreconditions(OperationMode::kDecompress, sourcePath, targetPath);
        !valid) {
        return valid;
    }
    return pipeline_.run(OperationMode::kDecompress, sourcePath, targetPath);
}

const PipelineStats& ChunkedCompressor::stats() const noexcept {
    return pipeline_.stats();
}

// =============================================================================
// StreamCompressor
// =============================================================================

StreamCompressor::StreamCompressor(CompressionLevel level)
    : level_(level) {}

VoidResult StreamCompressor::compress(const std::filesystem::path& sourcePath,
                                      const std::filesystem::path& targetPath) {
    if (auto valid = checkPreconditions(OperationMode::kCompress, sourcePath, targetPath);
        !valid) {
        return valid;
    }

    auto startTime = std::chrono::steady_clock::now();
    auto result = tryExecute([&] { return io::compressStream(sourcePath, targetPath, level_); });
    if (!result) {
        return std::unexpected(std::move(result.error()));
    }

    stats_ = PipelineStats{};
    stats_.inputBytes = result->inputBytes;
    stats_.outputBytes = result->outputBytes;
    stats_.workersUsed = 1;
    stats_.processingTimeMs = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime).count());
    return makeVoidSuccess();
}

VoidResult StreamCompressor::decompress(const std::filesystem::path& sourcePath,
                                        const std::filesystem::path& targetPath) {
    if (auto valid = checkPreconditions(OperationMode::kDecompress, sourcePath, targetPath);
        !valid) {
        return valid;
    }

    auto startTime = std::chrono::steady_clock::now();
    auto result = tryExecute([&] { return io::decompressStream(sourcePath, targetPath); });
    if (!result) {
        return std::unexpected(std::move(result.error()));
    }

    stats_ = PipelineStats{};
    stats_.inputBytes = result->inputBytes;
    stats_.outputBytes = result->outputBytes;
    stats_.workersUsed = 1;
    stats_.processingTimeMs = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime).count());
    return makeVoidSuccess();
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<ICompressor> makeCompressor(PipelineConfig config) {
    if (config.effectiveWorkers() == 1) {
        GZC_LOG_DEBUG("Using direct-stream compressor (single worker)");
        return std::make_unique<StreamCompressor>(config.compressionLevel);
    }
    GZC_LOG_DEBUG("Using chunked compressor: workers={}, queue_capacity={}",
                  config.effectiveWorkers(), config.effectiveQueueCapacity());
    return std::make_unique<ChunkedCompressor>(std::move(config));
}

}  // namespace gzc::pipeline
