// =============================================================================
// gzchunk - Pipeline Implementation
// =============================================================================
// Implements the chunked pipeline orchestrator: one reader thread, one
// transform worker thread and one writer thread per run, connected by two
// bounded queues.
// =============================================================================

#include "gzc/pipeline/pipeline.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <system_error>
#include <thread>

#include <fmt/format.h>

#include "gzc/common/logger.h"
#include "gzc/pipeline/pipeline_node.h"

namespace gzc::pipeline {

// =============================================================================
// Utility Function Implementations
// =============================================================================

std::size_t recommendedWorkerCount() noexcept {
    auto hwThreads = std::thread::hardware_concurrency();
    if (hwThreads == 0) {
        return 4;  // Fallback default
    }
    return std::min(hwThreads, 32u);
}

// =============================================================================
// Configuration Implementation
// =============================================================================

VoidResult PipelineConfig::validate() const {
    if (blockSize < kMinBlockSize || blockSize > kMaxBlockSize) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Block size must be between {} and {}, got {}",
                                         kMinBlockSize, kMaxBlockSize, blockSize));
    }
    if (!isValidCompressionLevel(compressionLevel)) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Compression level must be between {} and {}, got {}",
                                         kMinCompressionLevel, kMaxCompressionLevel,
                                         compressionLevel));
    }
    return makeVoidSuccess();
}

std::size_t PipelineConfig::effectiveWorkers() const noexcept {
    return workers == 0 ? recommendedWorkerCount() : workers;
}

std::size_t PipelineConfig::effectiveQueueCapacity() const noexcept {
    return queueCapacity == 0 ? effectiveWorkers() : queueCapacity;
}

// =============================================================================
// ChunkedPipelineImpl
// =============================================================================

namespace {

/// @brief Start a stage thread, reporting a failure to create it.
template <typename F>
bool startStage(std::thread& slot, std::string_view stage, ErrorChannel& errors, F&& body) {
    try {
        slot = std::thread(std::forward<F>(body));
        return true;
    } catch (const std::system_error& e) {
        errors.report(kPipelineStage,
                      Error{ErrorCode::kIOError,
                            fmt::format("Failed to start {} thread: {}", stage, e.what())});
        return false;
    }
}

}  // namespace

class ChunkedPipelineImpl {
public:
    explicit ChunkedPipelineImpl(PipelineConfig config)
        : config_(std::move(config)) {}

    VoidResult run(OperationMode mode,
                   const std::filesystem::path& sourcePath,
                   const std::filesystem::path& targetPath) {
        if (auto result = config_.validate(); !result) {
            return result;
        }

        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            return makeVoidError(ErrorCode::kInvalidState, "Pipeline is already running");
        }

        auto startTime = std::chrono::steady_clock::now();

        stats_ = PipelineStats{};
        stats_.workersUsed = kTransformWorkers;
        stageErrors_.clear();

        GZC_LOG_DEBUG("Pipeline starting: mode={}, source={}, target={}, queue_capacity={}",
                      operationModeToString(mode), sourcePath.string(), targetPath.string(),
                      config_.effectiveQueueCapacity());

        try {
            execute(mode, sourcePath, targetPath);
        } catch (const std::exception& e) {
            // Only reachable before any stage thread was started.
            stageErrors_.push_back(StageError{
                std::string(kPipelineStage),
                Error{ErrorCode::kIOError, fmt::format("Failed to set up pipeline: {}", e.what())}});
        }

        auto endTime = std::chrono::steady_clock::now();
        stats_.processingTimeMs = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count());
        running_.store(false);

        if (config_.errorCallback) {
            for (const auto& stageError : stageErrors_) {
                config_.errorCallback(stageError);
            }
        }

        if (!stageErrors_.empty()) {
            const auto& first = stageErrors_.front();
            GZC_LOG_DEBUG("Pipeline failed with {} stage error(s)", stageErrors_.size());
            return makeVoidError(first.error.code(),
                                 fmt::format("{}: {}", first.stage, first.error.message()));
        }

        GZC_LOG_INFO("{} finished: chunks={}, input={} bytes, output={} bytes, ratio={:.3f}, "
                     "throughput={:.2f} MB/s",
                     mode == OperationMode::kCompress ? "Compression" : "Decompression",
                     stats_.chunks, stats_.inputBytes, stats_.outputBytes,
                     stats_.compressionRatio(), stats_.throughputMBps());
        return makeVoidSuccess();
    }

    bool isRunning() const noexcept { return running_.load(); }

    const PipelineStats& stats() const noexcept { return stats_; }

    const std::vector<StageError>& stageErrors() const noexcept { return stageErrors_; }

    const PipelineConfig& config() const noexcept { return config_; }

    VoidResult setConfig(PipelineConfig config) {
        if (running_.load()) {
            return makeVoidError(ErrorCode::kInvalidState,
                                 "Cannot change configuration while running");
        }
        config_ = std::move(config);
        return makeVoidSuccess();
    }

private:
    /// @brief The barrier protocol supports more, one worker is what runs.
    static constexpr std::size_t kTransformWorkers = 1;

    void execute(OperationMode mode,
                 const std::filesystem::path& sourcePath,
                 const std::filesystem::path& targetPath) {
        const std::size_t capacity = config_.effectiveQueueCapacity();
        ChunkQueue primary(capacity);
        ChunkQueue secondary(capacity);
        OrderingBarrier transformBarrier(0);
        OrderingBarrier writerBarrier(0);
        ErrorChannel errors;

        ReaderNode reader(ReaderNodeConfig{mode, config_.blockSize});
        TransformNode transform(TransformNodeConfig{mode, config_.blockSize,
                                                    config_.compressionLevel});
        WriterNode writer(WriterNodeConfig{mode});

        std::thread writerThread;
        std::thread transformThread;
        std::thread readerThread;

        // Consumers first, so every producer has someone draining its queue.
        bool started =
            startStage(writerThread, kWriterStage, errors,
                       [&] { writer.run(targetPath, secondary, writerBarrier, errors); }) &&
            startStage(transformThread, kTransformStage, errors,
                       [&] { transform.run(primary, secondary, transformBarrier, errors); }) &&
            startStage(readerThread, kReaderStage, errors,
                       [&] { reader.run(sourcePath, primary, errors); });

        if (!started) {
            // Stand in for the producer that never started.
            if (transformThread.joinable()) {
                primary.enqueue(Chunk::sentinel());
            } else if (writerThread.joinable()) {
                secondary.enqueue(Chunk::sentinel());
            }
        }

        for (std::thread* thread : {&readerThread, &transformThread, &writerThread}) {
            if (thread->joinable()) {
                thread->join();
            }
        }

        stats_.chunks = writer.chunksWritten();
        stats_.inputBytes = reader.bytesRead();
        stats_.outputBytes = writer.bytesWritten();
        stageErrors_ = errors.errors();
    }

    PipelineConfig config_;
    PipelineStats stats_;
    std::vector<StageError> stageErrors_;
    std::atomic<bool> running_{false};
};

// =============================================================================
// ChunkedPipeline Public Interface
// =============================================================================

ChunkedPipeline::ChunkedPipeline(PipelineConfig config)
    : impl_(std::make_unique<ChunkedPipelineImpl>(std::move(config))) {}

ChunkedPipeline::~ChunkedPipeline() = default;

ChunkedPipeline::ChunkedPipeline(ChunkedPipeline&&) noexcept = default;
ChunkedPipeline& ChunkedPipeline::operator=(ChunkedPipeline&&) noexcept = default;

VoidResult ChunkedPipeline::run(OperationMode mode,
                                const std::filesystem::path& sourcePath,
                                const std::filesystem::path& targetPath) {
    return impl_->run(mode, sourcePath, targetPath);
}

bool ChunkedPipeline::isRunning() const noexcept {
    return impl_->isRunning();
}

const PipelineStats& ChunkedPipeline::stats() const noexcept {
    return impl_->stats();
}

const std::vector<StageError>& ChunkedPipeline::stageErrors() const noexcept {
    return impl_->stageErrors();
}

const PipelineConfig& ChunkedPipeline::config() const noexcept {
    return impl_->config();
}

VoidResult ChunkedPipeline::setConfig(PipelineConfig config) {
    return impl_->setConfig(std::move(config));
}

}  // namespace gzc::pipeline
