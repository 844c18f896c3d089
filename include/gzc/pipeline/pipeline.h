// =============================================================================
// gzchunk - Chunked Compression Pipeline
// =============================================================================
// Three-stage producer/consumer pipeline compressing or decompressing one
// file in fixed-size chunks:
//
//   source -> ReaderNode -> primary queue -> TransformNode
//          -> secondary queue -> WriterNode -> target
//
// Each stage runs on its own thread. Chunks carry a sequence number and the
// output is written in exactly the order the source was read. End of stream
// is signalled by a sentinel chunk (no payload) that every stage forwards
// before it exits, even after a failure, so a failing stage never leaves
// another one blocked.
//
// Stage errors do not travel through the queues. They are collected in a
// per-run ErrorChannel, handed to the configured ErrorCallback on the
// caller's thread after all stage threads were joined, and the first one
// becomes the result of run().
//
// Compressed layout: a concatenation of frames, each an 8-byte base64 length
// header (see format/frame_header.h) followed by one gzip member.
// =============================================================================

#ifndef GZC_PIPELINE_PIPELINE_H
#define GZC_PIPELINE_PIPELINE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gzc/common/error.h"
#include "gzc/common/types.h"
#include "gzc/pipeline/bounded_queue.h"

namespace gzc::pipeline {

// =============================================================================
// Forward Declarations
// =============================================================================

class ChunkedPipelineImpl;

// =============================================================================
// Chunk
// =============================================================================

/// @brief Unit of work flowing between the stages
///
/// A chunk without a payload is the end-of-stream sentinel. Stages test
/// isSentinel(), never the sequence number.
struct Chunk {
    /// @brief Position of the chunk in the source (0-based, kSentinelSequence for the sentinel)
    SequenceNumber sequence = kSentinelSequence;

    /// @brief Chunk bytes (absent only for the sentinel)
    std::optional<std::vector<std::uint8_t>> payload;

    /// @brief Create the end-of-stream sentinel
    [[nodiscard]] static Chunk sentinel() { return Chunk{}; }

    /// @brief Check if this is the end-of-stream sentinel
    [[nodiscard]] bool isSentinel() const noexcept { return !payload.has_value(); }

    /// @brief Payload size in bytes (0 for the sentinel)
    [[nodiscard]] std::size_t size() const noexcept { return payload ? payload->size() : 0; }
};

/// @brief Queue connecting two stages
using ChunkQueue = BoundedQueue<Chunk>;

// =============================================================================
// Error Reporting
// =============================================================================

/// @brief Error raised inside a stage, tagged with the stage name
struct StageError {
    /// @brief Originating stage ("reader", "transform", "writer" or "pipeline")
    std::string stage;

    /// @brief The error itself
    Error error;
};

/// @brief Receives each stage error of a run (called on the caller's thread)
using ErrorCallback = std::function<void(const StageError& error)>;

// =============================================================================
// Pipeline Statistics
// =============================================================================

/// @brief Statistics of the last pipeline run
struct PipelineStats {
    /// @brief Chunks written to the target
    std::uint64_t chunks = 0;

    /// @brief Bytes read from the source
    std::uint64_t inputBytes = 0;

    /// @brief Bytes written to the target (frame headers included)
    std::uint64_t outputBytes = 0;

    /// @brief Wall-clock time of the run (milliseconds)
    std::uint64_t processingTimeMs = 0;

    /// @brief Number of transform workers used
    std::size_t workersUsed = 0;

    /// @brief Get output/input size ratio
    [[nodiscard]] double compressionRatio() const noexcept {
        if (inputBytes == 0) return 1.0;
        return static_cast<double>(outputBytes) / static_cast<double>(inputBytes);
    }

    /// @brief Get throughput over the input (MB/s)
    [[nodiscard]] double throughputMBps() const noexcept {
        if (processingTimeMs == 0) return 0.0;
        return (static_cast<double>(inputBytes) / (1024.0 * 1024.0)) /
               (static_cast<double>(processingTimeMs) / 1000.0);
    }
};

// =============================================================================
// Pipeline Configuration
// =============================================================================

/// @brief Configuration for a compression or decompression run
struct PipelineConfig {
    /// @brief Worker count (0 = available parallelism, 1 = direct-stream codec)
    std::size_t workers = 0;

    /// @brief Capacity of each inter-stage queue (0 = effective worker count)
    std::size_t queueCapacity = 0;

    /// @brief Raw bytes per chunk; compression and decompression must agree
    std::size_t blockSize = kDefaultBlockSize;

    /// @brief zlib compression level (1-9)
    CompressionLevel compressionLevel = kDefaultCompressionLevel;

    /// @brief Stage error callback
    ErrorCallback errorCallback;

    /// @brief Validate configuration
    [[nodiscard]] VoidResult validate() const;

    /// @brief Get worker count with 0 resolved to the available parallelism
    [[nodiscard]] std::size_t effectiveWorkers() const noexcept;

    /// @brief Get queue capacity with 0 resolved to the effective worker count
    [[nodiscard]] std::size_t effectiveQueueCapacity() const noexcept;
};

// =============================================================================
// Chunked Pipeline
// =============================================================================

/// @brief Orchestrates one reader, one transform worker and one writer
///
/// Usage:
/// @code
/// PipelineConfig config;
/// config.workers = 4;
///
/// ChunkedPipeline pipeline(config);
/// auto result = pipeline.run(OperationMode::kCompress, "data.bin", "data.bin.gz");
/// if (result) {
///     auto stats = pipeline.stats();
/// }
/// @endcode
///
/// Each run() owns its own queues and ordering barriers, so separate
/// pipeline objects may run concurrently. run() itself does not check file
/// preconditions; ICompressor implementations do that before calling it.
class ChunkedPipeline {
public:
    /// @brief Construct with configuration
    /// @param config Pipeline configuration
    explicit ChunkedPipeline(PipelineConfig config = {});

    /// @brief Destructor
    ~ChunkedPipeline();

    // Non-copyable, movable
    ChunkedPipeline(const ChunkedPipeline&) = delete;
    ChunkedPipeline& operator=(const ChunkedPipeline&) = delete;
    ChunkedPipeline(ChunkedPipeline&&) noexcept;
    ChunkedPipeline& operator=(ChunkedPipeline&&) noexcept;

    /// @brief Run the pipeline on one file
    /// @param mode Compress raw data into frames, or decompress frames
    /// @param sourcePath File to read
    /// @param targetPath File to create or truncate (left partial on error)
    /// @return First stage error (message prefixed with the stage name), or success
    [[nodiscard]] VoidResult run(OperationMode mode,
                                 const std::filesystem::path& sourcePath,
                                 const std::filesystem::path& targetPath);

    /// @brief Check if a run is in progress
    [[nodiscard]] bool isRunning() const noexcept;

    /// @brief Get statistics of the last run
    [[nodiscard]] const PipelineStats& stats() const noexcept;

    /// @brief Get errors reported by the stages during the last run
    [[nodiscard]] const std::vector<StageError>& stageErrors() const noexcept;

    /// @brief Get current configuration
    [[nodiscard]] const PipelineConfig& config() const noexcept;

    /// @brief Update configuration (only when not running)
    [[nodiscard]] VoidResult setConfig(PipelineConfig config);

private:
    std::unique_ptr<ChunkedPipelineImpl> impl_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Get recommended worker count for current system
[[nodiscard]] std::size_t recommendedWorkerCount() noexcept;

}  // namespace gzc::pipeline

#endif  // GZC_PIPELINE_PIPELINE_H
