// =============================================================================
// gzchunk - Pipeline Node Abstractions
// =============================================================================
// Defines the individual pipeline stages.
//
// Pipeline stages:
// - ReaderNode: splits the source into chunks (raw blocks when compressing,
//   framed gzip members when decompressing)
// - TransformNode: compresses or inflates each chunk independently
// - WriterNode: writes chunks in sequence order, adding frame headers when
//   compressing
//
// Each node can be driven one step at a time (readChunk/process/writeChunk)
// or as a thread body through run(), which owns the sentinel protocol:
// whatever happens, run() leaves a sentinel on its output queue and, for
// consumers, drains its input up to the upstream sentinel.
// =============================================================================

#ifndef GZC_PIPELINE_PIPELINE_NODE_H
#define GZC_PIPELINE_PIPELINE_NODE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "gzc/common/error.h"
#include "gzc/common/types.h"
#include "gzc/pipeline/bounded_queue.h"
#include "gzc/pipeline/pipeline.h"

namespace gzc::pipeline {

// =============================================================================
// Forward Declarations
// =============================================================================

class ReaderNodeImpl;
class TransformNodeImpl;
class WriterNodeImpl;

// =============================================================================
// Node State
// =============================================================================

/// @brief State of a pipeline node
enum class NodeState : std::uint8_t {
    /// @brief Node is idle, ready to start
    kIdle = 0,

    /// @brief Node is running
    kRunning = 1,

    /// @brief Node has finished processing
    kFinished = 2,

    /// @brief Node encountered an error
    kError = 3
};

/// @brief Convert NodeState to string
[[nodiscard]] constexpr std::string_view nodeStateToString(NodeState state) noexcept {
    switch (state) {
        case NodeState::kIdle: return "idle";
        case NodeState::kRunning: return "running";
        case NodeState::kFinished: return "finished";
        case NodeState::kError: return "error";
    }
    return "unknown";
}

/// @brief Stage names used in error reports
inline constexpr std::string_view kReaderStage = "reader";
inline constexpr std::string_view kTransformStage = "transform";
inline constexpr std::string_view kWriterStage = "writer";
inline constexpr std::string_view kPipelineStage = "pipeline";

// =============================================================================
// Error Channel
// =============================================================================

/// @brief Thread-safe collector of stage errors for one run
class ErrorChannel {
public:
    ErrorChannel() = default;

    ErrorChannel(const ErrorChannel&) = delete;
    ErrorChannel& operator=(const ErrorChannel&) = delete;

    /// @brief Record an error raised by a stage
    void report(std::string_view stage, Error error);

    /// @brief Check if any error was reported
    [[nodiscard]] bool hasErrors() const;

    /// @brief Get a copy of all reported errors, in report order
    [[nodiscard]] std::vector<StageError> errors() const;

    /// @brief Get the first reported error, if any
    [[nodiscard]] std::optional<StageError> first() const;

private:
    mutable std::mutex mutex_;
    std::vector<StageError> errors_;
};

// =============================================================================
// Reader Node
// =============================================================================

/// @brief Configuration for reader node
struct ReaderNodeConfig {
    /// @brief Raw blocks when compressing, framed members when decompressing
    OperationMode mode = OperationMode::kCompress;

    /// @brief Raw bytes per chunk (compress) and bound for frame lengths (decompress)
    std::size_t blockSize = kDefaultBlockSize;

    /// @brief Validate configuration
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Reader node (serial input stage)
///
/// Compress mode reads the source in blockSize pieces, the last one possibly
/// shorter; an empty source yields no chunks. Decompress mode reads an
/// 8-byte frame header, then exactly the declared number of payload bytes.
/// A partial header, a short payload, or a declared length larger than any
/// gzip member of blockSize raw bytes can be is a CodecError.
class ReaderNode {
public:
    /// @brief Construct with configuration
    explicit ReaderNode(ReaderNodeConfig config = {});

    /// @brief Destructor
    ~ReaderNode();

    // Non-copyable, movable
    ReaderNode(const ReaderNode&) = delete;
    ReaderNode& operator=(const ReaderNode&) = delete;
    ReaderNode(ReaderNode&&) noexcept;
    ReaderNode& operator=(ReaderNode&&) noexcept;

    /// @brief Open source file
    [[nodiscard]] VoidResult open(const std::filesystem::path& path);

    /// @brief Read the next chunk
    /// @return Next chunk, or std::nullopt at end of file
    [[nodiscard]] Result<std::optional<Chunk>> readChunk();

    /// @brief Close source file
    void close() noexcept;

    /// @brief Thread body: read every chunk into output, then the sentinel
    /// @note Errors go to errors; the sentinel is enqueued on every path.
    void run(const std::filesystem::path& path, ChunkQueue& output, ErrorChannel& errors);

    /// @brief Get current state
    [[nodiscard]] NodeState state() const noexcept;

    /// @brief Get number of chunks read
    [[nodiscard]] std::uint64_t chunksRead() const noexcept;

    /// @brief Get number of bytes read from the source
    [[nodiscard]] std::uint64_t bytesRead() const noexcept;

    /// @brief Reset node state
    void reset() noexcept;

private:
    std::unique_ptr<ReaderNodeImpl> impl_;
};

// =============================================================================
// Transform Node
// =============================================================================

/// @brief Configuration for transform node
struct TransformNodeConfig {
    /// @brief Compress or decompress each chunk
    OperationMode mode = OperationMode::kCompress;

    /// @brief Upper bound on the size of a decompressed chunk
    std::size_t blockSize = kDefaultBlockSize;

    /// @brief zlib compression level (1-9)
    CompressionLevel compressionLevel = kDefaultCompressionLevel;

    /// @brief Validate configuration
    [[nodiscard]] VoidResult validate() const;
};

/// @brief Transform node (processing stage)
///
/// Every chunk is coded on its own: a compressed chunk is a complete gzip
/// member, so it can be inflated without any other chunk. The output chunk
/// keeps the input's sequence number.
class TransformNode {
public:
    /// @brief Construct with configuration
    explicit TransformNode(TransformNodeConfig config = {});

    /// @brief Destructor
    ~TransformNode();

    // Non-copyable, movable
    TransformNode(const TransformNode&) = delete;
    TransformNode& operator=(const TransformNode&) = delete;
    TransformNode(TransformNode&&) noexcept;
    TransformNode& operator=(TransformNode&&) noexcept;

    /// @brief Transform one chunk
    /// @param input Non-sentinel chunk
    /// @return Chunk with the same sequence number and the coded payload
    [[nodiscard]] Result<Chunk> process(Chunk input);

    /// @brief Thread body: transform chunks from input to output in sequence order
    /// @param barrier Shared by all transform workers of the run
    /// @note Always forwards a sentinel; after a failure keeps draining input
    ///       up to the sentinel so the reader is never left blocked.
    void run(ChunkQueue& input, ChunkQueue& output, OrderingBarrier& barrier,
             ErrorChannel& errors);

    /// @brief Get current state
    [[nodiscard]] NodeState state() const noexcept;

    /// @brief Get number of chunks processed
    [[nodiscard]] std::uint64_t chunksProcessed() const noexcept;

    /// @brief Reset node state
    void reset() noexcept;

private:
    std::unique_ptr<TransformNodeImpl> impl_;
};

// =============================================================================
// Writer Node
// =============================================================================

/// @brief Configuration for writer node
struct WriterNodeConfig {
    /// @brief Compress writes framed chunks, decompress writes raw payloads
    OperationMode mode = OperationMode::kCompress;
};

/// @brief Writer node (serial output stage)
///
/// The target file is held open from open() until finalize(), close() or
/// destruction. Nothing already written is removed on failure.
class WriterNode {
public:
    /// @brief Construct with configuration
    explicit WriterNode(WriterNodeConfig config = {});

    /// @brief Destructor
    ~WriterNode();

    // Non-copyable, movable
    WriterNode(const WriterNode&) = delete;
    WriterNode& operator=(const WriterNode&) = delete;
    WriterNode(WriterNode&&) noexcept;
    WriterNode& operator=(WriterNode&&) noexcept;

    /// @brief Create or truncate the target file
    [[nodiscard]] VoidResult open(const std::filesystem::path& path);

    /// @brief Write one chunk (frame header first in compress mode)
    [[nodiscard]] VoidResult writeChunk(const Chunk& chunk);

    /// @brief Flush and close the target file
    [[nodiscard]] VoidResult finalize();

    /// @brief Close without flushing checks
    void close() noexcept;

    /// @brief Thread body: write chunks from input in sequence order until the sentinel
    /// @note After a failure keeps draining input up to the sentinel.
    void run(const std::filesystem::path& path, ChunkQueue& input, OrderingBarrier& barrier,
             ErrorChannel& errors);

    /// @brief Get current state
    [[nodiscard]] NodeState state() const noexcept;

    /// @brief Get number of chunks written
    [[nodiscard]] std::uint64_t chunksWritten() const noexcept;

    /// @brief Get number of bytes written to the target
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept;

    /// @brief Reset node state
    void reset() noexcept;

private:
    std::unique_ptr<WriterNodeImpl> impl_;
};

// =============================================================================
// Helpers
// =============================================================================

/// @brief Dequeue and discard chunks until the sentinel has been consumed
void drainUntilSentinel(ChunkQueue& queue);

}  // namespace gzc::pipeline

#endif  // GZC_PIPELINE_PIPELINE_NODE_H
