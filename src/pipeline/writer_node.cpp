// =============================================================================
// gzchunk - WriterNode Implementation
// =============================================================================
// Implements the WriterNode (serial output stage).
// =============================================================================

#include "gzc/pipeline/pipeline_node.h"

#include <fstream>
#include <limits>

#include <fmt/format.h>

#include "gzc/common/logger.h"
#include "gzc/format/frame_header.h"

namespace gzc::pipeline {

// =============================================================================
// WriterNodeImpl
// =============================================================================

class WriterNodeImpl {
public:
    explicit WriterNodeImpl(WriterNodeConfig config)
        : config_(std::move(config)) {}

    VoidResult open(const std::filesystem::path& path) {
        close();
        stream_.open(path, std::ios::binary | std::ios::trunc);
        if (!stream_.is_open()) {
            state_ = NodeState::kError;
            return makeVoidError(ErrorCode::kIOError,
                                 fmt::format("Failed to create target file: {}", path.string()));
        }

        outputPath_ = path;
        state_ = NodeState::kRunning;
        totalChunksWritten_ = 0;
        totalBytesWritten_ = 0;

        GZC_LOG_DEBUG("WriterNode opened: path={}, mode={}", path.string(),
                      operationModeToString(config_.mode));
        return makeVoidSuccess();
    }

    VoidResult writeChunk(const Chunk& chunk) {
        if (state_ != NodeState::kRunning) {
            return makeVoidError(ErrorCode::kInvalidState, "Writer not open");
        }
        if (chunk.isSentinel()) {
            return makeVoidError(ErrorCode::kInvalidState, "Sentinel chunk cannot be written");
        }

        try {
            const auto& payload = *chunk.payload;
            if (config_.mode == OperationMode::kCompress) {
                if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
                    throw CodecError(
                        fmt::format("Compressed chunk of {} bytes does not fit a frame header",
                                    payload.size()),
                        chunkContext(chunk));
                }
                auto header = format::encodeFrameLength(static_cast<std::uint32_t>(payload.size()));
                writeBytes(header.data(), header.size(), chunk);
            }
            writeBytes(payload.data(), payload.size(), chunk);
            ++totalChunksWritten_;
            return makeVoidSuccess();

        } catch (const GZCException& e) {
            state_ = NodeState::kError;
            return std::unexpected(Error{e});
        } catch (const std::exception& e) {
            state_ = NodeState::kError;
            return makeVoidError(ErrorCode::kIOError,
                                 fmt::format("Failed to write chunk {}: {}", chunk.sequence,
                                             e.what()));
        }
    }

    VoidResult finalize() {
        if (state_ != NodeState::kRunning) {
            return makeVoidError(ErrorCode::kInvalidState, "Writer not open");
        }

        stream_.flush();
        if (!stream_) {
            state_ = NodeState::kError;
            return makeVoidError(ErrorCode::kIOError,
                                 fmt::format("Failed to flush target file: {}",
                                             outputPath_.string()));
        }
        stream_.close();
        state_ = NodeState::kFinished;

        GZC_LOG_DEBUG("WriterNode finalized: chunks={}, bytes={}", totalChunksWritten_,
                      totalBytesWritten_);
        return makeVoidSuccess();
    }

    void close() noexcept {
        if (stream_.is_open()) {
            stream_.close();
        }
        if (state_ == NodeState::kRunning) {
            state_ = NodeState::kIdle;
        }
    }

    void run(const std::filesystem::path& path, ChunkQueue& input, OrderingBarrier& barrier,
             ErrorChannel& errors) {
        if (auto opened = open(path); !opened) {
            errors.report(kWriterStage, std::move(opened.error()));
            drainUntilSentinel(input);
            return;
        }

        while (true) {
            Chunk chunk = input.dequeue();
            if (chunk.isSentinel()) {
                break;
            }

            barrier.wait(chunk.sequence);
            auto written = writeChunk(chunk);
            barrier.advance();
            if (!written) {
                errors.report(kWriterStage, std::move(written.error()));
                close();
                drainUntilSentinel(input);
                return;
            }
        }

        if (auto finalized = finalize(); !finalized) {
            errors.report(kWriterStage, std::move(finalized.error()));
            close();
        }
    }

    NodeState state() const noexcept { return state_; }
    std::uint64_t chunksWritten() const noexcept { return totalChunksWritten_; }
    std::uint64_t bytesWritten() const noexcept { return totalBytesWritten_; }

    void reset() noexcept {
        close();
        state_ = NodeState::kIdle;
        totalChunksWritten_ = 0;
        totalBytesWritten_ = 0;
    }

private:
    void writeBytes(const std::uint8_t* data, std::size_t size, const Chunk& chunk) {
        if (size == 0) {
            return;
        }
        stream_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!stream_) {
            throw IOError("Failed to write target file", chunkContext(chunk));
        }
        totalBytesWritten_ += size;
    }

    ErrorContext chunkContext(const Chunk& chunk) const {
        return ErrorContext{outputPath_.string()}
            .withSequence(chunk.sequence)
            .withOffset(totalBytesWritten_);
    }

    WriterNodeConfig config_;
    std::filesystem::path outputPath_;
    std::ofstream stream_;
    NodeState state_ = NodeState::kIdle;
    std::uint64_t totalChunksWritten_ = 0;
    std::uint64_t totalBytesWritten_ = 0;
};

// =============================================================================
// WriterNode Public Interface
// =============================================================================

WriterNode::WriterNode(WriterNodeConfig config)
    : impl_(std::make_unique<WriterNodeImpl>(std::move(config))) {}

WriterNode::~WriterNode() = default;

WriterNode::WriterNode(WriterNode&&) noexcept = default;
WriterNode& WriterNode::operator=(WriterNode&&) noexcept = default;

VoidResult WriterNode::open(const std::filesystem::path& path) {
    return impl_->open(path);
}

VoidResult WriterNode::writeChunk(const Chunk& chunk) {
    return impl_->writeChunk(chunk);
}

VoidResult WriterNode::finalize() {
    return impl_->finalize();
}

void WriterNode::close() noexcept {
    impl_->close();
}

void WriterNode::run(const std::filesystem::path& path, ChunkQueue& input,
                     OrderingBarrier& barrier, ErrorChannel& errors) {
    impl_->run(path, input, barrier, errors);
}

NodeState WriterNode::state() const noexcept {
    return impl_->state();
}

std::uint64_t WriterNode::chunksWritten() const noexcept {
    return impl_->chunksWritten();
}

std::uint64_t WriterNode::bytesWritten() const noexcept {
    return impl_->bytesWritten();
}

void WriterNode::reset() noexcept {
    impl_->reset();
}

}  // namespace gzc::pipeline
