// =============================================================================
// gzchunk - TransformNode Implementation
// =============================================================================
// Implements the TransformNode (processing stage).
// =============================================================================

#include "gzc/pipeline/pipeline_node.h"

#include <fmt/format.h>

#include "gzc/algo/chunk_codec.h"
#include "gzc/common/logger.h"

namespace gzc::pipeline {

// =============================================================================
// TransformNodeImpl
// =============================================================================

class TransformNodeImpl {
public:
    explicit TransformNodeImpl(TransformNodeConfig config)
        : config_(std::move(config)) {}

    Result<Chunk> process(Chunk input) {
        if (input.isSentinel()) {
            return makeError<Chunk>(ErrorCode::kInvalidState,
                                    "Sentinel chunk cannot be transformed");
        }

        try {
            Chunk output;
            output.sequence = input.sequence;
            if (config_.mode == OperationMode::kCompress) {
                output.payload = algo::compressChunk(*input.payload, config_.compressionLevel);
            } else {
                output.payload = algo::decompressChunk(*input.payload, config_.blockSize);
            }
            ++totalChunksProcessed_;
            return output;

        } catch (const GZCException& e) {
            ErrorContext context = e.context().value_or(ErrorContext{});
            context.withSequence(input.sequence);
            return makeError<Chunk>(GZCException(e.code(), e.message(), std::move(context)));
        } catch (const std::exception& e) {
            return makeError<Chunk>(
                ErrorCode::kCodecError,
                fmt::format("Failed to transform chunk {}: {}", input.sequence, e.what()));
        }
    }

    void run(ChunkQueue& input, ChunkQueue& output, OrderingBarrier& barrier,
             ErrorChannel& errors) {
        if (auto valid = config_.validate(); !valid) {
            errors.report(kTransformStage, std::move(valid.error()));
            fail(input, output);
            return;
        }

        state_ = NodeState::kRunning;
        GZC_LOG_DEBUG("TransformNode started: mode={}", operationModeToString(config_.mode));

        while (true) {
            Chunk chunk = input.dequeue();
            if (chunk.isSentinel()) {
                break;
            }

            barrier.wait(chunk.sequence);
            auto result = process(std::move(chunk));
            if (!result) {
                // Release any worker waiting on the next sequence number.
                barrier.advance();
                errors.report(kTransformStage, std::move(result.error()));
                fail(input, output);
                return;
            }
            output.enqueue(std::move(*result));
            barrier.advance();
        }

        output.enqueue(Chunk::sentinel());
        state_ = NodeState::kFinished;
        GZC_LOG_DEBUG("TransformNode finished: chunks={}", totalChunksProcessed_);
    }

    NodeState state() const noexcept { return state_; }
    std::uint64_t chunksProcessed() const noexcept { return totalChunksProcessed_; }

    void reset() noexcept {
        state_ = NodeState::kIdle;
        totalChunksProcessed_ = 0;
    }

private:
    /// @brief Unblock the writer, then keep the reader flowing until its sentinel.
    void fail(ChunkQueue& input, ChunkQueue& output) {
        state_ = NodeState::kError;
        output.enqueue(Chunk::sentinel());
        drainUntilSentinel(input);
    }

    TransformNodeConfig config_;
    NodeState state_ = NodeState::kIdle;
    std::uint64_t totalChunksProcessed_ = 0;
};

// =============================================================================
// TransformNode Public Interface
// =============================================================================

TransformNode::TransformNode(TransformNodeConfig config)
    : impl_(std::make_unique<TransformNodeImpl>(std::move(config))) {}

TransformNode::~TransformNode() = default;

TransformNode::TransformNode(TransformNode&&) noexcept = default;
TransformNode& TransformNode::operator=(TransformNode&&) noexcept = default;

Result<Chunk> TransformNode::process(Chunk input) {
    return impl_->process(std::move(input));
}

void TransformNode::run(ChunkQueue& input, ChunkQueue& output, OrderingBarrier& barrier,
                        ErrorChannel& errors) {
    impl_->run(input, output, barrier, errors);
}

NodeState TransformNode::state() const noexcept {
    return impl_->state();
}

std::uint64_t TransformNode::chunksProcessed() const noexcept {
    return impl_->chunksProcessed();
}

void TransformNode::reset() noexcept {
    impl_->reset();
}

}  // namespace gzc::pipeline
