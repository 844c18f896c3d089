// =============================================================================
// gzchunk - Pipeline Node Support
// =============================================================================
// Configuration validation, the per-run error channel, the ordering barrier
// and the sentinel drain helper shared by all stages.
// =============================================================================

#include "gzc/pipeline/pipeline_node.h"

#include <fmt/format.h>

#include "gzc/common/logger.h"

namespace gzc::pipeline {

// =============================================================================
// Configuration Validation
// =============================================================================

namespace {

VoidResult validateBlockSize(std::size_t blockSize) {
    if (blockSize < kMinBlockSize || blockSize > kMaxBlockSize) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Block size must be between {} and {}, got {}",
                                         kMinBlockSize, kMaxBlockSize, blockSize));
    }
    return makeVoidSuccess();
}

}  // namespace

VoidResult ReaderNodeConfig::validate() const {
    return validateBlockSize(blockSize);
}

VoidResult TransformNodeConfig::validate() const {
    if (!isValidCompressionLevel(compressionLevel)) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Compression level must be between {} and {}, got {}",
                                         kMinCompressionLevel, kMaxCompressionLevel,
                                         compressionLevel));
    }
    return validateBlockSize(blockSize);
}

// =============================================================================
// ErrorChannel Implementation
// =============================================================================

void ErrorChannel::report(std::string_view stage, Error error) {
    GZC_LOG_DEBUG("Stage '{}' reported: {}", stage, error.message());
    std::lock_guard lock(mutex_);
    errors_.push_back(StageError{std::string(stage), std::move(error)});
}

bool ErrorChannel::hasErrors() const {
    std::lock_guard lock(mutex_);
    return !errors_.empty();
}

std::vector<StageError> ErrorChannel::errors() const {
    std::lock_guard lock(mutex_);
    return errors_;
}

std::optional<StageError> ErrorChannel::first() const {
    std::lock_guard lock(mutex_);
    if (errors_.empty()) {
        return std::nullopt;
    }
    return errors_.front();
}

// =============================================================================
// OrderingBarrier Implementation
// =============================================================================

void OrderingBarrier::wait(SequenceNumber seq) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this, seq] { return next_ == seq; });
}

void OrderingBarrier::advance() {
    {
        std::lock_guard lock(mutex_);
        ++next_;
    }
    cv_.notify_all();
}

SequenceNumber OrderingBarrier::next() const {
    std::lock_guard lock(mutex_);
    return next_;
}

void OrderingBarrier::reset(SequenceNumber start) {
    {
        std::lock_guard lock(mutex_);
        next_ = start;
    }
    cv_.notify_all();
}

// =============================================================================
// Helpers
// =============================================================================

void drainUntilSentinel(ChunkQueue& queue) {
    std::uint64_t discarded = 0;
    while (!queue.dequeue().isSentinel()) {
        ++discarded;
    }
    if (discarded > 0) {
        GZC_LOG_DEBUG("Discarded {} chunks after stage failure", discarded);
    }
}

}  // namespace gzc::pipeline
