// =============================================================================
// gzchunk - ReaderNode Implementation
// =============================================================================
// Implements the ReaderNode (serial input stage).
// =============================================================================

#include "gzc/pipeline/pipeline_node.h"

#include <fstream>

#include <fmt/format.h>

#include "gzc/algo/chunk_codec.h"
#include "gzc/common/logger.h"
#include "gzc/format/frame_header.h"

namespace gzc::pipeline {

// =============================================================================
// ReaderNodeImpl
// =============================================================================

class ReaderNodeImpl {
public:
    explicit ReaderNodeImpl(ReaderNodeConfig config)
        : config_(std::move(config)) {}

    VoidResult open(const std::filesystem::path& path) {
        if (auto valid = config_.validate(); !valid) {
            state_ = NodeState::kError;
            return valid;
        }

        close();
        stream_.open(path, std::ios::binary);
        if (!stream_.is_open()) {
            state_ = NodeState::kError;
            return makeVoidError(ErrorCode::kIOError,
                                 fmt::format("Failed to open source file: {}", path.string()));
        }

        inputPath_ = path;
        state_ = NodeState::kRunning;
        nextSequence_ = 0;
        totalChunksRead_ = 0;
        totalBytesRead_ = 0;

        GZC_LOG_DEBUG("ReaderNode opened: path={}, mode={}, block_size={}", path.string(),
                      operationModeToString(config_.mode), config_.blockSize);
        return makeVoidSuccess();
    }

    Result<std::optional<Chunk>> readChunk() {
        if (state_ == NodeState::kFinished) {
            return std::optional<Chunk>{};
        }
        if (state_ != NodeState::kRunning) {
            return makeError<std::optional<Chunk>>(ErrorCode::kInvalidState, "Reader not open");
        }

        try {
            std::optional<std::vector<std::uint8_t>> payload =
                config_.mode == OperationMode::kCompress ? readRawBlock() : readFrame();
            if (!payload) {
                state_ = NodeState::kFinished;
                GZC_LOG_DEBUG("ReaderNode reached end of file: chunks={}, bytes={}",
                              totalChunksRead_, totalBytesRead_);
                return std::optional<Chunk>{};
            }

            Chunk chunk;
            chunk.sequence = nextSequence_++;
            chunk.payload = std::move(payload);
            ++totalChunksRead_;
            return std::optional<Chunk>{std::move(chunk)};

        } catch (const GZCException& e) {
            state_ = NodeState::kError;
            return makeError<std::optional<Chunk>>(e);
        } catch (const std::exception& e) {
            state_ = NodeState::kError;
            return makeError<std::optional<Chunk>>(
                ErrorCode::kIOError, fmt::format("Failed to read source: {}", e.what()));
        }
    }

    void close() noexcept {
        if (stream_.is_open()) {
            stream_.close();
        }
        if (state_ == NodeState::kRunning) {
            state_ = NodeState::kIdle;
        }
    }

    void run(const std::filesystem::path& path, ChunkQueue& output, ErrorChannel& errors) {
        auto opened = open(path);
        if (!opened) {
            errors.report(kReaderStage, std::move(opened.error()));
        } else {
            while (true) {
                auto next = readChunk();
                if (!next) {
                    errors.report(kReaderStage, std::move(next.error()));
                    break;
                }
                if (!next->has_value()) {
                    break;
                }
                output.enqueue(std::move(**next));
            }
        }

        // Exactly one sentinel per run, on success and on failure alike.
        output.enqueue(Chunk::sentinel());
        close();
    }

    NodeState state() const noexcept { return state_; }
    std::uint64_t chunksRead() const noexcept { return totalChunksRead_; }
    std::uint64_t bytesRead() const noexcept { return totalBytesRead_; }

    void reset() noexcept {
        close();
        state_ = NodeState::kIdle;
        nextSequence_ = 0;
        totalChunksRead_ = 0;
        totalBytesRead_ = 0;
    }

private:
    /// @brief Read up to size bytes into buffer; returns the count actually read.
    std::size_t readInto(std::uint8_t* buffer, std::size_t size) {
        stream_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(size));
        if (stream_.bad()) {
            throw IOError("Failed to read source file",
                          ErrorContext{inputPath_.string()}.withOffset(totalBytesRead_));
        }
        auto count = static_cast<std::size_t>(stream_.gcount());
        totalBytesRead_ += count;
        return count;
    }

    std::optional<std::vector<std::uint8_t>> readRawBlock() {
        std::vector<std::uint8_t> block(config_.blockSize);
        std::size_t count = readInto(block.data(), block.size());
        if (count == 0) {
            return std::nullopt;
        }
        block.resize(count);
        return block;
    }

    std::optional<std::vector<std::uint8_t>> readFrame() {
        const std::uint64_t frameOffset = totalBytesRead_;

        format::FrameHeaderBytes header{};
        std::size_t headerBytes = readInto(header.data(), header.size());
        if (headerBytes == 0) {
            return std::nullopt;
        }
        if (headerBytes < header.size()) {
            throw CodecError(fmt::format("Truncated frame header ({} of {} bytes)", headerBytes,
                                         header.size()),
                             frameContext(frameOffset));
        }

        auto length = format::decodeFrameLength(header);
        if (!length) {
            throw CodecError(length.error().message(), frameContext(frameOffset));
        }

        const std::size_t limit = algo::maxCompressedChunkSize(config_.blockSize);
        if (*length == 0 || *length > limit) {
            throw CodecError(fmt::format("Frame length {} outside 1..{} for block size {}",
                                         *length, limit, config_.blockSize),
                             frameContext(frameOffset));
        }

        std::vector<std::uint8_t> payload(*length);
        std::size_t payloadBytes = readInto(payload.data(), payload.size());
        if (payloadBytes < payload.size()) {
            throw CodecError(fmt::format("Truncated frame payload ({} of {} bytes)", payloadBytes,
                                         payload.size()),
                             frameContext(frameOffset));
        }
        return payload;
    }

    ErrorContext frameContext(std::uint64_t offset) const {
        return ErrorContext{inputPath_.string()}.withSequence(nextSequence_).withOffset(offset);
    }

    ReaderNodeConfig config_;
    std::filesystem::path inputPath_;
    std::ifstream stream_;
    NodeState state_ = NodeState::kIdle;
    SequenceNumber nextSequence_ = 0;
    std::uint64_t totalChunksRead_ = 0;
    std::uint64_t totalBytesRead_ = 0;
};

// =============================================================================
// ReaderNode Public Interface
// =============================================================================

ReaderNode::ReaderNode(ReaderNodeConfig config)
    : impl_(std::make_unique<ReaderNodeImpl>(std::move(config))) {}

ReaderNode::~ReaderNode() = default;

ReaderNode::ReaderNode(ReaderNode&&) noexcept = default;
ReaderNode& ReaderNode::operator=(ReaderNode&&) noexcept = default;

VoidResult ReaderNode::open(const std::filesystem::path& path) {
    return impl_->open(path);
}

Result<std::optional<Chunk>> ReaderNode::readChunk() {
    return impl_->readChunk();
}

void ReaderNode::close() noexcept {
    impl_->close();
}

void ReaderNode::run(const std::filesystem::path& path, ChunkQueue& output,
                     ErrorChannel& errors) {
    impl_->run(path, output, errors);
}

NodeState ReaderNode::state() const noexcept {
    return impl_->state();
}

std::uint64_t ReaderNode::chunksRead() const noexcept {
    return impl_->chunksRead();
}

std::uint64_t ReaderNode::bytesRead() const noexcept {
    return impl_->bytesRead();
}

void ReaderNode::reset() noexcept {
    impl_->reset();
}

}  // namespace gzc::pipeline
