// =============================================================================
// gzchunk - Compressor Interface
// =============================================================================
// One capability, two implementations:
//
// - ChunkedCompressor: the multi-threaded chunked pipeline; its output is a
//   sequence of length-framed gzip members.
// - StreamCompressor: a single plain gzip stream of the whole file.
//
// The two output formats are not interchangeable even though both use the
// ".gz" extension. makeCompressor() picks one from the configured worker
// count. Both check their arguments before any work starts:
//
//   blank path                        -> kInvalidArgument
//   source missing                    -> kFileNotFound
//   decompress source without ".gz"   -> kFormatError
// =============================================================================

#ifndef GZC_PIPELINE_COMPRESSOR_H
#define GZC_PIPELINE_COMPRESSOR_H

#include <filesystem>
#include <memory>
#include <string_view>

#include "gzc/common/error.h"
#include "gzc/common/types.h"
#include "gzc/pipeline/pipeline.h"

namespace gzc::pipeline {

// =============================================================================
// Compressor Interface
// =============================================================================

/// @brief Compresses or decompresses one file
class ICompressor {
public:
    virtual ~ICompressor() = default;

    /// @brief Compress sourcePath into targetPath (created or truncated)
    [[nodiscard]] virtual VoidResult compress(const std::filesystem::path& sourcePath,
                                              const std::filesystem::path& targetPath) = 0;

    /// @brief Decompress sourcePath (must end in ".gz") into targetPath
    [[nodiscard]] virtual VoidResult decompress(const std::filesystem::path& sourcePath,
                                                const std::filesystem::path& targetPath) = 0;

    /// @brief Short name of the implementation ("chunked" or "stream")
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// @brief Statistics of the last successful operation
    [[nodiscard]] virtual const PipelineStats& stats() const noexcept = 0;

protected:
    ICompressor() = default;
    ICompressor(const ICompressor&) = default;
    ICompressor& operator=(const ICompressor&) = default;
};

// =============================================================================
// Chunked Compressor
// =============================================================================

/// @brief Compressor backed by the chunked pipeline
class ChunkedCompressor final : public ICompressor {
public:
    explicit ChunkedCompressor(PipelineConfig config = {});

    [[nodiscard]] VoidResult compress(const std::filesystem::path& sourcePath,
                                      const std::filesystem::path& targetPath) override;

    [[nodiscard]] VoidResult decompress(const std::filesystem::path& sourcePath,
                                        const std::filesystem::path& targetPath) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "chunked"; }

    [[nodiscard]] const PipelineStats& stats() const noexcept override;

private:
    ChunkedPipeline pipeline_;
};

// =============================================================================
// Stream Compressor
// =============================================================================

/// @brief Single-threaded compressor writing one plain gzip stream
class StreamCompressor final : public ICompressor {
public:
    explicit StreamCompressor(CompressionLevel level = kDefaultCompressionLevel);

    [[nodiscard]] VoidResult compress(const std::filesystem::path& sourcePath,
                                      const std::filesystem::path& targetPath) override;

    [[nodiscard]] VoidResult decompress(const std::filesystem::path& sourcePath,
                                        const std::filesystem::path& targetPath) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "stream"; }

    [[nodiscard]] const PipelineStats& stats() const noexcept override { return stats_; }

private:
    CompressionLevel level_;
    PipelineStats stats_;
};

// =============================================================================
// Factory and Validation
// =============================================================================

/// @brief Create the compressor matching the configuration
/// @return StreamCompressor when the effective worker count is 1, otherwise ChunkedCompressor
[[nodiscard]] std::unique_ptr<ICompressor> makeCompressor(PipelineConfig config);

/// @brief Check the arguments of a compress or decompress call
[[nodiscard]] VoidResult checkPreconditions(OperationMode mode,
                                            const std::filesystem::path& sourcePath,
                                            const std::filesystem::path& targetPath);

}  // namespace gzc::pipeline

#endif  // GZC_PIPELINE_COMPRESSOR_H
