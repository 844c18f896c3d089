// =============================================================================
// gzchunk - Pipeline Property Tests
// =============================================================================
// Property-based tests for the chunked pipeline.
//
// **Round trip**: for any content, block size, worker count and queue
// capacity, decompress(compress(x)) == x.
//
// **Framing**: the compressed file holds ceil(size / blockSize) frames and
// the frame count does not depend on the queue capacity.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <filesystem>
#include <vector>

#include "gzc/format/frame_scanner.h"
#include "gzc/pipeline/compressor.h"
#include "gzc/pipeline/pipeline.h"
#include "test_support.h"

namespace gzc::pipeline::test {

using gzc::test::readFile;
using gzc::test::TempFileGuard;
using gzc::test::tempFilePath;
using gzc::test::writeFile;

// =============================================================================
// Generators
// =============================================================================

namespace gen {

/// @brief Content mixing runs of repeated bytes with arbitrary bytes
rc::Gen<std::vector<std::uint8_t>> content(std::size_t maxLen = 16'000) {
    return rc::gen::mapcat(
        rc::gen::inRange<std::size_t>(0, maxLen + 1),
        [](std::size_t len) {
            return rc::gen::container<std::vector<std::uint8_t>>(
                len,
                rc::gen::weightedOneOf<std::uint8_t>({
                    {3, rc::gen::elementOf(std::uint8_t{'a'}, std::uint8_t{'b'},
                                           std::uint8_t{'c'})},
                    {1, rc::gen::arbitrary<std::uint8_t>()},
                }));
        });
}

/// @brief Small block sizes so short inputs still span several chunks
rc::Gen<std::size_t> blockSize() {
    constexpr std::size_t kSizes[] = {16, 64, 512, 4096};
    return rc::gen::elementOf(kSizes[0], kSizes[1], kSizes[2], kSizes[3]);
}

}  // namespace gen

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(PipelineRoundTripProperty, ChunkedRoundTrip, ()) {
    const auto data = *gen::content();

    PipelineConfig config;
    config.blockSize = *gen::blockSize();
    config.workers = *rc::gen::inRange<std::size_t>(2, 9);
    config.queueCapacity = *rc::gen::inRange<std::size_t>(0, 9);
    config.compressionLevel = *rc::gen::inRange(kMinCompressionLevel, kMaxCompressionLevel + 1);

    TempFileGuard source(tempFilePath(".bin"));
    TempFileGuard compressed(tempFilePath(".bin.gz"));
    TempFileGuard restored(tempFilePath(".out"));
    writeFile(source.path(), data);

    ChunkedPipeline pipeline(config);
    auto packed = pipeline.run(OperationMode::kCompress, source.path(), compressed.path());
    RC_ASSERT(packed.has_value());

    auto summary = format::scanFrames(compressed.path());
    RC_ASSERT(summary.has_value());
    RC_ASSERT(summary->complete());
    RC_ASSERT(summary->frameCount() ==
              (data.size() + config.blockSize - 1) / config.blockSize);

    auto unpacked = pipeline.run(OperationMode::kDecompress, compressed.path(), restored.path());
    RC_ASSERT(unpacked.has_value());
    RC_ASSERT(readFile(restored.path()) == data);
}

RC_GTEST_PROP(PipelineRoundTripProperty, CompressorRoundTripForAnyWorkerCount, ()) {
    const auto data = *gen::content(8'000);

    PipelineConfig config;
    config.blockSize = 1024;
    config.workers = *rc::gen::inRange<std::size_t>(1, 5);

    TempFileGuard source(tempFilePath(".bin"));
    TempFileGuard compressed(tempFilePath(".bin.gz"));
    TempFileGuard restored(tempFilePath(".out"));
    writeFile(source.path(), data);

    auto compressor = makeCompressor(config);
    RC_ASSERT(compressor->compress(source.path(), compressed.path()).has_value());
    RC_ASSERT(compressor->decompress(compressed.path(), restored.path()).has_value());
    RC_ASSERT(readFile(restored.path()) == data);
}

RC_GTEST_PROP(PipelineRoundTripProperty, OutputIndependentOfQueueCapacity, ()) {
    const auto data = *gen::content(10'000);
    const auto capacityA = *rc::gen::inRange<std::size_t>(1, 9);
    const auto capacityB = *rc::gen::inRange<std::size_t>(1, 9);

    TempFileGuard source(tempFilePath(".bin"));
    TempFileGuard outA(tempFilePath(".a.gz"));
    TempFileGuard outB(tempFilePath(".b.gz"));
    writeFile(source.path(), data);

    PipelineConfig config;
    config.blockSize = 256;
    config.workers = 4;

    config.queueCapacity = capacityA;
    ChunkedPipeline first(config);
    RC_ASSERT(first.run(OperationMode::kCompress, source.path(), outA.path()).has_value());

    config.queueCapacity = capacityB;
    ChunkedPipeline second(config);
    RC_ASSERT(second.run(OperationMode::kCompress, source.path(), outB.path()).has_value());

    RC_ASSERT(readFile(outA.path()) == readFile(outB.path()));
}

}  // namespace gzc::pipeline::test
