// =============================================================================
// gzchunk - Command Tests
// =============================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <vector>

#include "commands/command_common.h"
#include "commands/compress_command.h"
#include "commands/decompress_command.h"
#include "commands/info_command.h"
#include "gzc/format/frame_header.h"
#include "test_support.h"

namespace gzc::commands {
namespace {

using gzc::test::makeContent;
using gzc::test::readFile;
using gzc::test::TempFileGuard;
using gzc::test::tempFilePath;
using gzc::test::writeFile;

[[nodiscard]] TransferOptions quietOptions(std::filesystem::path input,
                                           std::filesystem::path output,
                                           std::size_t threads) {
    TransferOptions options;
    options.inputPath = std::move(input);
    options.outputPath = std::move(output);
    options.threads = threads;
    options.showProgress = false;
    return options;
}

// =============================================================================
// Helpers
// =============================================================================

TEST(FormatElapsedTest, HoursMinutesSecondsMillis) {
    using namespace std::chrono;
    EXPECT_EQ(formatElapsed(milliseconds(0)), "00:00:00.000");
    EXPECT_EQ(formatElapsed(milliseconds(1234)), "00:00:01.234");
    EXPECT_EQ(formatElapsed(hours(2) + minutes(3) + seconds(4) + milliseconds(5)),
              "02:03:04.005");
}

TEST(PipelineConfigFromOptionsTest, CopiesSettings) {
    TransferOptions options;
    options.threads = 3;
    options.compressionLevel = 9;

    std::size_t errorCount = 0;
    auto config = makePipelineConfig(options, errorCount);
    EXPECT_EQ(config.workers, 3u);
    EXPECT_EQ(config.compressionLevel, 9);
    ASSERT_TRUE(static_cast<bool>(config.errorCallback));

    config.errorCallback(pipeline::StageError{"writer", Error{ErrorCode::kIOError, "disk full"}});
    EXPECT_EQ(errorCount, 1u);
}

TEST(ReportFailureTest, ReturnsErrorExitCode) {
    EXPECT_EQ(reportFailure("Compression", Error{ErrorCode::kFileNotFound, "x"}, 0), 6);
    EXPECT_EQ(reportFailure("Decompression", Error{ErrorCode::kCodecError, "y"}, 1), 4);
}

// =============================================================================
// Compress / Decompress
// =============================================================================

class TransferCommandTest : public ::testing::TestWithParam<std::size_t> {
protected:
    TempFileGuard source_{tempFilePath(".bin")};
    TempFileGuard compressed_{tempFilePath(".bin.gz")};
    TempFileGuard restored_{tempFilePath(".out")};
};

TEST_P(TransferCommandTest, RoundTrip) {
    auto content = makeContent(150'000);
    writeFile(source_.path(), content);

    CompressCommand compress(quietOptions(source_.path(), compressed_.path(), GetParam()));
    ASSERT_EQ(compress.execute(), 0);
    EXPECT_EQ(compress.stats().inputBytes, content.size());

    DecompressCommand decompress(quietOptions(compressed_.path(), restored_.path(), GetParam()));
    ASSERT_EQ(decompress.execute(), 0);
    EXPECT_EQ(readFile(restored_.path()), content);
}

INSTANTIATE_TEST_SUITE_P(Threads, TransferCommandTest, ::testing::Values(1u, 4u));

TEST(TransferCommandErrorTest, MissingSourceExitsWithFileNotFound) {
    CompressCommand compress(quietOptions(tempFilePath(".missing"), tempFilePath(".gz"), 2));
    EXPECT_EQ(compress.execute(), toExitCode(ErrorCode::kFileNotFound));
}

TEST(TransferCommandErrorTest, WrongExtensionExitsWithFormatError) {
    TempFileGuard source(tempFilePath(".bin"));
    writeFile(source.path(), makeContent(10));

    DecompressCommand decompress(quietOptions(source.path(), tempFilePath(".out"), 2));
    EXPECT_EQ(decompress.execute(), toExitCode(ErrorCode::kFormatError));
}

TEST(TransferCommandErrorTest, CorruptInputExitsWithCodecError) {
    TempFileGuard source(tempFilePath(".gz"));
    TempFileGuard target(tempFilePath(".out"));
    writeFile(source.path(), {'n', 'o', 't', ' ', 'a', ' ', 'f', 'r', 'a', 'm', 'e'});

    DecompressCommand decompress(quietOptions(source.path(), target.path(), 2));
    EXPECT_EQ(decompress.execute(), toExitCode(ErrorCode::kCodecError));
}

// =============================================================================
// Info
// =============================================================================

TEST(InfoCommandTest, WellFormedFileExitsZero) {
    TempFileGuard source(tempFilePath(".bin"));
    TempFileGuard compressed(tempFilePath(".bin.gz"));
    writeFile(source.path(), makeContent(5000));

    CompressCommand compress(quietOptions(source.path(), compressed.path(), 2));
    ASSERT_EQ(compress.execute(), 0);

    InfoOptions options;
    options.inputPath = compressed.path();
    options.detailed = true;
    EXPECT_EQ(InfoCommand(options).execute(), 0);

    options.jsonOutput = true;
    EXPECT_EQ(InfoCommand(options).execute(), 0);
}

TEST(InfoCommandTest, BrokenFramingExitsWithCodecError) {
    TempFileGuard file(tempFilePath(".gz"));
    auto header = format::encodeFrameLength(100);
    std::vector<std::uint8_t> bytes(header.begin(), header.end());
    bytes.resize(bytes.size() + 10, 0x00);
    writeFile(file.path(), bytes);

    InfoOptions options;
    options.inputPath = file.path();
    EXPECT_EQ(InfoCommand(options).execute(), toExitCode(ErrorCode::kCodecError));
}

TEST(InfoCommandTest, MissingFileExitsWithFileNotFound) {
    InfoOptions options;
    options.inputPath = tempFilePath(".gz");
    EXPECT_EQ(InfoCommand(options).execute(), toExitCode(ErrorCode::kFileNotFound));
}

}  // namespace
}  // namespace gzc::commands
