// =============================================================================
// gzchunk - Direct gzip Stream Tests
// =============================================================================

#include "gzc/io/gzip_stream.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "gzc/algo/chunk_codec.h"
#include "gzc/common/error.h"
#include "test_support.h"

namespace gzc::io {
namespace {

using gzc::test::makeContent;
using gzc::test::makeRandomBytes;
using gzc::test::readFile;
using gzc::test::TempFileGuard;
using gzc::test::tempFilePath;
using gzc::test::writeFile;

class GzipStreamTest : public ::testing::Test {
protected:
    TempFileGuard source_{tempFilePath(".bin")};
    TempFileGuard compressed_{tempFilePath(".bin.gz")};
    TempFileGuard restored_{tempFilePath(".out")};
};

TEST_F(GzipStreamTest, RoundTrip) {
    auto content = makeContent(300 * 1024);
    writeFile(source_.path(), content);

    auto packed = compressStream(source_.path(), compressed_.path(), 6);
    EXPECT_EQ(packed.inputBytes, content.size());
    EXPECT_LT(packed.outputBytes, content.size());

    auto unpacked = decompressStream(compressed_.path(), restored_.path());
    EXPECT_EQ(unpacked.inputBytes, packed.outputBytes);
    EXPECT_EQ(unpacked.outputBytes, content.size());
    EXPECT_EQ(readFile(restored_.path()), content);
}

TEST_F(GzipStreamTest, SmallBuffersRoundTrip) {
    auto content = makeRandomBytes(20'000);
    writeFile(source_.path(), content);

    (void)compressStream(source_.path(), compressed_.path(), 1, 64);
    (void)decompressStream(compressed_.path(), restored_.path(), 64);
    EXPECT_EQ(readFile(restored_.path()), content);
}

TEST_F(GzipStreamTest, OutputStartsWithGzipMagic) {
    writeFile(source_.path(), makeContent(1000));
    (void)compressStream(source_.path(), compressed_.path());

    auto bytes = readFile(compressed_.path());
    ASSERT_GE(bytes.size(), 2u);
    EXPECT_EQ(bytes[0], 0x1f);
    EXPECT_EQ(bytes[1], 0x8b);
}

TEST_F(GzipStreamTest, EmptySource) {
    writeFile(source_.path(), {});

    (void)compressStream(source_.path(), compressed_.path());
    EXPECT_FALSE(readFile(compressed_.path()).empty());

    auto unpacked = decompressStream(compressed_.path(), restored_.path());
    EXPECT_EQ(unpacked.outputBytes, 0u);
    EXPECT_TRUE(readFile(restored_.path()).empty());
}

TEST_F(GzipStreamTest, ZeroByteCompressedFileDecodesToEmpty) {
    writeFile(compressed_.path(), {});
    auto unpacked = decompressStream(compressed_.path(), restored_.path());
    EXPECT_EQ(unpacked.outputBytes, 0u);
    EXPECT_TRUE(readFile(restored_.path()).empty());
}

TEST_F(GzipStreamTest, ConcatenatedMembers) {
    auto first = makeContent(5000, 1);
    auto second = makeContent(7000, 2);

    auto memberA = algo::compressChunk(first);
    auto memberB = algo::compressChunk(second);
    std::vector<std::uint8_t> joined(memberA);
    joined.insert(joined.end(), memberB.begin(), memberB.end());
    writeFile(compressed_.path(), joined);

    (void)decompressStream(compressed_.path(), restored_.path());

    std::vector<std::uint8_t> expected(first);
    expected.insert(expected.end(), second.begin(), second.end());
    EXPECT_EQ(readFile(restored_.path()), expected);
}

TEST_F(GzipStreamTest, TruncatedStreamIsCodecError) {
    writeFile(source_.path(), makeRandomBytes(50'000));
    (void)compressStream(source_.path(), compressed_.path());

    auto bytes = readFile(compressed_.path());
    bytes.resize(bytes.size() / 2);
    writeFile(compressed_.path(), bytes);

    EXPECT_THROW((void)decompressStream(compressed_.path(), restored_.path()), CodecError);
}

TEST_F(GzipStreamTest, GarbageIsCodecError) {
    writeFile(compressed_.path(), makeRandomBytes(1000, 5));
    EXPECT_THROW((void)decompressStream(compressed_.path(), restored_.path()), CodecError);
}

TEST_F(GzipStreamTest, MissingSourceIsIOError) {
    EXPECT_THROW((void)compressStream(tempFilePath(".missing"), compressed_.path()), IOError);
    EXPECT_THROW((void)decompressStream(tempFilePath(".missing.gz"), restored_.path()), IOError);
}

TEST_F(GzipStreamTest, InvalidLevelIsArgumentError) {
    writeFile(source_.path(), makeContent(10));
    EXPECT_THROW((void)compressStream(source_.path(), compressed_.path(), 0), ArgumentError);
}

}  // namespace
}  // namespace gzc::io
