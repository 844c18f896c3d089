// =============================================================================
// gzchunk - Frame Header Tests
// =============================================================================

#include "gzc/format/frame_header.h"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <limits>
#include <string>

namespace gzc::format {
namespace {

[[nodiscard]] std::string asText(const FrameHeaderBytes& header) {
    return std::string(header.begin(), header.end());
}

[[nodiscard]] FrameHeaderBytes fromText(const std::string& text) {
    FrameHeaderBytes header{};
    for (std::size_t i = 0; i < header.size(); ++i) {
        header[i] = static_cast<std::uint8_t>(text.at(i));
    }
    return header;
}

// =============================================================================
// Encoding
// =============================================================================

TEST(FrameHeaderTest, KnownVectors) {
    EXPECT_EQ(asText(encodeFrameLength(0)), "AAAAAA==");
    EXPECT_EQ(asText(encodeFrameLength(1)), "AAAAAQ==");
    EXPECT_EQ(asText(encodeFrameLength(255)), "AAAA/w==");
    EXPECT_EQ(asText(encodeFrameLength(1024 * 1024)), "ABAAAA==");
    EXPECT_EQ(asText(encodeFrameLength(0x7FFFFFFF)), "f////w==");
    EXPECT_EQ(asText(encodeFrameLength(std::numeric_limits<std::uint32_t>::max())), "/////w==");
}

TEST(FrameHeaderTest, AlwaysEightBytes) {
    for (std::uint32_t value : {0u, 7u, 300u, 65536u, 123456789u, 0xFFFFFFFFu}) {
        auto header = encodeFrameLength(value);
        EXPECT_EQ(header.size(), kFrameHeaderSize);
        EXPECT_EQ(header[6], '=');
        EXPECT_EQ(header[7], '=');
    }
}

// =============================================================================
// Decoding
// =============================================================================

TEST(FrameHeaderTest, DecodesKnownVectors) {
    auto zero = decodeFrameLength(fromText("AAAAAA=="));
    ASSERT_TRUE(zero.has_value());
    EXPECT_EQ(*zero, 0u);

    auto mib = decodeFrameLength(fromText("ABAAAA=="));
    ASSERT_TRUE(mib.has_value());
    EXPECT_EQ(*mib, 1024u * 1024u);

    auto max = decodeFrameLength(fromText("/////w=="));
    ASSERT_TRUE(max.has_value());
    EXPECT_EQ(*max, std::numeric_limits<std::uint32_t>::max());
}

TEST(FrameHeaderTest, RejectsWrongSize) {
    std::array<std::uint8_t, 4> shortHeader{'A', 'A', 'A', 'A'};
    auto result = decodeFrameLength(shortHeader);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCodecError);
}

TEST(FrameHeaderTest, RejectsMissingPadding) {
    auto result = decodeFrameLength(fromText("AAAAAAAA"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCodecError);
}

TEST(FrameHeaderTest, RejectsBytesOutsideAlphabet) {
    auto result = decodeFrameLength(fromText("AA*AAA=="));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCodecError);

    // The first bytes of a plain gzip stream are not base64 text.
    FrameHeaderBytes gzipMagic{0x1f, 0x8b, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00};
    EXPECT_FALSE(decodeFrameLength(gzipMagic).has_value());
}

TEST(FrameHeaderTest, RejectsNonCanonicalPadBits) {
    // "AAAAAR==" differs from "AAAAAQ==" only in bits that must be zero.
    auto result = decodeFrameLength(fromText("AAAAAR=="));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCodecError);
}

TEST(FrameHeaderTest, EncodeDecodeSamples) {
    for (std::uint32_t value : {0u, 1u, 20u, 1048576u, 1048594u, 0xDEADBEEFu, 0xFFFFFFFFu}) {
        auto decoded = decodeFrameLength(encodeFrameLength(value));
        ASSERT_TRUE(decoded.has_value()) << value;
        EXPECT_EQ(*decoded, value);
    }
}

}  // namespace
}  // namespace gzc::format
