// =============================================================================
// gzchunk - Frame Header Property Tests
// =============================================================================
// For every 32-bit length, decode(encode(n)) == n and the encoding is 8
// printable base64 bytes ending in "==".
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cctype>
#include <cstdint>

#include "gzc/format/frame_header.h"

namespace gzc::format::test {

RC_GTEST_PROP(FrameHeaderProperty, EncodeDecodeRoundTrip, ()) {
    const auto length = *rc::gen::arbitrary<std::uint32_t>();

    auto header = encodeFrameLength(length);
    RC_ASSERT(header.size() == kFrameHeaderSize);

    auto decoded = decodeFrameLength(header);
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(*decoded == length);
}

RC_GTEST_PROP(FrameHeaderProperty, EncodingIsPrintableBase64, ()) {
    const auto length = *rc::gen::arbitrary<std::uint32_t>();
    auto header = encodeFrameLength(length);

    RC_ASSERT(std::all_of(header.begin(), header.begin() + 6, [](std::uint8_t c) {
        return std::isalnum(c) != 0 || c == '+' || c == '/';
    }));
    RC_ASSERT(header[6] == '=');
    RC_ASSERT(header[7] == '=');
}

RC_GTEST_PROP(FrameHeaderProperty, DistinctLengthsGiveDistinctHeaders, ()) {
    const auto a = *rc::gen::arbitrary<std::uint32_t>();
    const auto b = *rc::gen::suchThat(rc::gen::arbitrary<std::uint32_t>(),
                                      [a](std::uint32_t v) { return v != a; });
    RC_ASSERT(encodeFrameLength(a) != encodeFrameLength(b));
}

}  // namespace gzc::format::test
