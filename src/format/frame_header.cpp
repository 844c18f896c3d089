// =============================================================================
// gzchunk - Chunk Frame Header Implementation
// =============================================================================

#include "gzc/format/frame_header.h"

#include <fmt/format.h>

namespace gzc::format {

namespace {

constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::uint8_t kPad = '=';

/// @brief Number of base64 symbols carrying data for a 4-byte input.
constexpr std::size_t kDataSymbols = 6;

/// @brief Map a base64 symbol to its 6-bit value, -1 if not in the alphabet.
constexpr int symbolValue(std::uint8_t c) noexcept {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '+') {
        return 62;
    }
    if (c == '/') {
        return 63;
    }
    return -1;
}

}  // namespace

FrameHeaderBytes encodeFrameLength(std::uint32_t length) noexcept {
    const std::uint8_t b0 = static_cast<std::uint8_t>(length >> 24);
    const std::uint8_t b1 = static_cast<std::uint8_t>(length >> 16);
    const std::uint8_t b2 = static_cast<std::uint8_t>(length >> 8);
    const std::uint8_t b3 = static_cast<std::uint8_t>(length);

    FrameHeaderBytes out{};
    out[0] = static_cast<std::uint8_t>(kBase64Alphabet[b0 >> 2]);
    out[1] = static_cast<std::uint8_t>(kBase64Alphabet[((b0 & 0x03) << 4) | (b1 >> 4)]);
    out[2] = static_cast<std::uint8_t>(kBase64Alphabet[((b1 & 0x0F) << 2) | (b2 >> 6)]);
    out[3] = static_cast<std::uint8_t>(kBase64Alphabet[b2 & 0x3F]);
    out[4] = static_cast<std::uint8_t>(kBase64Alphabet[b3 >> 2]);
    out[5] = static_cast<std::uint8_t>(kBase64Alphabet[(b3 & 0x03) << 4]);
    out[6] = kPad;
    out[7] = kPad;
    return out;
}

Result<std::uint32_t> decodeFrameLength(std::span<const std::uint8_t> header) {
    if (header.size() != kFrameHeaderSize) {
        return makeError<std::uint32_t>(
            ErrorCode::kCodecError,
            fmt::format("frame header must be {} bytes, got {}", kFrameHeaderSize, header.size()));
    }

    if (header[6] != kPad || header[7] != kPad) {
        return makeError<std::uint32_t>(ErrorCode::kCodecError,
                                        "frame header is missing base64 padding");
    }

    std::array<std::uint32_t, kDataSymbols> values{};
    for (std::size_t i = 0; i < kDataSymbols; ++i) {
        int v = symbolValue(header[i]);
        if (v < 0) {
            return makeError<std::uint32_t>(
                ErrorCode::kCodecError,
                fmt::format("invalid base64 byte 0x{:02x} in frame header", header[i]));
        }
        values[i] = static_cast<std::uint32_t>(v);
    }

    // The last data symbol carries 2 bits of payload; the low 4 must be zero.
    if ((values[5] & 0x0F) != 0) {
        return makeError<std::uint32_t>(ErrorCode::kCodecError,
                                        "frame header has non-canonical base64 padding bits");
    }

    std::uint32_t length = 0;
    length |= (values[0] << 26);
    length |= (values[1] << 20);
    length |= (values[2] << 14);
    length |= (values[3] << 8);
    length |= (values[4] << 2);
    length |= (values[5] >> 4);
    return length;
}

}  // namespace gzc::format
