// =============================================================================
// gzchunk - Chunk Frame Header
// =============================================================================
// Fixed-width length header that delimits compressed chunks on disk.
//
// Chunked file layout (no global header, no trailer):
//
//   file   := frame*
//   frame  := header(8 bytes) payload(N bytes)
//   header := base64 text of the big-endian uint32 N ("AAAAAA==" .. "/////w==")
//
// Four input bytes always produce six base64 symbols followed by "==", so
// the header width does not depend on N. Decoding is strict: any byte
// outside the base64 alphabet, missing padding or non-zero pad bits is a
// CodecError. End-of-stream is plain end-of-file.
// =============================================================================

#ifndef GZC_FORMAT_FRAME_HEADER_H
#define GZC_FORMAT_FRAME_HEADER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "gzc/common/error.h"

namespace gzc::format {

// =============================================================================
// Constants
// =============================================================================

/// @brief Size of an encoded frame header in bytes.
inline constexpr std::size_t kFrameHeaderSize = 8;

/// @brief Raw bytes of one encoded frame header.
using FrameHeaderBytes = std::array<std::uint8_t, kFrameHeaderSize>;

// =============================================================================
// Encoding / Decoding
// =============================================================================

/// @brief Encode a payload length as an 8-byte frame header.
/// @param length Payload length in bytes.
/// @return Base64 text of the big-endian length.
[[nodiscard]] FrameHeaderBytes encodeFrameLength(std::uint32_t length) noexcept;

/// @brief Decode an 8-byte frame header back into a payload length.
/// @param header Exactly kFrameHeaderSize bytes.
/// @return Payload length, or kCodecError for malformed headers.
[[nodiscard]] Result<std::uint32_t> decodeFrameLength(std::span<const std::uint8_t> header);

}  // namespace gzc::format

#endif  // GZC_FORMAT_FRAME_HEADER_H
