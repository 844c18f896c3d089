// =============================================================================
// gzchunk - Chunk Codec
// =============================================================================
// Compresses and decompresses single chunks as self-contained gzip members
// (RFC 1952) using zlib.
//
// Each compressed chunk carries its own gzip header and trailer, so any
// chunk can be inflated without the chunks before it. The decompressor
// accepts exactly one member per chunk and rejects trailing bytes.
// =============================================================================

#ifndef GZC_ALGO_CHUNK_CODEC_H
#define GZC_ALGO_CHUNK_CODEC_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "gzc/common/types.h"

namespace gzc::algo {

/// @brief Compress a chunk into one complete gzip member.
/// @param input Raw chunk bytes (may be empty).
/// @param level zlib compression level (1-9).
/// @return Compressed bytes.
/// @throws CodecError if zlib fails.
[[nodiscard]] std::vector<std::uint8_t> compressChunk(std::span<const std::uint8_t> input,
                                                      CompressionLevel level = kDefaultCompressionLevel);

/// @brief Decompress one gzip member produced by compressChunk().
/// @param input Compressed bytes of exactly one member.
/// @param maxSize Upper bound on the decompressed size.
/// @return Decompressed bytes, trimmed to the size actually produced.
/// @throws CodecError for malformed or truncated data, trailing bytes, or
///         output larger than maxSize.
[[nodiscard]] std::vector<std::uint8_t> decompressChunk(std::span<const std::uint8_t> input,
                                                        std::size_t maxSize);

/// @brief Upper bound of the compressed size of a chunk of rawSize bytes.
/// @note Used by readers to reject frame headers that cannot be genuine.
[[nodiscard]] std::size_t maxCompressedChunkSize(std::size_t rawSize) noexcept;

}  // namespace gzc::algo

#endif  // GZC_ALGO_CHUNK_CODEC_H
