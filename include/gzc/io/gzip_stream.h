// =============================================================================
// gzchunk - Direct gzip Stream Codec
// =============================================================================
// Whole-file gzip compression and decompression without chunking or frame
// headers. This is the single-threaded path selected when only one worker
// is configured.
//
// Output of compressStream() is a plain gzip file readable by gzip(1); it is
// NOT a chunked file and cannot be read by the chunked pipeline (and vice
// versa), even though both use the ".gz" extension.
//
// Usage:
//   gzc::io::compressStream("data.bin", "data.bin.gz", 6);
//   gzc::io::decompressStream("data.bin.gz", "data.bin");
// =============================================================================

#ifndef GZC_IO_GZIP_STREAM_H
#define GZC_IO_GZIP_STREAM_H

#include <cstddef>
#include <cstdint>
#include <filesystem>

#include "gzc/common/types.h"

namespace gzc::io {

/// @brief Default I/O buffer size for stream coding (256 KiB).
inline constexpr std::size_t kDefaultStreamBufferSize = 256 * 1024;

/// @brief Byte counts of one stream operation.
struct StreamStats {
    std::uint64_t inputBytes = 0;
    std::uint64_t outputBytes = 0;
};

/// @brief Compress a whole file into one gzip stream.
/// @param source File to read.
/// @param target File to create or truncate.
/// @param level zlib compression level (1-9).
/// @param bufferSize Size of the read and write buffers.
/// @throws IOError if either file cannot be read or written.
/// @throws CodecError if zlib fails.
StreamStats compressStream(const std::filesystem::path& source,
                           const std::filesystem::path& target,
                           CompressionLevel level = kDefaultCompressionLevel,
                           std::size_t bufferSize = kDefaultStreamBufferSize);

/// @brief Decompress a gzip file (one or more concatenated members).
/// @note A zero-byte source produces a zero-byte target.
/// @throws IOError if either file cannot be read or written.
/// @throws CodecError for malformed or truncated gzip data.
StreamStats decompressStream(const std::filesystem::path& source,
                             const std::filesystem::path& target,
                             std::size_t bufferSize = kDefaultStreamBufferSize);

}  // namespace gzc::io

#endif  // GZC_IO_GZIP_STREAM_H
