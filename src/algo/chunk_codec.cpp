// =============================================================================
// gzchunk - Chunk Codec Implementation
// =============================================================================

#include "gzc/algo/chunk_codec.h"

#include <limits>

#include <fmt/format.h>

#include "zlib_stream.h"

namespace gzc::algo {

namespace {

/// @brief gzip header (10) plus trailer (8) minus the zlib wrapper (6)
///        that compressBound() already accounts for.
constexpr std::size_t kGzipWrapperOverhead = 18;

}  // namespace

std::vector<std::uint8_t> compressChunk(std::span<const std::uint8_t> input,
                                        CompressionLevel level) {
    if (!isValidCompressionLevel(level)) {
        throw ArgumentError(fmt::format("compression level must be {}-{}, got {}",
                                        kMinCompressionLevel, kMaxCompressionLevel, level));
    }
    if (input.size() > std::numeric_limits<uInt>::max()) {
        throw CodecError(fmt::format("chunk of {} bytes is too large to compress", input.size()));
    }

    detail::DeflateStream stream(level);
    z_stream& zs = stream.get();

    std::vector<std::uint8_t> output(deflateBound(&zs, static_cast<uLong>(input.size())));

    zs.next_in = const_cast<Bytef*>(input.data());
    zs.avail_in = static_cast<uInt>(input.size());
    zs.next_out = output.data();
    zs.avail_out = static_cast<uInt>(output.size());

    int ret = deflate(&zs, Z_FINISH);
    if (ret != Z_STREAM_END) {
        throw CodecError(fmt::format("deflate failed: {}", detail::zlibMessage(zs, ret)));
    }

    output.resize(zs.total_out);
    return output;
}

std::vector<std::uint8_t> decompressChunk(std::span<const std::uint8_t> input,
                                          std::size_t maxSize) {
    if (input.empty()) {
        throw CodecError("compressed chunk is empty");
    }
    if (input.size() > std::numeric_limits<uInt>::max() ||
        maxSize > std::numeric_limits<uInt>::max()) {
        throw CodecError(fmt::format("chunk of {} bytes is too large to decompress", input.size()));
    }

    detail::InflateStream stream;
    z_stream& zs = stream.get();

    std::vector<std::uint8_t> output(maxSize);

    zs.next_in = const_cast<Bytef*>(input.data());
    zs.avail_in = static_cast<uInt>(input.size());
    zs.next_out = output.data();
    zs.avail_out = static_cast<uInt>(output.size());

    int ret = inflate(&zs, Z_FINISH);
    switch (ret) {
        case Z_STREAM_END:
            break;
        case Z_BUF_ERROR:
            if (zs.avail_out == 0) {
                throw CodecError(
                    fmt::format("decompressed chunk exceeds block size of {} bytes", maxSize));
            }
            throw CodecError("compressed chunk is truncated");
        case Z_NEED_DICT:
        case Z_DATA_ERROR:
        case Z_MEM_ERROR:
        default:
            throw CodecError(fmt::format("inflate failed: {}", detail::zlibMessage(zs, ret)));
    }

    if (zs.avail_in != 0) {
        throw CodecError(
            fmt::format("{} trailing bytes after gzip member in chunk", zs.avail_in));
    }

    output.resize(zs.total_out);
    return output;
}

std::size_t maxCompressedChunkSize(std::size_t rawSize) noexcept {
    return static_cast<std::size_t>(compressBound(static_cast<uLong>(rawSize))) +
           kGzipWrapperOverhead;
}

}  // namespace gzc::algo
