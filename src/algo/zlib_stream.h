// =============================================================================
// gzchunk - zlib Stream Handles (internal)
// =============================================================================
// RAII owners for zlib deflate/inflate state configured for the gzip
// wrapper. Shared by the chunk codec and the direct-stream codec.
// =============================================================================

#ifndef GZC_ALGO_ZLIB_STREAM_H
#define GZC_ALGO_ZLIB_STREAM_H

#include <string>

#include <zlib.h>

#include <fmt/format.h>

#include "gzc/common/error.h"
#include "gzc/common/types.h"

namespace gzc::algo::detail {

/// @brief windowBits value selecting the gzip wrapper (15 + 16).
inline constexpr int kGzipWindowBits = MAX_WBITS + 16;

/// @brief Default zlib memLevel.
inline constexpr int kMemLevel = 8;

/// @brief Describe a zlib return code, preferring the stream's own message.
inline std::string zlibMessage(const z_stream& zs, int ret) {
    if (zs.msg != nullptr) {
        return fmt::format("{} ({})", zs.msg, ret);
    }
    return fmt::format("{} ({})", zError(ret), ret);
}

/// @brief Owns a z_stream initialised for gzip deflate.
class DeflateStream {
public:
    explicit DeflateStream(CompressionLevel level) {
        int ret = deflateInit2(&zs_, level, Z_DEFLATED, kGzipWindowBits, kMemLevel,
                               Z_DEFAULT_STRATEGY);
        if (ret != Z_OK) {
            throw CodecError(fmt::format("failed to initialize deflate: {}", zlibMessage(zs_, ret)));
        }
    }

    ~DeflateStream() { deflateEnd(&zs_); }

    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;
    DeflateStream(DeflateStream&&) = delete;
    DeflateStream& operator=(DeflateStream&&) = delete;

    [[nodiscard]] z_stream& get() noexcept { return zs_; }

private:
    z_stream zs_{};
};

/// @brief Owns a z_stream initialised for gzip inflate.
class InflateStream {
public:
    InflateStream() {
        int ret = inflateInit2(&zs_, kGzipWindowBits);
        if (ret != Z_OK) {
            throw CodecError(fmt::format("failed to initialize inflate: {}", zlibMessage(zs_, ret)));
        }
    }

    ~InflateStream() { inflateEnd(&zs_); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;
    InflateStream(InflateStream&&) = delete;
    InflateStream& operator=(InflateStream&&) = delete;

    [[nodiscard]] z_stream& get() noexcept { return zs_; }

private:
    z_stream zs_{};
};

}  // namespace gzc::algo::detail

#endif  // GZC_ALGO_ZLIB_STREAM_H
