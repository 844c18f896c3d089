// =============================================================================
// gzchunk - Direct gzip Stream Codec Implementation
// =============================================================================

#include "gzc/io/gzip_stream.h"

#include <fstream>
#include <vector>

#include <fmt/format.h>

#include "algo/zlib_stream.h"
#include "gzc/common/error.h"
#include "gzc/common/logger.h"

namespace gzc::io {

namespace {

std::ifstream openSource(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("failed to open source file", ErrorContext{path.string()});
    }
    return in;
}

std::ofstream openTarget(const std::filesystem::path& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IOError("failed to create target file", ErrorContext{path.string()});
    }
    return out;
}

/// @brief Read up to buffer.size() bytes, throwing on stream failure.
std::size_t readSome(std::ifstream& in, std::vector<std::uint8_t>& buffer,
                     const std::filesystem::path& path) {
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (in.bad()) {
        throw IOError("failed to read source file", ErrorContext{path.string()});
    }
    return static_cast<std::size_t>(in.gcount());
}

void writeAll(std::ofstream& out, const std::uint8_t* data, std::size_t size,
              const std::filesystem::path& path) {
    if (size == 0) {
        return;
    }
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!out) {
        throw IOError("failed to write target file", ErrorContext{path.string()});
    }
}

void finish(std::ofstream& out, const std::filesystem::path& path) {
    out.flush();
    if (!out) {
        throw IOError("failed to flush target file", ErrorContext{path.string()});
    }
}

}  // namespace

StreamStats compressStream(const std::filesystem::path& source,
                           const std::filesystem::path& target,
                           CompressionLevel level,
                           std::size_t bufferSize) {
    if (!isValidCompressionLevel(level)) {
        throw ArgumentError(fmt::format("compression level must be {}-{}, got {}",
                                        kMinCompressionLevel, kMaxCompressionLevel, level));
    }

    auto in = openSource(source);
    auto out = openTarget(target);

    algo::detail::DeflateStream stream(level);
    z_stream& zs = stream.get();

    std::vector<std::uint8_t> inBuffer(bufferSize);
    std::vector<std::uint8_t> outBuffer(bufferSize);
    StreamStats stats;

    int flush = Z_NO_FLUSH;
    do {
        std::size_t bytesRead = readSome(in, inBuffer, source);
        stats.inputBytes += bytesRead;
        flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;

        zs.next_in = inBuffer.data();
        zs.avail_in = static_cast<uInt>(bytesRead);

        do {
            zs.next_out = outBuffer.data();
            zs.avail_out = static_cast<uInt>(outBuffer.size());

            int ret = deflate(&zs, flush);
            if (ret == Z_STREAM_ERROR) {
                throw CodecError(fmt::format("deflate failed: {}",
                                             algo::detail::zlibMessage(zs, ret)));
            }

            std::size_t produced = outBuffer.size() - zs.avail_out;
            writeAll(out, outBuffer.data(), produced, target);
            stats.outputBytes += produced;
        } while (zs.avail_out == 0);
    } while (flush != Z_FINISH);

    finish(out, target);

    GZC_LOG_DEBUG("Stream compressed {} -> {} bytes", stats.inputBytes, stats.outputBytes);
    return stats;
}

StreamStats decompressStream(const std::filesystem::path& source,
                             const std::filesystem::path& target,
                             std::size_t bufferSize) {
    auto in = openSource(source);
    auto out = openTarget(target);

    algo::detail::InflateStream stream;
    z_stream& zs = stream.get();

    std::vector<std::uint8_t> inBuffer(bufferSize);
    std::vector<std::uint8_t> outBuffer(bufferSize);
    StreamStats stats;

    // True while a gzip member has started but its trailer was not yet seen.
    bool memberOpen = false;

    while (true) {
        std::size_t bytesRead = readSome(in, inBuffer, source);
        if (bytesRead == 0) {
            break;
        }
        stats.inputBytes += bytesRead;

        zs.next_in = inBuffer.data();
        zs.avail_in = static_cast<uInt>(bytesRead);

        do {
            zs.next_out = outBuffer.data();
            zs.avail_out = static_cast<uInt>(outBuffer.size());

            int ret = inflate(&zs, Z_NO_FLUSH);
            if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
                ret == Z_STREAM_ERROR) {
                throw CodecError(
                    fmt::format("inflate failed: {}", algo::detail::zlibMessage(zs, ret)),
                    ErrorContext{source.string()}.withOffset(stats.inputBytes - zs.avail_in));
            }

            std::size_t produced = outBuffer.size() - zs.avail_out;
            writeAll(out, outBuffer.data(), produced, target);
            stats.outputBytes += produced;

            if (ret == Z_BUF_ERROR) {
                break;
            }
            if (ret == Z_STREAM_END) {
                memberOpen = false;
                inflateReset(&zs);
            } else {
                memberOpen = true;
            }
        } while (zs.avail_in > 0 || zs.avail_out == 0);
    }

    if (memberOpen) {
        throw CodecError("gzip stream is truncated", ErrorContext{source.string()});
    }

    finish(out, target);

    GZC_LOG_DEBUG("Stream decompressed {} -> {} bytes", stats.inputBytes, stats.outputBytes);
    return stats;
}

}  // namespace gzc::io
