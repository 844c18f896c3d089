// =============================================================================
// gzchunk - Chunked File Scanner Implementation
// =============================================================================

#include "gzc/format/frame_scanner.h"

#include <fstream>
#include <system_error>

#include <fmt/format.h>

#include "gzc/format/frame_header.h"

namespace gzc::format {

Result<FrameSummary> scanFrames(const std::filesystem::path& path) {
    std::error_code ec;
    auto fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return makeError<FrameSummary>(ErrorCode::kFileNotFound,
                                           fmt::format("File not found: {}", path.string()));
        }
        return makeError<FrameSummary>(
            ErrorCode::kIOError, fmt::format("Cannot stat {}: {}", path.string(), ec.message()));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return makeError<FrameSummary>(ErrorCode::kIOError,
                                       fmt::format("Failed to open {}", path.string()));
    }

    FrameSummary summary;
    summary.fileSize = fileSize;

    std::uint64_t offset = 0;
    while (offset < fileSize) {
        const std::uint64_t remaining = fileSize - offset;
        if (remaining < kFrameHeaderSize) {
            summary.problem = fmt::format("truncated frame header at offset {} ({} of {} bytes)",
                                          offset, remaining, kFrameHeaderSize);
            break;
        }

        FrameHeaderBytes header{};
        in.seekg(static_cast<std::streamoff>(offset));
        in.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
        if (!in) {
            return makeError<FrameSummary>(
                ErrorCode::kIOError,
                fmt::format("Failed to read {} at offset {}", path.string(), offset));
        }

        auto length = decodeFrameLength(header);
        if (!length) {
            summary.problem = fmt::format("{} at offset {}", length.error().message(), offset);
            break;
        }

        if (*length == 0) {
            summary.problem = fmt::format("frame at offset {} declares an empty payload", offset);
            break;
        }

        const std::uint64_t payloadStart = offset + kFrameHeaderSize;
        if (*length > fileSize - payloadStart) {
            summary.problem = fmt::format("frame at offset {} declares {} bytes, {} remain",
                                          offset, *length, fileSize - payloadStart);
            break;
        }

        summary.frames.push_back(FrameInfo{summary.frames.size(), offset, *length});
        summary.payloadBytes += *length;
        offset = payloadStart + *length;
    }

    return summary;
}

}  // namespace gzc::format
