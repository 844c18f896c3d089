// =============================================================================
// gzchunk - Chunked File Scanner
// =============================================================================
// Walks a chunked file header by header without inflating any payload.
// Used by the `info` command and to check frame order in tests.
//
// Usage:
//   auto summary = gzc::format::scanFrames("data.bin.gz");
//   if (summary && summary->complete()) {
//       for (const auto& frame : summary->frames) { ... }
//   }
// =============================================================================

#ifndef GZC_FORMAT_FRAME_SCANNER_H
#define GZC_FORMAT_FRAME_SCANNER_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "gzc/common/error.h"

namespace gzc::format {

/// @brief Location of one frame in a chunked file.
struct FrameInfo {
    /// @brief Position of the frame in the file (0-based).
    std::uint64_t index = 0;

    /// @brief Byte offset of the frame header.
    std::uint64_t offset = 0;

    /// @brief Payload length declared by the header.
    std::uint32_t payloadLength = 0;
};

/// @brief Result of scanning a chunked file.
struct FrameSummary {
    /// @brief Every complete frame, in file order.
    std::vector<FrameInfo> frames;

    /// @brief Size of the scanned file.
    std::uint64_t fileSize = 0;

    /// @brief Sum of the payload lengths of all complete frames.
    std::uint64_t payloadBytes = 0;

    /// @brief Why scanning stopped before end of file, if it did.
    std::optional<std::string> problem;

    /// @brief Number of complete frames.
    [[nodiscard]] std::size_t frameCount() const noexcept { return frames.size(); }

    /// @brief True if the file is a whole number of well-formed frames.
    [[nodiscard]] bool complete() const noexcept { return !problem.has_value(); }
};

/// @brief Scan the frame layout of a chunked file.
/// @return Summary (malformed data is reported in FrameSummary::problem),
///         or an error if the file cannot be opened or read.
[[nodiscard]] Result<FrameSummary> scanFrames(const std::filesystem::path& path);

}  // namespace gzc::format

#endif  // GZC_FORMAT_FRAME_SCANNER_H
