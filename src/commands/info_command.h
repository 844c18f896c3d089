// =============================================================================
// gzchunk - Info Command
// =============================================================================
// Command handler for displaying the frame layout of a chunked file.
//
// This module provides:
// - InfoCommand: frame count, payload totals and framing integrity
// - Support for JSON output format
// - Per-frame offset/length table
// =============================================================================

#ifndef GZC_COMMANDS_INFO_COMMAND_H
#define GZC_COMMANDS_INFO_COMMAND_H

#include <filesystem>

#include "gzc/format/frame_scanner.h"

namespace gzc::commands {

// =============================================================================
// Info Options
// =============================================================================

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Chunked file to inspect.
    std::filesystem::path inputPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief List every frame.
    bool detailed = false;
};

// =============================================================================
// InfoCommand Class
// =============================================================================

/// @brief Command handler for displaying chunked file information.
class InfoCommand {
public:
    /// @brief Construct with options.
    explicit InfoCommand(InfoOptions options);

    /// @brief Execute the info command.
    /// @return Exit code (0 = well-formed file, kCodecError if framing is broken).
    [[nodiscard]] int execute();

private:
    void printText(const format::FrameSummary& summary) const;

    void printJson(const format::FrameSummary& summary) const;

    InfoOptions options_;
};

}  // namespace gzc::commands

#endif  // GZC_COMMANDS_INFO_COMMAND_H
