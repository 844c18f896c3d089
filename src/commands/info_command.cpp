// =============================================================================
// gzchunk - Info Command Implementation
// =============================================================================

#include "commands/info_command.h"

#include <iostream>
#include <string>

#include <fmt/format.h>

#include "gzc/common/error.h"
#include "gzc/common/logger.h"

namespace gzc::commands {

namespace {

std::string escapeJson(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

}  // namespace

InfoCommand::InfoCommand(InfoOptions options)
    : options_(std::move(options)) {}

int InfoCommand::execute() {
    auto summary = format::scanFrames(options_.inputPath);
    if (!summary) {
        GZC_LOG_ERROR("Info command failed: {}", summary.error().message());
        std::cerr << fmt::format("Error occurred: {}\n", summary.error().message());
        return summary.error().exitCode();
    }

    if (options_.jsonOutput) {
        printJson(*summary);
    } else {
        printText(*summary);
    }

    return summary->complete() ? toExitCode(ErrorCode::kSuccess)
                               : toExitCode(ErrorCode::kCodecError);
}

void InfoCommand::printText(const format::FrameSummary& summary) const {
    std::cout << "=== Chunked File Information ===" << std::endl;
    std::cout << std::endl;
    std::cout << "File:           " << options_.inputPath.string() << std::endl;
    std::cout << "Size:           " << summary.fileSize << " bytes" << std::endl;
    std::cout << "Frames:         " << summary.frameCount() << std::endl;
    std::cout << "Payload bytes:  " << summary.payloadBytes << std::endl;
    std::cout << "Framing:        " << (summary.complete() ? "Valid" : "BROKEN") << std::endl;

    if (summary.problem) {
        std::cout << std::endl;
        std::cout << "WARNING: " << *summary.problem << std::endl;
    }

    if (options_.detailed && !summary.frames.empty()) {
        std::cout << std::endl;
        std::cout << "--- Frames ---" << std::endl;
        std::cout << fmt::format("{:>8}  {:>14}  {:>12}\n", "index", "offset", "length");
        for (const auto& frame : summary.frames) {
            std::cout << fmt::format("{:>8}  {:>14}  {:>12}\n", frame.index, frame.offset,
                                     frame.payloadLength);
        }
    }

    std::cout << std::endl;
    std::cout << "================================" << std::endl;
}

void InfoCommand::printJson(const format::FrameSummary& summary) const {
    std::cout << "{" << std::endl;
    std::cout << "  \"file\": \"" << escapeJson(options_.inputPath.string()) << "\","
              << std::endl;
    std::cout << "  \"size\": " << summary.fileSize << "," << std::endl;
    std::cout << "  \"frames\": " << summary.frameCount() << "," << std::endl;
    std::cout << "  \"payload_bytes\": " << summary.payloadBytes << "," << std::endl;
    std::cout << "  \"complete\": " << (summary.complete() ? "true" : "false");
    if (summary.problem) {
        std::cout << "," << std::endl;
        std::cout << "  \"problem\": \"" << escapeJson(*summary.problem) << "\"";
    }
    if (options_.detailed) {
        std::cout << "," << std::endl;
        std::cout << "  \"frame_table\": [";
        for (std::size_t i = 0; i < summary.frames.size(); ++i) {
            const auto& frame = summary.frames[i];
            std::cout << (i == 0 ? "\n" : ",\n")
                      << fmt::format("    {{\"index\": {}, \"offset\": {}, \"length\": {}}}",
                                     frame.index, frame.offset, frame.payloadLength);
        }
        std::cout << (summary.frames.empty() ? "]" : "\n  ]");
    }
    std::cout << std::endl << "}" << std::endl;
}

}  // namespace gzc::commands
