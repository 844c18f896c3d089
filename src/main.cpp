// =============================================================================
// gzchunk - Chunked Multithreaded gzip Compressor
// =============================================================================
// Main entry point for the gzchunk command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: compress, decompress, info
// - Global options: threads, level, verbosity, log file
// - "/?" as an alias of --help
//
// Exit codes are the gzc::ErrorCode values; an invalid invocation exits 1.
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include "gzc/common/error.h"
#include "gzc/common/logger.h"
#include "gzc/common/types.h"

// Command implementations
#include "commands/compress_command.h"
#include "commands/decompress_command.h"
#include "commands/info_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "1.0.0";
constexpr const char* kDescription =
    "gzchunk: multithreaded chunked gzip compressor\n"
    "Usage: gzchunk <compress|decompress> <sourcePath> <targetPath>\n"
    "       gzchunk info <sourcePath>\n\n"
    "With more than one thread the output is a sequence of length-framed gzip\n"
    "chunks that only gzchunk can read back. With --threads 1 the output is a\n"
    "plain gzip stream. Decompress with the same thread setting.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::size_t threads = 0;   // 0 = auto-detect, 1 = direct stream
    int level = gzc::kDefaultCompressionLevel;
    int verbosity = 0;         // 0 = normal, 1+ = debug
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Command Options
// =============================================================================

struct CliTransferOptions {
    std::string source;
    std::string target;
};

CliTransferOptions gCompressOpts;
CliTransferOptions gDecompressOpts;

struct CliInfoOptions {
    std::string source;
    bool json = false;
    bool detailed = false;
};

CliInfoOptions gInfoOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupTransferCommand(CLI::App& app, const std::string& name, const std::string& help,
                          CliTransferOptions& opts) {
    auto* command = app.add_subcommand(name, help);
    command->fallthrough();

    // Paths are checked by the compressor so that each failure keeps its own exit code.
    command->add_option("source", opts.source, "Source file")->required();
    command->add_option("target", opts.target, "Target file")->required();
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Display the frame layout of a chunked file");
    info->fallthrough();

    info->add_option("source", gInfoOpts.source, "Chunked file")->required();
    info->add_flag("--json", gInfoOpts.json, "Output as JSON");
    info->add_flag("--detailed", gInfoOpts.detailed, "List every frame");
}

[[nodiscard]] bool helpRequested(int argc, char* argv[]) {
    return argc == 2 && std::string_view(argv[1]) == "/?";
}

[[nodiscard]] gzc::commands::TransferOptions makeTransferOptions(const CliTransferOptions& cli) {
    gzc::commands::TransferOptions opts;
    opts.inputPath = cli.source;
    opts.outputPath = cli.target;
    opts.compressionLevel = gOptions.level;
    opts.threads = gOptions.threads;
    opts.showProgress = !gOptions.quiet;
    opts.showSummary = gOptions.verbosity > 0 && !gOptions.quiet;
    return opts;
}

int dispatch(CLI::App& app) {
    try {
        if (app.got_subcommand("compress")) {
            gzc::commands::CompressCommand cmd(makeTransferOptions(gCompressOpts));
            return cmd.execute();
        }
        if (app.got_subcommand("decompress")) {
            gzc::commands::DecompressCommand cmd(makeTransferOptions(gDecompressOpts));
            return cmd.execute();
        }
        if (app.got_subcommand("info")) {
            gzc::commands::InfoOptions opts;
            opts.inputPath = gInfoOpts.source;
            opts.jsonOutput = gInfoOpts.json;
            opts.detailed = gInfoOpts.detailed;
            gzc::commands::InfoCommand cmd(std::move(opts));
            return cmd.execute();
        }
    } catch (const gzc::GZCException& ex) {
        GZC_LOG_ERROR("Error: {}", ex.what());
        std::cerr << "Error occurred: " << ex.what() << std::endl;
        return ex.exitCode();
    } catch (const std::exception& ex) {
        GZC_LOG_ERROR("Unexpected error: {}", ex.what());
        std::cerr << "Unexpected error: " << ex.what() << std::endl;
        return gzc::toExitCode(gzc::ErrorCode::kIOError);
    }

    return gzc::toExitCode(gzc::ErrorCode::kUsageError);
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription, "gzchunk"};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-t,--threads", gOptions.threads,
                   "Worker threads (0 = auto-detect, 1 = plain gzip stream)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_option("-l,--level", gOptions.level, "Compression level (1-9)")
        ->default_val(gzc::kDefaultCompressionLevel)
        ->check(CLI::Range(gzc::kMinCompressionLevel, gzc::kMaxCompressionLevel));

    app.add_flag("-v,--verbose", gOptions.verbosity, "Debug logging and a statistics summary");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write the log to this file");

    // Setup subcommands
    setupTransferCommand(app, "compress", "Compress a file", gCompressOpts);
    setupTransferCommand(app, "decompress", "Decompress a .gz file", gDecompressOpts);
    setupInfoCommand(app);

    app.require_subcommand(1);

    if (helpRequested(argc, argv)) {
        std::cout << app.help() << std::endl;
        return EXIT_SUCCESS;
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help and version requests exit 0, every other parse failure is a usage error.
        int code = app.exit(e);
        return code == 0 ? EXIT_SUCCESS : gzc::toExitCode(gzc::ErrorCode::kUsageError);
    }

    // Initialize logger
    try {
        gzc::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        if (gOptions.quiet) {
            logConfig.level = gzc::log::Level::kError;
        } else if (gOptions.verbosity >= 1) {
            logConfig.level = gzc::log::Level::kDebug;
        }
        gzc::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return gzc::toExitCode(gzc::ErrorCode::kIOError);
    }

    int exitCode = dispatch(app);
    gzc::log::shutdown();
    return exitCode;
}
