// =============================================================================
// srtchunk - Subtitle Ingestion Tool
// =============================================================================
// Main entry point for the srtc command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: validate, chunk
// - Global options: log level, log file, verbose, quiet
// - Environment fallbacks for configuration (SRTC_CHUNK_MAX_BLOCKS,
//   SRTC_LOG_LEVEL)
//
// Exit codes: 0 success, 1 usage error, 2 validation error, 3 parsing error.
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

#include "srtc/common/error.h"
#include "srtc/common/logger.h"
#include "srtc/common/types.h"

#include "commands/chunk_command.h"
#include "commands/validate_command.h"

namespace srtc::commands {
int runValidate(CLI::App* app);
int runChunk(CLI::App* app);
}  // namespace srtc::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "srtc: subtitle ingestion for batched translation\n"
    "Validates a SubRip (.srt) file, parses it into timed blocks and splits\n"
    "the blocks into fixed-size chunks.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string logLevel = "info";
    std::string logFile;
    int verbosity = 0;  // 0 = normal, 1+ = debug
    bool quiet = false;
};

GlobalOptions gOptions;

// =============================================================================
// Validate Command Options
// =============================================================================

struct CliValidateOptions {
    std::string input;
};

CliValidateOptions gValidateOpts;

// =============================================================================
// Chunk Command Options
// =============================================================================

struct CliChunkOptions {
    std::string input;
    int chunkMaxBlocks = srtc::kDefaultChunkMaxBlocks;
    bool json = false;
    bool showText = false;
};

CliChunkOptions gChunkOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupValidateCommand(CLI::App& app) {
    auto* validate = app.add_subcommand("validate", "Check a subtitle file without parsing it");
    validate->alias("v");

    // Existence is not checked here; the validator reports it with exit code 2
    validate->add_option("input", gValidateOpts.input, "Input .srt file")->required();
}

void setupChunkCommand(CLI::App& app) {
    auto* chunk = app.add_subcommand("chunk", "Parse a subtitle file and print its chunk layout");
    chunk->alias("c");

    chunk->add_option("input", gChunkOpts.input, "Input .srt file")->required();

    chunk->add_option("-n,--chunk-max-blocks", gChunkOpts.chunkMaxBlocks,
                      "Maximum subtitle blocks per chunk")
        ->default_val(srtc::kDefaultChunkMaxBlocks)
        ->envname("SRTC_CHUNK_MAX_BLOCKS");

    chunk->add_flag("--json", gChunkOpts.json, "Output as JSON");

    chunk->add_flag("--show-text", gChunkOpts.showText, "Include block text in the output");
}

[[nodiscard]] srtc::log::Level effectiveLogLevel() {
    if (gOptions.quiet) {
        return srtc::log::Level::kError;
    }
    if (gOptions.verbosity >= 1) {
        return srtc::log::Level::kDebug;
    }
    return srtc::log::levelFromString(gOptions.logLevel);
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_option("--log-level", gOptions.logLevel, "Log level")
        ->default_val("info")
        ->envname("SRTC_LOG_LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "error", "critical"},
                              CLI::ignore_case));

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    app.add_flag("-v,--verbose", gOptions.verbosity, "Enable debug logging");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    setupValidateCommand(app);
    setupChunkCommand(app);

    app.require_subcommand(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help and version requests exit 0; every other parse failure is a usage error
        const int rc = app.exit(e);
        return rc == 0 ? 0 : srtc::toExitCode(srtc::ErrorCode::kUsageError);
    }

    try {
        srtc::log::Config config;
        config.logFile = gOptions.logFile;
        config.level = effectiveLogLevel();
        // The console sink shares stdout with the JSON document
        config.enableConsole = !(app.got_subcommand("chunk") && gChunkOpts.json);
        srtc::log::init(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("validate")) {
            exitCode = srtc::commands::runValidate(app.get_subcommand("validate"));
        } else if (app.got_subcommand("chunk")) {
            exitCode = srtc::commands::runChunk(app.get_subcommand("chunk"));
        }
    } catch (const srtc::SRTCException& ex) {
        SRTC_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        SRTC_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    srtc::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace srtc::commands {

int runValidate([[maybe_unused]] CLI::App* app) {
    ValidateOptions opts;
    opts.inputPath = gValidateOpts.input;

    ValidateCommand cmd(std::move(opts), std::cout);
    return cmd.execute();
}

int runChunk([[maybe_unused]] CLI::App* app) {
    auto cmd = createChunkCommand(gChunkOpts.input, gChunkOpts.chunkMaxBlocks, gChunkOpts.json,
                                  gChunkOpts.showText);
    return cmd->execute();
}

}  // namespace srtc::commands
