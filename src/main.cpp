// =============================================================================
// linkx - Link Container Block Extractor
// =============================================================================
// Main entry point for the linkx command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: extract, info
// - Global options: threads, verbose, quiet, log file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

#include "linkx/common/error.h"
#include "linkx/common/logger.h"
#include "linkx/common/types.h"

#include "commands/extract_command.h"
#include "commands/info_command.h"

namespace linkx::commands {
int runExtract(CLI::App* app);
int runInfo(CLI::App* app);
}  // namespace linkx::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "linkx: extract blocks from a LinkInfo/LinkData container\n"
    "Reads the index file, decodes deflate blocks and writes one file per block.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int threads = 1;  // 0 = auto-detect
    int verbosity = 0;
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Extract Command Options
// =============================================================================

struct CliExtractOptions {
    std::string indexFile = linkx::kDefaultIndexFile;
    std::string dataFile = linkx::kDefaultDataFile;
    std::string outputPath = linkx::kDefaultOutputPath;
    std::string extension = linkx::kDefaultOutputExtension;
    bool checkSizes = false;
};

CliExtractOptions gExtractOpts;

// =============================================================================
// Info Command Options
// =============================================================================

struct CliInfoOptions {
    std::string indexFile = linkx::kDefaultIndexFile;
    std::string dataFile;
    bool json = false;
};

CliInfoOptions gInfoOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupExtractCommand(CLI::App& app) {
    auto* extract = app.add_subcommand("extract", "Extract every block to an output directory");
    extract->alias("x");

    extract->add_option("-i,--idx-file", gExtractOpts.indexFile, "Path to index file")
        ->default_val(linkx::kDefaultIndexFile);

    extract->add_option("-d,--data-file", gExtractOpts.dataFile, "Path to data file")
        ->default_val(linkx::kDefaultDataFile);

    extract->add_option("-o,--output-path", gExtractOpts.outputPath, "Output directory")
        ->default_val(linkx::kDefaultOutputPath);

    extract->add_option("--extension", gExtractOpts.extension, "Suffix of extracted block files")
        ->default_val(linkx::kDefaultOutputExtension);

    extract->add_flag("--check-sizes", gExtractOpts.checkSizes,
                      "Warn when a decoded block differs from its recorded uncompressed size");
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "List index records");
    info->alias("i");

    info->add_option("-i,--idx-file", gInfoOpts.indexFile, "Path to index file")
        ->default_val(linkx::kDefaultIndexFile);

    info->add_option("-d,--data-file", gInfoOpts.dataFile,
                     "Data file to check record ranges against");

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_option("-t,--threads", gOptions.threads,
                   "Number of worker threads (1 = sequential, 0 = auto-detect)")
        ->default_val(1)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Only report errors");

    app.add_option("--log-file", gOptions.logFile, "Also write the log to this file");

    setupExtractCommand(app);
    setupInfoCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        linkx::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = linkx::log::levelForVerbosity(gOptions.verbosity, gOptions.quiet);
        linkx::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("extract")) {
            exitCode = linkx::commands::runExtract(app.get_subcommand("extract"));
        } else if (app.got_subcommand("info")) {
            exitCode = linkx::commands::runInfo(app.get_subcommand("info"));
        }
    } catch (const linkx::LinkxException& ex) {
        LINKX_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        LINKX_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    linkx::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace linkx::commands {

int runExtract([[maybe_unused]] CLI::App* app) {
    ExtractCommandOptions opts;
    opts.indexPath = gExtractOpts.indexFile;
    opts.dataPath = gExtractOpts.dataFile;
    opts.outputPath = gExtractOpts.outputPath;
    opts.extension = gExtractOpts.extension;
    opts.threads = gOptions.threads;
    opts.checkUncompressedSize = gExtractOpts.checkSizes;
    opts.showSummary = !gOptions.quiet;

    ExtractCommand cmd(std::move(opts));
    return cmd.execute();
}

int runInfo([[maybe_unused]] CLI::App* app) {
    InfoOptions opts;
    opts.indexPath = gInfoOpts.indexFile;
    if (!gInfoOpts.dataFile.empty()) {
        opts.dataPath = gInfoOpts.dataFile;
    }
    opts.jsonOutput = gInfoOpts.json;

    InfoCommand cmd(std::move(opts), std::cout);
    return cmd.execute();
}

}  // namespace linkx::commands
