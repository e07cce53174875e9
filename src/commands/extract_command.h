// =============================================================================
// linkx - Extract Command
// =============================================================================
// Command handler for extracting every block of a link container.
//
// This module provides:
// - ExtractCommand: reads the index, opens the data file, prepares the
//   output directory and runs the Extractor
// - ExtractCommandOptions: configuration mapped from the CLI
// =============================================================================

#ifndef LINKX_COMMANDS_EXTRACT_COMMAND_H
#define LINKX_COMMANDS_EXTRACT_COMMAND_H

#include <filesystem>
#include <memory>
#include <string>

#include "linkx/common/error.h"
#include "linkx/common/types.h"
#include "linkx/pipeline/extractor.h"

namespace linkx::commands {

// =============================================================================
// Extract Options
// =============================================================================

/// @brief Configuration options for extraction.
struct ExtractCommandOptions {
    /// @brief Index file path.
    std::filesystem::path indexPath = kDefaultIndexFile;

    /// @brief Data file path.
    std::filesystem::path dataPath = kDefaultDataFile;

    /// @brief Output directory, created if absent.
    std::filesystem::path outputPath = kDefaultOutputPath;

    /// @brief Suffix of each block file.
    std::string extension = kDefaultOutputExtension;

    /// @brief Number of threads (1 = sequential, 0 = auto).
    int threads = 1;

    /// @brief Warn about decoded lengths that differ from the index.
    bool checkUncompressedSize = false;

    /// @brief Log a summary line when finished.
    bool showSummary = true;
};

// =============================================================================
// ExtractCommand Class
// =============================================================================

/// @brief Command handler for block extraction.
class ExtractCommand {
public:
    explicit ExtractCommand(ExtractCommandOptions options);

    ~ExtractCommand();

    // Non-copyable, movable
    ExtractCommand(const ExtractCommand&) = delete;
    ExtractCommand& operator=(const ExtractCommand&) = delete;
    ExtractCommand(ExtractCommand&&) noexcept;
    ExtractCommand& operator=(ExtractCommand&&) noexcept;

    /// @brief Run the extraction.
    /// @return Exit code (0 = success, even if some blocks were skipped).
    [[nodiscard]] int execute();

    /// @brief Statistics of the last run.
    [[nodiscard]] const pipeline::ExtractionStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const ExtractCommandOptions& options() const noexcept { return options_; }

private:
    /// @brief Log the end-of-run summary.
    void printSummary() const;

    ExtractCommandOptions options_;
    pipeline::ExtractionStats stats_;
};

}  // namespace linkx::commands

#endif  // LINKX_COMMANDS_EXTRACT_COMMAND_H
