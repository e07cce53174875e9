// =============================================================================
// linkx - Info Command
// =============================================================================
// Command handler for listing the index records of a link container.
//
// Prints every record's offset, sizes, method byte, reserved method bits and
// both opaque tags. With a data file, also reports whether each record's
// byte range fits inside it.
// =============================================================================

#ifndef LINKX_COMMANDS_INFO_COMMAND_H
#define LINKX_COMMANDS_INFO_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>

#include "linkx/common/error.h"
#include "linkx/common/types.h"
#include "linkx/format/index_reader.h"

namespace linkx::commands {

// =============================================================================
// Info Options
// =============================================================================

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Index file path.
    std::filesystem::path indexPath = kDefaultIndexFile;

    /// @brief Optional data file used for range checks.
    std::optional<std::filesystem::path> dataPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;
};

// =============================================================================
// InfoCommand Class
// =============================================================================

/// @brief Command handler for displaying index information.
class InfoCommand {
public:
    explicit InfoCommand(InfoOptions options, std::ostream& out);

    ~InfoCommand();

    InfoCommand(const InfoCommand&) = delete;
    InfoCommand& operator=(const InfoCommand&) = delete;

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    void printTextInfo(const format::IndexReadResult& index,
                       std::optional<std::uint64_t> dataSize);

    void printJsonInfo(const format::IndexReadResult& index,
                       std::optional<std::uint64_t> dataSize);

    InfoOptions options_;
    std::ostream& out_;
};

}  // namespace linkx::commands

#endif  // LINKX_COMMANDS_INFO_COMMAND_H
