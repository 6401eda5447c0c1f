// =============================================================================
// srtchunk - Validate Command
// =============================================================================
// Command handler that runs only the validation stage on one file.
// =============================================================================

#ifndef SRTC_COMMANDS_VALIDATE_COMMAND_H
#define SRTC_COMMANDS_VALIDATE_COMMAND_H

#include <filesystem>
#include <ostream>

#include "srtc/common/error.h"

namespace srtc::commands {

/// @brief Configuration options for the validate command.
struct ValidateOptions {
    /// @brief Input subtitle file path.
    std::filesystem::path inputPath;
};

/// @brief Command handler for the validate subcommand.
class ValidateCommand {
public:
    ValidateCommand(ValidateOptions options, std::ostream& out);

    /// @brief Execute the validate command.
    /// @return Exit code (0 = valid, 2 = validation error).
    [[nodiscard]] int execute();

private:
    ValidateOptions options_;
    std::ostream* out_;
};

}  // namespace srtc::commands

#endif  // SRTC_COMMANDS_VALIDATE_COMMAND_H
