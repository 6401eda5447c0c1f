// =============================================================================
// srtchunk - Validate Command Implementation
// =============================================================================

#include "validate_command.h"

#include "srtc/common/logger.h"
#include "srtc/io/file_validator.h"

namespace srtc::commands {

ValidateCommand::ValidateCommand(ValidateOptions options, std::ostream& out)
    : options_(std::move(options)), out_(&out) {}

int ValidateCommand::execute() {
    try {
        const auto size = io::validateSubtitleFile(options_.inputPath);
        *out_ << "OK " << options_.inputPath.string() << " (" << size << " bytes)" << std::endl;
        return 0;
    } catch (const SRTCException& e) {
        SRTC_LOG_ERROR("Validation failed: {}", e.what());
        *out_ << "INVALID " << options_.inputPath.string() << ": " << e.message() << std::endl;
        return e.exitCode();
    }
}

}  // namespace srtc::commands
