// =============================================================================
// srtchunk - Subtitle File Validator Implementation
// =============================================================================

#include "srtc/io/file_validator.h"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "srtc/common/logger.h"

namespace srtc::io {

namespace {

constexpr const char* kInvalidTypeMessage = "Invalid file type. Only .srt files are accepted.";

}  // namespace

// =============================================================================
// FileValidator Implementation
// =============================================================================

FileValidator::FileValidator(ValidatorOptions options)
    : FileValidator(localFileSystem(), std::move(options)) {}

FileValidator::FileValidator(const FileSystem& fileSystem, ValidatorOptions options)
    : fileSystem_(&fileSystem), options_(std::move(options)) {}

std::uintmax_t FileValidator::validate(const std::filesystem::path& path) const {
    if (path.empty() || !hasExtension(path, options_.extension)) {
        throw ValidationError(kInvalidTypeMessage, ErrorContext{path.string()});
    }

    std::expected<FileStatus, std::error_code> status;
    try {
        status = fileSystem_->status(path);
    } catch (const std::exception& e) {
        throw ValidationError(fmt::format("Could not access file: {}", e.what()),
                              ErrorContext{path.string()});
    }
    if (!status.has_value()) {
        throw ValidationError(fmt::format("Could not access file: {}", status.error().message()),
                              status.error(), ErrorContext{path.string()});
    }

    if (!status->isRegular) {
        throw ValidationError("Could not access file: not a regular file",
                              ErrorContext{path.string()});
    }

    if (status->size > options_.maxFileSize) {
        throw ValidationError(
            fmt::format("File size exceeds the limit of {}MB.", options_.maxFileSize / (1024 * 1024)),
            ErrorContext{path.string()});
    }

    if (status->size == 0) {
        throw ValidationError("File is empty.", ErrorContext{path.string()});
    }

    SRTC_LOG_DEBUG("Validated {} ({} bytes)", path.string(), status->size);
    return status->size;
}

Result<std::uintmax_t> FileValidator::check(const std::filesystem::path& path) const {
    try {
        return validate(path);
    } catch (const ValidationError& e) {
        return makeError<std::uintmax_t>(e);
    }
}

// =============================================================================
// Utility Functions
// =============================================================================

bool hasExtension(const std::filesystem::path& path, std::string_view extension) {
    const std::string name = path.string();
    if (extension.empty() || name.size() < extension.size()) {
        return false;
    }

    return std::equal(extension.begin(), extension.end(), name.end() - extension.size(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

std::uintmax_t validateSubtitleFile(const std::filesystem::path& path) {
    return FileValidator{}.validate(path);
}

}  // namespace srtc::io
