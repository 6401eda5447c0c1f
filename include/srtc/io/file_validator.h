// =============================================================================
// srtchunk - Subtitle File Validator
// =============================================================================
// Pre-parse checks on file identity and size.
//
// Checks run in this order and stop at the first failure:
//   1. path is non-empty and carries the subtitle extension (case-insensitive)
//   2. one metadata query succeeds and names a regular file
//   3. size <= maxFileSize
//   4. size > 0
//
// No content is read here. Oversized input is rejected before anything
// decodes it.
//
// Usage:
//   FileValidator validator;
//   auto size = validator.validate("/path/to/movie.srt");  // throws ValidationError
// =============================================================================

#ifndef SRTC_IO_FILE_VALIDATOR_H
#define SRTC_IO_FILE_VALIDATOR_H

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "srtc/common/error.h"
#include "srtc/common/types.h"
#include "srtc/io/file_system.h"

namespace srtc::io {

// =============================================================================
// Validator Options
// =============================================================================

/// @brief Limits applied by the validator.
struct ValidatorOptions {
    /// @brief Accepted extension including the dot.
    std::string extension{kSubtitleExtension};

    /// @brief Maximum accepted size in bytes.
    std::uintmax_t maxFileSize = kMaxFileSizeBytes;
};

// =============================================================================
// FileValidator Class
// =============================================================================

/// @brief Validates subtitle file paths before they are parsed.
class FileValidator {
public:
    /// @brief Construct a validator using the local filesystem.
    explicit FileValidator(ValidatorOptions options = {});

    /// @brief Construct a validator over a specific filesystem.
    /// @note The filesystem must outlive the validator.
    FileValidator(const FileSystem& fileSystem, ValidatorOptions options = {});

    /// @brief Validate a path.
    /// @return Size of the file in bytes.
    /// @throws ValidationError on any failed check.
    std::uintmax_t validate(const std::filesystem::path& path) const;

    /// @brief Validate a path without throwing.
    /// @return File size, or an Error with ErrorCode::kValidationError.
    [[nodiscard]] Result<std::uintmax_t> check(const std::filesystem::path& path) const;

    [[nodiscard]] const ValidatorOptions& options() const noexcept { return options_; }

private:
    const FileSystem* fileSystem_;
    ValidatorOptions options_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Case-insensitive check that the path ends with the extension.
/// @note Compares the path suffix, so a bare ".srt" file name is accepted.
[[nodiscard]] bool hasExtension(const std::filesystem::path& path, std::string_view extension);

/// @brief Validate a path with default limits against the local filesystem.
/// @throws ValidationError on any failed check.
std::uintmax_t validateSubtitleFile(const std::filesystem::path& path);

}  // namespace srtc::io

#endif  // SRTC_IO_FILE_VALIDATOR_H
