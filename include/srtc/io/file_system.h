// =============================================================================
// srtchunk - Filesystem Access
// =============================================================================
// Narrow filesystem interface used by the ingestion pipeline.
//
// The pipeline touches the filesystem exactly twice: one metadata query
// during validation and one full read during parsing. Both go through
// FileSystem so that tests can count and fake them.
//
// Thread Safety:
// - LocalFileSystem holds no state and may be shared between threads
// =============================================================================

#ifndef SRTC_IO_FILE_SYSTEM_H
#define SRTC_IO_FILE_SYSTEM_H

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>

#include "srtc/common/error.h"

namespace srtc::io {

// =============================================================================
// File Status
// =============================================================================

/// @brief Result of a metadata query.
struct FileStatus {
    /// @brief Whether the path names a regular file.
    bool isRegular = false;

    /// @brief Size in bytes (0 for non-regular files).
    std::uintmax_t size = 0;
};

// =============================================================================
// FileSystem Interface
// =============================================================================

/// @brief Filesystem operations needed by validation and parsing.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    /// @brief Query metadata without reading content.
    /// @return File status, or the system error that made the query fail.
    [[nodiscard]] virtual std::expected<FileStatus, std::error_code> status(
        const std::filesystem::path& path) const = 0;

    /// @brief Read the whole file as raw bytes.
    /// @throws IOError with kFileNotFound if the file no longer exists.
    /// @throws IOError on any other read failure.
    [[nodiscard]] virtual std::string readAll(const std::filesystem::path& path) const = 0;
};

// =============================================================================
// LocalFileSystem
// =============================================================================

/// @brief FileSystem backed by std::filesystem and std::ifstream.
class LocalFileSystem final : public FileSystem {
public:
    [[nodiscard]] std::expected<FileStatus, std::error_code> status(
        const std::filesystem::path& path) const override;

    [[nodiscard]] std::string readAll(const std::filesystem::path& path) const override;
};

/// @brief Process-wide LocalFileSystem instance.
[[nodiscard]] const FileSystem& localFileSystem() noexcept;

}  // namespace srtc::io

#endif  // SRTC_IO_FILE_SYSTEM_H
