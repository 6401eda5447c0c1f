// =============================================================================
// srtchunk - Filesystem Access Implementation
// =============================================================================

#include "srtc/io/file_system.h"

#include <cerrno>
#include <fstream>
#include <iterator>

#include "srtc/common/logger.h"

namespace srtc::io {

// =============================================================================
// LocalFileSystem Implementation
// =============================================================================

std::expected<FileStatus, std::error_code> LocalFileSystem::status(
    const std::filesystem::path& path) const {
    std::error_code ec;
    auto st = std::filesystem::status(path, ec);
    if (ec) {
        return std::unexpected(ec);
    }
    if (!std::filesystem::exists(st)) {
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }

    FileStatus result;
    result.isRegular = std::filesystem::is_regular_file(st);
    if (result.isRegular) {
        result.size = std::filesystem::file_size(path, ec);
        if (ec) {
            return std::unexpected(ec);
        }
    }
    return result;
}

std::string LocalFileSystem::readAll(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec(errno, std::generic_category());
        if (!std::filesystem::exists(path)) {
            throw IOError(ErrorCode::kFileNotFound, "File not found: " + path.string());
        }
        throw IOError("Failed to open file: " + path.string(), ec);
    }

    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        throw IOError("Failed to read file: " + path.string(),
                      std::make_error_code(std::errc::io_error));
    }

    SRTC_LOG_DEBUG("Read {} bytes from {}", content.size(), path.string());
    return content;
}

const FileSystem& localFileSystem() noexcept {
    static const LocalFileSystem instance;
    return instance;
}

}  // namespace srtc::io
