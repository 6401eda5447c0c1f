// =============================================================================
// srtchunk - Common Type Definitions
// =============================================================================
// Core type definitions for the subtitle ingestion library.
//
// This module defines:
// - SubtitleBlock: One timed text entry (index, start, end, content) plus the
//   translation slot filled in by the downstream translation stage
// - Chunk: A contiguous, order-preserving group of SubtitleBlocks
// - Timestamp, BlockIndex: Type aliases
// - Ingestion limits and defaults
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef SRTC_COMMON_TYPES_H
#define SRTC_COMMON_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace srtc {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Offset from the start of the subtitle file.
using Timestamp = std::chrono::milliseconds;

/// @brief Declared ordinal of a subtitle block (1-based, as written in the file).
using BlockIndex = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Accepted subtitle file extension (compared case-insensitively).
inline constexpr std::string_view kSubtitleExtension = ".srt";

/// @brief Maximum accepted subtitle file size in MiB.
inline constexpr std::uintmax_t kMaxFileSizeMB = 2;

/// @brief Maximum accepted subtitle file size in bytes.
inline constexpr std::uintmax_t kMaxFileSizeBytes = kMaxFileSizeMB * 1024 * 1024;

/// @brief Default number of blocks per chunk used by the CLI.
inline constexpr int kDefaultChunkMaxBlocks = 50;

// =============================================================================
// SubtitleBlock
// =============================================================================

/// @brief One timed text entry of a subtitle file.
///
/// index, start, end and content are fixed at construction. The translated
/// content slot starts out empty and belongs to the downstream translation
/// stage; std::nullopt means "not yet translated", which stays distinct from
/// a translation to the empty string.
class SubtitleBlock {
public:
    SubtitleBlock(BlockIndex index, Timestamp start, Timestamp end, std::string content)
        : index_(index), start_(start), end_(end), content_(std::move(content)) {}

    [[nodiscard]] BlockIndex index() const noexcept { return index_; }

    [[nodiscard]] Timestamp start() const noexcept { return start_; }

    [[nodiscard]] Timestamp end() const noexcept { return end_; }

    /// @brief Display duration. Negative if the source declared end < start.
    [[nodiscard]] Timestamp duration() const noexcept { return end_ - start_; }

    /// @brief Text payload, lines separated by '\n'.
    [[nodiscard]] const std::string& content() const noexcept { return content_; }

    [[nodiscard]] const std::optional<std::string>& translatedContent() const noexcept {
        return translatedContent_;
    }

    [[nodiscard]] bool isTranslated() const noexcept { return translatedContent_.has_value(); }

    void setTranslatedContent(std::string text) { translatedContent_ = std::move(text); }

    void clearTranslatedContent() noexcept { translatedContent_.reset(); }

    friend bool operator==(const SubtitleBlock&, const SubtitleBlock&) = default;

private:
    BlockIndex index_;
    Timestamp start_;
    Timestamp end_;
    std::string content_;
    std::optional<std::string> translatedContent_;
};

// =============================================================================
// Chunk
// =============================================================================

/// @brief Contiguous group of blocks handed to the translator as one batch.
using Chunk = std::vector<SubtitleBlock>;

}  // namespace srtc

#endif  // SRTC_COMMON_TYPES_H
