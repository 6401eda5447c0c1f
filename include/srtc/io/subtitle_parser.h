// =============================================================================
// srtchunk - Subtitle Parser
// =============================================================================
// Validation -> parse -> chunk pipeline for a single subtitle file.
//
// This module provides:
// - SubtitleParser: Validates, reads, decodes, parses and chunks a file
// - parseSrt(): Convenience entry point with default collaborators
// - ParseSummary: Chunk layout statistics for logging and the CLI
//
// Error contract:
// - ValidationError: raised before any content is read
// - ParsingError: raised after validation passed (file vanished, read
//   failure, grammar failure); carries the path and the underlying cause
// No other exception type leaves parse()/parseBlocks().
//
// Usage:
//   auto chunks = srtc::io::parseSrt("/path/to/movie.srt", 50);
//   for (auto& chunk : chunks) {
//       for (auto& block : chunk) {
//           block.setTranslatedContent(translate(block.content()));
//       }
//   }
// =============================================================================

#ifndef SRTC_IO_SUBTITLE_PARSER_H
#define SRTC_IO_SUBTITLE_PARSER_H

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "srtc/common/error.h"
#include "srtc/common/types.h"
#include "srtc/io/file_system.h"
#include "srtc/io/file_validator.h"
#include "srtc/io/srt_grammar.h"

namespace srtc::io {

// =============================================================================
// Parse Summary
// =============================================================================

/// @brief Layout statistics of a chunked parse result.
struct ParseSummary {
    std::size_t chunkCount = 0;
    std::size_t blockCount = 0;

    /// @brief Block count of each chunk, in order.
    std::vector<std::size_t> chunkSizes;

    /// @brief Earliest start over all blocks (zero when empty).
    Timestamp firstStart{0};

    /// @brief Latest end over all blocks (zero when empty).
    Timestamp lastEnd{0};

    /// @brief Blocks whose declared end precedes their start.
    std::size_t invertedBlocks = 0;
};

/// @brief Summarize a chunk sequence.
[[nodiscard]] ParseSummary summarize(const std::vector<Chunk>& chunks);

// =============================================================================
// SubtitleParser Class
// =============================================================================

/// @brief Ingests one subtitle file into chunks of SubtitleBlocks.
///
/// Thread Safety:
/// - Holds no per-call state; concurrent parse() calls on one instance are
///   safe as long as the collaborators are
class SubtitleParser {
public:
    /// @brief Construct with the local filesystem and the SubRip grammar.
    explicit SubtitleParser(ValidatorOptions options = {});

    /// @brief Construct with explicit collaborators.
    /// @note Both collaborators must outlive the parser.
    SubtitleParser(const FileSystem& fileSystem, const SubtitleGrammar& grammar,
                   ValidatorOptions options = {});

    /// @brief Validate, parse and chunk a file.
    /// @param path Subtitle file path.
    /// @param chunkMaxBlocks Maximum blocks per chunk, must be positive.
    /// @return Chunks in file order; empty if the file holds no entries.
    /// @throws ValidationError if chunkMaxBlocks <= 0 or the file fails validation.
    /// @throws ParsingError if the file cannot be read or parsed.
    [[nodiscard]] std::vector<Chunk> parse(const std::filesystem::path& path,
                                           int chunkMaxBlocks) const;

    /// @brief Validate and parse a file without chunking.
    /// @throws ValidationError, ParsingError as for parse().
    [[nodiscard]] std::vector<SubtitleBlock> parseBlocks(const std::filesystem::path& path) const;

    /// @brief Non-throwing form of parse().
    /// @return Chunks, or an Error with kValidationError or kParsingError.
    [[nodiscard]] Result<std::vector<Chunk>> tryParse(const std::filesystem::path& path,
                                                      int chunkMaxBlocks) const;

    [[nodiscard]] const FileValidator& validator() const noexcept { return validator_; }

private:
    /// @brief Read and decode the file, wrapping failures as ParsingError.
    [[nodiscard]] std::string readText(const std::filesystem::path& path) const;

    /// @brief Run the grammar, wrapping failures as ParsingError.
    [[nodiscard]] std::vector<SubtitleRecord> parseRecords(const std::filesystem::path& path,
                                                           std::string_view text) const;

    const FileSystem* fileSystem_;
    const SubtitleGrammar* grammar_;
    FileValidator validator_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Map grammar records 1:1 into blocks with no translation set.
[[nodiscard]] std::vector<SubtitleBlock> toBlocks(std::vector<SubtitleRecord> records);

/// @brief Parse a subtitle file with default collaborators and limits.
/// @throws ValidationError, ParsingError as for SubtitleParser::parse().
[[nodiscard]] std::vector<Chunk> parseSrt(const std::filesystem::path& path, int chunkMaxBlocks);

}  // namespace srtc::io

#endif  // SRTC_IO_SUBTITLE_PARSER_H
