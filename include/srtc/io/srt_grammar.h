// =============================================================================
// srtchunk - Subtitle Grammar
// =============================================================================
// Turns decoded subtitle text into timed records.
//
// This module provides:
// - SubtitleRecord: One (index, start, end, content) record
// - SubtitleGrammar: Capability interface consumed by the ingestion pipeline
// - SrtGrammar: Default SubRip implementation
// - Timestamp parsing and formatting helpers
//
// SubRip layout accepted by SrtGrammar:
//
//   1
//   00:00:01,000 --> 00:00:02,500 X1:40 X2:600
//   First line
//   Second line
//   <blank line>
//
// - Line endings may be LF, CRLF or CR
// - Blank lines before, between and after blocks are skipped
// - A block's text ends at an index line followed by a timing line, at a
//   digits-only line after a blank gap, or at end of input; other blank lines
//   stay in the text
// - Timestamp delimiters may be ',', '.' or ':'; the millisecond field may be
//   omitted and is read as an integer count of milliseconds
// - Anything after the end timestamp on the timing line is ignored
// - Start/end ordering is not checked
//
// Usage:
//   SrtGrammar grammar;
//   auto records = grammar.parse(text);  // throws GrammarError
// =============================================================================

#ifndef SRTC_IO_SRT_GRAMMAR_H
#define SRTC_IO_SRT_GRAMMAR_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "srtc/common/error.h"
#include "srtc/common/types.h"

namespace srtc::io {

// =============================================================================
// Subtitle Record
// =============================================================================

/// @brief A single record produced by a subtitle grammar.
struct SubtitleRecord {
    BlockIndex index = 0;
    Timestamp start{0};
    Timestamp end{0};

    /// @brief Text lines joined with '\n'.
    std::string content;

    /// @brief 1-based line number of the index line in the decoded text.
    std::uint64_t lineNumber = 0;
};

// =============================================================================
// SubtitleGrammar Interface
// =============================================================================

/// @brief Grammar collaborator: parse(text) -> ordered records | GrammarError.
class SubtitleGrammar {
public:
    virtual ~SubtitleGrammar() = default;

    /// @brief Parse decoded text into records, in file order.
    /// @return Records; empty if the text holds no entries.
    /// @throws GrammarError on malformed or truncated input.
    [[nodiscard]] virtual std::vector<SubtitleRecord> parse(std::string_view text) const = 0;

    /// @brief Short name used in log messages.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// =============================================================================
// SrtGrammar Class
// =============================================================================

/// @brief SubRip (.srt) grammar.
///
/// Thread Safety:
/// - Stateless; a single instance may be shared between threads
class SrtGrammar final : public SubtitleGrammar {
public:
    [[nodiscard]] std::vector<SubtitleRecord> parse(std::string_view text) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "srt"; }
};

/// @brief Process-wide SrtGrammar instance.
[[nodiscard]] const SubtitleGrammar& defaultGrammar() noexcept;

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Parse a single SubRip timestamp ("HH:MM:SS,mmm" and variants).
/// @return The offset, or nullopt if the text is not a timestamp.
[[nodiscard]] std::optional<Timestamp> parseSrtTimestamp(std::string_view text) noexcept;

/// @brief Format an offset as "HH:MM:SS,mmm".
/// @note Negative offsets are clamped to zero.
[[nodiscard]] std::string formatSrtTimestamp(Timestamp ts);

}  // namespace srtc::io

#endif  // SRTC_IO_SRT_GRAMMAR_H
