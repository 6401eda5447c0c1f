// =============================================================================
// srtchunk - Subtitle Grammar Implementation
// =============================================================================

#include "srtc/io/srt_grammar.h"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <fmt/format.h>

namespace srtc::io {

namespace {

/// @brief Longest line excerpt quoted in an error message.
constexpr std::size_t kMaxQuotedLength = 60;

/// @brief Upper bound for any single timestamp field.
constexpr std::uint64_t kMaxTimestampField = 1'000'000'000;

[[nodiscard]] bool isSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool isBlank(std::string_view line) noexcept {
    return std::all_of(line.begin(), line.end(), isSpace);
}

[[nodiscard]] std::string_view trim(std::string_view str) noexcept {
    while (!str.empty() && isSpace(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && isSpace(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

[[nodiscard]] std::string quote(std::string_view line) {
    if (line.size() <= kMaxQuotedLength) {
        return std::string(line);
    }
    return std::string(line.substr(0, kMaxQuotedLength)) + "...";
}

/// @brief Rewrite CRLF and lone CR line endings as LF.
[[nodiscard]] std::string normalizeLineEndings(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out.push_back(text[i]);
        }
    }
    return out;
}

[[nodiscard]] std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t begin = 0;
    while (begin <= text.size()) {
        auto end = text.find('\n', begin);
        if (end == std::string_view::npos) {
            if (begin < text.size()) {
                lines.push_back(text.substr(begin));
            }
            break;
        }
        lines.push_back(text.substr(begin, end - begin));
        begin = end + 1;
    }
    return lines;
}

// =============================================================================
// Timing Line Scanner
// =============================================================================

/// @brief Cursor over a single timing line.
class LineCursor {
public:
    explicit LineCursor(std::string_view line) noexcept : line_(line) {}

    [[nodiscard]] bool atEnd() const noexcept { return pos_ >= line_.size(); }

    [[nodiscard]] char peek() const noexcept { return atEnd() ? '\0' : line_[pos_]; }

    bool consume(char c) noexcept {
        if (peek() == c && !atEnd()) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skipSpaces() noexcept {
        while (!atEnd() && line_[pos_] == ' ') {
            ++pos_;
        }
    }

    void skipWhitespace() noexcept {
        while (!atEnd() && isSpace(line_[pos_])) {
            ++pos_;
        }
    }

    /// @brief Read a run of one or more decimal digits.
    [[nodiscard]] std::optional<std::uint64_t> digits() noexcept {
        const char* first = line_.data() + pos_;
        const char* last = line_.data() + line_.size();
        std::uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr == first) {
            return std::nullopt;
        }
        pos_ += static_cast<std::size_t>(ptr - first);
        return value;
    }

    [[nodiscard]] bool atDelimiter() const noexcept {
        char c = peek();
        return !atEnd() && (c == ',' || c == '.' || c == ':');
    }

    /// @brief Read a timestamp: H+ d M+ d S+ [d [ms*]] with d in {',', '.', ':'}.
    [[nodiscard]] std::optional<Timestamp> timestamp() noexcept {
        std::uint64_t fields[4] = {0, 0, 0, 0};
        for (int i = 0; i < 3; ++i) {
            if (i > 0) {
                if (!atDelimiter()) {
                    return std::nullopt;
                }
                ++pos_;
            }
            if (!std::isdigit(static_cast<unsigned char>(peek())) || atEnd()) {
                return std::nullopt;
            }
            auto value = digits();
            if (!value.has_value()) {
                return std::nullopt;
            }
            fields[i] = *value;
        }

        if (atDelimiter()) {
            ++pos_;
            if (!atEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
                auto value = digits();
                if (!value.has_value()) {
                    return std::nullopt;
                }
                fields[3] = *value;
            }
        }

        for (std::uint64_t field : fields) {
            if (field > kMaxTimestampField) {
                return std::nullopt;
            }
        }

        return std::chrono::hours(static_cast<std::int64_t>(fields[0])) +
               std::chrono::minutes(static_cast<std::int64_t>(fields[1])) +
               std::chrono::seconds(static_cast<std::int64_t>(fields[2])) +
               std::chrono::milliseconds(static_cast<std::int64_t>(fields[3]));
    }

    /// @brief Read the "-->" arrow, tolerating " - >", "-- >" and padding.
    bool arrow() noexcept {
        skipSpaces();
        if (!consume('-')) {
            return false;
        }
        if (!consume('-') && !consume(' ')) {
            return false;
        }
        skipSpaces();
        if (!consume('>')) {
            return false;
        }
        skipSpaces();
        return true;
    }

private:
    std::string_view line_;
    std::size_t pos_ = 0;
};

/// @brief Parse "start --> end [ignored]" into the record.
[[nodiscard]] bool parseTimingLine(std::string_view line, SubtitleRecord& record) noexcept {
    LineCursor cursor(line);
    cursor.skipWhitespace();

    auto start = cursor.timestamp();
    if (!start.has_value() || !cursor.arrow()) {
        return false;
    }

    auto end = cursor.timestamp();
    if (!end.has_value()) {
        return false;
    }

    record.start = *start;
    record.end = *end;
    return true;
}

[[nodiscard]] std::optional<BlockIndex> parseIndex(std::string_view line) noexcept {
    line = trim(line);
    if (line.empty() || !std::all_of(line.begin(), line.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        })) {
        return std::nullopt;
    }

    BlockIndex value = 0;
    auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), value);
    if (ec != std::errc{} || ptr != line.data() + line.size()) {
        return std::nullopt;
    }
    return value;
}

/// @brief True if lines[i] is an index line directly followed by a timing line.
[[nodiscard]] bool startsBlock(const std::vector<std::string_view>& lines, std::size_t i) {
    if (i + 1 >= lines.size() || !parseIndex(lines[i]).has_value()) {
        return false;
    }
    SubtitleRecord scratch;
    return parseTimingLine(lines[i + 1], scratch);
}

}  // namespace

// =============================================================================
// SrtGrammar Implementation
// =============================================================================

std::vector<SubtitleRecord> SrtGrammar::parse(std::string_view text) const {
    const std::string normalized = normalizeLineEndings(text);
    const std::vector<std::string_view> lines = splitLines(normalized);

    std::vector<SubtitleRecord> records;
    std::size_t i = 0;

    while (true) {
        while (i < lines.size() && isBlank(lines[i])) {
            ++i;
        }
        if (i >= lines.size()) {
            break;
        }

        // Line 1: index
        SubtitleRecord record;
        record.lineNumber = i + 1;

        auto index = parseIndex(lines[i]);
        if (!index.has_value()) {
            throw GrammarError(fmt::format("expected subtitle index, got '{}'", quote(lines[i])),
                               i + 1);
        }
        if (*index == 0) {
            throw GrammarError("subtitle index must be a positive integer", i + 1);
        }
        record.index = *index;
        ++i;

        // Line 2: timing
        if (i >= lines.size() || isBlank(lines[i])) {
            throw GrammarError(
                fmt::format("missing timing line after subtitle index {}", record.index), i + 1);
        }
        if (!parseTimingLine(lines[i], record)) {
            throw GrammarError(fmt::format("invalid timing line '{}'", quote(lines[i])), i + 1);
        }
        ++i;

        // Lines 3..n: text until the next block or end of input
        std::size_t contentLines = 0;
        while (i < lines.size()) {
            if (isBlank(lines[i])) {
                std::size_t next = i;
                while (next < lines.size() && isBlank(lines[next])) {
                    ++next;
                }
                // After a gap, a digits-only line opens the next block even
                // when its timing line is malformed
                if (next >= lines.size() || parseIndex(lines[next]).has_value()) {
                    i = next;
                    break;
                }
            } else if (startsBlock(lines, i)) {
                break;
            }
            if (contentLines++ > 0) {
                record.content.push_back('\n');
            }
            record.content.append(lines[i]);
            ++i;
        }

        records.push_back(std::move(record));
    }

    return records;
}

const SubtitleGrammar& defaultGrammar() noexcept {
    static const SrtGrammar instance;
    return instance;
}

// =============================================================================
// Utility Functions
// =============================================================================

std::optional<Timestamp> parseSrtTimestamp(std::string_view text) noexcept {
    text = trim(text);
    LineCursor cursor(text);
    auto ts = cursor.timestamp();
    if (!ts.has_value() || !cursor.atEnd()) {
        return std::nullopt;
    }
    return ts;
}

std::string formatSrtTimestamp(Timestamp ts) {
    auto total = std::max<std::int64_t>(ts.count(), 0);
    const auto ms = total % 1000;
    total /= 1000;
    const auto secs = total % 60;
    total /= 60;
    const auto mins = total % 60;
    const auto hours = total / 60;
    return fmt::format("{:02}:{:02}:{:02},{:03}", hours, mins, secs, ms);
}

}  // namespace srtc::io
