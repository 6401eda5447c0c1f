// =============================================================================
// srtchunk - Text Decoding
// =============================================================================
// Lossy UTF-8 decoding of raw subtitle bytes.
//
// Subtitle files in the wild are frequently saved in legacy code pages or
// contain stray bytes. Decoding never fails: each maximal invalid subsequence
// is replaced with U+FFFD, following the Unicode "best practice" for
// substitution (the same policy as Python's errors='replace' and ICU).
// =============================================================================

#ifndef SRTC_IO_TEXT_DECODER_H
#define SRTC_IO_TEXT_DECODER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace srtc::io {

/// @brief UTF-8 encoding of U+FFFD REPLACEMENT CHARACTER.
inline constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";

/// @brief UTF-8 byte order mark.
inline constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

/// @brief Statistics from a decode pass.
struct DecodeStats {
    /// @brief Number of U+FFFD substitutions made.
    std::size_t replacements = 0;

    /// @brief Whether a leading byte order mark was removed.
    bool bomStripped = false;
};

/// @brief Decode bytes as UTF-8, replacing invalid sequences with U+FFFD.
/// @note A leading byte order mark is removed from the result.
/// @param bytes Raw file content.
/// @param stats Optional output for substitution statistics.
/// @return Valid UTF-8 text.
[[nodiscard]] std::string decodeUtf8Lossy(std::string_view bytes, DecodeStats* stats = nullptr);

/// @brief Remove a leading UTF-8 byte order mark, if any.
/// @return true if a BOM was removed.
bool stripUtf8Bom(std::string& text) noexcept;

/// @brief Check whether bytes are entirely valid UTF-8.
[[nodiscard]] bool isValidUtf8(std::string_view bytes) noexcept;

}  // namespace srtc::io

#endif  // SRTC_IO_TEXT_DECODER_H
