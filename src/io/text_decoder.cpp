// =============================================================================
// srtchunk - Text Decoding Implementation
// =============================================================================

#include "srtc/io/text_decoder.h"

namespace srtc::io {

namespace {

/// @brief Outcome of inspecting the bytes at one position.
struct SequenceScan {
    /// @brief Bytes covered (valid sequence or maximal invalid subpart).
    std::size_t length = 1;

    bool valid = false;
};

/// @brief Inspect the UTF-8 sequence starting at bytes[pos].
/// @note Ranges follow Unicode Table 3-7 (well-formed UTF-8 byte sequences).
SequenceScan scanSequence(std::string_view bytes, std::size_t pos) noexcept {
    const auto lead = static_cast<unsigned char>(bytes[pos]);

    if (lead < 0x80) {
        return {1, true};
    }

    std::size_t needed = 0;
    unsigned char secondMin = 0x80;
    unsigned char secondMax = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        needed = 1;
    } else if (lead == 0xE0) {
        needed = 2;
        secondMin = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        needed = 2;
    } else if (lead == 0xED) {
        needed = 2;
        secondMax = 0x9F;  // excludes surrogates
    } else if (lead == 0xF0) {
        needed = 3;
        secondMin = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        needed = 3;
    } else if (lead == 0xF4) {
        needed = 3;
        secondMax = 0x8F;  // caps at U+10FFFF
    } else {
        return {1, false};
    }

    for (std::size_t k = 1; k <= needed; ++k) {
        if (pos + k >= bytes.size()) {
            return {k, false};
        }
        const auto c = static_cast<unsigned char>(bytes[pos + k]);
        const unsigned char lo = (k == 1) ? secondMin : 0x80;
        const unsigned char hi = (k == 1) ? secondMax : 0xBF;
        if (c < lo || c > hi) {
            return {k, false};
        }
    }

    return {needed + 1, true};
}

}  // namespace

std::string decodeUtf8Lossy(std::string_view bytes, DecodeStats* stats) {
    std::string out;
    out.reserve(bytes.size());

    std::size_t replacements = 0;
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const SequenceScan scan = scanSequence(bytes, pos);
        if (scan.valid) {
            out.append(bytes.substr(pos, scan.length));
        } else {
            out.append(kReplacementCharacter);
            ++replacements;
        }
        pos += scan.length;
    }

    bool bomStripped = stripUtf8Bom(out);

    if (stats != nullptr) {
        stats->replacements = replacements;
        stats->bomStripped = bomStripped;
    }
    return out;
}

bool stripUtf8Bom(std::string& text) noexcept {
    if (text.starts_with(kUtf8Bom)) {
        text.erase(0, kUtf8Bom.size());
        return true;
    }
    return false;
}

bool isValidUtf8(std::string_view bytes) noexcept {
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const SequenceScan scan = scanSequence(bytes, pos);
        if (!scan.valid) {
            return false;
        }
        pos += scan.length;
    }
    return true;
}

}  // namespace srtc::io
