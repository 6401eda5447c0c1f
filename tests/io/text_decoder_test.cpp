// =============================================================================
// srtchunk - Text Decoding Tests
// =============================================================================
// Unit and property tests for lossy UTF-8 decoding.
// =============================================================================

#include "srtc/io/text_decoder.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>

namespace srtc::io::test {

// =============================================================================
// Unit Tests
// =============================================================================

TEST(TextDecoderTest, ValidTextIsUnchanged) {
    const std::string text = "Hello\nCaf\xC3\xA9 \xE4\xB8\xAD\xE6\x96\x87 \xF0\x9F\x8E\xAC";
    DecodeStats stats;

    EXPECT_EQ(decodeUtf8Lossy(text, &stats), text);
    EXPECT_EQ(stats.replacements, 0u);
    EXPECT_FALSE(stats.bomStripped);
    EXPECT_TRUE(isValidUtf8(text));
}

TEST(TextDecoderTest, LoneInvalidByteIsReplaced) {
    DecodeStats stats;
    auto out = decodeUtf8Lossy("a\xFF" "b", &stats);

    EXPECT_EQ(out, std::string("a") + std::string(kReplacementCharacter) + "b");
    EXPECT_EQ(stats.replacements, 1u);
    EXPECT_FALSE(isValidUtf8("a\xFF" "b"));
}

TEST(TextDecoderTest, Latin1TextDecodesWithReplacements) {
    // "café" saved as Latin-1
    DecodeStats stats;
    auto out = decodeUtf8Lossy("caf\xE9", &stats);

    EXPECT_EQ(out, std::string("caf") + std::string(kReplacementCharacter));
    EXPECT_EQ(stats.replacements, 1u);
}

TEST(TextDecoderTest, TruncatedSequenceIsOneReplacement) {
    // E4 B8 is the maximal subpart of a three-byte sequence
    DecodeStats stats;
    auto out = decodeUtf8Lossy("\xE4\xB8" "x", &stats);

    EXPECT_EQ(out, std::string(kReplacementCharacter) + "x");
    EXPECT_EQ(stats.replacements, 1u);
}

TEST(TextDecoderTest, SurrogatesAndOverlongsAreRejected) {
    DecodeStats stats;

    // ED A0 80 encodes a surrogate: ED is invalid here, then A0 and 80
    auto surrogate = decodeUtf8Lossy("\xED\xA0\x80", &stats);
    EXPECT_EQ(stats.replacements, 3u);
    EXPECT_TRUE(isValidUtf8(surrogate));

    // C0 AF is an overlong '/'
    decodeUtf8Lossy("\xC0\xAF", &stats);
    EXPECT_EQ(stats.replacements, 2u);
}

TEST(TextDecoderTest, ByteOrderMarkIsStripped) {
    DecodeStats stats;
    auto out = decodeUtf8Lossy("\xEF\xBB\xBF" "1\n", &stats);

    EXPECT_EQ(out, "1\n");
    EXPECT_TRUE(stats.bomStripped);

    std::string text = "no bom";
    EXPECT_FALSE(stripUtf8Bom(text));
    EXPECT_EQ(text, "no bom");
}

TEST(TextDecoderTest, EmptyInput) {
    EXPECT_EQ(decodeUtf8Lossy(""), "");
    EXPECT_TRUE(isValidUtf8(""));
}

// =============================================================================
// Property Tests
// =============================================================================

/// @brief Decoding arbitrary bytes always yields valid UTF-8.
RC_GTEST_PROP(TextDecoderProperty, OutputIsAlwaysValidUtf8, ()) {
    auto bytes = *rc::gen::arbitrary<std::string>();
    auto out = decodeUtf8Lossy(bytes);

    RC_ASSERT(isValidUtf8(out));
}

/// @brief Already valid UTF-8 (without BOM) round-trips unchanged.
RC_GTEST_PROP(TextDecoderProperty, ValidInputIsIdentity, ()) {
    auto text = *rc::gen::container<std::string>(rc::gen::inRange<char>(0x20, 0x7F));
    text += "\xC3\xA9\xE2\x82\xAC";

    DecodeStats stats;
    RC_ASSERT(decodeUtf8Lossy(text, &stats) == text);
    RC_ASSERT(stats.replacements == 0u);
}

}  // namespace srtc::io::test
