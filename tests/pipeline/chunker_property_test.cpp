// =============================================================================
// srtchunk - Chunker Property Tests
// =============================================================================
// Property-based tests for block chunking.
//
// Properties tested:
// - Chunk count is ceil(n / m)
// - Every chunk but the last holds exactly m blocks; the last holds 1..m
// - Concatenating the chunks reproduces the input order
// =============================================================================

#include "srtc/pipeline/chunker.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>
#include <vector>

namespace srtc::pipeline::test {

// =============================================================================
// Generators
// =============================================================================

namespace gen {

/// @brief Generate n blocks with sequential indices and distinct content.
rc::Gen<std::vector<SubtitleBlock>> blocks(int maxCount) {
    return rc::gen::map(rc::gen::inRange(0, maxCount + 1), [](int count) {
        std::vector<SubtitleBlock> result;
        result.reserve(static_cast<std::size_t>(count));
        for (int i = 0; i < count; ++i) {
            result.emplace_back(static_cast<BlockIndex>(i + 1), Timestamp{i * 1000},
                                Timestamp{i * 1000 + 800}, "text " + std::to_string(i));
        }
        return result;
    });
}

}  // namespace gen

// =============================================================================
// Property Tests
// =============================================================================

/// @brief Chunk count and sizes follow ceil(n / m) packing.
RC_GTEST_PROP(ChunkerProperty, ChunkSizesArePacked, ()) {
    auto input = *gen::blocks(300);
    const int maxBlocks = *rc::gen::inRange(1, 64);
    const auto n = input.size();
    const auto m = static_cast<std::size_t>(maxBlocks);

    auto chunks = chunkBlocks(input, maxBlocks);

    RC_ASSERT(chunks.size() == expectedChunkCount(n, m));
    for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
        RC_ASSERT(chunks[i].size() == m);
    }
    if (!chunks.empty()) {
        RC_ASSERT(chunks.back().size() >= 1u);
        RC_ASSERT(chunks.back().size() <= m);
    }
}

/// @brief Flattening the chunks gives back the input sequence.
RC_GTEST_PROP(ChunkerProperty, FlattenPreservesOrder, ()) {
    auto input = *gen::blocks(300);
    const int maxBlocks = *rc::gen::inRange(1, 64);

    auto chunks = chunkBlocks(input, maxBlocks);

    RC_ASSERT(flattenChunks(chunks) == input);
}

/// @brief Any non-positive maximum is rejected.
RC_GTEST_PROP(ChunkerProperty, NonPositiveMaximumIsRejected, ()) {
    auto input = *gen::blocks(10);
    const int maxBlocks = *rc::gen::inRange(-1000, 1);

    RC_ASSERT_THROWS_AS((void)chunkBlocks(input, maxBlocks), ValidationError);
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(ChunkerTest, ExpectedChunkCount) {
    static_assert(expectedChunkCount(0, 4) == 0);
    static_assert(expectedChunkCount(10, 4) == 3);
    static_assert(expectedChunkCount(8, 4) == 2);
    static_assert(expectedChunkCount(1, 50) == 1);
    SUCCEED();
}

TEST(ChunkerTest, EmptyInputGivesNoChunks) {
    EXPECT_TRUE(chunkBlocks({}, 5).empty());
}

TEST(ChunkerTest, ExactMultiple) {
    std::vector<SubtitleBlock> input;
    for (int i = 1; i <= 8; ++i) {
        input.emplace_back(static_cast<BlockIndex>(i), Timestamp{0}, Timestamp{1}, "x");
    }

    auto chunks = chunkBlocks(input, 4);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].front().index(), 1u);
    EXPECT_EQ(chunks[1].front().index(), 5u);
    EXPECT_EQ(chunks[1].back().index(), 8u);
}

TEST(ChunkerTest, ErrorMessageNamesValue) {
    try {
        requireValidChunkSize(0);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.message(), "chunk_max_blocks must be a positive integer, got 0");
        EXPECT_EQ(e.exitCode(), 2);
    }
    EXPECT_NO_THROW(requireValidChunkSize(1));
}

}  // namespace srtc::pipeline::test
