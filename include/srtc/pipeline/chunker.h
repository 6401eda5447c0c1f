// =============================================================================
// srtchunk - Block Chunker
// =============================================================================
// Partitions an ordered block sequence into contiguous batches.
//
// For n blocks and a maximum m the result has ceil(n / m) chunks. Every chunk
// except the last holds exactly m blocks; the last holds between 1 and m.
// Blocks are never reordered and chunk boundaries ignore content.
// =============================================================================

#ifndef SRTC_PIPELINE_CHUNKER_H
#define SRTC_PIPELINE_CHUNKER_H

#include <cstddef>
#include <vector>

#include "srtc/common/error.h"
#include "srtc/common/types.h"

namespace srtc::pipeline {

/// @brief Number of chunks produced for a given block count.
/// @pre chunkMaxBlocks > 0
[[nodiscard]] constexpr std::size_t expectedChunkCount(std::size_t blockCount,
                                                       std::size_t chunkMaxBlocks) noexcept {
    return (blockCount + chunkMaxBlocks - 1) / chunkMaxBlocks;
}

/// @brief Reject a non-positive chunk size.
/// @throws ValidationError if chunkMaxBlocks <= 0.
void requireValidChunkSize(int chunkMaxBlocks);

/// @brief Split blocks into chunks of at most chunkMaxBlocks.
/// @param blocks Blocks in file order (consumed).
/// @param chunkMaxBlocks Maximum blocks per chunk.
/// @return Chunks in order; empty if blocks is empty.
/// @throws ValidationError if chunkMaxBlocks <= 0.
[[nodiscard]] std::vector<Chunk> chunkBlocks(std::vector<SubtitleBlock> blocks, int chunkMaxBlocks);

/// @brief Concatenate chunks back into one block sequence.
[[nodiscard]] std::vector<SubtitleBlock> flattenChunks(const std::vector<Chunk>& chunks);

}  // namespace srtc::pipeline

#endif  // SRTC_PIPELINE_CHUNKER_H
