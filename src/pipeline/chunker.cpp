// =============================================================================
// srtchunk - Block Chunker Implementation
// =============================================================================

#include "srtc/pipeline/chunker.h"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include "srtc/common/logger.h"

namespace srtc::pipeline {

void requireValidChunkSize(int chunkMaxBlocks) {
    if (chunkMaxBlocks <= 0) {
        throw ValidationError(
            fmt::format("chunk_max_blocks must be a positive integer, got {}", chunkMaxBlocks));
    }
}

std::vector<Chunk> chunkBlocks(std::vector<SubtitleBlock> blocks, int chunkMaxBlocks) {
    requireValidChunkSize(chunkMaxBlocks);

    const auto maxBlocks = static_cast<std::size_t>(chunkMaxBlocks);
    const std::size_t numChunks = expectedChunkCount(blocks.size(), maxBlocks);

    std::vector<Chunk> chunks;
    chunks.reserve(numChunks);

    auto it = std::make_move_iterator(blocks.begin());
    const auto last = std::make_move_iterator(blocks.end());
    for (std::size_t i = 0; i < numChunks; ++i) {
        const auto remaining = static_cast<std::size_t>(std::distance(it, last));
        const auto take = std::min(maxBlocks, remaining);
        chunks.emplace_back(it, std::next(it, static_cast<std::ptrdiff_t>(take)));
        std::advance(it, static_cast<std::ptrdiff_t>(take));
    }

    SRTC_LOG_DEBUG("Chunked {} blocks into {} chunks (max {} per chunk)", blocks.size(), numChunks,
                   maxBlocks);
    return chunks;
}

std::vector<SubtitleBlock> flattenChunks(const std::vector<Chunk>& chunks) {
    std::vector<SubtitleBlock> blocks;
    for (const auto& chunk : chunks) {
        blocks.insert(blocks.end(), chunk.begin(), chunk.end());
    }
    return blocks;
}

}  // namespace srtc::pipeline
