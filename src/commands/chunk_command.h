// =============================================================================
// srtchunk - Chunk Command
// =============================================================================
// Command handler that runs the full ingestion pipeline on one file and
// prints the resulting chunk layout.
//
// This module provides:
// - ChunkCommand: Validate, parse and chunk a subtitle file
// - Text and JSON output
// - Optional dump of block contents
// =============================================================================

#ifndef SRTC_COMMANDS_CHUNK_COMMAND_H
#define SRTC_COMMANDS_CHUNK_COMMAND_H

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "srtc/common/error.h"
#include "srtc/common/types.h"

namespace srtc::commands {

// =============================================================================
// Chunk Options
// =============================================================================

/// @brief Configuration options for the chunk command.
struct ChunkOptions {
    /// @brief Input subtitle file path.
    std::filesystem::path inputPath;

    /// @brief Maximum blocks per chunk.
    int chunkMaxBlocks = kDefaultChunkMaxBlocks;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief Print block text under each chunk.
    bool showText = false;
};

// =============================================================================
// ChunkCommand Class
// =============================================================================

/// @brief Command handler for the chunk subcommand.
class ChunkCommand {
public:
    explicit ChunkCommand(ChunkOptions options, std::ostream& out);

    ~ChunkCommand();

    ChunkCommand(const ChunkCommand&) = delete;
    ChunkCommand& operator=(const ChunkCommand&) = delete;
    ChunkCommand(ChunkCommand&&) noexcept;
    ChunkCommand& operator=(ChunkCommand&&) noexcept;

    /// @brief Execute the chunk command.
    /// @return Exit code (0 = success, 2 = validation error, 3 = parsing error).
    [[nodiscard]] int execute();

    [[nodiscard]] const ChunkOptions& options() const noexcept { return options_; }

private:
    void printTextLayout(const std::vector<Chunk>& chunks);

    void printJsonLayout(const std::vector<Chunk>& chunks);

    ChunkOptions options_;
    std::ostream* out_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Escape a string for inclusion in a JSON document.
[[nodiscard]] std::string jsonEscape(std::string_view text);

/// @brief Create a chunk command from CLI options.
[[nodiscard]] std::unique_ptr<ChunkCommand> createChunkCommand(const std::string& inputPath,
                                                               int chunkMaxBlocks,
                                                               bool jsonOutput, bool showText);

}  // namespace srtc::commands

#endif  // SRTC_COMMANDS_CHUNK_COMMAND_H
