// =============================================================================
// srtchunk - Chunk Command Implementation
// =============================================================================

#include "chunk_command.h"

#include <iostream>

#include <fmt/format.h>

#include "srtc/common/logger.h"
#include "srtc/io/srt_grammar.h"
#include "srtc/io/subtitle_parser.h"

namespace srtc::commands {

// =============================================================================
// ChunkCommand Implementation
// =============================================================================

ChunkCommand::ChunkCommand(ChunkOptions options, std::ostream& out)
    : options_(std::move(options)), out_(&out) {}

ChunkCommand::~ChunkCommand() = default;

ChunkCommand::ChunkCommand(ChunkCommand&&) noexcept = default;
ChunkCommand& ChunkCommand::operator=(ChunkCommand&&) noexcept = default;

int ChunkCommand::execute() {
    try {
        SRTC_LOG_DEBUG("Parsing subtitle file: {}", options_.inputPath.string());

        io::SubtitleParser parser;
        auto chunks = parser.parse(options_.inputPath, options_.chunkMaxBlocks);

        SRTC_LOG_DEBUG("Parsed {} chunks.", chunks.size());

        if (options_.jsonOutput) {
            printJsonLayout(chunks);
        } else {
            printTextLayout(chunks);
        }
        return 0;

    } catch (const SRTCException& e) {
        SRTC_LOG_ERROR("Chunk command failed: {}", e.what());
        return e.exitCode();
    }
}

void ChunkCommand::printTextLayout(const std::vector<Chunk>& chunks) {
    const auto summary = io::summarize(chunks);
    std::ostream& out = *out_;

    out << "=== Subtitle Chunk Layout ===" << '\n';
    out << '\n';
    out << "File:           " << options_.inputPath.string() << '\n';
    out << "Blocks:         " << summary.blockCount << '\n';
    out << "Chunks:         " << summary.chunkCount << '\n';
    out << "Max per chunk:  " << options_.chunkMaxBlocks << '\n';

    if (chunks.empty()) {
        out << '\n' << "(no subtitle entries)" << '\n';
        return;
    }

    out << "Span:           " << io::formatSrtTimestamp(summary.firstStart) << " --> "
        << io::formatSrtTimestamp(summary.lastEnd) << '\n';
    if (summary.invertedBlocks > 0) {
        out << "WARNING: " << summary.invertedBlocks << " block(s) end before they start" << '\n';
    }

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        out << '\n';
        out << fmt::format("--- Chunk {} ({} blocks, #{}-#{}, {} --> {}) ---", i + 1, chunk.size(),
                           chunk.front().index(), chunk.back().index(),
                           io::formatSrtTimestamp(chunk.front().start()),
                           io::formatSrtTimestamp(chunk.back().end()))
            << '\n';

        if (!options_.showText) {
            continue;
        }
        for (const auto& block : chunk) {
            out << block.index() << '\n';
            out << io::formatSrtTimestamp(block.start()) << " --> "
                << io::formatSrtTimestamp(block.end()) << '\n';
            out << block.content() << '\n';
            out << '\n';
        }
    }
    out.flush();
}

void ChunkCommand::printJsonLayout(const std::vector<Chunk>& chunks) {
    const auto summary = io::summarize(chunks);
    std::ostream& out = *out_;

    out << "{" << '\n';
    out << "  \"file\": \"" << jsonEscape(options_.inputPath.string()) << "\"," << '\n';
    out << "  \"chunk_max_blocks\": " << options_.chunkMaxBlocks << "," << '\n';
    out << "  \"block_count\": " << summary.blockCount << "," << '\n';
    out << "  \"chunk_count\": " << summary.chunkCount << "," << '\n';
    out << "  \"chunks\": [";

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        out << (i == 0 ? "\n" : ",\n");
        out << "    {\"blocks\": [";
        const auto& chunk = chunks[i];
        for (std::size_t j = 0; j < chunk.size(); ++j) {
            const auto& block = chunk[j];
            out << (j == 0 ? "" : ", ");
            out << fmt::format("{{\"index\": {}, \"start_ms\": {}, \"end_ms\": {}", block.index(),
                               block.start().count(), block.end().count());
            if (options_.showText) {
                out << ", \"content\": \"" << jsonEscape(block.content()) << "\"";
            }
            out << "}";
        }
        out << "]}";
    }

    out << (chunks.empty() ? "]" : "\n  ]") << '\n';
    out << "}" << std::endl;
}

// =============================================================================
// Utility Functions
// =============================================================================

std::string jsonEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::unique_ptr<ChunkCommand> createChunkCommand(const std::string& inputPath, int chunkMaxBlocks,
                                                 bool jsonOutput, bool showText) {
    ChunkOptions opts;
    opts.inputPath = inputPath;
    opts.chunkMaxBlocks = chunkMaxBlocks;
    opts.jsonOutput = jsonOutput;
    opts.showText = showText;

    return std::make_unique<ChunkCommand>(std::move(opts), std::cout);
}

}  // namespace srtc::commands
