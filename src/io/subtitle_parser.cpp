// =============================================================================
// srtchunk - Subtitle Parser Implementation
// =============================================================================

#include "srtc/io/subtitle_parser.h"

#include <algorithm>

#include <fmt/format.h>

#include "srtc/common/logger.h"
#include "srtc/io/text_decoder.h"
#include "srtc/pipeline/chunker.h"

namespace srtc::io {

// =============================================================================
// SubtitleParser Implementation
// =============================================================================

SubtitleParser::SubtitleParser(ValidatorOptions options)
    : SubtitleParser(localFileSystem(), defaultGrammar(), std::move(options)) {}

SubtitleParser::SubtitleParser(const FileSystem& fileSystem, const SubtitleGrammar& grammar,
                               ValidatorOptions options)
    : fileSystem_(&fileSystem), grammar_(&grammar), validator_(fileSystem, std::move(options)) {}

std::vector<Chunk> SubtitleParser::parse(const std::filesystem::path& path,
                                         int chunkMaxBlocks) const {
    // Contract violation is reported before touching the filesystem
    pipeline::requireValidChunkSize(chunkMaxBlocks);

    auto blocks = parseBlocks(path);
    if (blocks.empty()) {
        SRTC_LOG_DEBUG("No subtitle entries in {}", path.string());
        return {};
    }

    return pipeline::chunkBlocks(std::move(blocks), chunkMaxBlocks);
}

std::vector<SubtitleBlock> SubtitleParser::parseBlocks(const std::filesystem::path& path) const {
    validator_.validate(path);

    const std::string text = readText(path);
    auto records = parseRecords(path, text);

    for (const auto& record : records) {
        if (record.end < record.start) {
            SRTC_LOG_WARNING("Subtitle {} in {} ends before it starts ({} --> {})", record.index,
                             path.string(), formatSrtTimestamp(record.start),
                             formatSrtTimestamp(record.end));
        }
    }

    SRTC_LOG_DEBUG("Parsed {} subtitle entries from {} with {} grammar", records.size(),
                   path.string(), grammar_->name());
    return toBlocks(std::move(records));
}

Result<std::vector<Chunk>> SubtitleParser::tryParse(const std::filesystem::path& path,
                                                    int chunkMaxBlocks) const {
    return tryExecute([&]() { return parse(path, chunkMaxBlocks); });
}

std::string SubtitleParser::readText(const std::filesystem::path& path) const {
    std::string bytes;
    try {
        bytes = fileSystem_->readAll(path);
    } catch (const IOError& e) {
        if (e.code() == ErrorCode::kFileNotFound) {
            throw ParsingError(fmt::format("File not found: {}", path.string()), e.message(),
                               ErrorContext{path.string()});
        }
        throw ParsingError(fmt::format("Failed to read SRT file '{}': {}", path.string(), e.message()),
                           e.message(), ErrorContext{path.string()});
    } catch (const std::exception& e) {
        throw ParsingError(fmt::format("Failed to read SRT file '{}': {}", path.string(), e.what()),
                           e.what(), ErrorContext{path.string()});
    }

    DecodeStats stats;
    std::string text = decodeUtf8Lossy(bytes, &stats);
    if (stats.replacements > 0) {
        SRTC_LOG_WARNING("Replaced {} invalid UTF-8 sequences in {}", stats.replacements,
                         path.string());
    }
    return text;
}

std::vector<SubtitleRecord> SubtitleParser::parseRecords(const std::filesystem::path& path,
                                                         std::string_view text) const {
    try {
        return grammar_->parse(text);
    } catch (const GrammarError& e) {
        ErrorContext context{path.string()};
        std::string cause = e.message();
        if (auto line = e.lineNumber(); line.has_value()) {
            context.withLine(*line);
            cause = fmt::format("{} at line {}", e.message(), *line);
        }
        SRTC_LOG_WARNING("Grammar error in {}: {}", path.string(), cause);
        throw ParsingError(fmt::format("Failed to parse SRT file '{}': {}", path.string(), cause),
                           cause, std::move(context));
    } catch (const std::exception& e) {
        throw ParsingError(fmt::format("Failed to parse SRT file '{}': {}", path.string(), e.what()),
                           e.what(), ErrorContext{path.string()});
    }
}

// =============================================================================
// Utility Functions
// =============================================================================

std::vector<SubtitleBlock> toBlocks(std::vector<SubtitleRecord> records) {
    std::vector<SubtitleBlock> blocks;
    blocks.reserve(records.size());
    for (auto& record : records) {
        blocks.emplace_back(record.index, record.start, record.end, std::move(record.content));
    }
    return blocks;
}

std::vector<Chunk> parseSrt(const std::filesystem::path& path, int chunkMaxBlocks) {
    return SubtitleParser{}.parse(path, chunkMaxBlocks);
}

ParseSummary summarize(const std::vector<Chunk>& chunks) {
    ParseSummary summary;
    summary.chunkCount = chunks.size();
    summary.chunkSizes.reserve(chunks.size());

    bool first = true;
    for (const auto& chunk : chunks) {
        summary.chunkSizes.push_back(chunk.size());
        summary.blockCount += chunk.size();
        for (const auto& block : chunk) {
            if (first) {
                summary.firstStart = block.start();
                summary.lastEnd = block.end();
                first = false;
            } else {
                summary.firstStart = std::min(summary.firstStart, block.start());
                summary.lastEnd = std::max(summary.lastEnd, block.end());
            }
            if (block.end() < block.start()) {
                ++summary.invertedBlocks;
            }
        }
    }
    return summary;
}

}  // namespace srtc::io
