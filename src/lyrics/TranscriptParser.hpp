/**
 * @file TranscriptParser.hpp
 * @brief Speech recognizer JSON output to recognized words.
 *
 * Accepts whisper-style output: a root object with a `segments` array, a
 * bare array of segments, or a root object with a flat `words` array.
 * Segment keys: `text`, `start`, `end`, `words`. Word keys: `word` (or
 * `text`), `start`/`start_s`, `end`/`end_s`.
 *
 * @section Dependencies
 * - QtCore (QJsonDocument)
 */

#pragma once
#include <QByteArray>
#include <filesystem>
#include <vector>
#include "sync/Lyrics.hpp"
#include "util/Result.hpp"

namespace ks::lyrics {

class TranscriptParser {
public:
    static Result<std::vector<sync::RecognizedSegment>> parse(
            const QByteArray& json);

    static Result<std::vector<sync::RecognizedSegment>> parseFile(
            const std::filesystem::path& path);

    // All words in start order; segments without word timing are split
    // evenly across their text
    static std::vector<sync::RecognizedWord> flatten(
            const std::vector<sync::RecognizedSegment>& segments);
};

} // namespace ks::lyrics
