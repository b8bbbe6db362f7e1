#pragma once
// ReferenceJson.hpp - Reference lyric lines from JSON
// Either `[{"text": ..., "start": ...}]` or `{"lines": [...]}`.

#include <QByteArray>
#include <filesystem>
#include <vector>
#include "sync/Lyrics.hpp"
#include "util/Result.hpp"

namespace ks::lyrics {

class ReferenceJson {
public:
    static Result<std::vector<sync::ReferenceLine>> parse(const QByteArray& json);

    static Result<std::vector<sync::ReferenceLine>> parseFile(
            const std::filesystem::path& path);

    // Picks LrcParser or JSON by file extension (.json -> JSON, anything
    // else -> LRC)
    static Result<std::vector<sync::ReferenceLine>> load(
            const std::filesystem::path& path);
};

} // namespace ks::lyrics
