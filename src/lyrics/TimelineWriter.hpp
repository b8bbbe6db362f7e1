/**
 * @file TimelineWriter.hpp
 * @brief Synchronized timeline to JSON for caption renderers.
 *
 * Output shape:
 *   { "lines": [ { "text", "start", "end",
 *                  "words": [ { "word", "start", "end", "matched" } ] } ] }
 */

#pragma once
#include <QByteArray>
#include <filesystem>
#include "core/ConfigData.hpp"
#include "sync/Lyrics.hpp"
#include "util/Result.hpp"

namespace ks::lyrics {

class TimelineWriter {
public:
    static QByteArray toJson(const sync::Timeline& lines,
                             const OutputConfig& cfg);

    static Result<void> writeFile(const std::filesystem::path& path,
                                  const sync::Timeline& lines,
                                  const OutputConfig& cfg);
};

} // namespace ks::lyrics
