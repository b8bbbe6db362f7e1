/**
 * @file LrcParser.hpp
 * @brief Line-timed lyric (LRC) text to reference lines.
 *
 * Understands `[mm:ss.xx]text`, several time tags on one line
 * (`[00:12.00][01:40.00]chorus`), the `[offset:ms]` header and inline
 * word tags (`<00:12.50>`), which are stripped from the text. Other
 * header tags (`[ar:...]`, `[ti:...]`) and lines without text are skipped.
 *
 * @section Dependencies
 * - std::regex
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "sync/Lyrics.hpp"
#include "util/Result.hpp"

namespace ks::lyrics {

class LrcParser {
public:
    // Lines sorted by start time; equal starts keep file order
    static std::vector<sync::ReferenceLine> parse(const std::string& lrc);

    static Result<std::vector<sync::ReferenceLine>> parseFile(
            const std::filesystem::path& path);
};

} // namespace ks::lyrics
