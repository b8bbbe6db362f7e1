#include "TimelineQuery.hpp"
#include <algorithm>
#include "TokenNormalizer.hpp"

namespace ks::sync {

std::optional<std::size_t> TimelineQuery::activeLineIndex(
        const Timeline& lines,
        Seconds t) {
    if (lines.empty())
        return std::nullopt;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (t >= lines[i].start_s && t <= lines[i].end_s)
            return i;
    }
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].start_s > t)
            return i;
    }
    return lines.size();
}

f64 TimelineQuery::wipeProgress(const AlignedLine& line, Seconds t) {
    if (t <= line.start_s)
        return 0.0;
    if (t >= line.end_s)
        return 1.0;

    if (line.words.empty()) {
        const Seconds span = line.end_s - line.start_s;
        return span > 0.0 ? std::clamp((t - line.start_s) / span, 0.0, 1.0)
                          : 1.0;
    }

    // Each word owns its characters plus the space that follows it
    f64 total = 0.0;
    for (std::size_t i = 0; i < line.words.size(); ++i) {
        total += static_cast<f64>(
                TokenNormalizer::tokenLength(line.words[i].word));
        if (i + 1 < line.words.size())
            total += 1.0;
    }
    if (total <= 0.0)
        return 1.0;

    f64 revealed = 0.0;
    for (std::size_t i = 0; i < line.words.size(); ++i) {
        const auto& w = line.words[i];
        f64 width = static_cast<f64>(TokenNormalizer::tokenLength(w.word));
        if (i + 1 < line.words.size())
            width += 1.0;

        if (t < w.start_s)
            break; // silence before this word: hold at the previous end

        if (t <= w.end_s) {
            const Seconds span = w.end_s - w.start_s;
            const f64 p = span > 0.0 ? (t - w.start_s) / span : 1.0;
            revealed += width * p;
            break;
        }
        revealed += width;
    }

    return std::clamp(revealed / total, 0.0, 1.0);
}

} // namespace ks::sync
