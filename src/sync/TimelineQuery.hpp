/**
 * @file TimelineQuery.hpp
 * @brief Playback-time lookups for caption renderers.
 *
 * Answers "which line is on screen" and "how far has the wipe advanced"
 * for a finished timeline, without any knowledge of fonts or pixels.
 */

#pragma once
#include <optional>
#include "Lyrics.hpp"

namespace ks::sync {

class TimelineQuery {
public:
    // Line containing `t`, else the next upcoming line, else lines.size()
    // once playback is past the end. nullopt for an empty timeline.
    static std::optional<std::size_t> activeLineIndex(const Timeline& lines,
                                                      Seconds t);

    // Fraction [0, 1] of the line's characters revealed at time `t`
    static f64 wipeProgress(const AlignedLine& line, Seconds t);
};

} // namespace ks::sync
