/**
 * @file OverlapResolver.hpp
 * @brief Minimum visible duration and overlap removal for a finished timeline.
 *
 * One left-to-right pass. A line that is too short is extended; if it then
 * runs into its successor, the successor starts later. Earlier lines always
 * win because they are already on screen. Nothing is ever pulled backward.
 */

#pragma once
#include "Lyrics.hpp"
#include "core/ConfigData.hpp"

namespace ks::sync {

struct ResolveStats {
    std::size_t extendedLines{0};
    std::size_t pushedLines{0};
};

class OverlapResolver {
public:
    static ResolveStats resolve(Timeline& lines, const SyncConfig& cfg);

private:
    // Clamps the line's words into [start_s, end_s] and marks it Finalized
    static void finalize(AlignedLine& line);
};

} // namespace ks::sync
