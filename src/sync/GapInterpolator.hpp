/**
 * @file GapInterpolator.hpp
 * @brief Timing for reference words the recognizer missed.
 *
 * Unmatched words are laid out between their nearest matched neighbours
 * (anchors). A line with no anchor at all is spread evenly over its nominal
 * span.
 */

#pragma once
#include <vector>
#include "Lyrics.hpp"
#include "core/ConfigData.hpp"

namespace ks::sync {

struct FillResult {
    std::size_t filledWords{0};
    // No anchor existed; every word got an evenly distributed slot
    bool synthetic{false};
};

class GapInterpolator {
public:
    // Next line's start, or start + lastLineDuration for the final line
    static Seconds nominalEnd(const std::vector<ReferenceLine>& lines,
                              std::size_t index,
                              const SyncConfig& cfg);

    static FillResult fill(AlignedLine& line,
                           Seconds nominalStart,
                           Seconds nominalEnd,
                           const SyncConfig& cfg);

private:
    static void distributeEvenly(std::vector<AlignedWord>& words,
                                 std::size_t first,
                                 std::size_t last,
                                 Seconds spanStart,
                                 Seconds spanEnd);
};

} // namespace ks::sync
