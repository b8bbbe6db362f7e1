/**
 * @file GlobalOffsetEstimator.hpp
 * @brief Single-shift drift correction between lyric and recognizer timelines.
 *
 * Lyric sources and recognizers often disagree on where the song starts
 * (trimmed silence, different intros). The longest run of words shared by
 * both token streams anchors one bulk offset that is applied to every
 * reference line before per-line alignment.
 */

#pragma once
#include <vector>
#include "Lyrics.hpp"
#include "core/ConfigData.hpp"

namespace ks::sync {

struct OffsetEstimate {
    // recognized time minus reference time at the anchor; 0 when no anchor
    Seconds offset{0.0};
    // Length of the shared token run, 0 when none was found
    std::size_t anchorSize{0};
    Seconds referenceTime{0.0};
    Seconds recognizedTime{0.0};

    bool found() const {
        return anchorSize > 0;
    }
};

class GlobalOffsetEstimator {
public:
    static OffsetEstimate estimate(const std::vector<ReferenceLine>& lines,
                                   const std::vector<RecognizedWord>& words,
                                   const SyncConfig& cfg);

    // True when the estimate is large enough to be worth correcting
    static bool shouldApply(const OffsetEstimate& estimate,
                            const SyncConfig& cfg);

    // Copy of `lines` with `offset` added to every start
    static std::vector<ReferenceLine> applyOffset(
            const std::vector<ReferenceLine>& lines,
            Seconds offset);
};

} // namespace ks::sync
