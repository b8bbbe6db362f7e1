#pragma once
// TimelineTransform.hpp - Whole-timeline adjustments applied after sync
// (intro padding, sped-up audio, trimmed lead-in)

#include "Lyrics.hpp"
#include "core/ConfigData.hpp"

namespace ks::sync {

class TimelineTransform {
public:
    // Adds delta to every timestamp; results below zero are clamped to zero
    static void shift(Timeline& lines, Seconds delta);

    // Audio played `speedFactor` times faster: every timestamp is divided
    static void scale(Timeline& lines, f64 speedFactor);

    // How much lead-in to cut so vocals start `leadIn` seconds in.
    // 0 when the first line starts before `threshold` or trimming is off.
    static Seconds leadInTrim(const Timeline& lines,
                              Seconds threshold,
                              Seconds leadIn);

    // trim -> scale -> intro shift; returns the trimmed amount
    static Seconds applyConfig(Timeline& lines, const TimelineConfig& cfg);
};

} // namespace ks::sync
