#include "GapInterpolator.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace ks::sync {

Seconds GapInterpolator::nominalEnd(const std::vector<ReferenceLine>& lines,
                                    std::size_t index,
                                    const SyncConfig& cfg) {
    if (index + 1 < lines.size())
        return lines[index + 1].start_s;
    return lines[index].start_s + cfg.lastLineDuration;
}

void GapInterpolator::distributeEvenly(std::vector<AlignedWord>& words,
                                       std::size_t first,
                                       std::size_t last,
                                       Seconds spanStart,
                                       Seconds spanEnd) {
    const std::size_t count = last - first;
    const Seconds step = (spanEnd - spanStart) / static_cast<Seconds>(count);
    for (std::size_t k = 0; k < count; ++k) {
        AlignedWord& w = words[first + k];
        w.start_s = spanStart + static_cast<Seconds>(k) * step;
        w.end_s = spanStart + static_cast<Seconds>(k + 1) * step;
        w.matched = true;
    }
}

FillResult GapInterpolator::fill(AlignedLine& line,
                                 Seconds nominalStart,
                                 Seconds nominalEnd,
                                 const SyncConfig& cfg) {
    FillResult result;
    auto& words = line.words;

    if (words.empty()) {
        line.start_s = nominalStart;
        line.end_s = std::max(nominalEnd, nominalStart);
        line.stage = LineStage::FullyTimed;
        return result;
    }

    const bool anyMatched = std::any_of(
            words.begin(), words.end(), [](const auto& w) { return w.matched; });

    if (!anyMatched) {
        Seconds span = nominalEnd - nominalStart;
        if (span <= 0.0)
            span = cfg.lastLineDuration;
        distributeEvenly(words, 0, words.size(), nominalStart, nominalStart + span);
        result.filledWords = words.size();
        result.synthetic = true;
    } else {
        Seconds lastEnd = nominalStart;
        std::size_t k = 0;
        while (k < words.size()) {
            if (words[k].matched) {
                lastEnd = words[k].end_s;
                ++k;
                continue;
            }

            std::size_t runEnd = k;
            while (runEnd < words.size() && !words[runEnd].matched)
                ++runEnd;

            const Seconds gapStart = lastEnd;
            Seconds gapEnd = runEnd < words.size() ? words[runEnd].start_s
                                                   : nominalEnd;
            gapEnd = std::max(gapEnd, gapStart + cfg.minGapDuration);

            distributeEvenly(words, k, runEnd, gapStart, gapEnd);
            result.filledWords += runEnd - k;
            lastEnd = words[runEnd - 1].end_s;
            k = runEnd;
        }
    }

    line.start_s = words.front().start_s;
    line.end_s = words.back().end_s;
    line.stage = LineStage::FullyTimed;
    return result;
}

} // namespace ks::sync
