#include "OverlapResolver.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include "core/Logger.hpp"

namespace ks::sync {

void OverlapResolver::finalize(AlignedLine& line) {
    line.end_s = std::max(line.end_s, line.start_s);
    for (auto& w : line.words) {
        w.start_s = std::clamp(w.start_s, line.start_s, line.end_s);
        w.end_s = std::clamp(w.end_s, w.start_s, line.end_s);
    }
    line.stage = LineStage::Finalized;
}

ResolveStats OverlapResolver::resolve(Timeline& lines, const SyncConfig& cfg) {
    ResolveStats stats;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        AlignedLine& cur = lines[i];

        if (cur.end_s - cur.start_s < cfg.minLineDuration) {
            cur.end_s = cur.start_s + cfg.minLineDuration;
            // start + d may round to a sum whose difference falls short of d
            while (cur.end_s - cur.start_s < cfg.minLineDuration)
                cur.end_s = std::nextafter(
                        cur.end_s, std::numeric_limits<Seconds>::infinity());
            ++stats.extendedLines;
        }

        if (i + 1 < lines.size()) {
            AlignedLine& next = lines[i + 1];

            if (cur.end_s > next.start_s) {
                LOG_DEBUG("OverlapResolver: line {} pushed from {:.2f}s to "
                          "{:.2f}s",
                          i + 1,
                          next.start_s,
                          cur.end_s);
                next.start_s = cur.end_s;
                ++stats.pushedLines;
            }

            next.end_s = std::max(next.end_s, next.start_s + cfg.minPushedDuration);

            for (auto& w : next.words) {
                w.start_s = std::max(w.start_s, next.start_s);
                w.end_s = std::max(w.end_s, next.start_s);
            }
        }

        finalize(cur);
    }

    return stats;
}

} // namespace ks::sync
