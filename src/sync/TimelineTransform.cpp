#include "TimelineTransform.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace ks::sync {

namespace {

template <typename Fn>
void forEachTimestamp(Timeline& lines, Fn&& fn) {
    for (auto& line : lines) {
        fn(line.start_s);
        fn(line.end_s);
        for (auto& w : line.words) {
            fn(w.start_s);
            fn(w.end_s);
        }
    }
}

} // namespace

void TimelineTransform::shift(Timeline& lines, Seconds delta) {
    if (delta == 0.0)
        return;
    forEachTimestamp(lines, [delta](Seconds& t) { t = std::max(0.0, t + delta); });
}

void TimelineTransform::scale(Timeline& lines, f64 speedFactor) {
    if (speedFactor <= 0.0 || speedFactor == 1.0)
        return;
    forEachTimestamp(lines, [speedFactor](Seconds& t) { t /= speedFactor; });
}

Seconds TimelineTransform::leadInTrim(const Timeline& lines,
                                      Seconds threshold,
                                      Seconds leadIn) {
    if (threshold <= 0.0 || lines.empty())
        return 0.0;
    const Seconds firstStart = lines.front().start_s;
    if (firstStart <= threshold)
        return 0.0;
    return std::max(0.0, firstStart - leadIn);
}

Seconds TimelineTransform::applyConfig(Timeline& lines,
                                       const TimelineConfig& cfg) {
    const Seconds trim = leadInTrim(lines, cfg.trimThreshold, cfg.trimLeadIn);
    if (trim > 0.0) {
        LOG_INFO("TimelineTransform: long intro, trimming {:.2f}s of lead-in",
                 trim);
        shift(lines, -trim);
    }
    if (cfg.speedFactor != 1.0) {
        LOG_INFO("TimelineTransform: scaling timestamps by {}", cfg.speedFactor);
        scale(lines, cfg.speedFactor);
    }
    if (cfg.introOffset != 0.0) {
        LOG_INFO("TimelineTransform: shifting by {:.2f}s for intro",
                 cfg.introOffset);
        shift(lines, cfg.introOffset);
    }
    return trim;
}

} // namespace ks::sync
