/**
 * @file TimingSynchronizer.hpp
 * @brief Reference text + recognizer timing -> word-timed karaoke lines.
 *
 * Runs the full pipeline for one song:
 *   1. GlobalOffsetEstimator  - bulk drift correction
 *   2. LineWindowAligner      - per-line windowed matching
 *   3. GapInterpolator        - timing for unmatched words
 *   4. OverlapResolver        - minimum duration, no overlap
 *
 * A run never fails. Missing or mismatched input degrades timing quality
 * but always yields one output line per reference line. Each call works on
 * its own copies, so separate songs may be synchronized concurrently.
 */

#pragma once
#include <vector>
#include "GlobalOffsetEstimator.hpp"
#include "Lyrics.hpp"
#include "core/ConfigData.hpp"

namespace ks::sync {

struct SyncReport {
    OffsetEstimate offset;
    bool offsetApplied{false};
    std::size_t lineCount{0};
    std::size_t wordCount{0};
    std::size_t matchedWords{0};
    std::size_t interpolatedWords{0};
    std::size_t syntheticLines{0};
    std::size_t extendedLines{0};
    std::size_t pushedLines{0};
};

struct SyncResult {
    Timeline lines;
    SyncReport report;
};

class TimingSynchronizer {
public:
    explicit TimingSynchronizer(SyncConfig cfg = {});

    const SyncConfig& config() const {
        return cfg_;
    }

    SyncResult synchronize(const std::vector<ReferenceLine>& reference,
                           const std::vector<RecognizedWord>& recognized) const;

    // Fallback when no reference lyrics exist: recognizer segments become
    // the lines (text as heard), then go through overlap resolution.
    SyncResult fromSegments(const std::vector<RecognizedSegment>& segments) const;

    // Segment words, or an even per-word split of the segment text when the
    // recognizer gave none
    static std::vector<RecognizedWord> wordsOf(const RecognizedSegment& segment);

private:
    SyncConfig cfg_;
};

} // namespace ks::sync
