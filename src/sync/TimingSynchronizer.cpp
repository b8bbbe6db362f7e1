#include "TimingSynchronizer.hpp"
#include <algorithm>
#include "GapInterpolator.hpp"
#include "LineWindowAligner.hpp"
#include "OverlapResolver.hpp"
#include "TokenNormalizer.hpp"
#include "core/Logger.hpp"

namespace ks::sync {

TimingSynchronizer::TimingSynchronizer(SyncConfig cfg) : cfg_(cfg) {}

SyncResult TimingSynchronizer::synchronize(
        const std::vector<ReferenceLine>& reference,
        const std::vector<RecognizedWord>& recognized) const {
    SyncResult result;
    auto& report = result.report;
    report.lineCount = reference.size();

    if (reference.empty()) {
        LOG_WARN("TimingSynchronizer: no reference lines, nothing to align");
        return result;
    }
    if (recognized.empty()) {
        LOG_WARN("TimingSynchronizer: no recognized words, falling back to "
                 "reference timing");
    }

    report.offset = GlobalOffsetEstimator::estimate(reference, recognized, cfg_);
    std::vector<ReferenceLine> lines;
    if (GlobalOffsetEstimator::shouldApply(report.offset, cfg_)) {
        LOG_INFO("TimingSynchronizer: applying global offset of {:.2f}s",
                 report.offset.offset);
        lines = GlobalOffsetEstimator::applyOffset(reference,
                                                   report.offset.offset);
        report.offsetApplied = true;
    } else {
        lines = reference;
    }

    result.lines.reserve(lines.size());
    for (std::size_t i = 0; i < lines.size(); ++i) {
        AlignedLine line = LineWindowAligner::alignLine(lines, i, recognized, cfg_);
        for (const auto& w : line.words) {
            if (w.matched)
                ++report.matchedWords;
        }
        report.wordCount += line.words.size();

        // A negative offset can move early nominal starts before zero
        const Seconds nominalStart = std::max(0.0, lines[i].start_s);
        const Seconds nominalEnd = std::max(
                0.0, GapInterpolator::nominalEnd(lines, i, cfg_));
        const auto fill =
                GapInterpolator::fill(line, nominalStart, nominalEnd, cfg_);
        report.interpolatedWords += fill.filledWords;
        if (fill.synthetic)
            ++report.syntheticLines;

        result.lines.push_back(std::move(line));
    }

    const auto stats = OverlapResolver::resolve(result.lines, cfg_);
    report.extendedLines = stats.extendedLines;
    report.pushedLines = stats.pushedLines;

    for (std::size_t i = 0; i < result.lines.size(); ++i) {
        const auto& l = result.lines[i];
        LOG_DEBUG("TimingSynchronizer: line {} {} [{:.2f}s, {:.2f}s] '{}'",
                  i,
                  toString(l.stage),
                  l.start_s,
                  l.end_s,
                  l.text);
    }

    if (!recognized.empty() && report.matchedWords == 0) {
        LOG_WARN("TimingSynchronizer: no reference word matched the "
                 "transcription; timing is approximate");
    }
    LOG_INFO("TimingSynchronizer: {} lines, {}/{} words matched, {} "
             "interpolated, {} lines without anchors, {} pushed",
             report.lineCount,
             report.matchedWords,
             report.wordCount,
             report.interpolatedWords,
             report.syntheticLines,
             report.pushedLines);
    return result;
}

SyncResult TimingSynchronizer::fromSegments(
        const std::vector<RecognizedSegment>& segments) const {
    SyncResult result;
    auto& report = result.report;

    for (const auto& seg : segments) {
        auto words = wordsOf(seg);
        if (words.empty())
            continue;

        AlignedLine line;
        line.text = seg.text;
        line.start_s = seg.start_s;
        line.end_s = std::max(seg.end_s, seg.start_s);
        for (auto& w : words) {
            line.words.push_back({std::move(w.word), w.start_s, w.end_s, true});
        }
        line.stage = LineStage::FullyTimed;

        report.wordCount += line.words.size();
        report.matchedWords += line.words.size();
        result.lines.push_back(std::move(line));
    }
    report.lineCount = result.lines.size();

    const auto stats = OverlapResolver::resolve(result.lines, cfg_);
    report.extendedLines = stats.extendedLines;
    report.pushedLines = stats.pushedLines;

    LOG_INFO("TimingSynchronizer: {} transcript lines used as-is (text may "
             "differ from the original lyrics)",
             report.lineCount);
    return result;
}

std::vector<RecognizedWord> TimingSynchronizer::wordsOf(
        const RecognizedSegment& segment) {
    if (!segment.words.empty())
        return segment.words;

    std::vector<RecognizedWord> words;
    const auto surface = TokenNormalizer::splitWords(segment.text);
    if (surface.empty())
        return words;

    const Seconds span = std::max(segment.end_s - segment.start_s, 0.0);
    const Seconds step = span / static_cast<Seconds>(surface.size());
    for (std::size_t i = 0; i < surface.size(); ++i) {
        words.push_back({surface[i],
                         segment.start_s + static_cast<Seconds>(i) * step,
                         segment.start_s + static_cast<Seconds>(i + 1) * step});
    }
    return words;
}

} // namespace ks::sync
