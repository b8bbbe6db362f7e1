#include "LineWindowAligner.hpp"
#include <algorithm>
#include "SequenceMatcher.hpp"
#include "TokenNormalizer.hpp"
#include "core/Logger.hpp"

namespace ks::sync {

SearchWindow LineWindowAligner::windowFor(
        const std::vector<ReferenceLine>& lines,
        std::size_t index,
        const SyncConfig& cfg) {
    const Seconds nominalStart = lines[index].start_s;
    const Seconds nominalEnd = index + 1 < lines.size()
                                       ? lines[index + 1].start_s
                                       : nominalStart + cfg.defaultLineGap;

    SearchWindow window;
    window.start = std::max(0.0, nominalStart - cfg.windowMargin);
    window.end = nominalEnd + cfg.windowMargin;

    if (window.end <= window.start) {
        LOG_DEBUG("LineWindowAligner: degenerate window for line {} "
                  "([{:.2f}, {:.2f}]), widening by {:.2f}s",
                  index,
                  window.start,
                  window.end,
                  cfg.defaultLineGap);
        window.end = window.start + cfg.defaultLineGap;
        window.clamped = true;
    }
    return window;
}

std::vector<std::size_t> LineWindowAligner::candidatesIn(
        const std::vector<RecognizedWord>& words,
        const SearchWindow& window) {
    std::vector<std::size_t> indices;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (words[i].start_s < window.end && words[i].end_s > window.start)
            indices.push_back(i);
    }
    return indices;
}

AlignedLine LineWindowAligner::alignLine(
        const std::vector<ReferenceLine>& lines,
        std::size_t index,
        const std::vector<RecognizedWord>& words,
        const SyncConfig& cfg) {
    const ReferenceLine& ref = lines[index];

    AlignedLine line;
    line.text = ref.text;
    for (auto& w : TokenNormalizer::splitWords(ref.text))
        line.words.push_back({std::move(w), 0.0, 0.0, false});
    line.stage = LineStage::PartiallyAligned;

    const SearchWindow window = windowFor(lines, index, cfg);
    const auto pool = candidatesIn(words, window);
    if (pool.empty() || line.words.empty()) {
        LOG_DEBUG("LineWindowAligner: line {} has no candidates in "
                  "[{:.2f}, {:.2f}]",
                  index,
                  window.start,
                  window.end);
        return line;
    }

    // Empty tokens (pure punctuation) never take part in matching, so the
    // diff runs over filtered sequences and maps back through these indices.
    std::vector<std::string> refTokens;
    std::vector<std::size_t> refIndex;
    for (std::size_t i = 0; i < line.words.size(); ++i) {
        auto token = TokenNormalizer::normalize(line.words[i].word);
        if (token.empty())
            continue;
        refTokens.push_back(std::move(token));
        refIndex.push_back(i);
    }

    std::vector<std::string> asrTokens;
    std::vector<std::size_t> asrIndex;
    for (std::size_t idx : pool) {
        auto token = TokenNormalizer::normalize(words[idx].word);
        if (token.empty())
            continue;
        asrTokens.push_back(std::move(token));
        asrIndex.push_back(idx);
    }

    SequenceMatcher matcher(std::move(refTokens), std::move(asrTokens));
    std::size_t matchedCount = 0;
    for (const auto& op : matcher.opcodes()) {
        if (op.tag != OpTag::Equal)
            continue;
        const std::size_t count = std::min(op.a2 - op.a1, op.b2 - op.b1);
        for (std::size_t k = 0; k < count; ++k) {
            AlignedWord& target = line.words[refIndex[op.a1 + k]];
            const RecognizedWord& source = words[asrIndex[op.b1 + k]];
            target.start_s = source.start_s;
            target.end_s = source.end_s;
            target.matched = true;
            ++matchedCount;
        }
    }

    LOG_DEBUG("LineWindowAligner: line {} matched {}/{} words against {} "
              "candidates",
              index,
              matchedCount,
              line.words.size(),
              pool.size());
    return line;
}

} // namespace ks::sync
