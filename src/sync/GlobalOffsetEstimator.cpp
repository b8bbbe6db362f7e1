#include "GlobalOffsetEstimator.hpp"
#include <cmath>
#include "SequenceMatcher.hpp"
#include "TokenNormalizer.hpp"
#include "core/Logger.hpp"

namespace ks::sync {

namespace {

struct TimedToken {
    std::string token;
    Seconds time;
};

bool isAnchorCandidate(const std::string& token, const SyncConfig& cfg) {
    return TokenNormalizer::tokenLength(token) >= cfg.minTokenLength;
}

std::vector<std::string> tokensOf(const std::vector<TimedToken>& timed) {
    std::vector<std::string> out;
    out.reserve(timed.size());
    for (const auto& t : timed)
        out.push_back(t.token);
    return out;
}

} // namespace

OffsetEstimate GlobalOffsetEstimator::estimate(
        const std::vector<ReferenceLine>& lines,
        const std::vector<RecognizedWord>& words,
        const SyncConfig& cfg) {
    std::vector<TimedToken> refTokens;
    for (const auto& line : lines) {
        for (const auto& w : TokenNormalizer::splitWords(line.text)) {
            auto token = TokenNormalizer::normalize(w);
            if (isAnchorCandidate(token, cfg))
                refTokens.push_back({std::move(token), line.start_s});
        }
    }

    std::vector<TimedToken> asrTokens;
    for (const auto& w : words) {
        auto token = TokenNormalizer::normalize(w.word);
        if (isAnchorCandidate(token, cfg))
            asrTokens.push_back({std::move(token), w.start_s});
    }

    if (refTokens.empty() || asrTokens.empty()) {
        LOG_DEBUG("GlobalOffsetEstimator: no anchor tokens (reference={}, "
                  "recognized={})",
                  refTokens.size(),
                  asrTokens.size());
        return {};
    }

    SequenceMatcher matcher(tokensOf(refTokens), tokensOf(asrTokens));
    const MatchBlock block = matcher.findLongestMatch();
    if (block.size == 0) {
        LOG_DEBUG("GlobalOffsetEstimator: no shared token run");
        return {};
    }

    OffsetEstimate result;
    result.anchorSize = block.size;
    result.referenceTime = refTokens[block.a].time;
    result.recognizedTime = asrTokens[block.b].time;
    result.offset = result.recognizedTime - result.referenceTime;

    LOG_DEBUG("GlobalOffsetEstimator: offset {:.2f}s (reference {:.2f}s, "
              "audio {:.2f}s, anchor '{}' x{})",
              result.offset,
              result.referenceTime,
              result.recognizedTime,
              refTokens[block.a].token,
              block.size);
    return result;
}

bool GlobalOffsetEstimator::shouldApply(const OffsetEstimate& estimate,
                                        const SyncConfig& cfg) {
    return estimate.found() &&
           std::abs(estimate.offset) > cfg.globalOffsetThreshold;
}

std::vector<ReferenceLine> GlobalOffsetEstimator::applyOffset(
        const std::vector<ReferenceLine>& lines,
        Seconds offset) {
    std::vector<ReferenceLine> shifted = lines;
    for (auto& line : shifted)
        line.start_s += offset;
    return shifted;
}

} // namespace ks::sync
