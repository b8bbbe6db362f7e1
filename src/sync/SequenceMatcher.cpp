#include "SequenceMatcher.hpp"
#include <algorithm>
#include <tuple>

namespace ks::sync {

SequenceMatcher::SequenceMatcher(std::vector<std::string> a,
                                 std::vector<std::string> b)
    : a_(std::move(a)), b_(std::move(b)) {
    for (std::size_t j = 0; j < b_.size(); ++j) {
        b2j_[b_[j]].push_back(j);
    }
}

MatchBlock SequenceMatcher::findLongestMatch() const {
    return findLongestMatch(0, a_.size(), 0, b_.size());
}

MatchBlock SequenceMatcher::findLongestMatch(std::size_t alo,
                                             std::size_t ahi,
                                             std::size_t blo,
                                             std::size_t bhi) const {
    MatchBlock best{alo, blo, 0};

    // j2len[j] = length of the match ending at a[i-1], b[j]
    std::unordered_map<std::size_t, std::size_t> j2len;
    std::unordered_map<std::size_t, std::size_t> newj2len;

    for (std::size_t i = alo; i < ahi; ++i) {
        newj2len.clear();
        auto it = b2j_.find(a_[i]);
        if (it != b2j_.end()) {
            for (std::size_t j : it->second) {
                if (j < blo)
                    continue;
                if (j >= bhi)
                    break;
                std::size_t k = 1;
                if (j > 0) {
                    auto prev = j2len.find(j - 1);
                    if (prev != j2len.end())
                        k = prev->second + 1;
                }
                newj2len[j] = k;
                if (k > best.size) {
                    best = {i + 1 - k, j + 1 - k, k};
                }
            }
        }
        std::swap(j2len, newj2len);
    }

    return best;
}

std::vector<MatchBlock> SequenceMatcher::matchingBlocks() const {
    struct Range {
        std::size_t alo, ahi, blo, bhi;
    };

    std::vector<MatchBlock> blocks;
    std::vector<Range> queue{{0, a_.size(), 0, b_.size()}};

    while (!queue.empty()) {
        Range r = queue.back();
        queue.pop_back();

        MatchBlock m = findLongestMatch(r.alo, r.ahi, r.blo, r.bhi);
        if (m.size == 0)
            continue;

        blocks.push_back(m);
        if (r.alo < m.a && r.blo < m.b)
            queue.push_back({r.alo, m.a, r.blo, m.b});
        if (m.a + m.size < r.ahi && m.b + m.size < r.bhi)
            queue.push_back({m.a + m.size, r.ahi, m.b + m.size, r.bhi});
    }

    std::sort(blocks.begin(), blocks.end(), [](const auto& x, const auto& y) {
        return std::tie(x.a, x.b, x.size) < std::tie(y.a, y.b, y.size);
    });

    std::vector<MatchBlock> merged;
    MatchBlock run{0, 0, 0};
    for (const auto& m : blocks) {
        if (run.a + run.size == m.a && run.b + run.size == m.b) {
            run.size += m.size;
        } else {
            if (run.size > 0)
                merged.push_back(run);
            run = m;
        }
    }
    if (run.size > 0)
        merged.push_back(run);

    merged.push_back({a_.size(), b_.size(), 0});
    return merged;
}

std::vector<Opcode> SequenceMatcher::opcodes() const {
    std::vector<Opcode> ops;
    std::size_t i = 0;
    std::size_t j = 0;

    for (const auto& m : matchingBlocks()) {
        if (i < m.a && j < m.b)
            ops.push_back({OpTag::Replace, i, m.a, j, m.b});
        else if (i < m.a)
            ops.push_back({OpTag::Delete, i, m.a, j, m.b});
        else if (j < m.b)
            ops.push_back({OpTag::Insert, i, m.a, j, m.b});

        i = m.a + m.size;
        j = m.b + m.size;
        if (m.size > 0)
            ops.push_back({OpTag::Equal, m.a, i, m.b, j});
    }

    return ops;
}

const char* toString(OpTag tag) {
    switch (tag) {
    case OpTag::Equal:
        return "equal";
    case OpTag::Replace:
        return "replace";
    case OpTag::Delete:
        return "delete";
    case OpTag::Insert:
        return "insert";
    }
    return "unknown";
}

} // namespace ks::sync
