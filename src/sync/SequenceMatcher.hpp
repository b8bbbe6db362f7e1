/**
 * @file SequenceMatcher.hpp
 * @brief Longest-matching-block diff over token sequences.
 *
 * Finds the longest contiguous run shared by two token arrays, then recurses
 * on both sides of it to produce the full set of matching blocks and the
 * edit opcodes between them. Ties go to the block starting earliest in `a`,
 * then earliest in `b`, so results are deterministic.
 *
 * Used once over a whole song to estimate drift, and once per line to
 * transfer timestamps.
 */

#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace ks::sync {

struct MatchBlock {
    std::size_t a{0};
    std::size_t b{0};
    std::size_t size{0};

    bool operator==(const MatchBlock&) const = default;
};

enum class OpTag { Equal, Replace, Delete, Insert };

// Half-open ranges: a[a1, a2) turns into b[b1, b2)
struct Opcode {
    OpTag tag{OpTag::Equal};
    std::size_t a1{0};
    std::size_t a2{0};
    std::size_t b1{0};
    std::size_t b2{0};

    bool operator==(const Opcode&) const = default;
};

class SequenceMatcher {
public:
    SequenceMatcher(std::vector<std::string> a, std::vector<std::string> b);

    MatchBlock findLongestMatch() const;
    MatchBlock findLongestMatch(std::size_t alo,
                                std::size_t ahi,
                                std::size_t blo,
                                std::size_t bhi) const;

    // Sorted, adjacent blocks merged, terminated by {a.size(), b.size(), 0}
    std::vector<MatchBlock> matchingBlocks() const;

    std::vector<Opcode> opcodes() const;

private:
    std::vector<std::string> a_;
    std::vector<std::string> b_;
    // token -> ascending positions in b
    std::unordered_map<std::string, std::vector<std::size_t>> b2j_;
};

const char* toString(OpTag tag);

} // namespace ks::sync
