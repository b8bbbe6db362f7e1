/**
 * @file LineWindowAligner.hpp
 * @brief Per-line, time-windowed word alignment.
 *
 * Each reference line may only borrow timestamps from recognized words that
 * lie near its nominal position. Bounding the search stops a repeated chorus
 * word minutes away from being matched. Inside the window the line's tokens
 * are diffed against the candidate tokens and every equal run transfers its
 * timing.
 *
 * @section Dependencies
 * - SequenceMatcher
 * - TokenNormalizer
 */

#pragma once
#include <vector>
#include "Lyrics.hpp"
#include "core/ConfigData.hpp"

namespace ks::sync {

struct SearchWindow {
    Seconds start{0.0};
    Seconds end{0.0};
    // window_end was not after window_start and had to be widened
    bool clamped{false};
};

class LineWindowAligner {
public:
    static SearchWindow windowFor(const std::vector<ReferenceLine>& lines,
                                  std::size_t index,
                                  const SyncConfig& cfg);

    // Indices into `words` overlapping the window, in recognizer order
    static std::vector<std::size_t> candidatesIn(
            const std::vector<RecognizedWord>& words,
            const SearchWindow& window);

    // Words of the result keep zero timestamps where nothing matched
    static AlignedLine alignLine(const std::vector<ReferenceLine>& lines,
                                 std::size_t index,
                                 const std::vector<RecognizedWord>& words,
                                 const SyncConfig& cfg);
};

} // namespace ks::sync
