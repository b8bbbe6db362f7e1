#pragma once
// Lyrics.hpp - Structures for synced lyrics
// Reference lines in, recognizer words in, word-timed lines out.

#include <string>
#include <vector>
#include "util/Types.hpp"

namespace ks::sync {

// A lyric line whose text is trusted but whose start time may drift
struct ReferenceLine {
    std::string text;
    Seconds start_s{0.0};
};

// A word emitted by speech recognition; timing trusted, spelling not
struct RecognizedWord {
    std::string word;
    Seconds start_s{0.0};
    Seconds end_s{0.0};
};

// One recognizer segment; `words` may be empty when the recognizer gave no
// word-level detail
struct RecognizedSegment {
    std::string text;
    Seconds start_s{0.0};
    Seconds end_s{0.0};
    std::vector<RecognizedWord> words;
};

struct AlignedWord {
    std::string word;
    Seconds start_s{0.0};
    Seconds end_s{0.0};
    bool matched{false};
};

// Lifecycle of a line through the pipeline. Transitions only move forward.
enum class LineStage {
    Unaligned,
    PartiallyAligned,
    FullyTimed,
    Finalized
};

struct AlignedLine {
    std::string text;
    Seconds start_s{0.0};
    Seconds end_s{0.0};
    std::vector<AlignedWord> words;
    LineStage stage{LineStage::Unaligned};

    Seconds duration() const {
        return end_s - start_s;
    }
};

using Timeline = std::vector<AlignedLine>;

const char* toString(LineStage stage);

} // namespace ks::sync
