/**
 * @file TokenNormalizer.hpp
 * @brief Comparable tokens from lyric and recognizer words.
 *
 * Both sources spell the same word differently ("Don't" vs "dont,").
 * A token keeps only Unicode letters and digits, lowercased, so the two
 * can be compared for equality.
 *
 * @section Dependencies
 * - QtCore (QString / QChar Unicode tables)
 */

#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "util/Types.hpp"

namespace ks::sync {

class TokenNormalizer {
public:
    // May return an empty token; callers decide whether to drop it.
    static std::string normalize(std::string_view word);

    // Length of a token in code points, not bytes
    static std::size_t tokenLength(std::string_view token);

    // Whitespace split that keeps each word's surface form
    static std::vector<std::string> splitWords(std::string_view text);
};

} // namespace ks::sync
