#include "TokenNormalizer.hpp"
#include <QChar>
#include <QString>

namespace ks::sync {

std::string TokenNormalizer::normalize(std::string_view word) {
    if (word.empty())
        return {};

    const QString text = QString::fromUtf8(word.data(),
                                           static_cast<qsizetype>(word.size()));
    QString out;
    out.reserve(text.size());

    for (qsizetype i = 0; i < text.size(); ++i) {
        char32_t cp = text.at(i).unicode();
        if (text.at(i).isHighSurrogate() && i + 1 < text.size() &&
            text.at(i + 1).isLowSurrogate()) {
            cp = QChar::surrogateToUcs4(text.at(i), text.at(i + 1));
            ++i;
        }

        if (!QChar::isLetterOrNumber(cp))
            continue;

        const char32_t lower = QChar::toLower(cp);
        if (QChar::requiresSurrogates(lower)) {
            out.append(QChar(QChar::highSurrogate(lower)));
            out.append(QChar(QChar::lowSurrogate(lower)));
        } else {
            out.append(QChar(static_cast<char16_t>(lower)));
        }
    }

    return out.toStdString();
}

std::size_t TokenNormalizer::tokenLength(std::string_view token) {
    std::size_t count = 0;
    for (char c : token) {
        // Count every byte that is not a UTF-8 continuation byte
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

std::vector<std::string> TokenNormalizer::splitWords(std::string_view text) {
    std::vector<std::string> words;
    std::size_t pos = 0;
    const auto isSpace = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
               c == '\v';
    };

    while (pos < text.size()) {
        while (pos < text.size() && isSpace(text[pos]))
            ++pos;
        std::size_t end = pos;
        while (end < text.size() && !isSpace(text[end]))
            ++end;
        if (end > pos)
            words.emplace_back(text.substr(pos, end - pos));
        pos = end;
    }
    return words;
}

} // namespace ks::sync
