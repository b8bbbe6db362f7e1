#include "TranscriptParser.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <algorithm>
#include "core/Logger.hpp"
#include "sync/TimingSynchronizer.hpp"
#include "util/FileUtils.hpp"

namespace ks::lyrics {

namespace {

using Segments = std::vector<sync::RecognizedSegment>;

bool readTime(const QJsonObject& obj, const char* key, const char* altKey,
              Seconds& out) {
    if (obj.contains(key) && obj[key].isDouble()) {
        out = obj[key].toDouble();
        return true;
    }
    if (obj.contains(altKey) && obj[altKey].isDouble()) {
        out = obj[altKey].toDouble();
        return true;
    }
    return false;
}

std::vector<sync::RecognizedWord> parseWords(const QJsonArray& rawWords) {
    std::vector<sync::RecognizedWord> words;
    for (const auto& val : rawWords) {
        if (!val.isObject())
            continue;
        QJsonObject w = val.toObject();

        sync::RecognizedWord rw;
        QString surface = w.contains("word") ? w["word"].toString()
                                             : w["text"].toString();
        rw.word = surface.trimmed().toStdString();
        if (rw.word.empty())
            continue;

        if (!readTime(w, "start", "start_s", rw.start_s))
            continue;
        if (!readTime(w, "end", "end_s", rw.end_s))
            continue;

        words.push_back(std::move(rw));
    }
    return words;
}

std::string joinWords(const std::vector<sync::RecognizedWord>& words) {
    std::string text;
    for (const auto& w : words) {
        if (!text.empty())
            text += ' ';
        text += w.word;
    }
    return text;
}

bool parseSegment(const QJsonObject& obj, sync::RecognizedSegment& seg) {
    seg.text = obj["text"].toString().trimmed().toStdString();
    if (obj["words"].isArray())
        seg.words = parseWords(obj["words"].toArray());

    const bool hasStart = readTime(obj, "start", "start_s", seg.start_s);
    const bool hasEnd = readTime(obj, "end", "end_s", seg.end_s);

    if (!seg.words.empty()) {
        if (!hasStart)
            seg.start_s = seg.words.front().start_s;
        if (!hasEnd)
            seg.end_s = seg.words.back().end_s;
        if (seg.text.empty())
            seg.text = joinWords(seg.words);
        return true;
    }

    // Without words the segment is usable only if it is timed and has text
    return hasStart && hasEnd && !seg.text.empty();
}

} // namespace

Result<Segments> TranscriptParser::parse(const QByteArray& json) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (doc.isNull()) {
        return Result<Segments>::err("Transcript is not valid JSON: " +
                                     parseError.errorString().toStdString());
    }

    Segments segments;
    QJsonArray rawSegments;

    if (doc.isArray()) {
        rawSegments = doc.array();
    } else {
        QJsonObject obj = doc.object();
        if (obj["segments"].isArray()) {
            rawSegments = obj["segments"].toArray();
        } else if (obj["words"].isArray()) {
            // Flat word list: treat the whole transcript as one segment
            sync::RecognizedSegment seg;
            if (parseSegment(obj, seg))
                segments.push_back(std::move(seg));
        } else {
            return Result<Segments>::err(
                    "Transcript has neither 'segments' nor 'words'");
        }
    }

    for (const auto& val : rawSegments) {
        if (!val.isObject())
            continue;
        sync::RecognizedSegment seg;
        if (parseSegment(val.toObject(), seg))
            segments.push_back(std::move(seg));
    }

    return Result<Segments>::ok(std::move(segments));
}

Result<Segments> TranscriptParser::parseFile(const std::filesystem::path& path) {
    auto text = file::readText(path);
    if (text.isErr())
        return Result<Segments>::err(text.error().message);

    auto result = parse(QByteArray::fromStdString(text.value()));
    if (result.isOk()) {
        LOG_INFO("TranscriptParser: {} segments from {}",
                 result.value().size(),
                 path.string());
    }
    return result;
}

std::vector<sync::RecognizedWord> TranscriptParser::flatten(
        const std::vector<sync::RecognizedSegment>& segments) {
    std::vector<sync::RecognizedWord> words;
    for (const auto& seg : segments) {
        auto segWords = sync::TimingSynchronizer::wordsOf(seg);
        for (auto& w : segWords) {
            w.end_s = std::max(w.end_s, w.start_s);
            words.push_back(std::move(w));
        }
    }

    // Sort just in case
    std::stable_sort(words.begin(), words.end(), [](const auto& a, const auto& b) {
        return a.start_s < b.start_s;
    });
    return words;
}

} // namespace ks::lyrics
