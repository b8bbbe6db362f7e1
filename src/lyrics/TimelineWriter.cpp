#include "TimelineWriter.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace ks::lyrics {

QByteArray TimelineWriter::toJson(const sync::Timeline& lines,
                                  const OutputConfig& cfg) {
    QJsonArray linesArr;
    for (const auto& line : lines) {
        QJsonArray wordsArr;
        for (const auto& w : line.words) {
            QJsonObject wordObj{{"word", QString::fromStdString(w.word)},
                                {"start", w.start_s},
                                {"end", w.end_s}};
            if (cfg.includeMatched)
                wordObj.insert("matched", w.matched);
            wordsArr.append(wordObj);
        }

        linesArr.append(QJsonObject{{"text", QString::fromStdString(line.text)},
                                    {"start", line.start_s},
                                    {"end", line.end_s},
                                    {"words", wordsArr}});
    }

    QJsonObject root{{"lines", linesArr}};
    return QJsonDocument(root).toJson(cfg.pretty ? QJsonDocument::Indented
                                                 : QJsonDocument::Compact);
}

Result<void> TimelineWriter::writeFile(const std::filesystem::path& path,
                                       const sync::Timeline& lines,
                                       const OutputConfig& cfg) {
    if (path.has_parent_path() && !file::ensureDir(path.parent_path()))
        return Result<void>::err("Cannot create directory: " +
                                 path.parent_path().string());

    const QByteArray json = toJson(lines, cfg);
    auto written = file::writeText(path, json.toStdString());
    if (written.isOk())
        LOG_INFO("TimelineWriter: {} lines written to {}",
                 lines.size(),
                 path.string());
    return written;
}

} // namespace ks::lyrics
