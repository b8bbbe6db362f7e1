#include "ReferenceJson.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <algorithm>
#include <cctype>
#include "LrcParser.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace ks::lyrics {

using Lines = std::vector<sync::ReferenceLine>;

Result<Lines> ReferenceJson::parse(const QByteArray& json) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (doc.isNull()) {
        return Result<Lines>::err("Reference lyrics are not valid JSON: " +
                                  parseError.errorString().toStdString());
    }

    QJsonArray rawLines;
    if (doc.isArray()) {
        rawLines = doc.array();
    } else if (doc.object()["lines"].isArray()) {
        rawLines = doc.object()["lines"].toArray();
    } else {
        return Result<Lines>::err("Reference lyrics have no 'lines' array");
    }

    Lines lines;
    for (const auto& val : rawLines) {
        if (!val.isObject())
            continue;
        QJsonObject obj = val.toObject();

        sync::ReferenceLine line;
        line.text = obj["text"].toString().trimmed().toStdString();
        if (line.text.empty())
            continue;

        if (obj["start"].isDouble())
            line.start_s = obj["start"].toDouble();
        else if (obj["start_s"].isDouble())
            line.start_s = obj["start_s"].toDouble();
        else
            continue;

        lines.push_back(std::move(line));
    }

    std::stable_sort(lines.begin(), lines.end(), [](const auto& a, const auto& b) {
        return a.start_s < b.start_s;
    });
    return Result<Lines>::ok(std::move(lines));
}

Result<Lines> ReferenceJson::parseFile(const std::filesystem::path& path) {
    auto text = file::readText(path);
    if (text.isErr())
        return Result<Lines>::err(text.error().message);
    return parse(QByteArray::fromStdString(text.value()));
}

Result<Lines> ReferenceJson::load(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    auto result = ext == ".json" ? parseFile(path) : LrcParser::parseFile(path);
    if (result.isOk() && result.value().empty())
        return Result<Lines>::err("No reference lines in " + path.string());
    return result;
}

} // namespace ks::lyrics
