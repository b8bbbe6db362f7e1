#include "LrcParser.hpp"
#include <algorithm>
#include <charconv>
#include <regex>
#include <sstream>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace ks::lyrics {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Locale-independent; QCoreApplication may have switched LC_NUMERIC
Seconds toSeconds(const std::string& s) {
    Seconds value = 0.0;
    const char* begin = s.data();
    if (!s.empty() && s.front() == '+')
        ++begin;
    const auto [ptr, ec] = std::from_chars(begin, s.data() + s.size(), value);
    if (ec != std::errc())
        return 0.0;
    return value;
}

} // namespace

std::vector<sync::ReferenceLine> LrcParser::parse(const std::string& lrc) {
    static const std::regex timeTag(R"(^\[(\d+):(\d+(?:\.\d+)?)\])");
    static const std::regex offsetTag(R"(^\[offset:\s*([+-]?\d+)\s*\]$)",
                                      std::regex::icase);
    static const std::regex wordTag(R"(<\d+:\d+(?:\.\d+)?>)");

    std::vector<sync::ReferenceLine> lines;
    Seconds offset = 0.0;

    std::istringstream in(lrc);
    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = trim(raw);
        if (line.empty())
            continue;

        std::smatch match;
        if (std::regex_match(line, match, offsetTag)) {
            offset = toSeconds(match[1].str()) / 1000.0;
            continue;
        }

        std::vector<Seconds> starts;
        while (std::regex_search(line, match, timeTag)) {
            const Seconds minutes = toSeconds(match[1].str());
            const Seconds seconds = toSeconds(match[2].str());
            starts.push_back(minutes * 60.0 + seconds);
            line = match.suffix().str();
        }
        if (starts.empty())
            continue;

        std::string text = trim(std::regex_replace(line, wordTag, ""));
        if (text.empty())
            continue;

        for (Seconds start : starts)
            lines.push_back({text, start});
    }

    if (offset != 0.0) {
        // A positive offset shows lyrics earlier
        for (auto& l : lines)
            l.start_s = std::max(0.0, l.start_s - offset);
    }

    std::stable_sort(lines.begin(), lines.end(), [](const auto& a, const auto& b) {
        return a.start_s < b.start_s;
    });
    return lines;
}

Result<std::vector<sync::ReferenceLine>> LrcParser::parseFile(
        const std::filesystem::path& path) {
    auto text = file::readText(path);
    if (text.isErr())
        return Result<std::vector<sync::ReferenceLine>>::err(
                text.error().message);

    auto lines = parse(text.value());
    if (lines.empty()) {
        return Result<std::vector<sync::ReferenceLine>>::err(
                "No timed lyric lines in " + path.string());
    }
    LOG_INFO("LrcParser: {} lines from {}", lines.size(), path.string());
    return Result<std::vector<sync::ReferenceLine>>::ok(std::move(lines));
}

} // namespace ks::lyrics
