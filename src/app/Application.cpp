#include "Application.hpp"
#include <QCommandLineParser>
#include <utility>
#include <iostream>
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "lyrics/ReferenceJson.hpp"
#include "lyrics/TimelineWriter.hpp"
#include "lyrics/TranscriptParser.hpp"
#include "sync/TimelineQuery.hpp"
#include "sync/TimelineTransform.hpp"
#include "sync/TimingSynchronizer.hpp"

namespace ks {

namespace {

fs::path toPath(const QString& s) {
    return fs::path(s.toStdString());
}

void reportProbe(const sync::Timeline& lines, Seconds t) {
    auto idx = sync::TimelineQuery::activeLineIndex(lines, t);
    if (!idx || *idx >= lines.size()) {
        LOG_INFO("At {:.2f}s: no line on screen", t);
        return;
    }
    const auto& line = lines[*idx];
    LOG_INFO("At {:.2f}s: line {} '{}' [{:.2f}s - {:.2f}s], wipe {:.0f}%",
             t,
             *idx,
             line.text,
             line.start_s,
             line.end_s,
             sync::TimelineQuery::wipeProgress(line, t) * 100.0);
}

} // namespace

Application::Application(int& argc, char** argv)
    : qapp_(std::make_unique<QCoreApplication>(argc, argv)) {
    QCoreApplication::setApplicationName("karasync");
    QCoreApplication::setApplicationVersion("1.0.0");
}

Application::~Application() {
    Logger::shutdown();
}

Result<AppOptions> Application::parseArgs() {
    QCommandLineParser parser;
    parser.setApplicationDescription(
            "Retimes reference lyrics with word timing from a speech "
            "recognizer transcript.");
    auto helpOption = parser.addHelpOption();
    auto versionOption = parser.addVersionOption();

    QCommandLineOption lyricsOpt({"l", "lyrics"},
                                 "Reference lyrics (.lrc or .json).",
                                 "file");
    QCommandLineOption transcriptOpt({"t", "transcript"},
                                     "Recognizer transcript (.json).",
                                     "file");
    QCommandLineOption outputOpt({"o", "output"},
                                 "Timeline JSON output (default: stdout).",
                                 "file");
    QCommandLineOption configOpt({"c", "config"}, "TOML config file.", "file");
    QCommandLineOption debugOpt({"d", "debug"}, "Verbose logging.");
    QCommandLineOption atOpt("at",
                             "Log the active line and wipe progress at a "
                             "playback time.",
                             "seconds");
    parser.addOptions(
            {lyricsOpt, transcriptOpt, outputOpt, configOpt, debugOpt, atOpt});

    if (!parser.parse(QCoreApplication::arguments())) {
        return Result<AppOptions>::err(parser.errorText().toStdString());
    }

    AppOptions opts;
    if (parser.isSet(helpOption) || parser.isSet(versionOption)) {
        std::cout << (parser.isSet(helpOption)
                              ? parser.helpText().toStdString()
                              : "karasync " +
                                        QCoreApplication::applicationVersion()
                                                .toStdString() +
                                        "\n");
        opts.helpShown = true;
        return Result<AppOptions>::ok(opts);
    }

    if (!parser.isSet(lyricsOpt) && !parser.isSet(transcriptOpt)) {
        return Result<AppOptions>::err(
                "Need --lyrics, --transcript, or both");
    }

    opts.lyricsPath = toPath(parser.value(lyricsOpt));
    opts.transcriptPath = toPath(parser.value(transcriptOpt));
    opts.outputPath = toPath(parser.value(outputOpt));
    opts.configPath = toPath(parser.value(configOpt));
    opts.debug = parser.isSet(debugOpt);

    if (parser.isSet(atOpt)) {
        bool ok = false;
        const double t = parser.value(atOpt).toDouble(&ok);
        if (!ok || t < 0.0) {
            return Result<AppOptions>::err("--at expects a non-negative "
                                           "number of seconds");
        }
        opts.probeTime = t;
    }

    return Result<AppOptions>::ok(opts);
}

Result<void> Application::init(const AppOptions& opts) {
    opts_ = opts;
    if (opts_.helpShown)
        return Result<void>::ok();

    Logger::init("karasync", opts_.debug);

    auto loaded = opts_.configPath.empty() ? CONFIG.loadDefault()
                                           : CONFIG.load(opts_.configPath);
    if (loaded.isErr())
        return loaded;

    if (CONFIG.debug() && !opts_.debug)
        Logger::setDebug(true);

    return Result<void>::ok();
}

int Application::exec() {
    if (opts_.helpShown)
        return 0;

    const auto& cfg = std::as_const(CONFIG);
    sync::TimingSynchronizer synchronizer(cfg.sync());

    std::vector<sync::RecognizedSegment> segments;
    if (!opts_.transcriptPath.empty()) {
        auto parsed = lyrics::TranscriptParser::parseFile(opts_.transcriptPath);
        if (parsed.isErr()) {
            LOG_ERROR("Cannot read transcript: {}", parsed.error().message);
            return 1;
        }
        segments = std::move(parsed).value();
    }

    sync::SyncResult result;
    if (!opts_.lyricsPath.empty()) {
        auto reference = lyrics::ReferenceJson::load(opts_.lyricsPath);
        if (reference.isErr()) {
            LOG_ERROR("Cannot read lyrics: {}", reference.error().message);
            return 1;
        }
        result = synchronizer.synchronize(
                reference.value(), lyrics::TranscriptParser::flatten(segments));
    } else {
        LOG_WARN("No reference lyrics given; using the transcript text as-is");
        result = synchronizer.fromSegments(segments);
    }

    const Seconds trimmed =
            sync::TimelineTransform::applyConfig(result.lines, cfg.timeline());
    if (trimmed > 0.0) {
        LOG_INFO("Audio lead-in should be trimmed by {:.2f}s to match the "
                 "timeline",
                 trimmed);
    }

    if (opts_.probeTime)
        reportProbe(result.lines, *opts_.probeTime);

    if (opts_.outputPath.empty()) {
        std::cout << lyrics::TimelineWriter::toJson(result.lines, cfg.output())
                             .toStdString();
        std::cout.flush();
        return std::cout ? 0 : 1;
    }

    auto written = lyrics::TimelineWriter::writeFile(
            opts_.outputPath, result.lines, cfg.output());
    if (written.isErr()) {
        LOG_ERROR("Cannot write timeline: {}", written.error().message);
        return 1;
    }
    return 0;
}

} // namespace ks
