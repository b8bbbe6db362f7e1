/**
 * @file Application.hpp
 * @brief Command line front end.
 *
 * Loads reference lyrics and a recognizer transcript, synchronizes them and
 * writes the timeline JSON to a file or stdout.
 *
 * @section Dependencies
 * - QtCore (QCoreApplication, QCommandLineParser)
 * - Config, Logger
 */

#pragma once
#include <QCoreApplication>
#include <filesystem>
#include <memory>
#include <optional>
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace ks {

namespace fs = std::filesystem;

struct AppOptions {
    fs::path lyricsPath;
    fs::path transcriptPath;
    fs::path outputPath; // empty -> stdout
    fs::path configPath;
    bool debug{false};
    bool helpShown{false};
    std::optional<Seconds> probeTime;
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    Result<AppOptions> parseArgs();
    Result<void> init(const AppOptions& opts);
    int exec();

private:
    std::unique_ptr<QCoreApplication> qapp_;
    AppOptions opts_;
};

} // namespace ks
