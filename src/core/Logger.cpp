#include "Logger.hpp"
#include <vector>
#include "util/FileUtils.hpp"

namespace ks {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::filesystem::path Logger::logFile_;

namespace {

spdlog::level::level_enum levelFor(bool debug) {
    return debug ? spdlog::level::debug : spdlog::level::info;
}

} // namespace

void Logger::init(std::string_view appName, bool debug) {
    const std::string name(appName);
    spdlog::drop(name);
    logFile_.clear();

    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("%^[%H:%M:%S.%e] [%l]%$ %v");
        sinks.push_back(console);

        auto logDir = file::cacheDir() / "logs";
        if (!file::ensureDir(logDir))
            throw spdlog::spdlog_ex("Cannot create log directory " +
                                    logDir.string());

        auto path = logDir / (name + ".log");
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), 1024 * 1024 * 5, 3);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(fileSink);

        logger_ = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logFile_ = path;
    } catch (const spdlog::spdlog_ex& ex) {
        logger_ = std::make_shared<spdlog::logger>(
                name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        logger_->warn("File logging disabled: {}", ex.what());
    }

    logger_->set_level(levelFor(debug));
    logger_->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger_);
    spdlog::set_default_logger(logger_);

    LOG_DEBUG("Logger initialized. Debug mode: {}", debug);
    if (!logFile_.empty())
        LOG_DEBUG("Log file: {}", logFile_.string());
}

void Logger::setDebug(bool debug) {
    get()->set_level(levelFor(debug));
}

const std::filesystem::path& Logger::logFile() {
    return logFile_;
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
    }
    logger_.reset();
    logFile_.clear();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!logger_) {
        init();
    }
    return logger_;
}

} // namespace ks
