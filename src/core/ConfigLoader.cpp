#include "ConfigLoader.hpp"
#include <sstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace ks {

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());

        bool debug = config.debug();
        ConfigParsers::parseGeneral(tbl, debug);
        config.setDebug(debug);

        ConfigParsers::parseSync(tbl, config.sync());
        ConfigParsers::parseTimeline(tbl, config.timeline());
        ConfigParsers::parseOutput(tbl, config.output());

        config.markClean();
        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(std::string("Config parse error: ") +
                                 std::string(err.description()) + " (" +
                                 path.string() + ")");
    }
}

std::vector<fs::path> ConfigLoader::searchPaths() {
    return {file::configDir() / "config.toml",
            fs::path("/usr/share/karasync/config/default.toml")};
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    const auto candidates = searchPaths();
    for (const auto& path : candidates) {
        std::error_code ec;
        if (fs::exists(path, ec)) {
            config.configPath_ = path;
            return load(config, path);
        }
    }

    LOG_DEBUG("No config file found, using built-in defaults");
    config.configPath_ = candidates.front();
    return Result<void>::ok();
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    try {
        auto tbl = ConfigParsers::serialize(
                config.sync(), config.timeline(), config.output(), config.debug());
        std::ostringstream ss;
        ss << tbl;

        if (path.has_parent_path() && !file::ensureDir(path.parent_path()))
            return Result<void>::err("Cannot create config directory: " +
                                     path.parent_path().string());
        auto written = file::writeText(path, ss.str());
        if (written.isErr()) {
            LOG_ERROR("Failed to save config: {}", written.error().message);
            return written;
        }
        LOG_DEBUG("Config saved to: {}", path.string());
        return Result<void>::ok();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save config: {}", e.what());
        return Result<void>::err(std::string("Failed to save config: ") +
                                 e.what());
    }
}

} // namespace ks
