#include "Config.hpp"
#include "ConfigLoader.hpp"

namespace ks {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result<void> Config::load(const fs::path& path) {
    std::lock_guard lock(mutex_);
    configPath_ = path;
    return ConfigLoader::load(*this, path);
}

Result<void> Config::loadDefault() {
    std::lock_guard lock(mutex_);
    return ConfigLoader::loadDefault(*this);
}

Result<void> Config::save(const fs::path& path) const {
    std::lock_guard lock(mutex_);
    return ConfigLoader::save(*this, path);
}

void Config::reset() {
    std::lock_guard lock(mutex_);
    sync_ = SyncConfig{};
    timeline_ = TimelineConfig{};
    output_ = OutputConfig{};
    debug_ = false;
    dirty_ = false;
}

} // namespace ks
