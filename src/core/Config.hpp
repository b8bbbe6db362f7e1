/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * This file defines the Config class which provides a thread-safe singleton
 * for accessing and modifying application settings. It delegates parsing
 * to ConfigParsers and file I/O to ConfigLoader.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 *
 * @section Patterns
 * - Singleton: Global access point for configuration.
 * - Thread-Safe: Mutex-protected access to settings.
 */

#pragma once
#include <memory>
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace ks {

class Config {
public:
    static Config& instance();

    Result<void> load(const fs::path& path);
    Result<void> save(const fs::path& path) const;
    Result<void> loadDefault();

    // Restores built-in defaults for every section
    void reset();

    fs::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
        markDirty();
    }

    // Section accessors (const)
    const SyncConfig& sync() const {
        return sync_;
    }
    const TimelineConfig& timeline() const {
        return timeline_;
    }
    const OutputConfig& output() const {
        return output_;
    }

    // Section accessors (mutable)
    SyncConfig& sync() {
        markDirty();
        return sync_;
    }
    TimelineConfig& timeline() {
        markDirty();
        return timeline_;
    }
    OutputConfig& output() {
        markDirty();
        return output_;
    }

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    Config() = default;
    void markDirty() {
        dirty_ = true;
    }

    fs::path configPath_;
    bool dirty_{false};
    bool debug_{false};

    SyncConfig sync_;
    TimelineConfig timeline_;
    OutputConfig output_;

    mutable std::mutex mutex_;
};

#define CONFIG ks::Config::instance()

} // namespace ks
