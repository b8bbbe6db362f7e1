/**
 * @file ConfigLoader.hpp
 * @brief Reads and writes the TOML config file.
 *
 * Lookup order when no path is given: the user's config directory, then
 * the system-wide default installed with the tool. With neither present
 * the built-in defaults stay in effect.
 *
 * @section Dependencies
 * - ConfigParsers (toml++)
 * - FileUtils
 */

#pragma once
#include <filesystem>
#include <vector>
#include "util/Result.hpp"

namespace ks {

class Config;

class ConfigLoader {
public:
    static Result<void> load(Config& config, const std::filesystem::path& path);
    static Result<void> save(const Config& config,
                             const std::filesystem::path& path);
    static Result<void> loadDefault(Config& config);

    // Candidate config files, most specific first
    static std::vector<std::filesystem::path> searchPaths();
};

} // namespace ks
