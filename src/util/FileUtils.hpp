/**
 * @file FileUtils.hpp
 * @brief Filesystem helpers: XDG directories and whole-file text I/O.
 */

#pragma once
#include <filesystem>
#include <string>
#include "util/Result.hpp"

namespace ks::file {

namespace fs = std::filesystem;

// $XDG_CONFIG_HOME/karasync, falling back to ~/.config/karasync
fs::path configDir();

// $XDG_CACHE_HOME/karasync, falling back to ~/.cache/karasync
fs::path cacheDir();

bool ensureDir(const fs::path& dir);

Result<std::string> readText(const fs::path& path);
Result<void> writeText(const fs::path& path, const std::string& contents);

} // namespace ks::file
