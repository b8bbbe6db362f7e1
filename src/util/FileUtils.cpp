#include "FileUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ks::file {

namespace {

constexpr const char* kAppDirName = "karasync";

fs::path xdgDir(const char* envVar, const char* homeFallback) {
    if (const char* xdg = std::getenv(envVar); xdg && *xdg) {
        return fs::path(xdg) / kAppDirName;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / homeFallback / kAppDirName;
    }
    return fs::temp_directory_path() / kAppDirName;
}

} // namespace

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache");
}

bool ensureDir(const fs::path& dir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec))
        return true;
    fs::create_directories(dir, ec);
    return !ec;
}

Result<std::string> readText(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::err("Cannot open file: " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Result<std::string>::err("Failed to read file: " +
                                        path.string());
    }
    return Result<std::string>::ok(ss.str());
}

Result<void> writeText(const fs::path& path, const std::string& contents) {
    fs::path tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out)
            return Result<void>::err("Cannot open file for writing: " +
                                     tempPath.string());
        out << contents;
        if (!out)
            return Result<void>::err("Failed to write file: " +
                                     tempPath.string());
    }
    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        return Result<void>::err("Failed to replace file: " + path.string());
    }
    return Result<void>::ok();
}

} // namespace ks::file
