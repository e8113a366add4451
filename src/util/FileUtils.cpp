#include "FileUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cl::file {

namespace {
fs::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home);
    return fs::temp_directory_path();
}

// "<target>.tmp", or "<target>.tmp.N" when an unrelated file holds that name
fs::path tempSibling(const fs::path& target) {
    fs::path tempPath = target;
    tempPath += ".tmp";
    std::error_code ec;
    for (int n = 1; fs::exists(tempPath, ec); ++n) {
        tempPath = target;
        tempPath += ".tmp." + std::to_string(n);
    }
    return tempPath;
}

fs::path xdgDir(const char* var, const char* fallback) {
    if (const char* dir = std::getenv(var); dir && *dir)
        return fs::path(dir);
    return homeDir() / fallback;
}
} // namespace

fs::path configDir(std::string_view appName) {
    return xdgDir("XDG_CONFIG_HOME", ".config") / appName;
}

std::vector<fs::path> systemConfigDirs(std::string_view appName) {
    std::string dirs = "/etc/xdg";
    if (const char* env = std::getenv("XDG_CONFIG_DIRS"); env && *env)
        dirs = env;

    std::vector<fs::path> result;
    std::istringstream stream(dirs);
    std::string entry;
    while (std::getline(stream, entry, ':')) {
        if (entry.empty())
            continue;
        result.push_back(fs::path(entry) / appName);
    }
    return result;
}

fs::path cacheDir(std::string_view appName) {
    return xdgDir("XDG_CACHE_HOME", ".cache") / appName;
}

bool exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool ensureDir(const fs::path& dir) {
    if (dir.empty())
        return true;
    std::error_code ec;
    fs::create_directories(dir, ec);
    return !ec && fs::is_directory(dir, ec);
}

std::string joinPath(std::string_view directory, std::string_view filename) {
    if (directory.empty())
        return std::string(filename);

    std::string path(directory);
    if (path.back() != '/')
        path += '/';
    path += filename;
    return path;
}

Result<std::string> readText(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        return Result<std::string>::err("Failed to open " + path,
                                        ErrorKind::Io);

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad())
        return Result<std::string>::err("Failed to read " + path,
                                        ErrorKind::Io);
    return Result<std::string>::ok(contents.str());
}

Result<void> writeText(const std::string& path, std::string_view text) {
    fs::path target(path);
    if (!ensureDir(target.parent_path()))
        return Result<void>::err(
                "Failed to create directory " + target.parent_path().string(),
                ErrorKind::Io);

    auto tempPath = tempSibling(target);
    std::error_code ec;
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file)
            return Result<void>::err("Failed to open " + tempPath.string(),
                                     ErrorKind::Io);
        file.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!file.flush()) {
            file.close();
            fs::remove(tempPath, ec);
            return Result<void>::err("Failed to write " + tempPath.string(),
                                     ErrorKind::Io);
        }
    }

    fs::rename(tempPath, target, ec);
    if (ec) {
        auto message = "Failed to replace " + path + ": " + ec.message();
        fs::remove(tempPath, ec);
        return Result<void>::err(std::move(message), ErrorKind::Io);
    }
    return Result<void>::ok();
}

} // namespace cl::file
