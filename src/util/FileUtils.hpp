/**
 * @file FileUtils.hpp
 * @brief Filesystem helpers shared by the locator and the logger.
 *
 * Standard directories follow the XDG base directory layout. Text I/O returns
 * Result values and never throws.
 */

#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "util/Result.hpp"

namespace cl {

namespace fs = std::filesystem;

namespace file {

// $XDG_CONFIG_HOME/<app> or ~/.config/<app>
fs::path configDir(std::string_view appName);
// Each entry of $XDG_CONFIG_DIRS (default /etc/xdg) joined with <app>
std::vector<fs::path> systemConfigDirs(std::string_view appName);
// $XDG_CACHE_HOME/<app> or ~/.cache/<app>
fs::path cacheDir(std::string_view appName);

bool exists(const std::string& path);
bool ensureDir(const fs::path& dir);

// Joins with a literal '/' on every platform. An empty directory yields the
// filename alone.
std::string joinPath(std::string_view directory, std::string_view filename);

Result<std::string> readText(const std::string& path);
// Writes through a ".tmp" sibling that is renamed over the target. An
// existing file under that name is left alone and a numbered name is used.
Result<void> writeText(const std::string& path, std::string_view text);

} // namespace file
} // namespace cl
