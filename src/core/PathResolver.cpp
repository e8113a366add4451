#include "PathResolver.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace cl {

Result<std::string> PathResolver::resolve(const LocatorSettings& settings) {
    for (const auto& directory : settings.directories) {
        auto candidate = file::joinPath(directory, settings.filename);
        if (file::exists(candidate)) {
            LOG_DEBUG("Found {} in '{}'", settings.filename, directory);
            return Result<std::string>::ok(std::move(candidate));
        }
        LOG_TRACE("No {} in '{}'", settings.filename, directory);
    }

    if (settings.directories.empty())
        return Result<std::string>::ok(settings.filename);

    if (!settings.createIfMissing) {
        return Result<std::string>::err(
                settings.filename + " was not found in any of " +
                        std::to_string(settings.directories.size()) +
                        " directories",
                ErrorKind::NotFound);
    }

    auto path = file::joinPath(settings.directories.front(),
                               settings.filename);
    LOG_DEBUG("{} not found, will create it at {}", settings.filename, path);
    return Result<std::string>::ok(std::move(path));
}

} // namespace cl
