/**
 * @file PathResolver.hpp
 * @brief Locates a config file across an ordered list of directories.
 *
 * The first directory holding `{directory}/{filename}` wins. When nothing
 * matches, an empty directory list resolves to the bare filename and
 * createIfMissing resolves to the first directory; any other miss is a
 * NotFound error.
 *
 * @section Dependencies
 * - FileUtils
 */

#pragma once
#include <string>
#include <vector>
#include "util/Result.hpp"

namespace cl {

struct LocatorSettings {
    std::string filename;
    std::vector<std::string> directories;
    bool createIfMissing{false};
};

class PathResolver {
public:
    static Result<std::string> resolve(const LocatorSettings& settings);
};

} // namespace cl
