/**
 * @file ConfigLocator.hpp
 * @brief Typed config file lookup with default fallback.
 *
 * A ConfigLocator is built once through its Builder and is immutable
 * afterwards. load() resolves the file through PathResolver, decodes it with
 * the codec and, when the file is missing or unreadable, falls back to the
 * configured default. The default is written to the resolved path whenever
 * one exists; a failed write is logged and reported through
 * Loaded::persistError but never fails the load.
 *
 * Errors surfaced by load(): NotFound (resolution failed, no default) and
 * NoDefaultProvided (resolved file missing or invalid, no default).
 *
 * @section Dependencies
 * - PathResolver
 * - Codec (JsonCodec by default)
 * - FileUtils
 * - Logger
 *
 * @section Patterns
 * - Builder: settings are collected up front, then frozen by build().
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "Codec.hpp"
#include "JsonCodec.hpp"
#include "Logger.hpp"
#include "PathResolver.hpp"
#include "util/FileUtils.hpp"
#include "util/Result.hpp"

namespace cl {

enum class ConfigSource {
    File,             // decoded from the resolved file
    Default,          // default returned, nothing written
    PersistedDefault, // default returned and written to the resolved path
};

inline const char* toString(ConfigSource source) {
    switch (source) {
    case ConfigSource::File:
        return "file";
    case ConfigSource::Default:
        return "default";
    case ConfigSource::PersistedDefault:
        return "persisted default";
    }
    return "unknown";
}

template <typename T>
struct Loaded {
    T value;
    std::string path; // empty when resolution failed
    ConfigSource source{ConfigSource::File};
    std::optional<Error> persistError;
};

template <typename T, ConfigCodec<T> Codec = JsonCodec<T>>
class ConfigLocator {
public:
    class Builder {
    public:
        explicit Builder(std::string filename) {
            settings_.filename = std::move(filename);
        }

        Builder& directory(std::string dir) {
            settings_.directories.push_back(std::move(dir));
            return *this;
        }
        Builder& directories(const std::vector<std::string>& dirs) {
            settings_.directories.insert(
                    settings_.directories.end(), dirs.begin(), dirs.end());
            return *this;
        }
        Builder& userConfigDirectory(std::string_view appName) {
            return directory(file::configDir(appName).string());
        }
        Builder& systemConfigDirectories(std::string_view appName) {
            for (const auto& dir : file::systemConfigDirs(appName))
                directory(dir.string());
            return *this;
        }
        Builder& defaultValue(T value) {
            default_ = std::move(value);
            return *this;
        }
        Builder& createIfMissing(bool enabled = true) {
            settings_.createIfMissing = enabled;
            return *this;
        }

        ConfigLocator build() const {
            return ConfigLocator(settings_, default_);
        }

    private:
        LocatorSettings settings_;
        std::optional<T> default_;
    };

    const LocatorSettings& settings() const {
        return settings_;
    }
    bool hasDefault() const {
        return default_.has_value();
    }

    Result<std::string> resolvePath() const {
        return PathResolver::resolve(settings_);
    }

    Result<T> load() const {
        auto loaded = loadDetailed();
        if (!loaded)
            return Result<T>::err(loaded.error());
        return Result<T>::ok(std::move(loaded.value().value));
    }

    Result<Loaded<T>> loadDetailed() const {
        auto path = resolvePath();
        if (!path) {
            if (!default_) {
                LOG_WARN("{}", path.error().message);
                return Result<Loaded<T>>::err(path.error());
            }
            // No sanctioned location to write to: hand back the default only
            LOG_WARN("{}, using default config", path.error().message);
            return Result<Loaded<T>>::ok(
                    Loaded<T>{*default_, {}, ConfigSource::Default, {}});
        }

        auto text = file::readText(*path);
        if (text) {
            auto decoded = Codec::decode(*text);
            if (decoded) {
                LOG_INFO("Config loaded from: {}", *path);
                return Result<Loaded<T>>::ok(Loaded<T>{
                        std::move(*decoded), *path, ConfigSource::File, {}});
            }
            LOG_WARN("Ignoring {}: {}", *path, decoded.error().message);
        } else {
            LOG_DEBUG("{}", text.error().message);
        }

        return fallback(*path);
    }

    // Writes value to the resolved path, creating it only when
    // createIfMissing or an empty directory list allows it.
    Result<void> save(const T& value) const {
        auto path = resolvePath();
        if (!path)
            return Result<void>::err(path.error());
        return write(*path, value);
    }

private:
    ConfigLocator(LocatorSettings settings, std::optional<T> defaultValue)
        : settings_(std::move(settings)), default_(std::move(defaultValue)) {}

    Result<Loaded<T>> fallback(const std::string& path) const {
        if (!default_) {
            return Result<Loaded<T>>::err(
                    "No default config was provided for " +
                            settings_.filename,
                    ErrorKind::NoDefaultProvided);
        }

        Loaded<T> loaded{*default_, path, ConfigSource::Default, {}};
        auto written = write(path, *default_);
        if (written) {
            LOG_INFO("Wrote default config to {}", path);
            loaded.source = ConfigSource::PersistedDefault;
        } else {
            LOG_ERROR("Failed to persist default config: {}",
                      written.error().message);
            loaded.persistError = written.error();
        }
        return Result<Loaded<T>>::ok(std::move(loaded));
    }

    static Result<void> write(const std::string& path, const T& value) {
        auto encoded = Codec::encode(value);
        if (!encoded)
            return Result<void>::err(encoded.error());
        return file::writeText(path, *encoded);
    }

    LocatorSettings settings_;
    std::optional<T> default_;
};

} // namespace cl
