#include "Logger.hpp"
#include <vector>
#include "util/FileUtils.hpp"

namespace cl {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::mutex Logger::mutex_;

namespace {
constexpr auto kConsolePattern = "%^[%H:%M:%S.%e] [%l]%$ %v";

// Unregistered, so it never replaces the host's loggers
std::shared_ptr<spdlog::logger> makeConsoleLogger(const std::string& name,
                                                  spdlog::level::level_enum level) {
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(kConsolePattern);
    auto logger = std::make_shared<spdlog::logger>(name, console);
    logger->set_level(level);
    return logger;
}
} // namespace

void Logger::init(std::string_view appName, bool debug) {
    std::lock_guard lock(mutex_);
    const std::string name(appName);
    auto level = debug ? spdlog::level::debug : spdlog::level::info;

    try {
        spdlog::drop(name);

        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern(kConsolePattern);
        sinks.push_back(console);

        auto logDir = file::cacheDir(appName) / "logs";
        if (!file::ensureDir(logDir))
            throw spdlog::spdlog_ex("cannot create " + logDir.string());

        auto logFile = logDir / (name + ".log");
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(), 1024 * 1024 * 5, 3);
        rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(rotating);

        logger_ = std::make_shared<spdlog::logger>(
                name, sinks.begin(), sinks.end());
        logger_->set_level(level);
        logger_->flush_on(level);

        spdlog::register_logger(logger_);
        spdlog::set_default_logger(logger_);

        logger_->debug("Logger initialized, log file: {}", logFile.string());

    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::drop(name);
        logger_ = makeConsoleLogger(name, level);
        logger_->warn("Failed to create file logger: {}", ex.what());
    }
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
    logger_.reset();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard lock(mutex_);
    if (!logger_) {
        logger_ = makeConsoleLogger("config-locator", spdlog::level::info);
    }
    return logger_;
}

} // namespace cl
