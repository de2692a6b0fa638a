#include "logging/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace astar::logging {

namespace {

constexpr const char* kLoggerName = "astar";

std::shared_ptr<spdlog::logger> createLogger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto log = spdlog::stdout_color_mt(kLoggerName);
    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%n][%l] %v");
    log->set_level(spdlog::level::warn);
    return log;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = createLogger();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace astar::logging
