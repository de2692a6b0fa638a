#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace astar::logging {

/// Shared "astar" logger. Created on first use with a colored stdout
/// sink at level warn, unless the application registered its own logger
/// under that name beforehand.
std::shared_ptr<spdlog::logger> logger();

void setLogLevel(spdlog::level::level_enum level);

} // namespace astar::logging
