/// @file src/core/logging.cpp
/// @brief Shared spdlog logger for the finplan engine.

#include "finplan/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace finplan::logging {

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_level(spdlog::level::warn);
        created->set_pattern("%Y-%m-%d %H:%M:%S - %^%l%$ - %v");
        return created;
    }();
    return instance;
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace finplan::logging
