#pragma once

/// @file include/finplan/logging.hpp
/// @brief Access to the engine-wide spdlog logger.
///
/// All modules log through one logger named `"finplan"`. A host application
/// may register its own logger under that name before first use (for example
/// to redirect output to a file); otherwise a stderr colour logger at `warn`
/// level is created on demand.

#include <spdlog/spdlog.h>

#include <memory>

namespace finplan::logging {

inline constexpr const char* LOGGER_NAME = "finplan";

/// The shared logger. Never null; safe to call from any thread.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Change the level of the shared logger.
void set_level(spdlog::level::level_enum level);

}  // namespace finplan::logging
