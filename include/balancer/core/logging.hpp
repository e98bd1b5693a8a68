/* Access to the engine's spdlog logger. */
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace balancer::core {

// Returns the shared "balancer" logger, creating and registering it on first
// use. Levels honor SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=balancer=debug).
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

} // namespace balancer::core
