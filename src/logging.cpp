/*
  Engine logger — a single spdlog logger named "balancer".

  The logger is registered with spdlog's registry so that a host process can
  look it up by name and attach its own sinks or change its level. When the
  host registered one first, that instance is used as is.
*/
#include "balancer/core/logging.hpp"
#include "balancer/core/constants.hpp"

#include <string>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace balancer::core {

namespace {

std::shared_ptr<spdlog::logger> make_logger() {
  const std::string name(kLoggerName);
  if (auto existing = spdlog::get(name)) return existing;
  auto lg = spdlog::stderr_color_mt(name);
  lg->set_level(spdlog::level::warn);
  // SPDLOG_LEVEL overrides the default, e.g. SPDLOG_LEVEL=balancer=debug
  spdlog::cfg::load_env_levels();
  return lg;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
  // Function-local static: initialized once, thread-safe.
  static std::shared_ptr<spdlog::logger> lg = make_logger();
  return lg;
}

} // namespace balancer::core
