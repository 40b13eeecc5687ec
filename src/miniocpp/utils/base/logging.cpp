#include "logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <cassert>
#include <cstdlib>
#include <mutex>
#include <string>

namespace miniocpp::logging {
/// @private
static std::shared_ptr<spdlog::logger> instance;

/// @private
static std::once_flag flag;

/**
 * @ingroup logging
 * @brief lazily initializes and returns the logger instance.
 */
spdlog::logger& debug_logger() {
  std::call_once(flag, []() {
    instance = spdlog::stdout_color_mt("miniocpp");
    instance->set_pattern("[%Y-%m-%d %T] [%^%l%$] %v");

#ifdef DEBUG_BUILD
    instance->set_level(spdlog::level::trace);
#else
    instance->set_level(spdlog::level::info);
#endif

    const char* env_variable = "LOG_LEVEL_OVERRIDE";
    const char* log_level = std::getenv(env_variable);
    if (log_level && !set_log_level(log_level)) {
      instance->error("failed to set log level from environment variable {}={}", env_variable,
                      log_level);
    }
  });

  assert(instance);
  return *instance;
}

bool set_log_level(std::string_view level) {
  const auto value = spdlog::level::from_str(std::string{level});
  if (value == spdlog::level::off && level != "off")
    return false;
  // `debug_logger()` may be the caller, during initialization
  if (instance)
    instance->set_level(value);
  else
    debug_logger().set_level(value);
  return true;
}

} // namespace miniocpp::logging
