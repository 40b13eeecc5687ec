#pragma once

#include "spdlog/spdlog.h"

#include <string_view>

/**
 * @defgroup logging Logging
 * @ingroup miniocpp-utils
 *
 * @see https://github.com/gabime/spdlog
 *
 * Thin wrappers over one shared, colored stdout `spdlog` logger, named "miniocpp".
 * The default level is info (trace in debug builds). It can be changed with
 * `--log-level` on either executable, or the `LOG_LEVEL_OVERRIDE` environment variable.
 */

namespace miniocpp::logging {
using logger_type = spdlog::logger;

logger_type& debug_logger();

/**
 * @brief Set the level of the debug logger from a string, like "info" or "trace".
 * @return false iff `level` is not a recognized spdlog level name.
 */
bool set_log_level(std::string_view level);

template <typename... Args>
inline void log_trace(logger_type& logger, fmt::format_string<Args...> fmt, Args&&... args) {
  logger.trace(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_debug(logger_type& logger, fmt::format_string<Args...> fmt, Args&&... args) {
  logger.debug(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_info(logger_type& logger, fmt::format_string<Args...> fmt, Args&&... args) {
  logger.info(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_warn(logger_type& logger, fmt::format_string<Args...> fmt, Args&&... args) {
  logger.warn(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_error(logger_type& logger, fmt::format_string<Args...> fmt, Args&&... args) {
  logger.error(fmt, std::forward<Args>(args)...);
}

} // namespace miniocpp::logging
