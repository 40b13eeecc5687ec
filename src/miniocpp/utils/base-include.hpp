#pragma once

#include <tl/expected.hpp>

#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include "spdlog/spdlog.h"

#include <fmt/format.h>

#include "base/logging.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <unordered_map>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace miniocpp {
// -----------------------------------------------------------------------------

using tl::expected;
using tl::make_unexpected;
using tl::unexpected;

using thunk_type = std::function<void()>;

using std::string;
using std::unordered_map;
using std::vector;

using std::shared_ptr;

using std::cbegin;
using std::cend;

using std::error_code;

} // namespace miniocpp

#if defined __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#elif defined __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wvariadic-macros"
#endif

// --------------------------------------------------------------------- Logging

#ifdef DEBUG_BUILD
#define TRACE(fmt, ...)                                                                            \
  ::miniocpp::logging::log_trace(::miniocpp::logging::debug_logger(),                              \
                                 "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt, __FILE__,                   \
                                 __LINE__ __VA_OPT__(, ) __VA_ARGS__)

#define LOG_DEBUG(fmt, ...)                                                                        \
  ::miniocpp::logging::log_debug(::miniocpp::logging::debug_logger(),                              \
                                 "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt, __FILE__,                   \
                                 __LINE__ __VA_OPT__(, ) __VA_ARGS__)
#else
#define TRACE(fmt, ...)
#define LOG_DEBUG(fmt, ...)
#endif

#define INFO(fmt, ...)                                                                             \
  ::miniocpp::logging::log_info(::miniocpp::logging::debug_logger(),                               \
                                "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt, __FILE__,                    \
                                __LINE__ __VA_OPT__(, ) __VA_ARGS__)

#define WARN(fmt, ...)                                                                             \
  ::miniocpp::logging::log_warn(::miniocpp::logging::debug_logger(),                               \
                                "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt, __FILE__,                    \
                                __LINE__ __VA_OPT__(, ) __VA_ARGS__)

#define LOG_ERR(fmt, ...)                                                                          \
  ::miniocpp::logging::log_error(::miniocpp::logging::debug_logger(),                              \
                                 "[\x1b[4m\x1b[97m{}:{}\x1b[0m] " fmt, __FILE__,                   \
                                 __LINE__ __VA_OPT__(, ) __VA_ARGS__)

#if defined __clang__
#pragma clang diagnostic pop
#elif defined __GNUC__
#pragma GCC diagnostic pop
#endif
