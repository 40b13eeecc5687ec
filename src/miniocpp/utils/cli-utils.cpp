#include "cli-utils.hpp"

#include "base-include.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace miniocpp::cli {
// ---------------------------------------------------------------- safe-arg-str
/**
 * @ingroup cli
 * @brief Get the argument after `i` from command line arguments `argc` and
 *        `argv`. `i` must be in the range `[0..argc)`. If `i+1 == argc`
 *        then an exception is thrown.
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`.
 */
std::string safe_arg_str(int argc, char** argv, int& i) {
  if (i < 0 or i >= argc) throw std::out_of_range(fmt::format("argument index {} out of range", i));
  const string arg = argv[i];
  ++i;

  if (i >= argc)
    throw std::runtime_error(fmt::format("expected string after argument '{}'", arg));

  return std::string{argv[i]};
}

// ---------------------------------------------------------------- safe-arg-int
/**
 * @ingroup cli
 * @brief Parse the argument (as an integer) after `i` from command line
 *        arguments `argc` and `argv`. If `i+1 == argc`, or the argument
 *        cannot be parsed as a (possibly negative) integer, then an exception
 *        is thrown.
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc` or if `argv[i+1]` cannot be
 *   parsed as an integer.
 */
int safe_arg_int(int argc, char** argv, int& i) {
  if (i < 0 or i >= argc) throw std::out_of_range(fmt::format("argument index {} out of range", i));
  auto arg = argv[i];
  ++i;
  auto badness = (i >= argc);
  auto ret = 0;

  if (!badness) {
    char* end = nullptr;
    auto long_ret = strtol(argv[i], &end, 10);
    if (end == argv[i] or *end != '\0' or long_ret > std::numeric_limits<int>::max() or
        long_ret < std::numeric_limits<int>::lowest())
      badness = true;
    else
      ret = static_cast<int>(long_ret);
  }

  if (badness)
    throw std::runtime_error(fmt::format("expected integer after argument '{}'", arg));

  return ret;
}

bool is_help_switch(std::string_view arg) { return arg == "-h" or arg == "--help"; }

} // namespace miniocpp::cli
