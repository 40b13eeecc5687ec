#pragma once

#include <string>
#include <string_view>

/**
 * @defgroup cli Command Line Utils
 * @ingroup miniocpp-utils
 *
 * The `miniocpp` method for parsing command-line arguments: walk `argv`
 * by hand, and use these functions to safely consume the value that
 * follows a switch.
 */

namespace miniocpp::cli {
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i);

/**
 * @brief True iff `arg` is one of the switches `-h`, `--help`
 */
bool is_help_switch(std::string_view arg);

} // namespace miniocpp::cli
