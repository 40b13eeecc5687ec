#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup miniocpp-utils
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // Schema file missing!
 * return make_error_code(ecode::file_not_found);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace miniocpp {
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of miniocpp error codes.
 */
enum class ecode : int {
  okay = 0,          //!< i.e., everything's okay.
  argument_error,    //!< An invalid argument was supplied.
  file_not_found,    //!< A file (schema, config) does not exist.
  fail,              //!< I/O stream set the `fail` bit.
  invalid_url,       //!< A `ws://` url could not be parsed.
  already_registered //!< An identifier is already in use.
};
} // namespace miniocpp

namespace std {
template <> struct is_error_code_enum<miniocpp::ecode> : true_type {};
} // namespace std

namespace miniocpp {
error_code make_error_code(ecode);
} // namespace miniocpp
