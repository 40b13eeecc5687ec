#include "error-codes.hpp"

#include <string>

namespace miniocpp {
namespace {
/**
 * @private
 */
struct ECodeCategory : std::error_category {
  const char* name() const noexcept override;
  std::string message(int ev) const override;
};

/**
 * @private
 */
const char* ECodeCategory::name() const noexcept { return "miniocpp"; }

/**
 * @private
 */
std::string ECodeCategory::message(int e) const {
  switch (static_cast<ecode>(e)) {
  case ecode::okay: return "okay";
  case ecode::argument_error: return "argument error";
  case ecode::file_not_found: return "file not found";
  case ecode::fail: return "fail";
  case ecode::invalid_url: return "invalid url";
  case ecode::already_registered: return "already registered";
  }
  return "(unknown error)";
}

/**
 * @private
 */
static const ECodeCategory ecode_category{};
} // namespace

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), ecode_category}; }

} // namespace miniocpp
