#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace miniocpp::rpc {

/**
 * @ingroup miniocpp-rpc
 * @brief The outcome of an outbound call, as seen by the caller.
 */
enum class StatusCode : int8_t {
  OK = 0,
  INVALID_ARGUMENT,  // Could not encode the request
  DEADLINE_EXCEEDED, // No reply before the deadline
  ABORTED,           // The peer replied with a CallError
  INTERNAL,          // The reply could not be understood
  UNAVAILABLE        // The connection is not open, or closed while the call was pending
};

constexpr std::string_view str(StatusCode code) {
#define CASE(x)                                                                                    \
  case StatusCode::x:                                                                              \
    return #x
  switch (code) {
    CASE(OK);
    CASE(INVALID_ARGUMENT);
    CASE(DEADLINE_EXCEEDED);
    CASE(ABORTED);
    CASE(INTERNAL);
    CASE(UNAVAILABLE);
  }
#undef CASE
  return "<unknown case>";
}

class Status {
private:
  std::string error_message_{};
  std::string error_details_{};
  StatusCode status_code_{StatusCode::OK};

public:
  Status(StatusCode status_code = StatusCode::OK, std::string error_message = "",
         std::string error_details = "")
      : error_message_{std::move(error_message)}, error_details_{std::move(error_details)},
        status_code_{status_code} {}

  StatusCode error_code() const { return status_code_; }

  /** @brief For ABORTED, the peer's `errorCode` */
  std::string_view error_message() const { return error_message_; }

  /** @brief For ABORTED, the peer's `errorDescription` */
  std::string_view error_details() const { return error_details_; }

  bool ok() const { return status_code_ == StatusCode::OK; }

  bool operator==(const Status& o) const {
    return (status_code_ == o.status_code_) && (error_message_ == o.error_message_) &&
           (error_details_ == o.error_details_);
  }
  bool operator!=(const Status& o) const { return !(*this == o); }
};

} // namespace miniocpp::rpc
