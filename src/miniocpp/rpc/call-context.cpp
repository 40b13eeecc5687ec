#include "call-context.hpp"

#include "rpc-agent.hpp"

namespace miniocpp::rpc {

bool CallContext::mark_finished_() {
  std::lock_guard lock{padlock_};
  // Check if this has already been done
  if (has_finished_)
    return false;
  has_finished_ = true;
  return true;
}

bool CallContext::has_finished() const {
  std::lock_guard lock{padlock_};
  return has_finished_;
}

bool CallContext::finish_call(const Json& payload) {
  if (!mark_finished_())
    return false;
  return agent_->send_message(encode_result(id_, payload));
}

bool CallContext::finish_error(std::string_view error_code, std::string_view description) {
  if (!mark_finished_())
    return false;
  WARN("replying to '{}' ({}) with {}: {}", id_, action_, error_code, description);
  return agent_->send_message(encode_error(id_, error_code, description));
}

} // namespace miniocpp::rpc
