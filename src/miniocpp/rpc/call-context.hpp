#pragma once

#include "envelope.hpp"

#include "miniocpp/utils.hpp"

#include <mutex>

namespace miniocpp::rpc {

class RpcAgent;

/**
 * @brief Context for a single inbound call, while it is being executed.
 *
 * Exactly one reply is sent per call: the first `finish_call` or `finish_error`
 * wins, and later attempts are ignored.
 */
class CallContext {
private:
  std::shared_ptr<RpcAgent> agent_;
  string id_;
  string action_;
  mutable std::mutex padlock_;
  bool has_finished_{false};

  bool mark_finished_();

public:
  CallContext(std::shared_ptr<RpcAgent> agent, string id, string action)
      : agent_{std::move(agent)}, id_{std::move(id)}, action_{std::move(action)} {}

  /**
   * @brief The id of the call, as chosen by the caller.
   */
  const string& id() const { return id_; }

  /**
   * @brief The action being called, e.g., "Heartbeat".
   */
  const string& action() const { return action_; }

  /**
   * @brief The agent that received the call.
   */
  RpcAgent& agent() const { return *agent_; }

  /**
   * @brief Return true iff a reply has been sent
   */
  bool has_finished() const;

  /**
   * @brief Sends a CallResult to the wire.
   * @return false if the call was already finished, or the connection is gone.
   */
  bool finish_call(const Json& payload);

  /**
   * @brief Sends a CallError to the wire.
   * @return false if the call was already finished, or the connection is gone.
   */
  bool finish_error(std::string_view error_code, std::string_view description);
};

} // namespace miniocpp::rpc
