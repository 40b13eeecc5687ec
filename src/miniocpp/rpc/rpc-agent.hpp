#pragma once

#include "call-context.hpp"
#include "envelope.hpp"
#include "pending-calls.hpp"
#include "status.hpp"

#include "miniocpp/net/websockets/websocket-session.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace boost::asio {
class io_context;
}

namespace miniocpp::rpc {

/**
 * @ingroup miniocpp-rpc
 * @brief An `RpcAgent` can serve and send RPC calls on one connection.
 *
 * Inbound Calls are handed to `handle_call`. Inbound CallResults and CallErrors
 * resolve the matching outbound call. Malformed frames are logged and dropped;
 * the connection stays open.
 *
 * Every outbound call has a deadline (`call_timeout`), and is resolved exactly once:
 * with the reply, with DEADLINE_EXCEEDED, or with UNAVAILABLE when the connection
 * closes.
 */
class RpcAgent : public net::WebsocketSession, public std::enable_shared_from_this<RpcAgent> {
public:
  using CompletionHandler = CallWaiter::CompletionHandler;

private:
  boost::asio::io_context& io_context_;
  std::chrono::milliseconds call_timeout_;
  std::atomic<uint64_t> next_call_id_{1};
  PendingCalls pending_calls_;
  std::atomic<bool> is_closed_{false};

public:
  /**
   * @param io_context Where deadline timers run.
   * @param call_timeout The deadline for every outbound call.
   */
  RpcAgent(boost::asio::io_context& io_context, std::chrono::milliseconds call_timeout);
  ~RpcAgent() override;

  /**
   * @brief Sends a Call, registering it before the frame goes to the wire.
   * @param action The action to call, e.g., "GetConfiguration".
   * @param payload The call's payload.
   * @param completion Executed (once) with the outcome.
   * @return The waiter for the reply.
   */
  std::shared_ptr<CallWaiter> perform_call(std::string_view action, const Json& payload,
                                           CompletionHandler completion = nullptr);

  /**
   * @brief Sends a Call and blocks until the outcome is known.
   * @note Never call from an io thread: the reply and the deadline are both delivered by one.
   */
  Reply call(std::string_view action, const Json& payload);

  std::chrono::milliseconds call_timeout() const { return call_timeout_; }
  std::size_t pending_call_count() const { return pending_calls_.size(); }
  bool is_closed() const { return is_closed_.load(std::memory_order_acquire); }
  boost::asio::io_context& io_context() { return io_context_; }

  // @{ WebsocketSession
  void on_receive(std::span<const std::byte> payload) override;
  void on_close(uint16_t close_code, std::string_view reason) override;
  void on_error(net::WebsocketOperation operation, std::error_code ec) override;
  // @}

protected:
  /**
   * @brief Serve an inbound call. The call is answered through `context`,
   *        which may happen after this method returns.
   *
   * If this method throws, the caller is sent an `InternalError`.
   */
  virtual void handle_call(std::shared_ptr<CallContext> context, const Json& payload) = 0;

  /**
   * @brief The connection is gone, and all outstanding calls have been resolved.
   *        Called exactly once.
   */
  virtual void on_disconnect(uint16_t close_code, std::string_view reason) {}

private:
  void handle_call_(Envelope&& envelope);
  void handle_reply_(Envelope&& envelope);
};

} // namespace miniocpp::rpc
