#pragma once

#include "envelope.hpp"
#include "status.hpp"

#include "miniocpp/utils.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace miniocpp::rpc {

struct Reply {
  Status status{};
  Json payload{};
};

// -------------------------------------------------------------------------------------- CallWaiter

/**
 * @ingroup miniocpp-rpc
 * @brief The slot that an outbound call's reply is delivered to. Completes exactly once.
 *
 * The reply can be consumed with a completion handler (on whichever thread resolves the
 * call), or by blocking in `wait`. Never block on an io thread: the reply is delivered
 * by one.
 */
class CallWaiter {
public:
  using CompletionHandler = std::function<void(Status status, Json payload)>;

private:
  mutable std::mutex padlock_;
  std::condition_variable cv_;
  std::optional<Reply> reply_{};
  CompletionHandler completion_{};

public:
  /**
   * @brief Deliver the reply; wakes any waiters and runs the completion handler.
   * @return false iff the waiter was already complete, in which case nothing happens.
   */
  bool complete(Status status, Json payload);

  /**
   * @brief Runs `completion` when the reply arrives, or right away if it already has.
   */
  void set_completion(CompletionHandler completion);

  bool is_complete() const;

  /** @brief Block until the reply arrives */
  Reply wait();

  /** @brief Block until the reply arrives, or `timeout` elapses */
  std::optional<Reply> wait_for(std::chrono::milliseconds timeout);
};

// ------------------------------------------------------------------------------------ PendingCalls

/**
 * @ingroup miniocpp-rpc
 * @brief Outstanding outbound calls on one connection, by call id.
 */
class PendingCalls {
private:
  struct PendingCall {
    string action;
    std::chrono::steady_clock::time_point created_at;
    std::shared_ptr<CallWaiter> waiter;
  };

  mutable std::mutex padlock_;
  unordered_map<string, PendingCall> calls_;

public:
  /**
   * @brief Record a call, before its frame is sent.
   * @return The waiter, or `ecode::already_registered` if `id` is still outstanding.
   */
  expected<std::shared_ptr<CallWaiter>, error_code> register_call(string id, string action);

  /**
   * @brief Removes the call and completes its waiter.
   * @return false (and logs) if there's no outstanding call with `id`.
   */
  bool resolve(const string& id, Status status, Json payload = {});

  /**
   * @brief Completes every outstanding call with `status`.
   * @return The number of calls that were outstanding.
   */
  std::size_t close_all(const Status& status);

  std::size_t size() const;
};

} // namespace miniocpp::rpc
