#pragma once

#include "miniocpp/utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>

namespace miniocpp::ocpp {

/**
 * @ingroup miniocpp-ocpp
 * @brief Periodically emits a liveness call: emit, then sleep for the current interval.
 *
 * The interval is read fresh at the start of each sleep; changing it does not
 * shorten (or extend) a sleep already in progress. Intervals below 1 are treated as 1, and
 * intervals too long for the steady clock are treated as the longest it can time.
 */
class LivenessScheduler : public std::enable_shared_from_this<LivenessScheduler> {
public:
  using IntervalFunction = std::function<int64_t()>;

private:
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  IntervalFunction interval_;
  thunk_type emit_;
  std::chrono::milliseconds unit_;
  int64_t max_interval_;
  std::atomic<bool> is_running_{false};
  std::atomic<uint64_t> emit_count_{0};
  uint64_t generation_{0}; ///< Bumped on every start; guarded by the strand

  void cycle_(uint64_t generation);

public:
  /**
   * @param io_context Where the timer runs.
   * @param interval Returns the current interval, in `unit`s.
   * @param emit Sends the liveness call; must not block.
   * @param unit The length of one interval step; seconds outside of testing.
   */
  LivenessScheduler(boost::asio::io_context& io_context, IntervalFunction interval,
                    thunk_type emit, std::chrono::milliseconds unit = std::chrono::seconds{1});

  /** @brief Emit now, and then after every interval. Does nothing if already running. */
  void start();

  /** @brief No more emits; the sleep in progress is cancelled. */
  void stop();

  bool is_running() const { return is_running_.load(std::memory_order_acquire); }
  int64_t max_interval() const { return max_interval_; }
  uint64_t emit_count() const { return emit_count_.load(std::memory_order_acquire); }
};

} // namespace miniocpp::ocpp
