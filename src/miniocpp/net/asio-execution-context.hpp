#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cassert>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace miniocpp::net {

/**
 * @defgroup miniocpp-asio-beast Asio/Beast
 *
 * We use Asio for two things: an execution context, and managing timers.
 * Beast is used to manage websockets and the admin http server.
 */

/**
 * @brief Type erase the underlying boost::asio::io_context
 *
 * A work guard keeps the pool threads alive while there is no outstanding
 * work (e.g., a session that is idle between heartbeats). Call `stop()`
 * to release the threads.
 */
class AsioExecutionContext {
public:
  using ExecutorType = boost::asio::io_context::executor_type;
  using SteadyTimerType = boost::asio::steady_timer;

private:
  boost::asio::io_context& io_context_;
  std::size_t size_;
  std::vector<std::thread> pool_;
  std::optional<boost::asio::executor_work_guard<ExecutorType>> work_guard_;

public:
  AsioExecutionContext(boost::asio::io_context& io_context, std::size_t thread_pool_size = 0)
      : io_context_{io_context}, size_{thread_pool_size == 0 ? std::thread::hardware_concurrency()
                                                             : thread_pool_size} {
    if (size_ == 0)
      size_ = 1;
    pool_.reserve(size_);
  }

  AsioExecutionContext(const AsioExecutionContext&) = delete;
  AsioExecutionContext& operator=(const AsioExecutionContext&) = delete;

  ~AsioExecutionContext() {
    stop();
    join();
  }

  /** @brief Run the pool */
  void run() {
    assert(!is_running());
    work_guard_.emplace(io_context_.get_executor());
    for (std::size_t i = 0; i < size_; ++i)
      pool_.emplace_back([this]() { io_context_.run(); });
  }

  /** @brief Stop the io_context; pool threads return as soon as their current handler finishes */
  void stop() {
    work_guard_.reset();
    io_context_.stop();
  }

  /** @brief Wait for the pool threads to exit */
  void join() {
    for (auto& thread : pool_)
      if (thread.joinable())
        thread.join();
    pool_.clear();
  }

  /** @brief true iff the execution context is running */
  bool is_running() const noexcept { return pool_.size() > 0; }

  /** @brief Create a new steady timer bound to this execution context */
  SteadyTimerType make_steady_timer() const { return SteadyTimerType{io_context_}; }
};

} // namespace miniocpp::net
