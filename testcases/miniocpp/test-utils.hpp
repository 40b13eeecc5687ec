#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace miniocpp::tests {

/**
 * @brief Polls `predicate` until it holds, or `timeout` passes.
 * @return The last value of `predicate`.
 */
inline bool wait_until(std::function<bool()> predicate,
                       std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline)
      return predicate();
    std::this_thread::sleep_for(std::chrono::milliseconds{2});
  }
  return true;
}

} // namespace miniocpp::tests
