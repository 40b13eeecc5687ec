#include "miniocpp/test-utils.hpp"

#include "miniocpp/net/asio-execution-context.hpp"
#include "miniocpp/ocpp/liveness-scheduler.hpp"

#include <boost/asio/io_context.hpp>

#include <catch2/catch.hpp>

#include <atomic>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace miniocpp::ocpp::tests {

using miniocpp::tests::wait_until;
using Clock = std::chrono::steady_clock;

class EmitLog {
private:
  mutable std::mutex padlock_;
  vector<Clock::time_point> times_;

public:
  void record() {
    std::lock_guard lock{padlock_};
    times_.push_back(Clock::now());
  }

  vector<Clock::time_point> times() const {
    std::lock_guard lock{padlock_};
    return times_;
  }

  std::size_t size() const {
    std::lock_guard lock{padlock_};
    return times_.size();
  }
};

CATCH_TEST_CASE("liveness-scheduler", "[liveness-scheduler]") {
  constexpr auto k_unit = std::chrono::milliseconds{20};

  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, 2};
  pool.run();

  auto log = std::make_shared<EmitLog>();
  auto interval = std::make_shared<std::atomic<int64_t>>(5);

  auto scheduler = std::make_shared<LivenessScheduler>(
      io_context, [interval]() { return interval->load(); }, [log]() { log->record(); }, k_unit);

  CATCH_SECTION("a new interval does not cut short the current sleep") {
    scheduler->start();
    scheduler->start(); // no-op
    CATCH_REQUIRE(scheduler->is_running());
    CATCH_REQUIRE(wait_until([&]() { return log->size() == 1; }));

    // Two units into the five unit sleep
    std::this_thread::sleep_for(2 * k_unit);
    interval->store(1);

    CATCH_REQUIRE(wait_until([&]() { return log->size() >= 3; }));
    scheduler->stop();

    const auto times = log->times();
    const auto first_sleep = times[1] - times[0];
    const auto second_sleep = times[2] - times[1];
    CATCH_REQUIRE(first_sleep >= 5 * k_unit);
    CATCH_REQUIRE(second_sleep >= k_unit);
    CATCH_REQUIRE(second_sleep < first_sleep);
  }

  CATCH_SECTION("stop") {
    interval->store(1);
    scheduler->start();
    CATCH_REQUIRE(wait_until([&]() { return log->size() >= 2; }));
    scheduler->stop();
    CATCH_REQUIRE_FALSE(scheduler->is_running());

    std::this_thread::sleep_for(2 * k_unit);
    const auto count = log->size();
    std::this_thread::sleep_for(5 * k_unit);
    CATCH_REQUIRE(log->size() == count);
    CATCH_REQUIRE(scheduler->emit_count() == count);
  }

  CATCH_SECTION("intervals below one are one") {
    interval->store(0);
    scheduler->start();
    CATCH_REQUIRE(wait_until([&]() { return log->size() >= 3; }));
    scheduler->stop();

    const auto times = log->times();
    CATCH_REQUIRE(times[1] - times[0] >= k_unit);
    CATCH_REQUIRE(times[2] - times[1] >= k_unit);
  }

  CATCH_SECTION("huge intervals sleep for the longest the clock can time") {
    using Duration = std::chrono::steady_clock::duration;
    CATCH_REQUIRE(scheduler->max_interval() > 0);
    CATCH_REQUIRE(scheduler->max_interval() <=
                  Duration::max() / std::chrono::duration_cast<Duration>(k_unit));

    interval->store(std::numeric_limits<int64_t>::max());
    scheduler->start();
    CATCH_REQUIRE(wait_until([&]() { return log->size() == 1; }));
    std::this_thread::sleep_for(10 * k_unit);
    CATCH_REQUIRE(log->size() == 1);
    scheduler->stop();
  }

  CATCH_SECTION("restarting runs a single schedule") {
    interval->store(2);
    scheduler->start();
    CATCH_REQUIRE(wait_until([&]() { return log->size() >= 1; }));
    for (auto i = 0; i < 20; ++i) {
      scheduler->stop();
      scheduler->start();
    }
    std::this_thread::sleep_for(3 * k_unit);

    const auto settled = log->size();
    CATCH_REQUIRE(wait_until([&]() { return log->size() >= settled + 4; }));
    scheduler->stop();

    const auto times = log->times();
    for (auto i = settled; i + 1 < times.size(); ++i)
      CATCH_REQUIRE(times[i + 1] - times[i] >= 2 * k_unit);
  }

  CATCH_SECTION("a failed emit does not stop the schedule") {
    auto failing = std::make_shared<LivenessScheduler>(
        io_context, []() { return int64_t{1}; },
        [log]() {
          log->record();
          throw std::runtime_error{"no connection"};
        },
        k_unit);
    failing->start();
    CATCH_REQUIRE(wait_until([&]() { return log->size() >= 3; }));
    failing->stop();
  }
}

} // namespace miniocpp::ocpp::tests
