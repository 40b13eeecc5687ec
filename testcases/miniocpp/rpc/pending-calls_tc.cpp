#include "miniocpp/rpc/pending-calls.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <thread>

namespace miniocpp::rpc::tests {

CATCH_TEST_CASE("pending-calls", "[pending-calls]") {
  PendingCalls calls;

  CATCH_SECTION("resolve exactly once") {
    auto waiter = calls.register_call("X", "Heartbeat");
    CATCH_REQUIRE(waiter.has_value());
    CATCH_REQUIRE(calls.size() == 1);

    std::atomic<int> counter{0};
    (*waiter)->set_completion([&counter](Status status, Json payload) {
      CATCH_REQUIRE(status.ok());
      CATCH_REQUIRE(payload["currentTime"] == "now");
      ++counter;
    });

    CATCH_REQUIRE(calls.resolve("X", Status{}, Json{{"currentTime", "now"}}));
    CATCH_REQUIRE_FALSE(calls.resolve("X", Status{StatusCode::INTERNAL}, Json{}));
    CATCH_REQUIRE(counter == 1);
    CATCH_REQUIRE(calls.size() == 0);

    const auto reply = (*waiter)->wait();
    CATCH_REQUIRE(reply.status.ok());
    CATCH_REQUIRE(reply.payload["currentTime"] == "now");
  }

  CATCH_SECTION("unknown ids are ignored") {
    auto x = calls.register_call("X", "Heartbeat");
    auto y = calls.register_call("Y", "Heartbeat");
    CATCH_REQUIRE(x.has_value());
    CATCH_REQUIRE(y.has_value());

    CATCH_REQUIRE_FALSE(calls.resolve("Z", Status{}));
    CATCH_REQUIRE(calls.size() == 2);
    CATCH_REQUIRE_FALSE((*x)->is_complete());
    CATCH_REQUIRE_FALSE((*y)->is_complete());

    CATCH_REQUIRE(calls.resolve("Y", Status{}));
    CATCH_REQUIRE_FALSE((*x)->is_complete());
    CATCH_REQUIRE((*y)->is_complete());
  }

  CATCH_SECTION("duplicate ids are refused") {
    auto x = calls.register_call("X", "Heartbeat");
    CATCH_REQUIRE(x.has_value());
    auto again = calls.register_call("X", "BootNotification");
    CATCH_REQUIRE_FALSE(again.has_value());
    CATCH_REQUIRE(again.error() == make_error_code(ecode::already_registered));
    CATCH_REQUIRE(calls.size() == 1);
  }

  CATCH_SECTION("close all") {
    auto x = calls.register_call("X", "Heartbeat");
    auto y = calls.register_call("Y", "GetConfiguration");
    CATCH_REQUIRE(calls.close_all(Status{StatusCode::UNAVAILABLE, "connection closed"}) == 2);
    CATCH_REQUIRE(calls.size() == 0);
    CATCH_REQUIRE((*x)->wait().status.error_code() == StatusCode::UNAVAILABLE);
    CATCH_REQUIRE((*y)->wait().status.error_code() == StatusCode::UNAVAILABLE);
    CATCH_REQUIRE(calls.close_all(Status{StatusCode::UNAVAILABLE}) == 0);
  }

  CATCH_SECTION("late completion handler") {
    auto x = calls.register_call("X", "Heartbeat");
    CATCH_REQUIRE(calls.resolve("X", Status{StatusCode::DEADLINE_EXCEEDED, "call timed out"}));

    bool is_called = false;
    (*x)->set_completion([&is_called](Status status, Json) {
      CATCH_REQUIRE(status.error_code() == StatusCode::DEADLINE_EXCEEDED);
      is_called = true;
    });
    CATCH_REQUIRE(is_called);
  }

  CATCH_SECTION("wait across threads") {
    auto x = calls.register_call("X", "Heartbeat");
    CATCH_REQUIRE_FALSE((*x)->wait_for(std::chrono::milliseconds{10}).has_value());

    std::thread resolver{[&calls]() {
      std::this_thread::sleep_for(std::chrono::milliseconds{20});
      calls.resolve("X", Status{}, Json{{"status", "Accepted"}});
    }};
    const auto reply = (*x)->wait_for(std::chrono::seconds{5});
    resolver.join();

    CATCH_REQUIRE(reply.has_value());
    CATCH_REQUIRE(reply->payload["status"] == "Accepted");
  }
}

} // namespace miniocpp::rpc::tests
