#include "miniocpp/test-utils.hpp"

#include "miniocpp/net/asio-execution-context.hpp"
#include "miniocpp/rpc/rpc-agent.hpp"

#include <boost/asio/io_context.hpp>

#include <catch2/catch.hpp>

#include <atomic>
#include <stdexcept>

namespace miniocpp::rpc::tests {

using miniocpp::tests::wait_until;

// --------------------------------------------------------------------------------------- TestAgent

class TestAgent : public RpcAgent {
private:
  std::atomic<int> disconnect_count_{0};
  std::atomic<bool> is_second_reply_refused_{false};

public:
  TestAgent(boost::asio::io_context& io_context, std::chrono::milliseconds call_timeout)
      : RpcAgent{io_context, call_timeout} {}

  int disconnect_count() const { return disconnect_count_.load(); }
  bool is_second_reply_refused() const { return is_second_reply_refused_.load(); }

protected:
  void handle_call(std::shared_ptr<CallContext> context, const Json& payload) override {
    if (context->action() == "Echo") {
      context->finish_call(payload);
    } else if (context->action() == "Fail") {
      context->finish_error(call_error::k_generic_error, "failed on purpose");
    } else if (context->action() == "Throw") {
      throw std::runtime_error{"handler threw"};
    } else if (context->action() == "Twice") {
      const auto first = context->finish_call(Json{{"first", true}});
      const auto second = context->finish_call(Json{{"second", true}});
      is_second_reply_refused_ = first && !second && context->has_finished();
    } else if (context->action() == "Silent") {
      // Never answered
    } else {
      context->finish_error(call_error::k_not_implemented, context->action());
    }
  }

  void on_disconnect(uint16_t, std::string_view) override { ++disconnect_count_; }
};

// --------------------------------------------------------------------------------------- rpc-agent

CATCH_TEST_CASE("rpc-agent", "[rpc-agent]") {
  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, 2};
  pool.run();

  const auto timeout = std::chrono::milliseconds{250};
  auto server = std::make_shared<TestAgent>(io_context, timeout);
  auto client = std::make_shared<TestAgent>(io_context, timeout);
  net::connect_loopback(server, client, io_context);

  const auto shutdown = [&]() {
    client->close(1000, "done");
    CATCH_REQUIRE(wait_until([&]() { return client->is_closed() && server->is_closed(); }));
  };

  CATCH_SECTION("echo") {
    const auto payload = Json{{"key", Json::array({"HeartbeatInterval"})}};
    const auto reply = client->call("Echo", payload);
    CATCH_REQUIRE(reply.status.ok());
    CATCH_REQUIRE(reply.payload == payload);
    CATCH_REQUIRE(client->pending_call_count() == 0);

    // Both directions
    const auto back = server->call("Echo", Json{{"n", 7}});
    CATCH_REQUIRE(back.status.ok());
    CATCH_REQUIRE(back.payload["n"] == 7);
    shutdown();
  }

  CATCH_SECTION("call error") {
    const auto reply = client->call("Fail", Json::object());
    CATCH_REQUIRE(reply.status.error_code() == StatusCode::ABORTED);
    CATCH_REQUIRE(reply.status.error_message() == call_error::k_generic_error);
    CATCH_REQUIRE(reply.status.error_details() == "failed on purpose");
    shutdown();
  }

  CATCH_SECTION("a throwing handler replies InternalError") {
    const auto reply = client->call("Throw", Json::object());
    CATCH_REQUIRE(reply.status.error_code() == StatusCode::ABORTED);
    CATCH_REQUIRE(reply.status.error_message() == call_error::k_internal_error);
    CATCH_REQUIRE(reply.status.error_details() == "handler threw");

    // Still connected
    CATCH_REQUIRE(client->call("Echo", Json::object()).status.ok());
    shutdown();
  }

  CATCH_SECTION("one reply per call") {
    const auto reply = client->call("Twice", Json::object());
    CATCH_REQUIRE(reply.status.ok());
    CATCH_REQUIRE(reply.payload["first"] == true);
    CATCH_REQUIRE(server->is_second_reply_refused());
    shutdown();
  }

  CATCH_SECTION("deadline") {
    const auto started = std::chrono::steady_clock::now();
    const auto reply = client->call("Silent", Json::object());
    const auto elapsed = std::chrono::steady_clock::now() - started;
    CATCH_REQUIRE(reply.status.error_code() == StatusCode::DEADLINE_EXCEEDED);
    CATCH_REQUIRE(elapsed >= timeout);
    CATCH_REQUIRE(client->pending_call_count() == 0);
    shutdown();
  }

  CATCH_SECTION("malformed frames are dropped") {
    CATCH_REQUIRE(client->send_message(net::make_send_buffer("garbage")));
    CATCH_REQUIRE(client->send_message(net::make_send_buffer(R"([9, "1", {}])")));
    CATCH_REQUIRE(client->send_message(net::make_send_buffer(R"([3, "no-such-call", {}])")));
    CATCH_REQUIRE(client->call("Echo", Json{{"still", "open"}}).status.ok());
    CATCH_REQUIRE_FALSE(server->is_closed());
    shutdown();
  }

  CATCH_SECTION("close fails pending calls") {
    std::atomic<int> completions{0};
    auto waiter =
        client->perform_call("Silent", Json::object(), [&completions](Status status, Json) {
          if (status.error_code() == StatusCode::UNAVAILABLE)
            ++completions;
        });
    CATCH_REQUIRE(client->pending_call_count() == 1);

    server->close(1001, "going away");
    const auto reply = waiter->wait();
    CATCH_REQUIRE(reply.status.error_code() == StatusCode::UNAVAILABLE);
    CATCH_REQUIRE(wait_until([&]() { return completions.load() == 1; }));
    CATCH_REQUIRE(client->pending_call_count() == 0);

    CATCH_REQUIRE(wait_until([&]() { return client->is_closed() && server->is_closed(); }));
    CATCH_REQUIRE(client->disconnect_count() == 1);
    CATCH_REQUIRE(server->disconnect_count() == 1);
    CATCH_REQUIRE_FALSE(client->is_connected());

    // Calls after close fail right away
    const auto after = client->call("Echo", Json::object());
    CATCH_REQUIRE(after.status.error_code() == StatusCode::UNAVAILABLE);

    // Closing again is a no-op
    client->close();
    CATCH_REQUIRE(client->disconnect_count() == 1);
  }
}

} // namespace miniocpp::rpc::tests
