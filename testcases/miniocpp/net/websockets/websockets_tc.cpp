#include "miniocpp/test-utils.hpp"

#include "miniocpp/net/asio-execution-context.hpp"
#include "miniocpp/net/websockets/websocket-server.hpp"

#include <boost/asio/io_context.hpp>

#include <catch2/catch.hpp>

#include <atomic>
#include <mutex>

namespace miniocpp::net::tests {

using miniocpp::tests::wait_until;

// ----------------------------------------------------------------------------------- ServerSession

class ServerSession : public net::WebsocketSession {
public:
  void on_connect() override { INFO("server created a new connection"); }

  void on_receive(std::span<const std::byte> payload) override {
    INFO("server received: {}", to_string_view(payload));
    send_message(net::make_send_buffer(net::to_string_view(payload)));
  }

  void on_close(uint16_t code, std::string_view reason) override {
    INFO("server closing session, code={}, reason='{}'", code, reason);
  }

  void on_error(net::WebsocketOperation operation, std::error_code ec) override {
    LOG_ERR("server error on op={}: {}", str(operation), ec.message());
  }
};

// ---------------------------------------------------------------------------------- Session Client

class SessionClient : public net::WebsocketSession {
private:
  mutable std::mutex padlock_;
  vector<string> received_;
  std::atomic<bool> is_closed_{false};
  std::atomic<bool> has_error_{false};

public:
  void on_connect() override {
    INFO("client connected");
    send_message(net::make_send_buffer("Hello"));
    send_message(net::make_send_buffer("World!"));
  }

  void on_receive(std::span<const std::byte> payload) override {
    INFO("client received: {}", to_string_view(payload));
    std::size_t count = 0;
    {
      std::lock_guard lock{padlock_};
      received_.emplace_back(to_string_view(payload));
      count = received_.size();
    }
    if (count == 2)
      close(1000, "orderly shutdown");
  }

  void on_close(uint16_t code, std::string_view reason) override {
    INFO("client closing session, code={}, reason='{}'", code, reason);
    is_closed_ = true;
  }

  void on_error(net::WebsocketOperation operation, std::error_code ec) override {
    LOG_ERR("error on op={}: {}", str(operation), ec.message());
    has_error_ = true;
  }

  vector<string> received() const {
    std::lock_guard lock{padlock_};
    return received_;
  }
  bool is_closed() const { return is_closed_.load(); }
  bool has_error() const { return has_error_.load(); }
};

// ------------------------------------------------------------------------------- websockets-server

CATCH_TEST_CASE("websockets-server", "[websockets-server]") {
  constexpr uint16_t k_port = 28081;

  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, 2};

  net::WebsocketServer::Config config;
  config.address = "127.0.0.1";
  config.port = k_port;
  config.session_factory = []() { return std::make_shared<ServerSession>(); };

  auto server = net::WebsocketServer{io_context, config};
  CATCH_REQUIRE_FALSE(server.run());

  pool.run();

  CATCH_SECTION("echo, in order, then close") {
    auto client = std::make_shared<SessionClient>();
    net::connect(client, io_context, "localhost", k_port, "/CP-1");

    CATCH_REQUIRE(wait_until([&]() { return client->is_closed(); }));
    CATCH_REQUIRE_FALSE(client->has_error());
    const auto expected_messages = vector<string>{"Hello", "World!"};
    CATCH_REQUIRE(client->received() == expected_messages);
    CATCH_REQUIRE_FALSE(client->is_connected());
  }

  CATCH_SECTION("connection refused") {
    auto client = std::make_shared<SessionClient>();
    net::connect(client, io_context, "127.0.0.1", k_port + 1);

    CATCH_REQUIRE(wait_until([&]() { return client->has_error(); }));
    CATCH_REQUIRE(client->received().empty());
    CATCH_REQUIRE_FALSE(client->send_message(net::make_send_buffer("nobody home")));
  }

  server.shutdown();
}

// ----------------------------------------------------------------------------------- websocket url

CATCH_TEST_CASE("websocket-url", "[websocket-url]") {
  {
    const auto url = parse_websocket_url("ws://localhost:9000/ocpp/CP-1");
    CATCH_REQUIRE(url.has_value());
    CATCH_REQUIRE(url->host == "localhost");
    CATCH_REQUIRE(url->port == 9000);
    CATCH_REQUIRE(url->target == "/ocpp/CP-1");
  }

  {
    const auto url = parse_websocket_url("ws://10.0.0.7");
    CATCH_REQUIRE(url.has_value());
    CATCH_REQUIRE(url->host == "10.0.0.7");
    CATCH_REQUIRE(url->port == 80);
    CATCH_REQUIRE(url->target == "/");
  }

  const auto invalid = make_error_code(ecode::invalid_url);
  CATCH_REQUIRE(parse_websocket_url("").error() == invalid);
  CATCH_REQUIRE(parse_websocket_url("wss://localhost:9000/").error() == invalid);
  CATCH_REQUIRE(parse_websocket_url("http://localhost/").error() == invalid);
  CATCH_REQUIRE(parse_websocket_url("ws://:9000/").error() == invalid);
  CATCH_REQUIRE(parse_websocket_url("ws://localhost:/").error() == invalid);
  CATCH_REQUIRE(parse_websocket_url("ws://localhost:0/").error() == invalid);
  CATCH_REQUIRE(parse_websocket_url("ws://localhost:65536/").error() == invalid);
  CATCH_REQUIRE(parse_websocket_url("ws://localhost:90x0/").error() == invalid);
}

} // namespace miniocpp::net::tests
