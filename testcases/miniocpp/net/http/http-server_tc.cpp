#include "miniocpp/net/asio-execution-context.hpp"
#include "miniocpp/net/http/http-server.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <thread>

namespace miniocpp::net::tests {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using Json = nlohmann::json;

struct TestResponse {
  unsigned status = 0;
  string body;
  string content_type;
};

// A blocking client, one request per connection
static TestResponse http_request(uint16_t port, http::verb verb, std::string_view target,
                                 std::string_view body = "") {
  asio::io_context ioc;
  asio::ip::tcp::resolver resolver{ioc};
  beast::tcp_stream stream{ioc};
  stream.connect(resolver.resolve("127.0.0.1", std::to_string(port)));

  http::request<http::string_body> request{verb, beast::string_view{target.data(), target.size()},
                                           11};
  request.set(http::field::host, "127.0.0.1");
  request.keep_alive(false);
  request.body() = string{body};
  request.prepare_payload();
  http::write(stream, request);

  beast::flat_buffer buffer;
  http::response<http::string_body> response;
  http::read(stream, buffer, response);

  beast::error_code ec;
  stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);

  const auto content_type = response[http::field::content_type];
  return TestResponse{response.result_int(), response.body(),
                      string{content_type.data(), content_type.size()}};
}

// ------------------------------------------------------------------------------------- http-server

CATCH_TEST_CASE("http-server", "[http-server]") {
  constexpr uint16_t k_port = 28091;

  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, 2};

  HttpServer::Config config;
  config.address = "127.0.0.1";
  config.port = k_port;
  config.handler = [](HttpRequest request, HttpResponder respond) {
    if (request.target == "/throw")
      throw std::runtime_error{"handler failed"};

    Json echo = {{"method", request.method}, {"target", request.target}, {"body", request.body}};
    if (request.target == "/later") {
      // Respond from somewhere else, after the handler has returned
      std::thread{[respond, echo]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
        respond(HttpResponse{202, echo.dump()});
      }}.detach();
      return;
    }
    respond(HttpResponse{200, echo.dump()});
    respond(HttpResponse{500, "ignored"});
  };

  HttpServer server{io_context, config};
  CATCH_REQUIRE_FALSE(server.run());
  pool.run();

  CATCH_SECTION("get") {
    const auto response = http_request(k_port, http::verb::get, "/devices?key=A");
    CATCH_REQUIRE(response.status == 200);
    CATCH_REQUIRE(response.content_type == "application/json");
    const auto json = Json::parse(response.body);
    CATCH_REQUIRE(json["method"] == "GET");
    CATCH_REQUIRE(json["target"] == "/devices?key=A");
    CATCH_REQUIRE(json["body"] == "");
  }

  CATCH_SECTION("post") {
    const auto response =
        http_request(k_port, http::verb::post, "/devices/CP-1/configuration", R"({"key":"A"})");
    CATCH_REQUIRE(response.status == 200);
    const auto json = Json::parse(response.body);
    CATCH_REQUIRE(json["method"] == "POST");
    CATCH_REQUIRE(json["body"] == R"({"key":"A"})");
  }

  CATCH_SECTION("asynchronous response") {
    const auto response = http_request(k_port, http::verb::get, "/later");
    CATCH_REQUIRE(response.status == 202);
    CATCH_REQUIRE(Json::parse(response.body)["target"] == "/later");
  }

  CATCH_SECTION("throwing handler") {
    const auto response = http_request(k_port, http::verb::get, "/throw");
    CATCH_REQUIRE(response.status == 500);
    CATCH_REQUIRE(Json::parse(response.body)["error"] == "internal error");
  }

  server.shutdown();
}

} // namespace miniocpp::net::tests
