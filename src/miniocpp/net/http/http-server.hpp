#pragma once

#include "miniocpp/utils.hpp"

namespace boost::asio {
class io_context;
}

namespace miniocpp::net {

struct HttpRequest {
  string method; //!< e.g., "GET"
  string target; //!< e.g., "/devices/CP-1/configuration?key=HeartbeatInterval"
  string body;
};

struct HttpResponse {
  unsigned status = 200;
  string body = {};
  string content_type = "application/json";
};

/**
 * @brief Sends the response for one request. Call exactly once, from any thread.
 */
using HttpResponder = std::function<void(HttpResponse response)>;

/**
 * @brief Serves one request. May respond after returning.
 */
using HttpHandler = std::function<void(HttpRequest request, HttpResponder respond)>;

// ------------------------------------------------------------------------------------ HttpServer

/**
 * @ingroup miniocpp-asio-beast
 * @brief A small HTTP/1.1 server; every request is passed to one handler.
 */
class HttpServer {
private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

public:
  struct Config {
    string address = "0.0.0.0"; //! Listen address
    uint16_t port = 0;          //! Listen port
    HttpHandler handler;        //! Must be set
  };

  HttpServer(boost::asio::io_context& io_context, const Config& config);
  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = default;
  ~HttpServer();
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = default;

  /**
   * @brief Start listening on the configured port.
   */
  std::error_code run();

  /**
   * @brief Stop accepting connections.
   */
  void shutdown();
};

} // namespace miniocpp::net
