#pragma once

#include "websocket-session.hpp"

#include "miniocpp/utils.hpp"

namespace boost::asio {
class io_context;
}

namespace miniocpp::net {

// --------------------------------------------------------------------------------- WebsocketServer

class WebsocketServer {
private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

public:
  struct Config {
    string address = "0.0.0.0"; //! Listen address
    uint16_t port = 0;          //! Listen port

    /**
     * @brief A callback for associating logic with an underlying websocket session.
     * @note Must be set, and must not throw.
     */
    std::function<std::shared_ptr<WebsocketSession>()> session_factory;
  };

  /**
   * Exceptions
   * + std::bad_alloc
   */
  WebsocketServer(boost::asio::io_context& io_context, const Config& config);
  WebsocketServer(const WebsocketServer&) = delete;
  WebsocketServer(WebsocketServer&&) = default;
  ~WebsocketServer();
  WebsocketServer& operator=(const WebsocketServer&) = delete;
  WebsocketServer& operator=(WebsocketServer&&) = default;

  /**
   * @brief Start listening on the configured port.
   */
  std::error_code run();

  /**
   * @brief Orderly shutdown of the server; open sessions are closed.
   */
  void shutdown();
};

} // namespace miniocpp::net
