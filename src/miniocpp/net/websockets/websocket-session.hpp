#pragma once

#include "miniocpp/utils.hpp"

#include "miniocpp/net/buffer.hpp"

namespace boost::asio {
class io_context;
}

namespace miniocpp::net::detail {
class Transport;
}

namespace miniocpp::net {

enum class WebsocketOperation : int {
  CONNECT,   // A (client) is initiating a connection
  HANDSHAKE, // websocket handshake
  ACCEPT,    // Accepting a new connection
  READ,      // During read operation
  WRITE,     // During a write operation
  CLOSE      // The websocket stream is being closed
};

constexpr std::string_view str(WebsocketOperation op) {
#define CASE(x)                                                                                    \
  case WebsocketOperation::x:                                                                      \
    return #x
  switch (op) {
    CASE(CONNECT);
    CASE(HANDSHAKE);
    CASE(ACCEPT);
    CASE(READ);
    CASE(WRITE);
    CASE(CLOSE);
  }
#undef CASE
  return "<unknown case>";
}

// -------------------------------------------------------------------------------- WebsocketSession

/**
 * A `WebsocketSession` is a two-way connection between a client and server.
 *
 * When a server receives a new connection, a `WebsocketSession` instance
 * is created to manage two-way communication with the client -- i.e, sending and
 * receiving.
 *
 * `WebsocketSession` can also be used to create a client connection to a websocket
 * server, using the `connect` free function, or joined in-process to another
 * session with `connect_loopback`.
 *
 * All messages sent from one session are written by a single writer, in the order
 * that `send_message` was called, no matter how many threads call it.
 *
 * @see WebsocketServer::Config for where to set the factory method on a websocket server.
 */
class WebsocketSession {
private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;
  friend void attach_transport(WebsocketSession&, std::shared_ptr<detail::Transport>);

public:
  WebsocketSession();
  virtual ~WebsocketSession();

  /**
   * @brief Close the endpoint.
   * @param close_code A two byte integer sent to the other endpoint.
   * @param reason An optional utf-8 encoded string.
   * @see https://datatracker.ietf.org/doc/html/rfc6455#section-7.1.2
   */
  void close(uint16_t close_code = 1000, std::string_view reason = "");

  /**
   * @brief Queue a message for sending to the other end.
   * @return false iff the session is not attached to a live transport.
   */
  bool send_message(BufferType&& buffer);

  /**
   * @brief True iff a transport is attached and not yet closed.
   */
  bool is_connected() const;

  /**
   * @brief A new connection has been made
   * @note must be threadsafe
   */
  virtual void on_connect() {}

  /**
   * @brief A callback that is called when a connection receives a new message.
   * @note Must be threadsafe
   *
   * The `payload` must be decoded immediately, because the underlying buffer
   * will be reused.
   */
  virtual void on_receive(std::span<const std::byte> payload) = 0;

  /**
   * @brief The connection is gone. Called at most once per connection.
   * @note must be threadsafe
   */
  virtual void on_close(uint16_t close_code, std::string_view reason) {}

  /**
   * @brief Errors are reported here; read errors are followed by `on_close`.
   * @note must be threadsafe
   */
  virtual void on_error(WebsocketOperation operation, std::error_code ec) {}
};

/**
 * @private
 * @brief Binds a session to the transport that carries its messages.
 */
void attach_transport(WebsocketSession& session, std::shared_ptr<detail::Transport> transport);

// ------------------------------------------------------------------------------------ WebsocketUrl

struct WebsocketUrl {
  string host = {};
  uint16_t port = 80;
  string target = "/";
};

/**
 * @brief Parse `ws://host[:port][/target]`. Secure (`wss://`) urls are not supported.
 */
expected<WebsocketUrl, error_code> parse_websocket_url(std::string_view url);

/**
 * @brief Connect to an endpoint.
 *
 * @param session The instance that manages the client connections.
 * @param io_context An asio context for executing logic.
 * @param host Host to connect to.
 * @param port Port to connect to.
 * @param target The http request-target of the websocket upgrade.
 *
 * A copy `session` is stored internally by the websocket driver, and the instance will
 * stay alive at least until the socket errors or is closed.
 */
void connect(std::shared_ptr<WebsocketSession> session, //
             boost::asio::io_context& io_context,       //
             std::string_view host,                     //
             uint16_t port,                             //
             std::string_view target = "/");            //

/**
 * @brief Join two sessions in-process, without a socket.
 *
 * Messages sent by one session are delivered (in order) to the other's `on_receive`,
 * on a strand of `io_context`. Closing either side closes both. Both sessions receive
 * `on_connect` before any message is delivered.
 */
void connect_loopback(std::shared_ptr<WebsocketSession> a, //
                      std::shared_ptr<WebsocketSession> b, //
                      boost::asio::io_context& io_context);

} // namespace miniocpp::net
