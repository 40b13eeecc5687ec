#include "transport.hpp"
#include "websocket-server.hpp"
#include "websocket-session.hpp"

#include "miniocpp/utils.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/core/ignore_unused.hpp>

#include <array>
#include <atomic>
#include <cassert>
#include <charconv>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <string>

namespace miniocpp::net {

namespace asio = boost::asio;
namespace beast = boost::beast;

// This pimpl needs to come first
struct WebsocketSession::Pimpl {
private:
  mutable std::mutex padlock_;
  std::weak_ptr<detail::Transport> transport_{};

public:
  void set_transport(shared_ptr<detail::Transport> transport) {
    std::lock_guard lock{padlock_};
    transport_ = transport;
  }

  shared_ptr<detail::Transport> transport() const {
    std::lock_guard lock{padlock_};
    return transport_.lock();
  }
};

} // namespace miniocpp::net

namespace miniocpp::net::detail {

// --------------------------------------------------------------------------------- ServerCallbacks

struct ServerCallbacks {
  std::function<std::shared_ptr<WebsocketSession>()> session_factory;
};

// ----------------------------------------------------------------------------------------- Session

class Session : public Transport, public std::enable_shared_from_this<Session> {
  const uint64_t id_{0};                                         //! server only
  std::shared_ptr<WebsocketSession> external_session_ = nullptr; //! External facing session
  beast::websocket::stream<beast::tcp_stream> ws_;
  beast::flat_buffer buffer_;
  std::chrono::milliseconds timeout_{30 * 1000};
  std::function<void(Session*)> on_close_thunk_;

  std::deque<BufferType> write_queue_; //! Only touched on the strand
  std::atomic<bool> is_open_{false};
  std::atomic<bool> close_notified_{false};

  asio::ip::tcp::resolver resolver_; //! client only
  std::string host_;                 //! client only
  uint16_t port_{0};                 //! client only
  std::string target_;               //! client only

public:
  // Takes ownership of the socket -- for building server-side sessions
  Session(uint64_t id, asio::ip::tcp::socket&& socket)
      : id_{id}, ws_{std::move(socket)}, resolver_{ws_.get_executor()} {}

  explicit Session(asio::io_context& ioc)
      : ws_{asio::make_strand(ioc)}, resolver_{ws_.get_executor()} {}

  ~Session() override {
    if (on_close_thunk_)
      on_close_thunk_(this);
  }

  static std::shared_ptr<Session>
  make_server_side_session(uint64_t id, asio::ip::tcp::socket&& socket,
                           const std::shared_ptr<ServerCallbacks>& callbacks) {
    auto session = std::make_shared<Session>(id, std::move(socket));
    try {
      session->external_session_ = callbacks->session_factory();
    } catch (std::exception& e) {
      LOG_ERR("callback `session_factory` must not throw: {}", e.what());
      return nullptr;
    }
    if (session->external_session_ == nullptr) {
      LOG_ERR("callback `session_factory` returned an empty result");
      return nullptr;
    }
    attach_transport(*session->external_session_, session);
    TRACE("server side session created, id={}", id);
    return session;
  }

  static void client_connect(std::shared_ptr<WebsocketSession> ws_session,
                             asio::io_context& io_context, std::string_view host, uint16_t port,
                             std::string_view target) {
    assert(ws_session != nullptr);

    auto internal_session = std::make_shared<Session>(io_context);
    internal_session->external_session_ = ws_session;
    attach_transport(*ws_session, internal_session);

    internal_session->connect(host, port, target);
  }

  // @{ Transport
  void async_write(BufferType&& buffer) override {
    auto thunk = [ptr = shared_from_this(), buffer = std::move(buffer)]() mutable {
      ptr->write_queue_.push_back(std::move(buffer));
      if (ptr->write_queue_.size() == 1) // Otherwise a write is already in flight
        ptr->do_write_();
    };
    asio::post(ws_.get_executor(), std::move(thunk));
  }

  void close(uint16_t close_code, std::string_view reason) override {
    auto close_reason = beast::websocket::close_reason{
        beast::websocket::close_code{close_code}, beast::string_view{reason.data(), reason.size()}};

    asio::post(ws_.get_executor(), [ptr = shared_from_this(), close_reason]() {
      if (!ptr->ws_.is_open()) {
        ptr->notify_closed_(close_reason.code, "");
        return;
      }
      ptr->ws_.async_close(close_reason, [ptr, close_reason](beast::error_code ec) {
        if (ec && ec != beast::websocket::error::closed)
          ptr->on_error(WebsocketOperation::CLOSE, ec);
        ptr->notify_closed_(close_reason.code,
                            std::string_view{close_reason.reason.data(),
                                             close_reason.reason.size()});
      });
    });
  }

  bool is_open() const override { return is_open_.load(std::memory_order_acquire); }
  // @}

  void cancel_socket() {
    asio::post(ws_.get_executor(),
               [ptr = shared_from_this()]() { beast::get_lowest_layer(ptr->ws_).cancel(); });
  }

  // @{ Client side functions
  void connect(std::string_view host, uint16_t port, std::string_view target) {
    // Save these for later
    host_ = std::string{std::cbegin(host), std::cend(host)};
    port_ = port;
    target_ = std::string{std::cbegin(target), std::cend(target)};

    // Look up the domain name
    resolver_.async_resolve(host_, std::to_string(port_),
                            beast::bind_front_handler(&Session::on_resolve, shared_from_this()));
  }

  void on_resolve(beast::error_code ec, asio::ip::tcp::resolver::results_type results) {
    if (ec) {
      on_error(WebsocketOperation::CONNECT, ec);
      return;
    }

    // Set a timeout on the operation
    beast::get_lowest_layer(ws_).expires_after(timeout_);

    // Make the connection on the IP address we get from a lookup
    beast::get_lowest_layer(ws_).async_connect(
        results, beast::bind_front_handler(&Session::on_client_connect, shared_from_this()));
  }

  void on_client_connect(beast::error_code ec,
                         asio::ip::tcp::resolver::results_type::endpoint_type ep) {
    if (ec) {
      on_error(WebsocketOperation::CONNECT, ec);
      return;
    }

    // Turn off the timeout on the tcp_stream, because
    // the websocket stream has its own timeout system.
    beast::get_lowest_layer(ws_).expires_never();

    // Set suggested timeout settings for the websocket
    ws_.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::client));

    // Set a decorator to change the User-Agent of the handshake
    ws_.set_option(
        beast::websocket::stream_base::decorator([](beast::websocket::request_type& req) {
          req.set(beast::http::field::user_agent,
                  std::string{BOOST_BEAST_VERSION_STRING} + " miniocpp-point");
          req.set(beast::http::field::sec_websocket_protocol, "ocpp1.6");
        }));

    // Update the host_ string. This will provide the value of the
    // Host HTTP header during the WebSocket handshake.
    // See https://tools.ietf.org/html/rfc7230#section-5.4
    host_ += ':' + std::to_string(ep.port());

    // Perform the websocket handshake
    ws_.async_handshake(host_, target_,
                        beast::bind_front_handler(&Session::on_accept, shared_from_this()));
  }
  // @}

  // @{ Server side functions
  // Get on the correct executor
  void run_server_session(std::function<void(Session*)> on_close_thunk) {
    on_close_thunk_ = std::move(on_close_thunk); // deletes server-side resources

    // We need to be executing within a strand to perform async operations
    // on the I/O objects in this session.
    boost::asio::dispatch(
        ws_.get_executor(),
        beast::bind_front_handler(&Session::on_run_server_session, shared_from_this()));
  }

  void on_run_server_session() {
    // Set suggested timeout settings for the websocket
    ws_.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::server));

    // Set a decorator to change the Server of the handshake
    ws_.set_option(
        beast::websocket::stream_base::decorator([](beast::websocket::response_type& res) {
          res.set(beast::http::field::server,
                  std::string(BOOST_BEAST_VERSION_STRING) + " miniocpp-central");
          res.set(beast::http::field::sec_websocket_protocol, "ocpp1.6");
        }));

    // Accept the websocket handshake
    ws_.async_accept(beast::bind_front_handler(&Session::on_accept, shared_from_this()));
  }
  // @}

  void on_accept(beast::error_code ec) {
    if (ec) {
      on_error(WebsocketOperation::ACCEPT, ec);
      return;
    }

    ws_.text(true);
    is_open_.store(true, std::memory_order_release);
    try {
      external_session_->on_connect();
    } catch (std::exception& e) {
      LOG_ERR("callback `on_connect` must not throw: {}", e.what());
    }

    // Read a message
    do_read();
  }

  void do_read() {
    // Read a message into our buffer
    ws_.async_read(buffer_, beast::bind_front_handler(&Session::on_read, shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    // This indicates that the session was closed
    if (ec == beast::websocket::error::closed) {
      const auto& reason = ws_.reason();
      notify_closed_(reason.code, std::string_view{reason.reason.data(), reason.reason.size()});
      return;
    }

    if (ec) {
      if (ec != asio::error::operation_aborted)
        on_error(WebsocketOperation::READ, ec);
      notify_closed_(beast::websocket::close_code::abnormal, ec.message());
      return;
    }

    const auto data = buffer_.cdata();
    const auto ptr = static_cast<const std::byte*>(data.data());
    try {
      external_session_->on_receive(std::span<const std::byte>{ptr, ptr + data.size()});
    } catch (std::exception& e) {
      LOG_ERR("callback `on_receive` must not throw: {}", e.what());
    }

    buffer_.consume(buffer_.size()); // Clear the buffer
    do_read();                       // Read another message
  }

  void on_error(WebsocketOperation operation, std::error_code ec) {
    external_session_->on_error(operation, ec);
  }

private:
  void do_write_() {
    const auto& buffer = write_queue_.front();
    ws_.async_write(asio::buffer(buffer.data(), buffer.size()),
                    beast::bind_front_handler(&Session::on_write_, shared_from_this()));
  }

  void on_write_(beast::error_code ec, std::size_t) {
    if (ec) {
      on_error(WebsocketOperation::WRITE, ec);
      write_queue_.clear(); // The read side reports the close
      return;
    }
    write_queue_.pop_front();
    if (!write_queue_.empty())
      do_write_();
  }

  void notify_closed_(uint16_t code, std::string_view reason) {
    is_open_.store(false, std::memory_order_release);
    if (close_notified_.exchange(true, std::memory_order_acq_rel))
      return; // Only once
    TRACE("session {} closed, code={}, reason='{}'", id_, code, reason);
    try {
      external_session_->on_close(code, reason);
    } catch (std::exception& e) {
      LOG_ERR("callback `on_close` must not throw: {}", e.what());
    }
  }
};

// ---------------------------------------------------------------------------------------- Listener

// Accepts incoming connections and launches the sessions
class Listener : public std::enable_shared_from_this<Listener> {
private:
  asio::io_context& ioc_;
  asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<ServerCallbacks> callbacks_;
  beast::error_code ec_;
  std::atomic<uint64_t> session_id_;

  /**
   * When a session destructs, a callback should delete from this session
   */
  std::mutex padlock_;
  std::unordered_map<Session*, std::weak_ptr<Session>> sessions_;
  bool is_shutdown_ = false;

public:
  Listener(asio::io_context& ioc, asio::ip::tcp::endpoint endpoint,
           std::shared_ptr<ServerCallbacks> callbacks)
      : ioc_{ioc}, acceptor_{asio::make_strand(ioc)}, callbacks_{std::move(callbacks)}, ec_{},
        session_id_{1} {
    // Open the acceptor
    acceptor_.open(endpoint.protocol(), ec_);
    if (ec_)
      return;

    // Allow address reuse
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec_);
    if (ec_)
      return;

    // Bind to the server address
    acceptor_.bind(endpoint, ec_);
    if (ec_)
      return;

    // Start listening for connections
    acceptor_.listen(asio::socket_base::max_listen_connections, ec_);
  }

  // Start accepting incoming connections
  beast::error_code run() {
    if (!ec_)
      do_accept_();
    return ec_;
  }

  void shutdown() {
    {
      std::lock_guard lock{padlock_};
      is_shutdown_ = true;
    }
    asio::post(acceptor_.get_executor(), [ptr = shared_from_this()]() { ptr->finish_shutdown_(); });
  }

private:
  void do_accept_() {
    // The new connection gets its own strand
    acceptor_.async_accept(asio::make_strand(ioc_),
                           beast::bind_front_handler(&Listener::on_accept_, shared_from_this()));
  }

  void on_accept_(beast::error_code ec, asio::ip::tcp::socket socket) {
    if (ec == asio::error::operation_aborted)
      return; // Shutting down

    if (ec) {
      INFO("websocket-server on-accept error: {}", ec.message());
    } else {
      // Create the session and run it
      auto session = Session::make_server_side_session(
          session_id_.fetch_add(1, std::memory_order_acq_rel), std::move(socket), callbacks_);

      if (session != nullptr) {
        bool is_shutdown = false;

        {
          std::lock_guard lock{padlock_};
          is_shutdown = is_shutdown_;
          if (!is_shutdown)
            sessions_.insert({session.get(), session});
        }

        if (is_shutdown) {
          session->cancel_socket();
        } else {
          session->run_server_session(
              [weak = weak_from_this()](Session* session) mutable {
                auto ptr = weak.lock();
                if (ptr)
                  ptr->remove_session_(session);
              });
        }
      }
    }

    // Accept another connection
    do_accept_();
  }

  void remove_session_(Session* session) {
    std::lock_guard lock{padlock_};
    sessions_.erase(session);
  }

  void finish_shutdown_() {
    beast::error_code ec;
    acceptor_.close(ec); // stop listening

    decltype(sessions_) sessions;
    { // clean out the current sessions
      std::lock_guard lock{padlock_};
      using std::swap;
      swap(sessions, sessions_);
    }

    for (auto& session : sessions) {
      auto ptr = session.second.lock();
      if (ptr)
        ptr->close(beast::websocket::close_code::going_away, "server shutdown");
    }
  }
};

// ------------------------------------------------------------------------------------ LoopbackLink

class LoopbackLink;

class LoopbackEndpoint : public Transport {
private:
  std::shared_ptr<LoopbackLink> link_;
  const std::size_t side_;

public:
  LoopbackEndpoint(std::shared_ptr<LoopbackLink> link, std::size_t side)
      : link_{std::move(link)}, side_{side} {}

  void async_write(BufferType&& buffer) override;
  void close(uint16_t close_code, std::string_view reason) override;
  bool is_open() const override;
};

/**
 * The link (and both sessions) stay alive until one side closes.
 */
class LoopbackLink : public std::enable_shared_from_this<LoopbackLink> {
private:
  asio::strand<asio::io_context::executor_type> strand_;
  mutable std::mutex padlock_;
  std::array<std::shared_ptr<WebsocketSession>, 2> sessions_;
  std::array<std::shared_ptr<LoopbackEndpoint>, 2> endpoints_;
  bool is_open_ = true;

  std::shared_ptr<WebsocketSession> session_(std::size_t side) const {
    std::lock_guard lock{padlock_};
    return is_open_ ? sessions_[side] : nullptr;
  }

public:
  explicit LoopbackLink(asio::io_context& ioc) : strand_{asio::make_strand(ioc)} {}

  static void join(std::shared_ptr<WebsocketSession> a, std::shared_ptr<WebsocketSession> b,
                   asio::io_context& ioc) {
    assert(a != nullptr && b != nullptr);
    auto link = std::make_shared<LoopbackLink>(ioc);
    link->sessions_ = {std::move(a), std::move(b)};
    for (std::size_t side = 0; side < 2; ++side) {
      link->endpoints_[side] = std::make_shared<LoopbackEndpoint>(link, side);
      attach_transport(*link->sessions_[side], link->endpoints_[side]);
    }
    asio::post(link->strand_, [link]() {
      for (std::size_t side = 0; side < 2; ++side) {
        auto session = link->session_(side);
        if (session)
          session->on_connect();
      }
    });
  }

  void deliver(std::size_t from, BufferType&& buffer) {
    auto target = session_(1 - from);
    if (target == nullptr)
      return; // Closed
    asio::post(strand_, [target = std::move(target), buffer = std::move(buffer)]() {
      try {
        target->on_receive(to_span_bytes(buffer));
      } catch (std::exception& e) {
        LOG_ERR("callback `on_receive` must not throw: {}", e.what());
      }
    });
  }

  void close(uint16_t close_code, std::string_view reason) {
    decltype(sessions_) sessions;
    decltype(endpoints_) endpoints;
    {
      std::lock_guard lock{padlock_};
      if (!is_open_)
        return;
      is_open_ = false;
      using std::swap;
      swap(sessions, sessions_);
      swap(endpoints, endpoints_);
    }
    asio::post(strand_, [sessions = std::move(sessions), endpoints = std::move(endpoints),
                         close_code, reason = std::string{reason}]() {
      for (const auto& session : sessions) {
        try {
          session->on_close(close_code, reason);
        } catch (std::exception& e) {
          LOG_ERR("callback `on_close` must not throw: {}", e.what());
        }
      }
    });
  }

  bool is_open() const {
    std::lock_guard lock{padlock_};
    return is_open_;
  }
};

void LoopbackEndpoint::async_write(BufferType&& buffer) {
  link_->deliver(side_, std::move(buffer));
}

void LoopbackEndpoint::close(uint16_t close_code, std::string_view reason) {
  link_->close(close_code, reason);
}

bool LoopbackEndpoint::is_open() const { return link_->is_open(); }

} // namespace miniocpp::net::detail

namespace miniocpp::net {

// -------------------------------------------------------------------------------- WebsocketSession

WebsocketSession::WebsocketSession() : pimpl_{std::make_unique<Pimpl>()} {}

WebsocketSession::~WebsocketSession() = default;

void WebsocketSession::close(uint16_t close_code, std::string_view reason) {
  auto ptr = pimpl_->transport();
  if (ptr)
    ptr->close(close_code, reason);
}

bool WebsocketSession::send_message(BufferType&& buffer) {
  auto ptr = pimpl_->transport();
  if (ptr == nullptr || !ptr->is_open())
    return false;
  ptr->async_write(std::move(buffer));
  return true;
}

bool WebsocketSession::is_connected() const {
  auto ptr = pimpl_->transport();
  return ptr != nullptr && ptr->is_open();
}

void attach_transport(WebsocketSession& session, std::shared_ptr<detail::Transport> transport) {
  session.pimpl_->set_transport(std::move(transport));
}

// ------------------------------------------------------------------------------------ WebsocketUrl

expected<WebsocketUrl, error_code> parse_websocket_url(std::string_view url) {
  constexpr std::string_view k_scheme = "ws://";
  if (!url.starts_with(k_scheme))
    return make_unexpected(make_error_code(ecode::invalid_url));

  const auto rest = url.substr(k_scheme.size());
  const auto slash = rest.find('/');
  const auto authority = rest.substr(0, slash);

  WebsocketUrl out;
  if (slash != std::string_view::npos)
    out.target = string{rest.substr(slash)};

  const auto colon = authority.rfind(':');
  const auto host = authority.substr(0, colon);
  if (host.empty())
    return make_unexpected(make_error_code(ecode::invalid_url));
  out.host = string{host};

  if (colon != std::string_view::npos) {
    const auto port_str = authority.substr(colon + 1);
    unsigned value = 0;
    const auto [end, ec] =
        std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
    if (ec != std::errc{} || end != port_str.data() + port_str.size() || value == 0 ||
        value > std::numeric_limits<uint16_t>::max())
      return make_unexpected(make_error_code(ecode::invalid_url));
    out.port = static_cast<uint16_t>(value);
  }

  return out;
}

void connect(std::shared_ptr<WebsocketSession> session, asio::io_context& io_context,
             std::string_view host, uint16_t port, std::string_view target) {
  detail::Session::client_connect(std::move(session), io_context, host, port, target);
}

void connect_loopback(std::shared_ptr<WebsocketSession> a, std::shared_ptr<WebsocketSession> b,
                      asio::io_context& io_context) {
  detail::LoopbackLink::join(std::move(a), std::move(b), io_context);
}

// ------------------------------------------------------------------------------------------- Pimpl

struct WebsocketServer::Pimpl {
  std::shared_ptr<detail::Listener> listener = nullptr;

  Pimpl(boost::asio::io_context& io_context, const Config& config) {
    auto callbacks = std::make_shared<detail::ServerCallbacks>();
    callbacks->session_factory = config.session_factory;

    beast::error_code ec;
    const auto address = asio::ip::make_address(config.address, ec);
    if (ec) {
      LOG_ERR("invalid listen address '{}': {}", config.address, ec.message());
      return;
    }

    listener = std::make_shared<detail::Listener>(
        io_context, asio::ip::tcp::endpoint{address, config.port}, std::move(callbacks));
  }
};

// ------------------------------------------------------------------------------------ Construction

WebsocketServer::WebsocketServer(boost::asio::io_context& io_context, const Config& config)
    : pimpl_{std::make_unique<Pimpl>(io_context, config)} {}

WebsocketServer::~WebsocketServer() = default;

std::error_code WebsocketServer::run() {
  // Create and launch a listening port
  if (pimpl_->listener == nullptr)
    return make_error_code(ecode::argument_error);
  return pimpl_->listener->run();
}

void WebsocketServer::shutdown() {
  TRACE("post shutdown");
  if (pimpl_->listener)
    pimpl_->listener->shutdown();
}

} // namespace miniocpp::net
