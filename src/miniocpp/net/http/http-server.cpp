#include "http-server.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <atomic>
#include <memory>

namespace miniocpp::net::detail {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

// ------------------------------------------------------------------------------------- HttpSession

class HttpSession : public std::enable_shared_from_this<HttpSession> {
private:
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> request_;
  std::shared_ptr<const HttpHandler> handler_;
  std::chrono::seconds timeout_{30};

public:
  HttpSession(asio::ip::tcp::socket&& socket, std::shared_ptr<const HttpHandler> handler)
      : stream_{std::move(socket)}, handler_{std::move(handler)} {}

  void run() {
    // Get on the session's strand
    asio::dispatch(stream_.get_executor(),
                   beast::bind_front_handler(&HttpSession::do_read_, shared_from_this()));
  }

private:
  void do_read_() {
    request_ = {};
    stream_.expires_after(timeout_);
    http::async_read(stream_, buffer_, request_,
                     beast::bind_front_handler(&HttpSession::on_read_, shared_from_this()));
  }

  void on_read_(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      do_close_();
      return;
    }
    if (ec) {
      if (ec != asio::error::operation_aborted && ec != beast::error::timeout)
        INFO("http read error: {}", ec.message());
      return;
    }

    HttpRequest request;
    const auto method = request_.method_string();
    const auto target = request_.target();
    request.method = string{method.data(), method.size()};
    request.target = string{target.data(), target.size()};
    request.body = std::move(request_.body());
    TRACE("http request: {} {}", request.method, request.target);

    auto is_responded = std::make_shared<std::atomic<bool>>(false);
    auto respond = [ptr = shared_from_this(), is_responded, version = request_.version(),
                    keep_alive = request_.keep_alive()](HttpResponse response) {
      if (is_responded->exchange(true))
        return; // Only once
      asio::post(ptr->stream_.get_executor(),
                 [ptr, version, keep_alive, response = std::move(response)]() mutable {
                   ptr->write_(version, keep_alive, std::move(response));
                 });
    };

    try {
      (*handler_)(std::move(request), respond);
    } catch (std::exception& e) {
      LOG_ERR("http handler failed: {}", e.what());
      respond(HttpResponse{500, R"({"error":"internal error"})"});
    }
  }

  void write_(unsigned version, bool keep_alive, HttpResponse&& response) {
    auto message = std::make_shared<http::response<http::string_body>>(
        static_cast<http::status>(response.status), version);
    message->set(http::field::server, BOOST_BEAST_VERSION_STRING);
    message->set(http::field::content_type, response.content_type);
    message->keep_alive(keep_alive);
    message->body() = std::move(response.body);
    message->prepare_payload();

    http::async_write(stream_, *message,
                      [ptr = shared_from_this(), message](beast::error_code ec, std::size_t) {
                        if (ec) {
                          INFO("http write error: {}", ec.message());
                          return;
                        }
                        if (!message->keep_alive()) {
                          ptr->do_close_();
                          return;
                        }
                        ptr->do_read_();
                      });
  }

  void do_close_() {
    beast::error_code ec;
    stream_.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
  }
};

// ------------------------------------------------------------------------------------ HttpListener

class HttpListener : public std::enable_shared_from_this<HttpListener> {
private:
  asio::io_context& ioc_;
  asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const HttpHandler> handler_;
  beast::error_code ec_;

public:
  HttpListener(asio::io_context& ioc, asio::ip::tcp::endpoint endpoint,
               std::shared_ptr<const HttpHandler> handler)
      : ioc_{ioc}, acceptor_{asio::make_strand(ioc)}, handler_{std::move(handler)}, ec_{} {
    acceptor_.open(endpoint.protocol(), ec_);
    if (ec_)
      return;
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec_);
    if (ec_)
      return;
    acceptor_.bind(endpoint, ec_);
    if (ec_)
      return;
    acceptor_.listen(asio::socket_base::max_listen_connections, ec_);
  }

  beast::error_code run() {
    if (!ec_)
      do_accept_();
    return ec_;
  }

  void shutdown() {
    asio::post(acceptor_.get_executor(), [ptr = shared_from_this()]() {
      beast::error_code ec;
      ptr->acceptor_.close(ec);
    });
  }

private:
  void do_accept_() {
    acceptor_.async_accept(
        asio::make_strand(ioc_),
        beast::bind_front_handler(&HttpListener::on_accept_, shared_from_this()));
  }

  void on_accept_(beast::error_code ec, asio::ip::tcp::socket socket) {
    if (ec == asio::error::operation_aborted)
      return; // Shutting down

    if (ec) {
      INFO("http-server on-accept error: {}", ec.message());
    } else {
      std::make_shared<HttpSession>(std::move(socket), handler_)->run();
    }

    do_accept_();
  }
};

} // namespace miniocpp::net::detail

namespace miniocpp::net {

namespace asio = boost::asio;

struct HttpServer::Pimpl {
  std::shared_ptr<detail::HttpListener> listener = nullptr;

  Pimpl(asio::io_context& io_context, const Config& config) {
    boost::system::error_code ec;
    const auto address = asio::ip::make_address(config.address, ec);
    if (ec) {
      LOG_ERR("invalid listen address '{}': {}", config.address, ec.message());
      return;
    }
    listener = std::make_shared<detail::HttpListener>(
        io_context, asio::ip::tcp::endpoint{address, config.port},
        std::make_shared<const HttpHandler>(config.handler));
  }
};

HttpServer::HttpServer(asio::io_context& io_context, const Config& config)
    : pimpl_{std::make_unique<Pimpl>(io_context, config)} {}

HttpServer::~HttpServer() = default;

std::error_code HttpServer::run() {
  if (pimpl_->listener == nullptr)
    return make_error_code(ecode::argument_error);
  return pimpl_->listener->run();
}

void HttpServer::shutdown() {
  if (pimpl_->listener)
    pimpl_->listener->shutdown();
}

} // namespace miniocpp::net
