#include "rpc-agent.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace miniocpp::rpc {

namespace asio = boost::asio;

// ------------------------------------------------------------------------------------ Construction

RpcAgent::RpcAgent(boost::asio::io_context& io_context, std::chrono::milliseconds call_timeout)
    : io_context_{io_context}, call_timeout_{call_timeout} {}

RpcAgent::~RpcAgent() {
  // Nobody can be left waiting on a reply that can never arrive
  pending_calls_.close_all(Status{StatusCode::UNAVAILABLE, "connection closed"});
}

// ------------------------------------------------------------------------------------ perform call

std::shared_ptr<CallWaiter> RpcAgent::perform_call(std::string_view action, const Json& payload,
                                                   CompletionHandler completion) {
  const auto id = std::to_string(next_call_id_.fetch_add(1, std::memory_order_acq_rel));

  auto registered = pending_calls_.register_call(id, string{action});
  if (!registered) {
    auto waiter = std::make_shared<CallWaiter>();
    waiter->set_completion(std::move(completion));
    waiter->complete(Status{StatusCode::INVALID_ARGUMENT, registered.error().message()}, Json{});
    return waiter;
  }
  auto waiter = std::move(*registered);

  // Setup the deadline
  auto timer = std::make_shared<asio::steady_timer>(io_context_, call_timeout_);
  timer->async_wait([weak = weak_from_this(), id](const boost::system::error_code& ec) {
    if (ec)
      return; // Cancelled: the call was resolved some other way
    auto ptr = weak.lock();
    if (ptr != nullptr)
      ptr->pending_calls_.resolve(id, Status{StatusCode::DEADLINE_EXCEEDED, "call timed out"});
  });

  waiter->set_completion(
      [timer, completion = std::move(completion)](Status status, Json payload) {
        asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
        if (completion)
          completion(std::move(status), std::move(payload));
      });

  TRACE("sending call '{}' ({})", id, action);

  // Send the message to the wire
  if (!send_message(encode_call(id, action, payload)))
    pending_calls_.resolve(id, Status{StatusCode::UNAVAILABLE, "not connected"});

  return waiter;
}

Reply RpcAgent::call(std::string_view action, const Json& payload) {
  return perform_call(action, payload)->wait();
}

// -------------------------------------------------------------------------------------- on receive

void RpcAgent::on_receive(std::span<const std::byte> payload) {
  auto envelope = decode_envelope(payload);
  if (!envelope) {
    WARN("dropping malformed frame ({}): '{}'", envelope.error(), net::to_string_view(payload));
    return;
  }

  if (envelope->type == MessageType::CALL) {
    handle_call_(std::move(*envelope));
  } else {
    handle_reply_(std::move(*envelope));
  }
}

void RpcAgent::handle_call_(Envelope&& envelope) {
  TRACE("received call '{}' ({}): {}", envelope.id, envelope.action, envelope.payload.dump());
  auto context = std::make_shared<CallContext>(shared_from_this(), envelope.id, envelope.action);
  try {
    handle_call(context, envelope.payload);
  } catch (std::exception& e) {
    LOG_ERR("call '{}' ({}) failed: {}", envelope.id, envelope.action, e.what());
    context->finish_error(call_error::k_internal_error, e.what());
  }
}

void RpcAgent::handle_reply_(Envelope&& envelope) {
  if (envelope.type == MessageType::CALL_RESULT) {
    pending_calls_.resolve(envelope.id, Status{}, std::move(envelope.payload));
    return;
  }

  string error_code{call_error::k_generic_error};
  string description;
  if (envelope.payload.is_object()) {
    const auto ii = envelope.payload.find("errorCode");
    if (ii != envelope.payload.end() && ii->is_string())
      error_code = ii->get<string>();
    const auto jj = envelope.payload.find("errorDescription");
    if (jj != envelope.payload.end() && jj->is_string())
      description = jj->get<string>();
  }
  pending_calls_.resolve(envelope.id,
                         Status{StatusCode::ABORTED, std::move(error_code), std::move(description)},
                         std::move(envelope.payload));
}

// ---------------------------------------------------------------------------------------- on close

void RpcAgent::on_close(uint16_t close_code, std::string_view reason) {
  if (is_closed_.exchange(true, std::memory_order_acq_rel))
    return;
  const auto count =
      pending_calls_.close_all(Status{StatusCode::UNAVAILABLE, "connection closed"});
  INFO("connection closed, code={}, reason='{}', {} pending call(s) failed", close_code, reason,
       count);
  on_disconnect(close_code, reason);
}

void RpcAgent::on_error(net::WebsocketOperation operation, std::error_code ec) {
  WARN("websocket error during {}: {}", str(operation), ec.message());
}

} // namespace miniocpp::rpc
