#include "central-system.hpp"

#include <boost/asio/io_context.hpp>

namespace miniocpp::ocpp {

// ---------------------------------------------------------------------------------- CentralSession

CentralSession::CentralSession(boost::asio::io_context& io_context,
                               std::chrono::milliseconds call_timeout,
                               std::shared_ptr<PeerRegistry> registry,
                               std::shared_ptr<SchemaValidator> validator,
                               int64_t heartbeat_interval)
    : rpc::RpcAgent{io_context, call_timeout}, registry_{std::move(registry)},
      validator_{std::move(validator)}, heartbeat_interval_{heartbeat_interval} {}

string CentralSession::identity() const {
  std::lock_guard lock{padlock_};
  return identity_;
}

void CentralSession::on_connect() { INFO("new charge point connection"); }

void CentralSession::handle_call(std::shared_ptr<rpc::CallContext> context, const Json& payload) {
  auto request = parse_central_request(context->action(), payload, *validator_);
  if (!request) {
    context->finish_error(request.error().error_code, request.error().description);
    return;
  }

  std::visit(overloaded{[&](const BootNotificationRequest& x) {
                          context->finish_call(Json(on_boot_notification_(x)));
                        },
                        [&](const HeartbeatRequest& x) {
                          context->finish_call(Json(on_heartbeat_(x)));
                        }},
             *request);
}

BootNotificationResponse
CentralSession::on_boot_notification_(const BootNotificationRequest& request) {
  const auto& identity = request.charge_point_serial_number;
  {
    std::lock_guard lock{padlock_};
    identity_ = identity;
  }
  registry_->upsert(identity, shared_from_this());
  INFO("charge point '{}' registered (vendor '{}', model '{}')", identity,
       request.charge_point_vendor, request.charge_point_model);

  return BootNotificationResponse{string{k_accepted}, Timestamp::now().to_string(),
                                  heartbeat_interval_};
}

HeartbeatResponse CentralSession::on_heartbeat_(const HeartbeatRequest&) {
  TRACE("heartbeat from '{}'", identity());
  return HeartbeatResponse{Timestamp::now().to_string()};
}

void CentralSession::on_disconnect(uint16_t, std::string_view) {
  const auto count = registry_->remove_session(this);
  INFO("charge point '{}' disconnected, {} registration(s) removed", identity(), count);
}

// ----------------------------------------------------------------------------------- CentralSystem

CentralSystem::CentralSystem(boost::asio::io_context& io_context, Config config,
                             std::shared_ptr<SchemaValidator> validator)
    : config_{std::move(config)}, io_context_{io_context},
      registry_{std::make_shared<PeerRegistry>()}, validator_{std::move(validator)} {
  if (validator_ == nullptr)
    validator_ =
        std::make_shared<JsonSchemaValidator>(config_.schema_dir, config_.allow_missing_schemas);
}

CentralSystem::~CentralSystem() = default;

std::shared_ptr<CentralSession> CentralSystem::make_session() {
  return std::make_shared<CentralSession>(io_context_, config_.call_timeout, registry_,
                                          validator_, config_.heartbeat_interval);
}

std::error_code CentralSystem::run() {
  net::WebsocketServer::Config server_config;
  server_config.address = config_.address;
  server_config.port = config_.ws_port;
  server_config.session_factory = [this]() { return make_session(); };

  server_ = std::make_unique<net::WebsocketServer>(io_context_, server_config);
  auto ec = server_->run();
  if (ec) {
    LOG_ERR("could not listen on {}:{}: {}", config_.address, config_.ws_port, ec.message());
    return ec;
  }
  INFO("central system listening on ws://{}:{}", config_.address, config_.ws_port);
  return ec;
}

void CentralSystem::shutdown() {
  if (server_)
    server_->shutdown();
}

} // namespace miniocpp::ocpp
