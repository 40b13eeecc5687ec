#include "charge-point.hpp"

namespace miniocpp::ocpp {

ChargePoint::ChargePoint(boost::asio::io_context& io_context, Config config,
                         std::shared_ptr<SchemaValidator> validator)
    : rpc::RpcAgent{io_context, config.call_timeout}, config_{std::move(config)},
      store_{std::make_shared<ConfigurationStore>(
          ConfigurationStore::default_entries(config_.vendor, config_.model,
                                              config_.serial_number, config_.heartbeat_interval))},
      validator_{std::move(validator)} {}

ChargePoint::~ChargePoint() {
  if (scheduler_)
    scheduler_->stop();
}

bool ChargePoint::is_heartbeat_running() const {
  std::lock_guard lock{padlock_};
  return scheduler_ != nullptr && scheduler_->is_running();
}

void ChargePoint::set_finished_handler(thunk_type thunk) {
  std::lock_guard lock{padlock_};
  on_finished_ = std::move(thunk);
}

void ChargePoint::finish_() {
  thunk_type thunk;
  {
    std::lock_guard lock{padlock_};
    using std::swap;
    swap(thunk, on_finished_);
  }
  if (thunk)
    thunk();
}

// ---------------------------------------------------------------------------------------- Outbound

std::shared_ptr<rpc::CallWaiter> ChargePoint::send_boot_notification() {
  const auto request =
      BootNotificationRequest{config_.model, config_.vendor, config_.serial_number};
  INFO("sending BootNotification for '{}'", config_.serial_number);
  return perform_call(str(Action::BOOT_NOTIFICATION), Json(request),
                      [weak = weak_from_this()](rpc::Status status, Json payload) {
                        auto ptr = std::static_pointer_cast<ChargePoint>(weak.lock());
                        if (ptr != nullptr)
                          ptr->on_boot_reply_(status, payload);
                      });
}

std::shared_ptr<rpc::CallWaiter> ChargePoint::send_heartbeat() {
  return perform_call(str(Action::HEARTBEAT), Json(HeartbeatRequest{}),
                      [](rpc::Status status, Json payload) {
                        if (!status.ok()) {
                          WARN("Heartbeat failed: {} {} {}", str(status.error_code()),
                               status.error_message(), status.error_details());
                          return;
                        }
                        auto response = from_payload<HeartbeatResponse>(payload);
                        if (!response) {
                          WARN("invalid Heartbeat reply: {}", response.error());
                          return;
                        }
                        TRACE("Heartbeat reply, currentTime={}", response->current_time);
                      });
}

void ChargePoint::on_boot_reply_(const rpc::Status& status, const Json& payload) {
  if (!status.ok()) {
    LOG_ERR("BootNotification failed: {} {} {}", str(status.error_code()), status.error_message(),
            status.error_details());
    return;
  }

  auto response = from_payload<BootNotificationResponse>(payload);
  if (!response) {
    LOG_ERR("invalid BootNotification reply: {}", response.error());
    return;
  }

  if (response->status != k_accepted) {
    WARN("BootNotification not accepted: '{}'", response->status);
    return;
  }

  if (response->interval > ConfigurationStore::k_max_heartbeat_interval)
    WARN("BootNotification interval {}s is above {}s", response->interval,
         ConfigurationStore::k_max_heartbeat_interval);
  if (response->interval > 0)
    store_->set(ConfigurationStore::k_heartbeat_interval,
                ConfigValue{std::min(response->interval,
                                     ConfigurationStore::k_max_heartbeat_interval)});
  is_accepted_.store(true, std::memory_order_release);
  INFO("BootNotification accepted at {}, heartbeat interval {}s", response->current_time,
       store_->get_int(ConfigurationStore::k_heartbeat_interval, config_.heartbeat_interval));

  start_heartbeat_();
}

void ChargePoint::start_heartbeat_() {
  auto weak = std::weak_ptr<rpc::RpcAgent>{weak_from_this()};
  auto interval = [store = store_, fallback = config_.heartbeat_interval]() {
    return store->get_int(ConfigurationStore::k_heartbeat_interval, fallback);
  };
  auto emit = [weak]() {
    auto ptr = std::static_pointer_cast<ChargePoint>(weak.lock());
    if (ptr != nullptr && !ptr->is_closed())
      ptr->send_heartbeat();
  };

  std::shared_ptr<LivenessScheduler> scheduler;
  {
    std::lock_guard lock{padlock_};
    if (scheduler_ != nullptr || is_closed())
      return; // Already running, or too late
    scheduler_ = std::make_shared<LivenessScheduler>(io_context(), std::move(interval),
                                                     std::move(emit), config_.heartbeat_unit);
    scheduler = scheduler_;
  }
  scheduler->start();
}

// ----------------------------------------------------------------------------------------- Inbound

void ChargePoint::handle_call(std::shared_ptr<rpc::CallContext> context, const Json& payload) {
  auto request = parse_point_request(context->action(), payload, *validator_);
  if (!request) {
    context->finish_error(request.error().error_code, request.error().description);
    return;
  }

  std::visit(overloaded{[&](const GetConfigurationRequest& x) {
                          context->finish_call(Json(on_get_configuration_(x)));
                        },
                        [&](const ChangeConfigurationRequest& x) {
                          context->finish_call(Json(on_change_configuration_(x)));
                        }},
             *request);
}

GetConfigurationResponse
ChargePoint::on_get_configuration_(const GetConfigurationRequest& request) {
  GetConfigurationResponse response;

  if (request.keys.empty()) { // Everything
    for (auto& entry : store_->entries())
      response.configuration_key.push_back(
          KeyValue{std::move(entry.key), std::move(entry.value), entry.readonly});
    return response;
  }

  for (const auto& key : request.keys) {
    auto entry = store_->get(key);
    if (entry.has_value())
      response.configuration_key.push_back(
          KeyValue{std::move(entry->key), std::move(entry->value), entry->readonly});
    else
      response.unknown_key.push_back(key);
  }
  return response;
}

ChangeConfigurationResponse
ChargePoint::on_change_configuration_(const ChangeConfigurationRequest& request) {
  const auto result = store_->change(request.key, request.value);
  if (result != ConfigurationStore::ChangeResult::ACCEPTED) {
    WARN("rejected change of '{}' to {}: {}", request.key, request.value.dump(), str(result));
    return ChangeConfigurationResponse{string{k_rejected}};
  }
  INFO("configuration '{}' changed to {}", request.key, request.value.dump());
  return ChangeConfigurationResponse{string{k_accepted}};
}

// ---------------------------------------------------------------------------------- Connection

void ChargePoint::on_connect() {
  INFO("connected to the central system");
  send_boot_notification();
}

void ChargePoint::on_error(net::WebsocketOperation operation, std::error_code ec) {
  rpc::RpcAgent::on_error(operation, ec);
  switch (operation) {
  case net::WebsocketOperation::CONNECT:
  case net::WebsocketOperation::HANDSHAKE:
  case net::WebsocketOperation::ACCEPT:
    LOG_ERR("could not connect to the central system: {}", ec.message());
    finish_(); // There is no connection to close
    break;
  default:
    break;
  }
}

void ChargePoint::on_disconnect(uint16_t, std::string_view) {
  std::shared_ptr<LivenessScheduler> scheduler;
  {
    std::lock_guard lock{padlock_};
    scheduler = scheduler_;
  }
  if (scheduler)
    scheduler->stop();
  INFO("disconnected from the central system");
  finish_();
}

} // namespace miniocpp::ocpp
