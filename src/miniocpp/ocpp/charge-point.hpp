#pragma once

#include "actions.hpp"
#include "configuration-store.hpp"
#include "liveness-scheduler.hpp"
#include "schema-validator.hpp"

#include "miniocpp/rpc/rpc-agent.hpp"

#include <atomic>
#include <chrono>
#include <mutex>

namespace miniocpp::ocpp {

/**
 * @ingroup miniocpp-ocpp
 * @brief The charge point's side of its connection to the central system.
 *
 * On connect, sends a BootNotification. Once that is accepted, adopts the returned
 * heartbeat interval and starts sending Heartbeats. Serves GetConfiguration and
 * ChangeConfiguration against its `ConfigurationStore`.
 */
class ChargePoint : public rpc::RpcAgent {
public:
  struct Config {
    string model;
    string vendor;
    string serial_number;
    int64_t heartbeat_interval = 300;               //!< Until the central system says otherwise
    std::chrono::milliseconds call_timeout{30000};  //!< Deadline for outbound calls
    std::chrono::milliseconds heartbeat_unit{1000}; //!< One interval step
  };

private:
  Config config_;
  std::shared_ptr<ConfigurationStore> store_;
  std::shared_ptr<SchemaValidator> validator_;

  mutable std::mutex padlock_;
  std::shared_ptr<LivenessScheduler> scheduler_ = nullptr;
  thunk_type on_finished_{};
  std::atomic<bool> is_accepted_{false};

public:
  ChargePoint(boost::asio::io_context& io_context, Config config,
              std::shared_ptr<SchemaValidator> validator);
  ~ChargePoint() override;

  ConfigurationStore& configuration() { return *store_; }
  const Config& config() const { return config_; }

  /** @brief true once the central system has accepted the BootNotification */
  bool is_accepted() const { return is_accepted_.load(std::memory_order_acquire); }

  /** @brief true while Heartbeats are being sent */
  bool is_heartbeat_running() const;

  /**
   * @brief Executed once, when the connection fails or closes.
   */
  void set_finished_handler(thunk_type thunk);

  std::shared_ptr<rpc::CallWaiter> send_boot_notification();
  std::shared_ptr<rpc::CallWaiter> send_heartbeat();

  // @{ WebsocketSession
  void on_connect() override;
  void on_error(net::WebsocketOperation operation, std::error_code ec) override;
  // @}

protected:
  void handle_call(std::shared_ptr<rpc::CallContext> context, const Json& payload) override;
  void on_disconnect(uint16_t close_code, std::string_view reason) override;

private:
  void on_boot_reply_(const rpc::Status& status, const Json& payload);
  void start_heartbeat_();
  void finish_();

  GetConfigurationResponse on_get_configuration_(const GetConfigurationRequest& request);
  ChangeConfigurationResponse on_change_configuration_(const ChangeConfigurationRequest& request);
};

} // namespace miniocpp::ocpp
