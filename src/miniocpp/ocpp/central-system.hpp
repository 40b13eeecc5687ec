#pragma once

#include "actions.hpp"
#include "peer-registry.hpp"
#include "schema-validator.hpp"

#include "miniocpp/net/websockets/websocket-server.hpp"
#include "miniocpp/rpc/rpc-agent.hpp"

#include <chrono>
#include <mutex>

namespace miniocpp::ocpp {

// ---------------------------------------------------------------------------------- CentralSession

/**
 * @ingroup miniocpp-ocpp
 * @brief The central system's side of one charge point connection.
 *
 * Serves BootNotification and Heartbeat. A successful BootNotification registers
 * the session under the charge point's serial number.
 */
class CentralSession : public rpc::RpcAgent {
private:
  std::shared_ptr<PeerRegistry> registry_;
  std::shared_ptr<SchemaValidator> validator_;
  int64_t heartbeat_interval_;

  mutable std::mutex padlock_;
  string identity_{};

public:
  CentralSession(boost::asio::io_context& io_context, std::chrono::milliseconds call_timeout,
                 std::shared_ptr<PeerRegistry> registry,
                 std::shared_ptr<SchemaValidator> validator, int64_t heartbeat_interval);

  /** @brief The identity from the last accepted BootNotification; empty before that. */
  string identity() const;

  void on_connect() override;

protected:
  void handle_call(std::shared_ptr<rpc::CallContext> context, const Json& payload) override;
  void on_disconnect(uint16_t close_code, std::string_view reason) override;

private:
  BootNotificationResponse on_boot_notification_(const BootNotificationRequest& request);
  HeartbeatResponse on_heartbeat_(const HeartbeatRequest& request);
};

// ----------------------------------------------------------------------------------- CentralSystem

/**
 * @ingroup miniocpp-ocpp
 * @brief Accepts charge point connections, and keeps track of them by identity.
 */
class CentralSystem {
public:
  struct Config {
    string address = "0.0.0.0";
    uint16_t ws_port = 9000;
    string schema_dir = "schemas";
    bool allow_missing_schemas = false;
    int64_t heartbeat_interval = 300; //!< Seconds; sent in every BootNotification reply
    std::chrono::milliseconds call_timeout{30000};
  };

private:
  Config config_;
  boost::asio::io_context& io_context_;
  std::shared_ptr<PeerRegistry> registry_;
  std::shared_ptr<SchemaValidator> validator_;
  std::unique_ptr<net::WebsocketServer> server_;

public:
  /**
   * @param validator If not set, schemas are loaded from `config.schema_dir`.
   */
  CentralSystem(boost::asio::io_context& io_context, Config config,
                std::shared_ptr<SchemaValidator> validator = nullptr);
  CentralSystem(const CentralSystem&) = delete;
  CentralSystem& operator=(const CentralSystem&) = delete;
  ~CentralSystem();

  /**
   * @brief A session for a new connection.
   */
  std::shared_ptr<CentralSession> make_session();

  /**
   * @brief Start listening for charge points on `config.ws_port`.
   */
  std::error_code run();

  /**
   * @brief Stop listening, and close all connections.
   */
  void shutdown();

  const Config& config() const { return config_; }
  std::shared_ptr<PeerRegistry> registry() const { return registry_; }
};

} // namespace miniocpp::ocpp
