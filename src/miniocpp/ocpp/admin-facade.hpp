#pragma once

#include "messages.hpp"
#include "peer-registry.hpp"

#include "miniocpp/net/http/http-server.hpp"

#include <variant>

namespace miniocpp::ocpp {

// ------------------------------------------------------------------------------------- AdminError

enum class AdminErrorKind : int {
  INVALID_REQUEST,   // 400
  NOT_FOUND,         // 404, unknown route
  NOT_CONNECTED,     // 404, device not connected
  CALL_ERROR,        // 502, the device replied with a CallError
  CONNECTION_CLOSED, // 503
  TIMEOUT,           // 504
  INTERNAL           // 500
};

struct AdminError {
  AdminErrorKind kind{AdminErrorKind::INTERNAL};
  string message;
};

unsigned http_status(AdminErrorKind kind);

// ----------------------------------------------------------------------------------- AdminRequest

struct ListDevices {};

struct GetDeviceConfiguration {
  string identity;
  vector<string> keys; //!< Empty means every key
};

struct ChangeDeviceConfiguration {
  string identity;
  string key;
  Json value;
};

using AdminRequest = std::variant<ListDevices, GetDeviceConfiguration, ChangeDeviceConfiguration>;

/**
 * @brief Routes an HTTP request.
 *
 * + `GET /devices`
 * + `GET /devices/{identity}/configuration?key=A&key=B`
 * + `POST /devices/{identity}/configuration`, with body `{"key": "A", "value": "1"}`
 */
expected<AdminRequest, AdminError> parse_admin_request(std::string_view method,
                                                       std::string_view target,
                                                       std::string_view body);

// ------------------------------------------------------------------------------------ AdminFacade

/**
 * @ingroup miniocpp-ocpp
 * @brief Administrative operations against connected charge points.
 *
 * Each operation issues a call into the target device's session, and reports the
 * outcome asynchronously; nothing here blocks.
 */
class AdminFacade {
public:
  using Completion = std::function<void(expected<Json, AdminError> result)>;

private:
  std::shared_ptr<PeerRegistry> registry_;

public:
  explicit AdminFacade(std::shared_ptr<PeerRegistry> registry) : registry_{std::move(registry)} {}

  /** @brief The identities of connected devices */
  vector<string> devices() const;

  /**
   * @brief GetConfiguration against device `identity`.
   *        Completes with the device's reply: `{configurationKey, unknownKey}`.
   */
  void get_configuration(const string& identity, vector<string> keys, Completion completion);

  /**
   * @brief ChangeConfiguration against device `identity`.
   *        Completes with the device's reply: `{status}`.
   */
  void change_configuration(const string& identity, string key, Json value,
                            Completion completion);

  void execute(const AdminRequest& request, Completion completion);

  /**
   * @brief The `net::HttpHandler` for the admin HTTP server.
   */
  void serve(net::HttpRequest request, net::HttpResponder respond);
};

} // namespace miniocpp::ocpp
