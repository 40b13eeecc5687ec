#pragma once

#include "miniocpp/utils.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <variant>

/**
 * @defgroup miniocpp-ocpp OCPP
 *
 * Payloads of the four supported actions, and their json form.
 */

namespace miniocpp::ocpp {

using Json = nlohmann::json;

/**
 * @brief A configuration value is either a string or an integer.
 */
using ConfigValue = std::variant<string, int64_t>;

Json to_json_value(const ConfigValue& value);

// -------------------------------------------------------------------------------- BootNotification

struct BootNotificationRequest {
  string charge_point_model;
  string charge_point_vendor;
  string charge_point_serial_number;
};

struct BootNotificationResponse {
  string status;       //!< "Accepted", "Pending" or "Rejected"
  string current_time; //!< ISO-8601
  int64_t interval{0}; //!< Heartbeat interval, in seconds
};

// --------------------------------------------------------------------------------------- Heartbeat

struct HeartbeatRequest {};

struct HeartbeatResponse {
  string current_time;
};

// -------------------------------------------------------------------------------- GetConfiguration

struct GetConfigurationRequest {
  vector<string> keys; //!< Json field "key"; absent means every key
};

struct KeyValue {
  string key;
  ConfigValue value;
  bool readonly{false};
};

struct GetConfigurationResponse {
  vector<KeyValue> configuration_key;
  vector<string> unknown_key;
};

// ----------------------------------------------------------------------------- ChangeConfiguration

struct ChangeConfigurationRequest {
  string key;
  Json value; //!< string or integer; coerced to the entry's type
};

struct ChangeConfigurationResponse {
  string status; //!< "Accepted" or "Rejected"
};

constexpr std::string_view k_accepted = "Accepted";
constexpr std::string_view k_rejected = "Rejected";

// ---------------------------------------------------------------------------------- json bindings

void to_json(Json& j, const BootNotificationRequest& o);
void from_json(const Json& j, BootNotificationRequest& o);
void to_json(Json& j, const BootNotificationResponse& o);
void from_json(const Json& j, BootNotificationResponse& o);
void to_json(Json& j, const HeartbeatRequest& o);
void from_json(const Json& j, HeartbeatRequest& o);
void to_json(Json& j, const HeartbeatResponse& o);
void from_json(const Json& j, HeartbeatResponse& o);
void to_json(Json& j, const GetConfigurationRequest& o);
void from_json(const Json& j, GetConfigurationRequest& o);
void to_json(Json& j, const KeyValue& o);
void from_json(const Json& j, KeyValue& o);
void to_json(Json& j, const GetConfigurationResponse& o);
void from_json(const Json& j, GetConfigurationResponse& o);
void to_json(Json& j, const ChangeConfigurationRequest& o);
void from_json(const Json& j, ChangeConfigurationRequest& o);
void to_json(Json& j, const ChangeConfigurationResponse& o);
void from_json(const Json& j, ChangeConfigurationResponse& o);

/**
 * @brief Converts a payload to `T`, without throwing.
 */
template <typename T> expected<T, string> from_payload(const Json& payload) {
  try {
    return payload.get<T>();
  } catch (Json::exception& e) {
    return make_unexpected(string{e.what()});
  }
}

} // namespace miniocpp::ocpp
