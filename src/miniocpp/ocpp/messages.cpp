#include "messages.hpp"

namespace miniocpp::ocpp {

Json to_json_value(const ConfigValue& value) {
  return std::visit([](const auto& x) { return Json(x); }, value);
}

namespace {
  ConfigValue from_json_value(const Json& j) {
    if (j.is_number_integer())
      return j.get<int64_t>();
    return j.get<string>(); // throws type_error otherwise
  }
} // namespace

// -------------------------------------------------------------------------------- BootNotification

void to_json(Json& j, const BootNotificationRequest& o) {
  j = Json{{"chargePointModel", o.charge_point_model},
           {"chargePointVendor", o.charge_point_vendor},
           {"chargePointSerialNumber", o.charge_point_serial_number}};
}

void from_json(const Json& j, BootNotificationRequest& o) {
  j.at("chargePointModel").get_to(o.charge_point_model);
  j.at("chargePointVendor").get_to(o.charge_point_vendor);
  j.at("chargePointSerialNumber").get_to(o.charge_point_serial_number);
}

void to_json(Json& j, const BootNotificationResponse& o) {
  j = Json{{"status", o.status}, {"currentTime", o.current_time}, {"interval", o.interval}};
}

void from_json(const Json& j, BootNotificationResponse& o) {
  j.at("status").get_to(o.status);
  j.at("currentTime").get_to(o.current_time);
  j.at("interval").get_to(o.interval);
}

// --------------------------------------------------------------------------------------- Heartbeat

void to_json(Json& j, const HeartbeatRequest&) { j = Json::object(); }

void from_json(const Json& j, HeartbeatRequest&) {
  j.get_ref<const Json::object_t&>(); // throws type_error if not an object
}

void to_json(Json& j, const HeartbeatResponse& o) { j = Json{{"currentTime", o.current_time}}; }

void from_json(const Json& j, HeartbeatResponse& o) { j.at("currentTime").get_to(o.current_time); }

// -------------------------------------------------------------------------------- GetConfiguration

void to_json(Json& j, const GetConfigurationRequest& o) {
  j = Json::object();
  if (!o.keys.empty())
    j["key"] = o.keys;
}

void from_json(const Json& j, GetConfigurationRequest& o) {
  o.keys.clear();
  j.get_ref<const Json::object_t&>();
  if (j.contains("key"))
    j.at("key").get_to(o.keys);
}

void to_json(Json& j, const KeyValue& o) {
  j = Json{{"key", o.key}, {"value", to_json_value(o.value)}, {"readonly", o.readonly}};
}

void from_json(const Json& j, KeyValue& o) {
  j.at("key").get_to(o.key);
  o.value = from_json_value(j.at("value"));
  o.readonly = j.value("readonly", false);
}

void to_json(Json& j, const GetConfigurationResponse& o) {
  j = Json{{"configurationKey", o.configuration_key}, {"unknownKey", o.unknown_key}};
}

void from_json(const Json& j, GetConfigurationResponse& o) {
  o.configuration_key = j.value("configurationKey", vector<KeyValue>{});
  o.unknown_key = j.value("unknownKey", vector<string>{});
}

// ----------------------------------------------------------------------------- ChangeConfiguration

void to_json(Json& j, const ChangeConfigurationRequest& o) {
  j = Json{{"key", o.key}, {"value", o.value}};
}

void from_json(const Json& j, ChangeConfigurationRequest& o) {
  j.at("key").get_to(o.key);
  o.value = j.at("value");
}

void to_json(Json& j, const ChangeConfigurationResponse& o) { j = Json{{"status", o.status}}; }

void from_json(const Json& j, ChangeConfigurationResponse& o) { j.at("status").get_to(o.status); }

} // namespace miniocpp::ocpp
