#include "miniocpp/ocpp/actions.hpp"
#include "miniocpp/ocpp/schema-validator.hpp"

#include "miniocpp/rpc/envelope.hpp"

#include <catch2/catch.hpp>

namespace miniocpp::ocpp::tests {

CATCH_TEST_CASE("request-parsing", "[actions]") {
  JsonSchemaValidator validator{MINIOCPP_SCHEMA_DIR};

  CATCH_SECTION("action names") {
    CATCH_REQUIRE(parse_action("BootNotification") == Action::BOOT_NOTIFICATION);
    CATCH_REQUIRE(parse_action("ChangeConfiguration") == Action::CHANGE_CONFIGURATION);
    CATCH_REQUIRE_FALSE(parse_action("bootnotification").has_value());
    CATCH_REQUIRE(str(Action::GET_CONFIGURATION) == "GetConfiguration");
  }

  CATCH_SECTION("central requests") {
    const auto boot = parse_central_request("BootNotification",
                                            Json{{"chargePointModel", "M"},
                                                 {"chargePointVendor", "V"},
                                                 {"chargePointSerialNumber", "CP-1"}},
                                            validator);
    CATCH_REQUIRE(boot.has_value());
    CATCH_REQUIRE(std::holds_alternative<BootNotificationRequest>(*boot));
    CATCH_REQUIRE(std::get<BootNotificationRequest>(*boot).charge_point_serial_number == "CP-1");

    const auto heartbeat = parse_central_request("Heartbeat", Json::object(), validator);
    CATCH_REQUIRE(heartbeat.has_value());
    CATCH_REQUIRE(std::holds_alternative<HeartbeatRequest>(*heartbeat));
  }

  CATCH_SECTION("failures") {
    const auto unknown = parse_central_request("Authorize", Json::object(), validator);
    CATCH_REQUIRE(unknown.error().error_code == rpc::call_error::k_not_implemented);

    const auto wrong_role = parse_central_request("GetConfiguration", Json::object(), validator);
    CATCH_REQUIRE(wrong_role.error().error_code == rpc::call_error::k_not_supported);

    const auto invalid = parse_central_request("BootNotification", Json::object(), validator);
    CATCH_REQUIRE(invalid.error().error_code == rpc::call_error::k_formation_violation);

    const auto point_role = parse_point_request("Heartbeat", Json::object(), validator);
    CATCH_REQUIRE(point_role.error().error_code == rpc::call_error::k_not_supported);
  }

  CATCH_SECTION("point requests") {
    const auto get = parse_point_request(
        "GetConfiguration", Json{{"key", Json::array({"HeartbeatInterval", "X"})}}, validator);
    CATCH_REQUIRE(get.has_value());
    CATCH_REQUIRE(std::get<GetConfigurationRequest>(*get).keys.size() == 2);

    const auto all = parse_point_request("GetConfiguration", Json::object(), validator);
    CATCH_REQUIRE(std::get<GetConfigurationRequest>(*all).keys.empty());

    const auto change = parse_point_request(
        "ChangeConfiguration", Json{{"key", "HeartbeatInterval"}, {"value", "60"}}, validator);
    CATCH_REQUIRE(change.has_value());
    CATCH_REQUIRE(std::get<ChangeConfigurationRequest>(*change).key == "HeartbeatInterval");
    CATCH_REQUIRE(std::get<ChangeConfigurationRequest>(*change).value == "60");
  }
}

} // namespace miniocpp::ocpp::tests
