#include "miniocpp/ocpp/schema-validator.hpp"

#include <catch2/catch.hpp>

namespace miniocpp::ocpp::tests {

// ---------------------------------------------------------------------------- check_against_schema

CATCH_TEST_CASE("check-against-schema", "[schema-validator]") {
  const auto schema = Json::parse(R"({
    "type": "object",
    "properties": {
      "key": {"type": "string", "maxLength": 5},
      "value": {"type": ["string", "integer"], "minimum": 0},
      "mode": {"enum": ["fast", "slow"]},
      "tags": {"type": "array", "minItems": 1, "items": {"type": "string"}}
    },
    "required": ["key"],
    "additionalProperties": false
  })");

  CATCH_REQUIRE(check_against_schema(schema, Json{{"key", "abc"}}).has_value());
  CATCH_REQUIRE(check_against_schema(schema, Json{{"key", "abc"}, {"value", 3}}).has_value());
  CATCH_REQUIRE(check_against_schema(schema, Json{{"key", "abc"}, {"value", "x"}}).has_value());
  CATCH_REQUIRE(check_against_schema(schema, Json{{"key", "abc"}, {"mode", "slow"}}).has_value());

  // Code points, not bytes
  CATCH_REQUIRE(check_against_schema(schema, Json{{"key", "\xc3\xa9\xc3\xa9\xc3\xa9"}}));

  {
    const auto result = check_against_schema(schema, Json::object());
    CATCH_REQUIRE_FALSE(result.has_value());
    CATCH_REQUIRE(result.error() == "/: missing required property 'key'");
  }

  {
    const auto result = check_against_schema(schema, Json{{"key", "abcdef"}});
    CATCH_REQUIRE_FALSE(result.has_value());
    CATCH_REQUIRE(result.error() == "/key: exceeds maxLength 5");
  }

  {
    const auto result = check_against_schema(schema, Json{{"key", 7}});
    CATCH_REQUIRE_FALSE(result.has_value());
    CATCH_REQUIRE(result.error() == R"(/key: expected type "string")");
  }

  CATCH_REQUIRE_FALSE(check_against_schema(schema, Json::array()));
  CATCH_REQUIRE_FALSE(check_against_schema(schema, Json{{"key", "a"}, {"other", 1}}));
  CATCH_REQUIRE_FALSE(check_against_schema(schema, Json{{"key", "a"}, {"value", true}}));
  CATCH_REQUIRE_FALSE(check_against_schema(schema, Json{{"key", "a"}, {"value", -1}}));
  CATCH_REQUIRE_FALSE(check_against_schema(schema, Json{{"key", "a"}, {"mode", "medium"}}));
  CATCH_REQUIRE_FALSE(check_against_schema(schema, Json{{"key", "a"}, {"tags", Json::array()}}));

  {
    const auto result =
        check_against_schema(schema, Json{{"key", "a"}, {"tags", Json::array({"x", 2})}});
    CATCH_REQUIRE_FALSE(result.has_value());
    CATCH_REQUIRE(result.error() == R"(/tags/1: expected type "string")");
  }
}

// ----------------------------------------------------------------------------- JsonSchemaValidator

CATCH_TEST_CASE("json-schema-validator", "[schema-validator]") {
  JsonSchemaValidator validator{MINIOCPP_SCHEMA_DIR};

  CATCH_SECTION("BootNotification") {
    const auto boot = Json{{"chargePointModel", "Model"},
                           {"chargePointVendor", "Vendor"},
                           {"chargePointSerialNumber", "CP-1"}};
    CATCH_REQUIRE(validator.validate("BootNotification", boot));

    auto missing = boot;
    missing.erase("chargePointSerialNumber");
    CATCH_REQUIRE_FALSE(validator.validate("BootNotification", missing));

    auto too_long = boot;
    too_long["chargePointModel"] = string(21, 'M');
    CATCH_REQUIRE_FALSE(validator.validate("BootNotification", too_long));

    auto extra = boot;
    extra["firmwareVersion"] = 1;
    CATCH_REQUIRE_FALSE(validator.validate("BootNotification", extra));
  }

  CATCH_SECTION("Heartbeat") {
    CATCH_REQUIRE(validator.validate("Heartbeat", Json::object()));
    CATCH_REQUIRE_FALSE(validator.validate("Heartbeat", Json{{"x", 1}}));
    CATCH_REQUIRE_FALSE(validator.validate("Heartbeat", Json::array()));
  }

  CATCH_SECTION("GetConfiguration") {
    CATCH_REQUIRE(validator.validate("GetConfiguration", Json::object()));
    CATCH_REQUIRE(validator.validate("GetConfiguration",
                                     Json{{"key", Json::array({"HeartbeatInterval"})}}));
    CATCH_REQUIRE_FALSE(validator.validate("GetConfiguration", Json{{"key", "HeartbeatInterval"}}));
    CATCH_REQUIRE_FALSE(
        validator.validate("GetConfiguration", Json{{"key", Json::array({string(51, 'k')})}}));
  }

  CATCH_SECTION("ChangeConfiguration") {
    const auto as_string = Json{{"key", "HeartbeatInterval"}, {"value", "60"}};
    const auto as_integer = Json{{"key", "HeartbeatInterval"}, {"value", 60}};
    const auto no_value = Json{{"key", "HeartbeatInterval"}};
    CATCH_REQUIRE(validator.validate("ChangeConfiguration", as_string));
    CATCH_REQUIRE(validator.validate("ChangeConfiguration", as_integer));
    CATCH_REQUIRE_FALSE(validator.validate("ChangeConfiguration", no_value));
    CATCH_REQUIRE_FALSE(validator.validate("ChangeConfiguration",
                                           Json{{"key", "HeartbeatInterval"}, {"value", true}}));
  }

  CATCH_SECTION("missing schemas fail closed") {
    CATCH_REQUIRE_FALSE(validator.validate("Authorize", Json::object()));

    JsonSchemaValidator lenient{MINIOCPP_SCHEMA_DIR, true};
    CATCH_REQUIRE(lenient.validate("Authorize", Json::object()));
    CATCH_REQUIRE_FALSE(lenient.validate("Heartbeat", Json{{"x", 1}}));
  }

  CATCH_SECTION("add schema") {
    JsonSchemaValidator custom{"/no/such/directory"};
    CATCH_REQUIRE_FALSE(custom.validate("Heartbeat", Json::object()));
    custom.add_schema("Heartbeat", Json{{"type", "object"}});
    CATCH_REQUIRE(custom.validate("Heartbeat", Json::object()));
  }
}

} // namespace miniocpp::ocpp::tests
