#include "miniocpp/ocpp/configuration-store.hpp"

#include <catch2/catch.hpp>

namespace miniocpp::ocpp::tests {

using ChangeResult = ConfigurationStore::ChangeResult;

CATCH_TEST_CASE("configuration-store", "[configuration-store]") {
  ConfigurationStore store{ConfigurationStore::default_entries("Vendor", "Model", "CP-1", 30)};

  CATCH_SECTION("defaults") {
    const auto entries = store.entries();
    CATCH_REQUIRE(entries.size() == 7);
    CATCH_REQUIRE(entries[0].key == "HeartbeatInterval");
    CATCH_REQUIRE(store.get_int("HeartbeatInterval", 0) == 30);
    CATCH_REQUIRE(store.get_int("ConnectionTimeOut", 0) == 60);
    CATCH_REQUIRE(store.get_int("NumberOfConnectors", 0) == 1);
    CATCH_REQUIRE(store.get("NumberOfConnectors")->readonly);
    CATCH_REQUIRE(std::get<string>(store.get("ChargePointSerialNumber")->value) == "CP-1");
    CATCH_REQUIRE(std::get<string>(store.get("ChargePointVendor")->value) == "Vendor");
    CATCH_REQUIRE_FALSE(store.get("Nonexistent").has_value());
    CATCH_REQUIRE(store.get_int("Nonexistent", -1) == -1);
    CATCH_REQUIRE(store.get_int("ChargePointModel", -1) == -1); // not an integer
  }

  CATCH_SECTION("change an integer, from a string") {
    CATCH_REQUIRE(store.change("HeartbeatInterval", Json("60")) == ChangeResult::ACCEPTED);
    CATCH_REQUIRE(std::get<int64_t>(store.get("HeartbeatInterval")->value) == 60);

    CATCH_REQUIRE(store.change("HeartbeatInterval", Json(" 90 ")) == ChangeResult::ACCEPTED);
    CATCH_REQUIRE(store.get_int("HeartbeatInterval", 0) == 90);

    CATCH_REQUIRE(store.change("HeartbeatInterval", Json(120)) == ChangeResult::ACCEPTED);
    CATCH_REQUIRE(store.get_int("HeartbeatInterval", 0) == 120);
  }

  CATCH_SECTION("invalid values change nothing") {
    CATCH_REQUIRE(store.change("HeartbeatInterval", Json("sixty")) == ChangeResult::INVALID_VALUE);
    CATCH_REQUIRE(store.change("HeartbeatInterval", Json("60s")) == ChangeResult::INVALID_VALUE);
    CATCH_REQUIRE(store.change("HeartbeatInterval", Json("")) == ChangeResult::INVALID_VALUE);
    CATCH_REQUIRE(store.change("HeartbeatInterval", Json("-5")) == ChangeResult::INVALID_VALUE);
    CATCH_REQUIRE(store.change("HeartbeatInterval", Json(-5)) == ChangeResult::INVALID_VALUE);
    CATCH_REQUIRE(store.change("HeartbeatInterval", Json(1.5)) == ChangeResult::INVALID_VALUE);
    CATCH_REQUIRE(store.change("HeartbeatInterval", Json(true)) == ChangeResult::INVALID_VALUE);
    CATCH_REQUIRE(store.get_int("HeartbeatInterval", 0) == 30);
  }

  CATCH_SECTION("the heartbeat interval is at most a day") {
    const auto max = ConfigurationStore::k_max_heartbeat_interval;
    CATCH_REQUIRE(store.change("HeartbeatInterval", Json("9223372036854775807")) ==
                  ChangeResult::INVALID_VALUE);
    CATCH_REQUIRE(store.change("HeartbeatInterval", Json(max + 1)) == ChangeResult::INVALID_VALUE);
    CATCH_REQUIRE_FALSE(store.set("HeartbeatInterval", ConfigValue{max + 1}));
    CATCH_REQUIRE(store.get_int("HeartbeatInterval", 0) == 30);

    CATCH_REQUIRE(store.change("HeartbeatInterval", Json(max)) == ChangeResult::ACCEPTED);
    CATCH_REQUIRE(store.get_int("HeartbeatInterval", 0) == max);

    // Other integers are unbounded
    CATCH_REQUIRE(store.change("ConnectionTimeOut", Json("9223372036854775807")) ==
                  ChangeResult::ACCEPTED);
  }

  CATCH_SECTION("unknown and readonly keys") {
    const auto before = store.entries();
    CATCH_REQUIRE(store.change("NoSuchKey", Json("60")) == ChangeResult::UNKNOWN_KEY);
    CATCH_REQUIRE(store.change("NumberOfConnectors", Json(2)) == ChangeResult::READONLY);
    CATCH_REQUIRE(store.change("ChargePointVendor", Json("Other")) == ChangeResult::READONLY);

    const auto after = store.entries();
    CATCH_REQUIRE(after.size() == before.size());
    for (std::size_t i = 0; i < after.size(); ++i) {
      CATCH_REQUIRE(after[i].key == before[i].key);
      CATCH_REQUIRE(after[i].value == before[i].value);
    }
  }

  CATCH_SECTION("local set") {
    CATCH_REQUIRE(store.set("HeartbeatInterval", ConfigValue{int64_t{15}}));
    CATCH_REQUIRE(store.get_int("HeartbeatInterval", 0) == 15);
    CATCH_REQUIRE(store.set("NumberOfConnectors", ConfigValue{int64_t{2}})); // readonly is local
    CATCH_REQUIRE(store.get_int("NumberOfConnectors", 0) == 2);
    CATCH_REQUIRE_FALSE(store.set("HeartbeatInterval", ConfigValue{string{"15"}}));
    CATCH_REQUIRE_FALSE(store.set("NoSuchKey", ConfigValue{int64_t{1}}));
  }

  CATCH_SECTION("string entries") {
    ConfigurationStore custom{vector<ConfigEntry>{{"Greeting", string{"hello"}, false}}};
    CATCH_REQUIRE(custom.change("Greeting", Json("bonjour")) == ChangeResult::ACCEPTED);
    CATCH_REQUIRE(std::get<string>(custom.get("Greeting")->value) == "bonjour");
    CATCH_REQUIRE(custom.change("Greeting", Json(7)) == ChangeResult::INVALID_VALUE);
  }
}

CATCH_TEST_CASE("coerce-config-value", "[configuration-store]") {
  const auto integer = ConfigValue{int64_t{0}};
  const auto text = ConfigValue{string{}};

  CATCH_REQUIRE(coerce_config_value(integer, Json("42")) == ConfigValue{int64_t{42}});
  CATCH_REQUIRE(coerce_config_value(integer, Json(42)) == ConfigValue{int64_t{42}});
  CATCH_REQUIRE(coerce_config_value(text, Json("42")) == ConfigValue{string{"42"}});
  CATCH_REQUIRE_FALSE(coerce_config_value(integer, Json("4 2")).has_value());
  CATCH_REQUIRE_FALSE(coerce_config_value(integer, Json::array()).has_value());
  CATCH_REQUIRE_FALSE(coerce_config_value(text, Json(nullptr)).has_value());

  CATCH_REQUIRE(str(ConfigurationStore::ChangeResult::READONLY) == "readonly key");
}

} // namespace miniocpp::ocpp::tests
