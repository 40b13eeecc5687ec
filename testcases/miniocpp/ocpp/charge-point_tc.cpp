#include "miniocpp/test-utils.hpp"

#include "miniocpp/net/asio-execution-context.hpp"
#include "miniocpp/ocpp/charge-point.hpp"

#include <boost/asio/io_context.hpp>

#include <catch2/catch.hpp>

#include <atomic>
#include <limits>
#include <thread>

namespace miniocpp::ocpp::tests {

using miniocpp::tests::wait_until;

namespace {
  /**
   * @brief Stands in for the central system: answers BootNotification and Heartbeat.
   */
  class CentralStub : public rpc::RpcAgent {
  private:
    string boot_status_;
    int64_t boot_interval_;
    std::atomic<int> boot_count_{0};
    std::atomic<int> heartbeat_count_{0};

  public:
    CentralStub(boost::asio::io_context& io_context, string boot_status, int64_t boot_interval)
        : rpc::RpcAgent{io_context, std::chrono::milliseconds{500}},
          boot_status_{std::move(boot_status)}, boot_interval_{boot_interval} {}

    int boot_count() const { return boot_count_.load(); }
    int heartbeat_count() const { return heartbeat_count_.load(); }

  protected:
    void handle_call(std::shared_ptr<rpc::CallContext> context, const Json&) override {
      const auto now = Timestamp::now().to_string();
      if (context->action() == "BootNotification") {
        ++boot_count_;
        context->finish_call(Json(BootNotificationResponse{boot_status_, now, boot_interval_}));
      } else if (context->action() == "Heartbeat") {
        ++heartbeat_count_;
        context->finish_call(Json(HeartbeatResponse{now}));
      } else {
        context->finish_error(rpc::call_error::k_not_implemented, context->action());
      }
    }
  };

  ChargePoint::Config point_config() {
    ChargePoint::Config config;
    config.model = "Model-T";
    config.vendor = "Acme";
    config.serial_number = "SN-0001";
    config.heartbeat_interval = 30;
    config.call_timeout = std::chrono::milliseconds{500};
    config.heartbeat_unit = std::chrono::milliseconds{20};
    return config;
  }
} // namespace

CATCH_TEST_CASE("charge-point", "[charge-point]") {
  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, 2};
  pool.run();

  const auto validator = std::make_shared<JsonSchemaValidator>(MINIOCPP_SCHEMA_DIR);
  auto point = std::make_shared<ChargePoint>(io_context, point_config(), validator);

  std::atomic<int> finished_count{0};
  point->set_finished_handler([&finished_count]() { ++finished_count; });

  const auto shutdown = [&](std::shared_ptr<rpc::RpcAgent> central) {
    central->close(1000, "done");
    CATCH_REQUIRE(wait_until([&]() { return point->is_closed() && central->is_closed(); }));
    CATCH_REQUIRE(wait_until([&]() { return finished_count.load() == 1; }));
    CATCH_REQUIRE_FALSE(point->is_heartbeat_running());
  };

  CATCH_SECTION("boot notification, then heartbeats") {
    auto central = std::make_shared<CentralStub>(io_context, "Accepted", 1);
    net::connect_loopback(central, point, io_context);

    CATCH_REQUIRE(wait_until([&]() { return point->is_accepted(); }));
    CATCH_REQUIRE(wait_until([&]() { return central->heartbeat_count() >= 3; }));
    CATCH_REQUIRE(point->is_heartbeat_running());
    CATCH_REQUIRE(central->boot_count() == 1);
    CATCH_REQUIRE(point->configuration().get_int("HeartbeatInterval", 0) == 1);

    shutdown(central);

    // No heartbeats once the connection is gone
    const auto count = central->heartbeat_count();
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
    CATCH_REQUIRE(central->heartbeat_count() == count);
  }

  CATCH_SECTION("a rejected boot notification sends no heartbeats") {
    auto central = std::make_shared<CentralStub>(io_context, "Rejected", 1);
    net::connect_loopback(central, point, io_context);

    CATCH_REQUIRE(wait_until([&]() { return central->boot_count() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
    CATCH_REQUIRE_FALSE(point->is_accepted());
    CATCH_REQUIRE_FALSE(point->is_heartbeat_running());
    CATCH_REQUIRE(central->heartbeat_count() == 0);
    CATCH_REQUIRE(point->configuration().get_int("HeartbeatInterval", 0) == 30);

    central->close(1000, "done");
    CATCH_REQUIRE(wait_until([&]() { return finished_count.load() == 1; }));
  }

  CATCH_SECTION("an oversized boot interval is clamped") {
    auto central = std::make_shared<CentralStub>(io_context, "Accepted",
                                                 std::numeric_limits<int64_t>::max());
    net::connect_loopback(central, point, io_context);

    CATCH_REQUIRE(wait_until([&]() { return point->is_accepted(); }));
    CATCH_REQUIRE(point->configuration().get_int("HeartbeatInterval", 0) ==
                  ConfigurationStore::k_max_heartbeat_interval);
    CATCH_REQUIRE(wait_until([&]() { return central->heartbeat_count() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
    CATCH_REQUIRE(central->heartbeat_count() == 1);

    shutdown(central);
  }

  CATCH_SECTION("get configuration") {
    auto central = std::make_shared<CentralStub>(io_context, "Accepted", 0);
    net::connect_loopback(central, point, io_context);
    CATCH_REQUIRE(wait_until([&]() { return point->is_accepted(); }));

    // An interval of 0 in the reply keeps the configured one
    CATCH_REQUIRE(point->configuration().get_int("HeartbeatInterval", 0) == 30);

    const auto reply = central->call(
        "GetConfiguration", Json{{"key", Json::array({"HeartbeatInterval", "Nonexistent"})}});
    CATCH_REQUIRE(reply.status.ok());

    const auto expected_known = Json::array(
        {Json{{"key", "HeartbeatInterval"}, {"value", 30}, {"readonly", false}}});
    const auto expected_unknown = Json::array({"Nonexistent"});
    CATCH_REQUIRE(reply.payload["configurationKey"] == expected_known);
    CATCH_REQUIRE(reply.payload["unknownKey"] == expected_unknown);

    // No keys means every key
    const auto all = central->call("GetConfiguration", Json::object());
    CATCH_REQUIRE(all.status.ok());
    const auto entry_count = point->configuration().entries().size();
    CATCH_REQUIRE(all.payload["configurationKey"].size() == entry_count);
    CATCH_REQUIRE(all.payload["unknownKey"].empty());

    const auto invalid = central->call("GetConfiguration", Json{{"key", "HeartbeatInterval"}});
    CATCH_REQUIRE(invalid.status.error_message() == rpc::call_error::k_formation_violation);

    shutdown(central);
  }

  CATCH_SECTION("change configuration") {
    auto central = std::make_shared<CentralStub>(io_context, "Accepted", 0);
    net::connect_loopback(central, point, io_context);
    CATCH_REQUIRE(wait_until([&]() { return point->is_accepted(); }));

    const auto change = [&](const Json& payload) {
      return central->call("ChangeConfiguration", payload);
    };

    {
      const auto reply = change(Json{{"key", "HeartbeatInterval"}, {"value", "60"}});
      CATCH_REQUIRE(reply.status.ok());
      CATCH_REQUIRE(reply.payload["status"] == "Accepted");
      CATCH_REQUIRE(point->configuration().get_int("HeartbeatInterval", 0) == 60);
    }

    {
      const auto before = point->configuration().entries().size();
      const auto reply = change(Json{{"key", "NoSuchKey"}, {"value", "60"}});
      CATCH_REQUIRE(reply.status.ok());
      CATCH_REQUIRE(reply.payload["status"] == "Rejected");
      CATCH_REQUIRE_FALSE(point->configuration().get("NoSuchKey").has_value());
      CATCH_REQUIRE(point->configuration().entries().size() == before);
    }

    {
      const auto reply = change(Json{{"key", "NumberOfConnectors"}, {"value", "4"}});
      CATCH_REQUIRE(reply.payload["status"] == "Rejected");
      CATCH_REQUIRE(point->configuration().get_int("NumberOfConnectors", 0) == 1);
    }

    {
      const auto reply =
          change(Json{{"key", "HeartbeatInterval"}, {"value", "9223372036854775807"}});
      CATCH_REQUIRE(reply.payload["status"] == "Rejected");
      CATCH_REQUIRE(point->configuration().get_int("HeartbeatInterval", 0) == 60);
    }

    {
      const auto reply = change(Json{{"key", "HeartbeatInterval"}, {"value", "soon"}});
      CATCH_REQUIRE(reply.payload["status"] == "Rejected");
      CATCH_REQUIRE(point->configuration().get_int("HeartbeatInterval", 0) == 60);
    }

    {
      // Fails the schema: not applied, and answered with a CallError
      const auto reply = change(Json{{"key", "HeartbeatInterval"}, {"value", true}});
      CATCH_REQUIRE(reply.status.error_code() == rpc::StatusCode::ABORTED);
      CATCH_REQUIRE(reply.status.error_message() == rpc::call_error::k_formation_violation);
      CATCH_REQUIRE(point->configuration().get_int("HeartbeatInterval", 0) == 60);
    }

    shutdown(central);
  }

  CATCH_SECTION("actions the charge point does not serve") {
    auto central = std::make_shared<CentralStub>(io_context, "Accepted", 0);
    net::connect_loopback(central, point, io_context);
    CATCH_REQUIRE(wait_until([&]() { return point->is_accepted(); }));

    const auto wrong_role = central->call("Heartbeat", Json::object());
    CATCH_REQUIRE(wrong_role.status.error_message() == rpc::call_error::k_not_supported);

    const auto unknown = central->call("Reset", Json{{"type", "Hard"}});
    CATCH_REQUIRE(unknown.status.error_message() == rpc::call_error::k_not_implemented);

    shutdown(central);
  }
}

} // namespace miniocpp::ocpp::tests
