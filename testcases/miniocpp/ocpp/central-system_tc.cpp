#include "miniocpp/test-utils.hpp"

#include "miniocpp/net/asio-execution-context.hpp"
#include "miniocpp/ocpp/central-system.hpp"

#include <boost/asio/io_context.hpp>

#include <catch2/catch.hpp>

namespace miniocpp::ocpp::tests {

using miniocpp::tests::wait_until;

namespace {
  /**
   * @brief Stands in for a charge point: sends what the test asks, and serves nothing.
   */
  class PointStub : public rpc::RpcAgent {
  public:
    using rpc::RpcAgent::RpcAgent;

  protected:
    void handle_call(std::shared_ptr<rpc::CallContext> context, const Json&) override {
      context->finish_error(rpc::call_error::k_not_implemented, context->action());
    }
  };

  Json boot_payload(const string& serial_number) {
    return Json(BootNotificationRequest{"Model-T", "Acme", serial_number});
  }
} // namespace

CATCH_TEST_CASE("central-system", "[central-system]") {
  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, 2};
  pool.run();

  CentralSystem::Config config;
  config.heartbeat_interval = 42;
  config.call_timeout = std::chrono::milliseconds{500};
  CentralSystem central{io_context, config,
                        std::make_shared<JsonSchemaValidator>(MINIOCPP_SCHEMA_DIR)};
  auto registry = central.registry();

  auto session = central.make_session();
  auto point = std::make_shared<PointStub>(io_context, std::chrono::milliseconds{500});
  net::connect_loopback(session, point, io_context);

  const auto shutdown = [&]() {
    point->close(1000, "done");
    CATCH_REQUIRE(wait_until([&]() { return point->is_closed() && session->is_closed(); }));
  };

  CATCH_SECTION("boot notification registers the identity") {
    const auto before = Timestamp::now();
    const auto reply = point->call("BootNotification", boot_payload("SN-0001"));
    CATCH_REQUIRE(reply.status.ok());
    CATCH_REQUIRE(reply.payload["status"] == "Accepted");
    CATCH_REQUIRE(reply.payload["interval"] == 42);

    const auto current_time = Timestamp::parse(reply.payload["currentTime"].get<string>());
    CATCH_REQUIRE(current_time.has_value());
    CATCH_REQUIRE(before <= *current_time);

    CATCH_REQUIRE(session->identity() == "SN-0001");
    CATCH_REQUIRE(registry->lookup("SN-0001") == session);
    CATCH_REQUIRE(registry->size() == 1);

    // The session is now reachable by identity, and the disconnect unregisters it
    shutdown();
    CATCH_REQUIRE(wait_until([&]() { return registry->size() == 0; }));
    CATCH_REQUIRE(registry->lookup("SN-0001") == nullptr);
  }

  CATCH_SECTION("a second boot notification renames the session") {
    CATCH_REQUIRE(point->call("BootNotification", boot_payload("SN-0001")).status.ok());
    CATCH_REQUIRE(point->call("BootNotification", boot_payload("SN-0002")).status.ok());
    CATCH_REQUIRE(registry->identities() == vector<string>{"SN-0002"});
    shutdown();
  }

  CATCH_SECTION("an invalid boot notification is a FormationViolation") {
    auto payload = boot_payload("SN-0001");
    payload.erase("chargePointVendor");
    const auto reply = point->call("BootNotification", payload);
    CATCH_REQUIRE(reply.status.error_code() == rpc::StatusCode::ABORTED);
    CATCH_REQUIRE(reply.status.error_message() == rpc::call_error::k_formation_violation);

    const auto too_long = point->call("BootNotification", boot_payload(string(26, 'x')));
    CATCH_REQUIRE(too_long.status.error_message() == rpc::call_error::k_formation_violation);

    CATCH_REQUIRE(registry->size() == 0);
    CATCH_REQUIRE(session->identity().empty());
    shutdown();
  }

  CATCH_SECTION("heartbeat") {
    const auto before = Timestamp::now();
    const auto reply = point->call("Heartbeat", Json::object());
    CATCH_REQUIRE(reply.status.ok());
    const auto current_time = Timestamp::parse(reply.payload["currentTime"].get<string>());
    CATCH_REQUIRE(current_time.has_value());
    CATCH_REQUIRE(before <= *current_time);

    const auto invalid = point->call("Heartbeat", Json{{"unexpected", 1}});
    CATCH_REQUIRE(invalid.status.error_message() == rpc::call_error::k_formation_violation);
    shutdown();
  }

  CATCH_SECTION("actions the central system does not serve") {
    const auto unknown = point->call("StartTransaction", Json::object());
    CATCH_REQUIRE(unknown.status.error_code() == rpc::StatusCode::ABORTED);
    CATCH_REQUIRE(unknown.status.error_message() == rpc::call_error::k_not_implemented);

    const auto wrong_role = point->call("GetConfiguration", Json::object());
    CATCH_REQUIRE(wrong_role.status.error_message() == rpc::call_error::k_not_supported);

    // The connection survives both
    CATCH_REQUIRE(point->call("Heartbeat", Json::object()).status.ok());
    shutdown();
  }

  CATCH_SECTION("the central system calls the charge point") {
    const auto reply = session->call("GetConfiguration", Json::object());
    CATCH_REQUIRE(reply.status.error_message() == rpc::call_error::k_not_implemented);
    shutdown();
  }
}

} // namespace miniocpp::ocpp::tests
