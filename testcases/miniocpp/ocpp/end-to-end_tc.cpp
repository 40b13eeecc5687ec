#include "miniocpp/test-utils.hpp"

#include "miniocpp/net/asio-execution-context.hpp"
#include "miniocpp/ocpp/admin-facade.hpp"
#include "miniocpp/ocpp/central-system.hpp"
#include "miniocpp/ocpp/charge-point.hpp"

#include <boost/asio/io_context.hpp>

#include <catch2/catch.hpp>

#include <atomic>
#include <future>

namespace miniocpp::ocpp::tests {

using miniocpp::tests::wait_until;

namespace {
  expected<Json, AdminError> await(std::function<void(AdminFacade::Completion)> operation) {
    auto promise = std::make_shared<std::promise<expected<Json, AdminError>>>();
    auto future = promise->get_future();
    operation([promise](expected<Json, AdminError> result) {
      promise->set_value(std::move(result));
    });
    if (future.wait_for(std::chrono::seconds{5}) != std::future_status::ready)
      return make_unexpected(AdminError{AdminErrorKind::INTERNAL, "test timed out"});
    return future.get();
  }
} // namespace

CATCH_TEST_CASE("end-to-end", "[end-to-end]") {
  constexpr uint16_t k_port = 28101;

  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, 4};
  pool.run();

  const auto validator = std::make_shared<JsonSchemaValidator>(MINIOCPP_SCHEMA_DIR);

  CentralSystem::Config config;
  config.address = "127.0.0.1";
  config.ws_port = k_port;
  config.heartbeat_interval = 1;
  config.call_timeout = std::chrono::milliseconds{1000};
  CentralSystem central{io_context, config, validator};
  CATCH_REQUIRE_FALSE(central.run());
  AdminFacade admin{central.registry()};

  ChargePoint::Config point_config;
  point_config.model = "Model-T";
  point_config.vendor = "Acme";
  point_config.serial_number = "CP-E2E";
  point_config.call_timeout = std::chrono::milliseconds{1000};
  point_config.heartbeat_unit = std::chrono::milliseconds{20};
  auto point = std::make_shared<ChargePoint>(io_context, point_config, validator);

  std::atomic<bool> is_finished{false};
  point->set_finished_handler([&is_finished]() { is_finished = true; });
  net::connect(point, io_context, "127.0.0.1", k_port, "/ocpp/CP-E2E");

  CATCH_SECTION("a charge point boots, and is administered through the central system") {
    CATCH_REQUIRE(wait_until([&]() { return admin.devices() == vector<string>{"CP-E2E"}; }));
    CATCH_REQUIRE(wait_until([&]() { return point->is_heartbeat_running(); }));
    CATCH_REQUIRE(point->configuration().get_int("HeartbeatInterval", 0) == 1);

    const auto before = Timestamp::now();
    const auto heartbeat = point->send_heartbeat()->wait();
    CATCH_REQUIRE(heartbeat.status.ok());
    const auto current_time = Timestamp::parse(heartbeat.payload["currentTime"].get<string>());
    CATCH_REQUIRE(current_time.has_value());
    CATCH_REQUIRE(before <= *current_time);

    const auto changed = await([&](AdminFacade::Completion completion) {
      admin.change_configuration("CP-E2E", "MeterValueSampleInterval", "15", completion);
    });
    CATCH_REQUIRE(changed.has_value());
    CATCH_REQUIRE((*changed)["status"] == "Accepted");

    const auto fetched = await([&](AdminFacade::Completion completion) {
      admin.get_configuration("CP-E2E", {"MeterValueSampleInterval", "Nonexistent"}, completion);
    });
    CATCH_REQUIRE(fetched.has_value());
    const auto expected_known = Json::array(
        {Json{{"key", "MeterValueSampleInterval"}, {"value", 15}, {"readonly", false}}});
    CATCH_REQUIRE((*fetched)["configurationKey"] == expected_known);
    CATCH_REQUIRE((*fetched)["unknownKey"] == Json::array({"Nonexistent"}));

    // Shutting down closes the connection on both ends
    central.shutdown();
    CATCH_REQUIRE(wait_until([&]() { return is_finished.load(); }));
    CATCH_REQUIRE(wait_until([&]() { return admin.devices().empty(); }));
    CATCH_REQUIRE_FALSE(point->is_heartbeat_running());

    const auto late = await([&](AdminFacade::Completion completion) {
      admin.get_configuration("CP-E2E", {}, completion);
    });
    CATCH_REQUIRE_FALSE(late.has_value());
    CATCH_REQUIRE(late.error().kind == AdminErrorKind::NOT_CONNECTED);
  }

  CATCH_SECTION("the charge point disconnects") {
    CATCH_REQUIRE(wait_until([&]() { return point->is_accepted(); }));
    CATCH_REQUIRE(wait_until([&]() { return admin.devices().size() == 1; }));

    point->close(1000, "bye");
    CATCH_REQUIRE(wait_until([&]() { return is_finished.load(); }));
    CATCH_REQUIRE(wait_until([&]() { return admin.devices().empty(); }));
    CATCH_REQUIRE(point->send_heartbeat()->wait().status.error_code() ==
                  rpc::StatusCode::UNAVAILABLE);
    central.shutdown();
  }
}

} // namespace miniocpp::ocpp::tests
