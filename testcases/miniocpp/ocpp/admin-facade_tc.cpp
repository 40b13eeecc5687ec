#include "miniocpp/test-utils.hpp"

#include "miniocpp/net/asio-execution-context.hpp"
#include "miniocpp/ocpp/admin-facade.hpp"
#include "miniocpp/ocpp/central-system.hpp"
#include "miniocpp/ocpp/charge-point.hpp"

#include <boost/asio/io_context.hpp>

#include <catch2/catch.hpp>

#include <future>

namespace miniocpp::ocpp::tests {

using miniocpp::tests::wait_until;

// ---------------------------------------------------------------------------- parse admin request

CATCH_TEST_CASE("parse-admin-request", "[admin-facade]") {
  CATCH_SECTION("list devices") {
    CATCH_REQUIRE(std::holds_alternative<ListDevices>(*parse_admin_request("GET", "/devices", "")));
    CATCH_REQUIRE(parse_admin_request("GET", "/devices/", "").has_value());
    CATCH_REQUIRE_FALSE(parse_admin_request("POST", "/devices", "").has_value());
  }

  CATCH_SECTION("get configuration") {
    const auto request =
        parse_admin_request("GET", "/devices/CP%201/configuration?key=A&key=B&other=C", "");
    CATCH_REQUIRE(request.has_value());
    const auto& get = std::get<GetDeviceConfiguration>(*request);
    CATCH_REQUIRE(get.identity == "CP 1");
    CATCH_REQUIRE(get.keys == vector<string>{"A", "B"});

    const auto all = parse_admin_request("GET", "/devices/CP-1/configuration/", "");
    CATCH_REQUIRE(all.has_value());
    CATCH_REQUIRE(std::get<GetDeviceConfiguration>(*all).keys.empty());

    const auto bad_query = parse_admin_request("GET", "/devices/CP-1/configuration?key=%zz", "");
    CATCH_REQUIRE_FALSE(bad_query.has_value());
    CATCH_REQUIRE(bad_query.error().kind == AdminErrorKind::INVALID_REQUEST);
  }

  CATCH_SECTION("change configuration") {
    const auto request = parse_admin_request("POST", "/devices/CP-1/configuration",
                                             R"({"key": "HeartbeatInterval", "value": "60"})");
    CATCH_REQUIRE(request.has_value());
    const auto& change = std::get<ChangeDeviceConfiguration>(*request);
    CATCH_REQUIRE(change.identity == "CP-1");
    CATCH_REQUIRE(change.key == "HeartbeatInterval");
    CATCH_REQUIRE(change.value == "60");

    const auto as_integer = parse_admin_request("POST", "/devices/CP-1/configuration",
                                                R"({"key": "HeartbeatInterval", "value": 60})");
    CATCH_REQUIRE(as_integer.has_value());
    CATCH_REQUIRE(std::get<ChangeDeviceConfiguration>(*as_integer).value == 60);

    for (const auto body : {"", "not json", "[]", R"({"value": "60"})", R"({"key": ""})",
                            R"({"key": "A", "value": true})", R"({"key": 1, "value": "1"})"}) {
      const auto result = parse_admin_request("POST", "/devices/CP-1/configuration", body);
      CATCH_REQUIRE_FALSE(result.has_value());
      CATCH_REQUIRE(result.error().kind == AdminErrorKind::INVALID_REQUEST);
    }
  }

  CATCH_SECTION("unknown routes") {
    for (const auto target : {"/", "/nothing", "/devices/CP-1", "/devices/CP-1/firmware",
                              "/devices/CP-1/configuration/extra"}) {
      const auto result = parse_admin_request("GET", target, "");
      CATCH_REQUIRE_FALSE(result.has_value());
      CATCH_REQUIRE(result.error().kind == AdminErrorKind::NOT_FOUND);
    }
    const auto wrong_method = parse_admin_request("DELETE", "/devices/CP-1/configuration", "");
    CATCH_REQUIRE(wrong_method.error().kind == AdminErrorKind::NOT_FOUND);
  }

  CATCH_SECTION("http status") {
    CATCH_REQUIRE(http_status(AdminErrorKind::INVALID_REQUEST) == 400);
    CATCH_REQUIRE(http_status(AdminErrorKind::NOT_FOUND) == 404);
    CATCH_REQUIRE(http_status(AdminErrorKind::NOT_CONNECTED) == 404);
    CATCH_REQUIRE(http_status(AdminErrorKind::CALL_ERROR) == 502);
    CATCH_REQUIRE(http_status(AdminErrorKind::CONNECTION_CLOSED) == 503);
    CATCH_REQUIRE(http_status(AdminErrorKind::TIMEOUT) == 504);
    CATCH_REQUIRE(http_status(AdminErrorKind::INTERNAL) == 500);
  }
}

// ------------------------------------------------------------------------------------ AdminFacade

namespace {
  using AdminResult = expected<Json, AdminError>;

  /**
   * @brief Boots, and then never answers a call.
   */
  class SilentPoint : public rpc::RpcAgent {
  public:
    using rpc::RpcAgent::RpcAgent;

    void on_connect() override {
      perform_call("BootNotification",
                   Json(BootNotificationRequest{"Model-S", "Acme", "SN-SILENT"}));
    }

  protected:
    void handle_call(std::shared_ptr<rpc::CallContext>, const Json&) override {}
  };

  /**
   * @brief Runs `operation` with a completion, and waits for the result.
   */
  AdminResult await(std::function<void(AdminFacade::Completion)> operation) {
    auto promise = std::make_shared<std::promise<AdminResult>>();
    auto future = promise->get_future();
    operation([promise](AdminResult result) { promise->set_value(std::move(result)); });
    if (future.wait_for(std::chrono::seconds{5}) != std::future_status::ready)
      return make_unexpected(AdminError{AdminErrorKind::INTERNAL, "test timed out"});
    return future.get();
  }

  net::HttpResponse await_response(AdminFacade& admin, net::HttpRequest request) {
    auto promise = std::make_shared<std::promise<net::HttpResponse>>();
    auto future = promise->get_future();
    admin.serve(std::move(request),
                [promise](net::HttpResponse response) { promise->set_value(std::move(response)); });
    if (future.wait_for(std::chrono::seconds{5}) != std::future_status::ready)
      return net::HttpResponse{0, "test timed out"};
    return future.get();
  }
} // namespace

CATCH_TEST_CASE("admin-facade", "[admin-facade]") {
  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, 2};
  pool.run();

  const auto validator = std::make_shared<JsonSchemaValidator>(MINIOCPP_SCHEMA_DIR);
  CentralSystem::Config config;
  config.call_timeout = std::chrono::milliseconds{250};
  CentralSystem central{io_context, config, validator};
  AdminFacade admin{central.registry()};

  ChargePoint::Config point_config;
  point_config.model = "Model-T";
  point_config.vendor = "Acme";
  point_config.serial_number = "CP-1";
  point_config.heartbeat_interval = 30;
  point_config.call_timeout = std::chrono::milliseconds{250};
  point_config.heartbeat_unit = std::chrono::milliseconds{20};

  auto session = central.make_session();
  auto point = std::make_shared<ChargePoint>(io_context, point_config, validator);
  net::connect_loopback(session, point, io_context);
  CATCH_REQUIRE(wait_until([&]() { return admin.devices() == vector<string>{"CP-1"}; }));

  const auto shutdown = [&]() {
    point->close(1000, "done");
    CATCH_REQUIRE(wait_until([&]() { return point->is_closed() && session->is_closed(); }));
    CATCH_REQUIRE(wait_until([&]() { return admin.devices().empty(); }));
  };

  CATCH_SECTION("get configuration") {
    const auto result = await([&](AdminFacade::Completion completion) {
      admin.get_configuration("CP-1", {"HeartbeatInterval", "Nonexistent"}, completion);
    });
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE((*result)["configurationKey"].size() == 1);
    CATCH_REQUIRE((*result)["configurationKey"][0]["key"] == "HeartbeatInterval");
    CATCH_REQUIRE((*result)["unknownKey"] == Json::array({"Nonexistent"}));
    shutdown();
  }

  CATCH_SECTION("change configuration") {
    const auto result = await([&](AdminFacade::Completion completion) {
      admin.change_configuration("CP-1", "HeartbeatInterval", "60", completion);
    });
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE((*result)["status"] == "Accepted");
    CATCH_REQUIRE(point->configuration().get_int("HeartbeatInterval", 0) == 60);
    shutdown();
  }

  CATCH_SECTION("a CallError from the device") {
    const auto result = await([&](AdminFacade::Completion completion) {
      admin.change_configuration("CP-1", "HeartbeatInterval", true, completion);
    });
    CATCH_REQUIRE_FALSE(result.has_value());
    CATCH_REQUIRE(result.error().kind == AdminErrorKind::CALL_ERROR);
    CATCH_REQUIRE(result.error().message.starts_with("FormationViolation"));
    shutdown();
  }

  CATCH_SECTION("device not connected") {
    const auto result = await([&](AdminFacade::Completion completion) {
      admin.get_configuration("CP-2", {}, completion);
    });
    CATCH_REQUIRE_FALSE(result.has_value());
    CATCH_REQUIRE(result.error().kind == AdminErrorKind::NOT_CONNECTED);
    CATCH_REQUIRE(result.error().message == "device 'CP-2' not connected");
    shutdown();
  }

  CATCH_SECTION("timeout, and connection closed") {
    auto silent_session = central.make_session();
    auto silent = std::make_shared<SilentPoint>(io_context, std::chrono::milliseconds{250});
    net::connect_loopback(silent_session, silent, io_context);
    CATCH_REQUIRE(wait_until([&]() { return admin.devices().size() == 2; }));

    const auto timed_out = await([&](AdminFacade::Completion completion) {
      admin.get_configuration("SN-SILENT", {}, completion);
    });
    CATCH_REQUIRE_FALSE(timed_out.has_value());
    CATCH_REQUIRE(timed_out.error().kind == AdminErrorKind::TIMEOUT);

    auto promise = std::make_shared<std::promise<AdminResult>>();
    auto future = promise->get_future();
    admin.get_configuration("SN-SILENT", {}, [promise](AdminResult result) {
      promise->set_value(std::move(result));
    });
    silent->close(1001, "going away");
    CATCH_REQUIRE(future.wait_for(std::chrono::seconds{5}) == std::future_status::ready);
    const auto closed = future.get();
    CATCH_REQUIRE_FALSE(closed.has_value());
    CATCH_REQUIRE(closed.error().kind == AdminErrorKind::CONNECTION_CLOSED);

    CATCH_REQUIRE(wait_until([&]() { return admin.devices() == vector<string>{"CP-1"}; }));
    shutdown();
  }

  CATCH_SECTION("serve") {
    {
      const auto response = await_response(admin, {"GET", "/devices", ""});
      CATCH_REQUIRE(response.status == 200);
      CATCH_REQUIRE(Json::parse(response.body) == Json{{"devices", Json::array({"CP-1"})}});
    }

    {
      const auto response =
          await_response(admin, {"GET", "/devices/CP-1/configuration?key=NumberOfConnectors", ""});
      CATCH_REQUIRE(response.status == 200);
      const auto body = Json::parse(response.body);
      CATCH_REQUIRE(body["configurationKey"][0]["value"] == 1);
      CATCH_REQUIRE(body["configurationKey"][0]["readonly"] == true);
    }

    {
      const auto response = await_response(
          admin, {"POST", "/devices/CP-1/configuration", R"({"key": "NoSuchKey", "value": "1"})"});
      CATCH_REQUIRE(response.status == 200);
      CATCH_REQUIRE(Json::parse(response.body)["status"] == "Rejected");
    }

    {
      const auto response = await_response(admin, {"GET", "/devices/CP-2/configuration", ""});
      CATCH_REQUIRE(response.status == 404);
      CATCH_REQUIRE(Json::parse(response.body)["error"] == "device 'CP-2' not connected");
    }

    {
      // Decodes to a byte that is not utf-8
      const auto response = await_response(admin, {"GET", "/devices/%FF/configuration", ""});
      CATCH_REQUIRE(response.status == 404);
      const auto message = Json::parse(response.body)["error"].get<string>();
      CATCH_REQUIRE(message.starts_with("device '"));
      CATCH_REQUIRE(message.ends_with("' not connected"));
    }

    {
      const auto response = await_response(admin, {"POST", "/devices/CP-1/configuration", "{"});
      CATCH_REQUIRE(response.status == 400);
    }

    CATCH_REQUIRE(await_response(admin, {"GET", "/elsewhere", ""}).status == 404);
    shutdown();
  }
}

} // namespace miniocpp::ocpp::tests
