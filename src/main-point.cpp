#include "miniocpp/net/asio-execution-context.hpp"
#include "miniocpp/net/websockets/websocket-session.hpp"
#include "miniocpp/ocpp/charge-point.hpp"
#include "miniocpp/ocpp/schema-validator.hpp"
#include "miniocpp/utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <csignal>
#include <future>

namespace miniocpp {

struct Config {
  bool show_help{false};
  string uri{};
  ocpp::ChargePoint::Config point{};
  string schema_dir{"schemas"};
  bool allow_missing_schemas{false};
  string log_level{};
};

static void show_help(const char* exec) {
  fmt::print(R"V0G0N(

   Usage: {} --uri <ws://host:port/path> --model <model> --vendor <vendor>
             --serial-number <sn> [OPTIONS...]

      --uri <url>                 Central system to connect to
      --model <model>             Charge point model
      --vendor <vendor>           Charge point vendor
      --serial-number <sn>        Charge point serial number; the identity of the device
      --schema-dir <dir>          Directory with <Action>.json schemas; default is 'schemas'
      --allow-missing-schemas     Accept payloads for actions that have no schema
      --heartbeat-interval <s>    Used until the central system sets one; default is 300
      --call-timeout-ms <ms>      Deadline for calls to the central system; default is 30000
      --log-level <level>         trace, debug, info, warn, err, critical, or off

)V0G0N",
             exec);
}

static int point_main(int argc, char** argv) {
  Config config;
  auto has_error = false;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];
    try {
      if (cli::is_help_switch(arg)) {
        config.show_help = true;
      } else if (arg == "--uri") {
        config.uri = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--model") {
        config.point.model = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--vendor") {
        config.point.vendor = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--serial-number" || arg == "--serial_number") {
        config.point.serial_number = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--schema-dir") {
        config.schema_dir = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--allow-missing-schemas") {
        config.allow_missing_schemas = true;
      } else if (arg == "--heartbeat-interval") {
        config.point.heartbeat_interval = cli::safe_arg_int(argc, argv, i);
      } else if (arg == "--call-timeout-ms") {
        const auto millis = cli::safe_arg_int(argc, argv, i);
        config.point.call_timeout = std::chrono::milliseconds{millis};
      } else if (arg == "--log-level") {
        config.log_level = cli::safe_arg_str(argc, argv, i);
      } else {
        fmt::print(stderr, "unexpected argument: '{}'\n", arg);
        has_error = true;
      }
    } catch (std::runtime_error& e) {
      fmt::print(stderr, "Error on command-line: {}\n", e.what());
      has_error = true;
    }
  }

  if (config.show_help) {
    show_help(argv[0]);
    return EXIT_SUCCESS;
  }

  const auto require = [&has_error](const string& value, const char* name) {
    if (value.empty()) {
      fmt::print(stderr, "missing required argument {}\n", name);
      has_error = true;
    }
  };
  require(config.uri, "--uri");
  require(config.point.model, "--model");
  require(config.point.vendor, "--vendor");
  require(config.point.serial_number, "--serial-number");

  if (config.point.heartbeat_interval <= 0 || config.point.call_timeout.count() <= 0) {
    fmt::print(stderr, "heartbeat interval and call timeout must be positive\n");
    has_error = true;
  }

  if (!config.log_level.empty() && !logging::set_log_level(config.log_level)) {
    fmt::print(stderr, "invalid log level: '{}'\n", config.log_level);
    has_error = true;
  }

  const auto url = net::parse_websocket_url(config.uri);
  if (!config.uri.empty() && !url) {
    fmt::print(stderr, "invalid uri: '{}', expected ws://host[:port][/path]\n", config.uri);
    has_error = true;
  }

  if (has_error) {
    fmt::print(stderr, "aborting...\n");
    return EXIT_FAILURE;
  }

  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, 2};

  auto validator =
      std::make_shared<ocpp::JsonSchemaValidator>(config.schema_dir, config.allow_missing_schemas);
  auto point = std::make_shared<ocpp::ChargePoint>(io_context, config.point, validator);

  auto finished = std::make_shared<std::promise<void>>();
  auto is_finished = std::make_shared<std::atomic<bool>>(false);
  auto finished_future = finished->get_future();
  auto finish = [finished, is_finished]() {
    if (!is_finished->exchange(true))
      finished->set_value();
  };
  point->set_finished_handler(finish);

  // On a signal, close the connection, but don't wait on it forever
  auto stop_timer = pool.make_steady_timer();
  boost::asio::signal_set signals{io_context, SIGINT, SIGTERM};
  signals.async_wait([&stop_timer, point, finish](const boost::system::error_code& ec,
                                                  int signal_number) {
    if (ec)
      return;
    INFO("received signal {}, disconnecting", signal_number);
    point->close(1000, "shutdown");
    stop_timer.expires_after(std::chrono::seconds{1});
    stop_timer.async_wait([finish](const boost::system::error_code&) { finish(); });
  });

  pool.run();
  INFO("connecting to {}", config.uri);
  net::connect(point, io_context, url->host, url->port, url->target);

  finished_future.wait();
  signals.cancel();
  stop_timer.cancel();
  pool.stop();
  pool.join();
  return EXIT_SUCCESS;
}

} // namespace miniocpp

int main(int argc, char** argv) { return miniocpp::point_main(argc, argv); }
