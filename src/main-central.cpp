#include "miniocpp/net/asio-execution-context.hpp"
#include "miniocpp/net/http/http-server.hpp"
#include "miniocpp/ocpp/admin-facade.hpp"
#include "miniocpp/ocpp/central-system.hpp"
#include "miniocpp/utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <csignal>

namespace miniocpp {

struct Config {
  bool show_help{false};
  ocpp::CentralSystem::Config central{};
  uint16_t http_port{3000};
  int threads{0}; //!< 0 means one per core
  string log_level{};
};

static void show_help(const char* exec) {
  fmt::print(R"V0G0N(

   Usage: {} [OPTIONS...]

      --address <addr>            Listen address; default is 0.0.0.0
      --ws-port <port>            Websocket port for charge points; default is 9000
      --http-port <port>          Port for the admin HTTP api; default is 3000
      --schema-dir <dir>          Directory with <Action>.json schemas; default is 'schemas'
      --allow-missing-schemas     Accept payloads for actions that have no schema
      --heartbeat-interval <s>    Heartbeat interval sent to charge points; default is 300
      --call-timeout-ms <ms>      Deadline for calls to charge points; default is 30000
      --threads <n>               Size of the io thread pool; default is one per core
      --log-level <level>         trace, debug, info, warn, err, critical, or off

   Admin api:

      GET  /devices
      GET  /devices/<id>/configuration?key=<key>&key=<key>
      POST /devices/<id>/configuration   {{"key": "<key>", "value": "<value>"}}

)V0G0N",
             exec);
}

static uint16_t to_port(int value) {
  if (value <= 0 || value > std::numeric_limits<uint16_t>::max())
    throw std::runtime_error(fmt::format("invalid port: {}", value));
  return static_cast<uint16_t>(value);
}

static int central_main(int argc, char** argv) {
  Config config;
  auto has_error = false;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];
    try {
      if (cli::is_help_switch(arg)) {
        config.show_help = true;
      } else if (arg == "--address") {
        config.central.address = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--ws-port") {
        config.central.ws_port = to_port(cli::safe_arg_int(argc, argv, i));
      } else if (arg == "--http-port") {
        config.http_port = to_port(cli::safe_arg_int(argc, argv, i));
      } else if (arg == "--schema-dir") {
        config.central.schema_dir = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--allow-missing-schemas") {
        config.central.allow_missing_schemas = true;
      } else if (arg == "--heartbeat-interval") {
        config.central.heartbeat_interval = cli::safe_arg_int(argc, argv, i);
      } else if (arg == "--call-timeout-ms") {
        const auto millis = cli::safe_arg_int(argc, argv, i);
        config.central.call_timeout = std::chrono::milliseconds{millis};
      } else if (arg == "--threads") {
        config.threads = cli::safe_arg_int(argc, argv, i);
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

  if (config.central.heartbeat_interval <= 0 || config.central.call_timeout.count() <= 0 ||
      config.threads < 0) {
    fmt::print(stderr, "heartbeat interval, call timeout and threads must be positive\n");
    has_error = true;
  }

  if (!config.log_level.empty() && !logging::set_log_level(config.log_level)) {
    fmt::print(stderr, "invalid log level: '{}'\n", config.log_level);
    has_error = true;
  }

  if (has_error) {
    fmt::print(stderr, "aborting...\n");
    return EXIT_FAILURE;
  }

  if (!is_directory(config.central.schema_dir))
    WARN("schema directory '{}' does not exist", config.central.schema_dir);

  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, std::size_t(config.threads)};

  ocpp::CentralSystem central{io_context, config.central};
  if (central.run())
    return EXIT_FAILURE;

  ocpp::AdminFacade admin{central.registry()};
  net::HttpServer::Config http_config;
  http_config.address = config.central.address;
  http_config.port = config.http_port;
  http_config.handler = [&admin](net::HttpRequest request, net::HttpResponder respond) {
    admin.serve(std::move(request), std::move(respond));
  };
  net::HttpServer http_server{io_context, http_config};
  if (auto ec = http_server.run(); ec) {
    LOG_ERR("could not start the admin api on port {}: {}", config.http_port, ec.message());
    return EXIT_FAILURE;
  }
  INFO("admin api listening on http://{}:{}", config.central.address, config.http_port);

  // Close connections, and give the close frames a moment to go out
  auto stop_timer = pool.make_steady_timer();
  boost::asio::signal_set signals{io_context, SIGINT, SIGTERM};
  signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
    if (ec)
      return;
    INFO("received signal {}, shutting down", signal_number);
    http_server.shutdown();
    central.shutdown();
    stop_timer.expires_after(std::chrono::milliseconds{250});
    stop_timer.async_wait([&pool](const boost::system::error_code&) { pool.stop(); });
  });

  pool.run();
  pool.join();
  return EXIT_SUCCESS;
}

} // namespace miniocpp

int main(int argc, char** argv) { return miniocpp::central_main(argc, argv); }
