
// We know that `main.cpp` is going to be first in unity builds.
// Therefore, we include our precompiled header here, so that it
// is first in the unity (testcases) build.
#include "stdinc.hpp"

#include "granville/net.hpp"
#include "granville/utils.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

namespace granville {

// ----------------------------------------------------------------------------------------- Config

struct Config {
  bool show_help{false};
  bool has_error{false};
  net::RpcClientOptions options{};
  net::WebsocketTransport::Config transport{};
};

static void show_help(std::string_view exec) {
  fmt::print(R"V0G0N(

   Usage: {} --server host:port [--server host:port]... [OPTIONS...]

      Connects to each rpc server over a TLS websocket, waits for every
      handshake, prints the composite manifest and the zone map, then stops.

   Options:

      --server <host:port>       An rpc server; may be given many times.
      --client-id <string>       Client id sent in the handshake. Default is a random guid.
      --connect-timeout <ms>     Timeout for each connect attempt. Default is 30000.
      --request-timeout <ms>     Default request timeout. Default is 30000.
      --retries <n>              Connect retries per server. Default is 3.
      --retry-delay <ms>         Delay between connect retries. Default is 1000.
      --heartbeat <ms>           Heartbeat interval; 0 disables. Default is 0.
      --unhealthy-after <n>      Consecutive send failures before a server is unhealthy.
                                 Default is 3.
      --remove-unhealthy         Drop the connection to a server once it is unhealthy.
      --target <path>            Websocket request target. Default is "/".
      --no-verify                Do not verify server certificates.
      --ca-file <filename>       Extra certificate authorities (PEM).

   Environment:

      LOG_LEVEL_OVERRIDE         One of: trace, debug, info, warn, error, critical, off

)V0G0N",
             exec);
}

static Config parse_command_line(int argc, char** argv) {
  Config config;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string_view arg = argv[i];
      if (cli::is_help_flag(arg)) {
        config.show_help = true;
      } else if (arg == "--server") {
        const auto text = cli::safe_arg_str(argc, argv, i);
        auto endpoint = net::parse_endpoint(text);
        if (!endpoint.has_value()) {
          fmt::print(stderr, "invalid server '{}': {}\n", text, endpoint.error().message());
          config.has_error = true;
        } else {
          config.options.server_endpoints.push_back(std::move(*endpoint));
        }
      } else if (arg == "--client-id") {
        config.options.client_id = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--connect-timeout") {
        config.options.connection_timeout_ms = cli::safe_arg_int(argc, argv, i, 1, 3600 * 1000);
      } else if (arg == "--request-timeout") {
        config.options.request_timeout_ms = cli::safe_arg_int(argc, argv, i, 1, 3600 * 1000);
      } else if (arg == "--retries") {
        config.options.max_retry_attempts = cli::safe_arg_int(argc, argv, i, 0, 1000);
      } else if (arg == "--retry-delay") {
        config.options.retry_delay_ms = cli::safe_arg_int(argc, argv, i, 0, 3600 * 1000);
      } else if (arg == "--heartbeat") {
        config.options.heartbeat_interval_ms = cli::safe_arg_int(argc, argv, i, 0, 3600 * 1000);
      } else if (arg == "--unhealthy-after") {
        config.options.unhealthy_threshold = cli::safe_arg_int(argc, argv, i, 1, 1000);
      } else if (arg == "--remove-unhealthy") {
        config.options.remove_unhealthy_servers = true;
      } else if (arg == "--target") {
        config.transport.target = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--no-verify") {
        config.transport.verify_peer = false;
      } else if (arg == "--ca-file") {
        config.transport.ca_file = cli::safe_arg_str(argc, argv, i);
      } else {
        fmt::print(stderr, "unexpected argument: '{}'\n", arg);
        config.has_error = true;
      }
    }
  } catch (std::runtime_error& e) {
    fmt::print(stderr, "{}\n", e.what());
    config.has_error = true;
  }

  if (!config.show_help && !config.has_error && config.options.server_endpoints.empty()) {
    fmt::print(stderr, "at least one --server must be given\n");
    config.has_error = true;
  }

  return config;
}

// ------------------------------------------------------------------------------------------ print

static void print_summary(const net::RpcClient& client) {
  const auto manifest = client.manifests().current();

  fmt::print("manifest version {}\n", manifest->version);
  fmt::print("   grains:\n");
  for (const auto& [grain_type, properties] : manifest->grains) {
    fmt::print("      {}\n", grain_type);
    for (const auto& [key, value] : properties)
      fmt::print("         {} = {}\n", key, value);
  }
  fmt::print("   interfaces:\n");
  for (const auto& [interface_type, properties] : manifest->interfaces) {
    fmt::print("      {}\n", interface_type);
    for (const auto& [key, value] : properties)
      fmt::print("         {} = {}\n", key, value);
  }

  fmt::print("zones:\n");
  for (const auto& [zone_id, server_id] : client.connections().get_zone_mappings())
    fmt::print("   {} -> {}\n", zone_id, server_id);
}

// ------------------------------------------------------------------------------------------- main

int main(int argc, char** argv) {
  const auto config = parse_command_line(argc, argv);
  if (config.show_help) {
    show_help(argv[0]);
    return EXIT_SUCCESS;
  }
  if (config.has_error) {
    fmt::print(stderr, "aborting due to previous errors, pass -h for help\n");
    return EXIT_FAILURE;
  }

  boost::asio::io_context io_context;
  net::AsioExecutionContext pool{io_context, 2};
  pool.run();

  auto client = net::RpcClient::make(
      config.options, io_context, net::make_websocket_transport_factory(io_context, config.transport));

  // Every server answers the handshake with an acknowledgement
  std::mutex padlock;
  std::condition_variable cv;
  std::set<std::string> acknowledged;
  std::optional<net::Status> start_status;

  auto subscription = client->handshake_completed().connect([&](const std::string& server_id) {
    {
      std::lock_guard lock{padlock};
      acknowledged.insert(server_id);
    }
    cv.notify_all();
  });

  client->start([&](net::Status status) {
    {
      std::lock_guard lock{padlock};
      start_status = std::move(status);
    }
    cv.notify_all();
  });

  const auto n_servers = config.options.server_endpoints.size();
  const auto deadline = std::chrono::milliseconds{config.options.connection_timeout_ms};
  bool ok = false;
  {
    std::unique_lock lock{padlock};
    const bool finished = cv.wait_for(lock, deadline * (config.options.max_retry_attempts + 2), [&] {
      return (start_status.has_value() && !start_status->ok())
             || (start_status.has_value() && acknowledged.size() >= n_servers);
    });
    if (!finished) {
      LOG_ERR("timed out waiting for {} handshake(s), {} received", n_servers, acknowledged.size());
    } else if (!start_status->ok()) {
      LOG_ERR("could not connect: {}", start_status->to_string());
    } else {
      ok = true;
    }
  }

  if (ok) {
    INFO("connected to {} server(s) as '{}'", n_servers, client->options().client_id);
    print_summary(*client);
  }

  subscription.disconnect();
  client->stop();
  pool.stop();

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace granville

// Don't compile in main(...) if we're doing a testcase build
#ifndef CATCH_BUILD

int main(int argc, char** argv) { return granville::main(argc, argv); }

#endif
