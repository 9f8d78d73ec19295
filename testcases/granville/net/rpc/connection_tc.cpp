
#include "stdinc.hpp"

#include "test-cluster.hpp"

#include "granville/net/rpc/connection.hpp"

#include <catch2/catch.hpp>

namespace granville::net::test {

struct ErrorCatcher {
  std::mutex padlock;
  std::optional<std::error_code> ec;

  Transport::CompletionHandler handler() {
    return [this](std::error_code error) {
      std::lock_guard lock{padlock};
      ec = error;
    };
  }

  std::optional<std::error_code> wait() {
    wait_until([this]() {
      std::lock_guard lock{padlock};
      return ec.has_value();
    });
    std::lock_guard lock{padlock};
    return ec;
  }
};

CATCH_TEST_CASE("Connection", "[connection]") {
  TestCluster cluster;
  const auto endpoint = cluster.add_server(9000, {"echo"}, [](const RpcMessage& message) {
    return std::vector<RpcMessage>{message}; // echo
  });
  const auto factory = cluster.transport_factory();

  CATCH_SECTION("events carry the server id") {
    auto transport = factory();
    auto connection = Connection::make("server-a", endpoint, transport);

    std::atomic<int> n_established{0};
    std::atomic<int> n_data{0};
    std::atomic<int> n_closed{0};
    connection->on_established().connect([&](const std::string& server_id, const Endpoint&) {
      if (server_id == "server-a")
        ++n_established;
    });
    connection->on_data().connect([&](const std::string& server_id, std::span<const std::byte>) {
      if (server_id == "server-a")
        ++n_data;
    });
    connection->on_closed().connect([&](const std::string& server_id, const Endpoint&) {
      if (server_id == "server-a")
        ++n_closed;
    });

    ErrorCatcher connected;
    transport->connect(endpoint, connected.handler());
    CATCH_REQUIRE(connected.wait() == std::error_code{});
    CATCH_REQUIRE(n_established.load() == 1);

    ErrorCatcher sent;
    connection->send(encode_message(RpcMessage{RpcHeartbeat{new_guid(), "client", 1}}),
                     sent.handler());
    CATCH_REQUIRE(sent.wait() == std::error_code{});
    CATCH_REQUIRE(wait_until([&]() { return n_data == 1; }));

    cluster.close_server(9000);
    CATCH_REQUIRE(wait_until([&]() { return n_closed == 1; }));
  }

  CATCH_SECTION("send outcomes drive the server's health") {
    auto transport = factory();
    auto connection = Connection::make("server-a", endpoint, transport);
    connection->set_unhealthy_threshold(2);

    std::mutex padlock;
    std::vector<std::pair<ServerHealth, ServerHealth>> changes;
    connection->on_health_changed().connect(
        [&](const std::string&, ServerHealth previous, ServerHealth current) {
          std::lock_guard lock{padlock};
          changes.emplace_back(previous, current);
        });
    const auto n_changes = [&]() {
      std::lock_guard lock{padlock};
      return changes.size();
    };

    CATCH_REQUIRE(connection->health() == ServerHealth::UNKNOWN);
    CATCH_REQUIRE(!connection->is_established());
    for (int i = 0; i < 3; ++i) { // not connected yet, so every send fails
      ErrorCatcher sent;
      connection->send(encode_message(RpcMessage{RpcHeartbeat{new_guid(), "client", 1}}),
                       sent.handler());
      CATCH_REQUIRE(sent.wait() == make_error_code(ecode::not_connected));
    }
    CATCH_REQUIRE(connection->consecutive_failures() == 3);
    CATCH_REQUIRE(connection->health() == ServerHealth::UNHEALTHY);
    CATCH_REQUIRE(n_changes() == 1);

    ErrorCatcher connected;
    transport->connect(endpoint, connected.handler());
    CATCH_REQUIRE(connected.wait() == std::error_code{});
    CATCH_REQUIRE(connection->is_established());

    ErrorCatcher sent;
    connection->send(encode_message(RpcMessage{RpcHeartbeat{new_guid(), "client", 1}}),
                     sent.handler());
    CATCH_REQUIRE(sent.wait() == std::error_code{});
    CATCH_REQUIRE(wait_until([&]() { return n_changes() == 2; }));
    CATCH_REQUIRE(connection->health() == ServerHealth::HEALTHY);
    CATCH_REQUIRE(connection->consecutive_failures() == 0);

    std::lock_guard lock{padlock};
    CATCH_REQUIRE(changes[0] == std::make_pair(ServerHealth::UNKNOWN, ServerHealth::UNHEALTHY));
    CATCH_REQUIRE(changes[1] == std::make_pair(ServerHealth::UNHEALTHY, ServerHealth::HEALTHY));
  }

  CATCH_SECTION("disposed connections refuse to send, and go quiet") {
    auto transport = factory();
    auto connection = Connection::make("server-a", endpoint, transport);
    std::atomic<int> n_events{0};
    connection->on_data().connect([&](const std::string&, std::span<const std::byte>) { ++n_events; });
    connection->on_closed().connect([&](const std::string&, const Endpoint&) { ++n_events; });

    ErrorCatcher connected;
    transport->connect(endpoint, connected.handler());
    CATCH_REQUIRE(connected.wait() == std::error_code{});

    connection->dispose();
    connection->dispose();
    CATCH_REQUIRE(connection->is_disposed());

    // Completes synchronously
    std::optional<std::error_code> ec;
    connection->send(make_send_buffer("x"), [&ec](std::error_code error) { ec = error; });
    CATCH_REQUIRE(ec == std::optional<std::error_code>{make_error_code(ecode::connection_disposed)});
    CATCH_REQUIRE(transport->data_received().num_slots() == 0);

    transport->stop();
    ErrorCatcher after_stop;
    transport->send(make_send_buffer("y"), after_stop.handler());
    CATCH_REQUIRE(after_stop.wait() == std::optional<std::error_code>{make_error_code(ecode::not_connected)});
    CATCH_REQUIRE(n_events.load() == 0);
  }

  CATCH_SECTION("maximum message size") {
    auto connection = Connection::make("server-a", endpoint, factory(), 4);
    std::optional<std::error_code> ec;
    connection->send(make_send_buffer("12345"), [&ec](std::error_code error) { ec = error; });
    CATCH_REQUIRE(ec == std::optional<std::error_code>{make_error_code(ecode::message_too_large)});
  }

  CATCH_SECTION("a transport is required") {
    CATCH_REQUIRE_THROWS_AS(Connection::make("server-a", endpoint, nullptr), std::invalid_argument);
  }
}

} // namespace granville::net::test
