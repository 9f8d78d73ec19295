
#include "stdinc.hpp"

#include "test-cluster.hpp"

#include <catch2/catch.hpp>

#include <functional>
#include <thread>

namespace granville::net::test {

namespace {

/// Every completion a request receives
class Completions {
private:
  mutable std::mutex padlock_;
  std::vector<std::pair<Status, RpcResponse>> outcomes_;

public:
  RpcClient::ResponseHandler handler() {
    return [this](Status status, RpcResponse response) {
      std::lock_guard lock{padlock_};
      outcomes_.emplace_back(std::move(status), std::move(response));
    };
  }

  std::size_t size() const {
    std::lock_guard lock{padlock_};
    return outcomes_.size();
  }

  bool wait(std::size_t n = 1) {
    return wait_until([this, n]() { return size() >= n; });
  }

  std::pair<Status, RpcResponse> at(std::size_t index) const {
    std::lock_guard lock{padlock_};
    return outcomes_.at(index);
  }
};

RpcRequest make_request(std::optional<int32_t> zone_id = std::nullopt) {
  const SerializationSessionFactory serializer;
  RpcRequest request;
  request.grain_id = GrainId{"Player", "p1"};
  request.interface_type = "IPlayer";
  request.method_id = 2;
  request.arguments = serializer.serialize_arguments(std::string{"abc"}, int32_t{5});
  request.target_zone_id = zone_id;
  return request;
}

/// Answers every request with `name`
TestCluster::MessageHandler reply_with(std::string name) {
  return [name](const RpcMessage& message) -> std::vector<RpcMessage> {
    const SerializationSessionFactory serializer;
    if (const auto* request = std::get_if<RpcRequest>(&message))
      return {make_response(*request, serializer.serialize_result(name))};
    return {};
  };
}

TestCluster::MessageHandler never_reply() {
  return [](const RpcMessage&) { return std::vector<RpcMessage>{}; };
}

RpcClientOptions make_options(std::vector<Endpoint> endpoints) {
  RpcClientOptions options;
  options.client_id = "test-client";
  options.server_endpoints = std::move(endpoints);
  options.connection_timeout_ms = 1000;
  options.max_retry_attempts = 0;
  options.retry_delay_ms = 1;
  return options;
}

std::string result_of(const RpcClient& client, const RpcResponse& response) {
  auto value = client.serializer().deserialize<std::string>(to_span_bytes(response.payload));
  return value ? *value : value.error().to_string();
}

} // namespace

// ------------------------------------------------------------------------------------------- calls

CATCH_TEST_CASE("RpcClient requests", "[rpc-client]") {
  TestCluster cluster;

  CATCH_SECTION("a call is answered") {
    const auto endpoint = cluster.add_server(
        9000, {"silo-a"}, [](const RpcMessage& message) -> std::vector<RpcMessage> {
          const SerializationSessionFactory serializer;
          const auto* request = std::get_if<RpcRequest>(&message);
          if (request == nullptr || request->method_id != 2)
            return {};
          auto args = serializer.deserialize_arguments<std::string, int32_t>(
              to_span_bytes(request->arguments));
          if (!args)
            return {};
          const auto& [text, number] = *args;
          return {make_response(*request, serializer.serialize_result(text + std::to_string(number)))};
        });

    auto client = RpcClient::make(make_options({endpoint}), cluster.io_context(),
                                  cluster.transport_factory());
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());
    CATCH_REQUIRE(client->state() == RpcClientState::STARTED);

    Completions completions;
    client->send_request(make_request(), completions.handler());
    CATCH_REQUIRE(completions.wait());

    const auto [status, response] = completions.at(0);
    CATCH_REQUIRE(status.ok());
    CATCH_REQUIRE(response.success);
    CATCH_REQUIRE(result_of(*client, response) == "abc5");
    CATCH_REQUIRE(client->pending_request_count() == 0);
    CATCH_REQUIRE(cluster.count_received<RpcHandshake>(9000) == 1);
  }

  CATCH_SECTION("the handshake identifies the client") {
    const auto endpoint = cluster.add_server(9000, {"silo-a"});
    auto client = RpcClient::make(make_options({endpoint}), cluster.io_context(),
                                  cluster.transport_factory());
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());

    const auto received = cluster.received(9000);
    CATCH_REQUIRE(received.size() == 1);
    const auto& handshake = std::get<RpcHandshake>(received.front());
    CATCH_REQUIRE(handshake.client_id == "test-client");
    CATCH_REQUIRE(handshake.protocol_version == k_protocol_version);
    CATCH_REQUIRE(!handshake.message_id.is_nil());
  }

  CATCH_SECTION("a request without a response times out") {
    const auto endpoint = cluster.add_server(9000, {"silo-a"}, never_reply());
    auto client = RpcClient::make(make_options({endpoint}), cluster.io_context(),
                                  cluster.transport_factory());
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());

    auto request = make_request();
    request.message_id = new_guid();
    request.timeout_ms = 50;
    const auto request_id = request.message_id;

    Completions completions;
    client->send_request(std::move(request), completions.handler());
    CATCH_REQUIRE(client->has_pending_request(request_id));
    CATCH_REQUIRE(completions.wait());
    CATCH_REQUIRE(completions.at(0).first.error_code() == StatusCode::DEADLINE_EXCEEDED);
    CATCH_REQUIRE(!client->has_pending_request(request_id));
  }

  CATCH_SECTION("a duplicate response is dropped") {
    const auto endpoint = cluster.add_server(
        9000, {"silo-a"}, [](const RpcMessage& message) -> std::vector<RpcMessage> {
          const SerializationSessionFactory serializer;
          const auto* request = std::get_if<RpcRequest>(&message);
          if (request == nullptr)
            return {};
          return {make_response(*request, serializer.serialize_result(std::string{"first"})),
                  make_response(*request, serializer.serialize_result(std::string{"second"}))};
        });
    auto client = RpcClient::make(make_options({endpoint}), cluster.io_context(),
                                  cluster.transport_factory());
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());

    Completions completions;
    client->send_request(make_request(), completions.handler());
    CATCH_REQUIRE(completions.wait());
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    CATCH_REQUIRE(completions.size() == 1);
    CATCH_REQUIRE(result_of(*client, completions.at(0).second) == "first");
  }

  CATCH_SECTION("a failed response reports the server's message") {
    const auto endpoint = cluster.add_server(
        9000, {"silo-a"}, [](const RpcMessage& message) -> std::vector<RpcMessage> {
          const auto* request = std::get_if<RpcRequest>(&message);
          if (request == nullptr)
            return {};
          RpcResponse response;
          response.request_id = request->message_id;
          response.success = false;
          response.error_message = "grain not found";
          return {response};
        });
    auto client = RpcClient::make(make_options({endpoint}), cluster.io_context(),
                                  cluster.transport_factory());
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());

    Completions completions;
    client->send_request(make_request(), completions.handler());
    CATCH_REQUIRE(completions.wait());
    const auto [status, response] = completions.at(0);
    CATCH_REQUIRE(status.error_code() == StatusCode::UNKNOWN);
    CATCH_REQUIRE(status.error_message() == "grain not found");
    CATCH_REQUIRE(!response.success);
  }

  CATCH_SECTION("an error message fails its request") {
    const auto endpoint = cluster.add_server(
        9000, {"silo-a"}, [](const RpcMessage& message) -> std::vector<RpcMessage> {
          const auto* request = std::get_if<RpcRequest>(&message);
          if (request == nullptr)
            return {};
          RpcErrorMessage error;
          error.request_id = request->message_id;
          error.error_type = "InvalidOperation";
          error.message = "boom";
          // An error not tied to any request is only logged
          return {RpcErrorMessage{Guid{}, "Warning", "ignored"}, error};
        });
    auto client = RpcClient::make(make_options({endpoint}), cluster.io_context(),
                                  cluster.transport_factory());
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());

    Completions completions;
    client->send_request(make_request(), completions.handler());
    CATCH_REQUIRE(completions.wait());
    const auto status = completions.at(0).first;
    CATCH_REQUIRE(status.error_code() == StatusCode::INTERNAL);
    CATCH_REQUIRE(status.error_message() == "boom");
  }

  CATCH_SECTION("stop cancels pending requests") {
    const auto endpoint = cluster.add_server(9000, {"silo-a"}, never_reply());
    auto client = RpcClient::make(make_options({endpoint}), cluster.io_context(),
                                  cluster.transport_factory());
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());

    Completions completions;
    client->send_request(make_request(), completions.handler());
    client->send_request(make_request(), completions.handler());
    CATCH_REQUIRE(client->pending_request_count() == 2);

    client->stop();
    CATCH_REQUIRE(completions.size() == 2);
    CATCH_REQUIRE(completions.at(0).first.error_code() == StatusCode::CANCELLED);
    CATCH_REQUIRE(completions.at(1).first.error_code() == StatusCode::CANCELLED);
    CATCH_REQUIRE(client->state() == RpcClientState::STOPPED);
    CATCH_REQUIRE(client->connections().size() == 0);

    try {
      client->send_request(make_request(), completions.handler());
      CATCH_FAIL("send after stop");
    } catch (const RpcException& e) {
      CATCH_REQUIRE(e.error_code() == StatusCode::FAILED_PRECONDITION);
    }

    client->stop(); // idempotent
    CATCH_REQUIRE(completions.size() == 2);
  }

  CATCH_SECTION("no connection to route to") {
    auto client =
        RpcClient::make(make_options({}), cluster.io_context(), cluster.transport_factory());
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());
    CATCH_REQUIRE(client->state() == RpcClientState::STARTED);

    Completions completions;
    try {
      client->send_request(make_request(), completions.handler());
      CATCH_FAIL("send without connections");
    } catch (const RpcException& e) {
      CATCH_REQUIRE(e.error_code() == StatusCode::FAILED_PRECONDITION);
    }
    CATCH_REQUIRE(completions.size() == 0);
    CATCH_REQUIRE(client->pending_request_count() == 0);
  }
}

// --------------------------------------------------------------------------------------- lifecycle

CATCH_TEST_CASE("RpcClient lifecycle", "[rpc-client]") {
  TestCluster cluster;

  CATCH_SECTION("start twice") {
    const auto endpoint = cluster.add_server(9000, {"silo-a"});
    auto client = RpcClient::make(make_options({endpoint}), cluster.io_context(),
                                  cluster.transport_factory());
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());

    std::optional<Status> second;
    client->start([&](Status status) { second = std::move(status); });
    CATCH_REQUIRE(second.has_value());
    CATCH_REQUIRE(second->error_code() == StatusCode::FAILED_PRECONDITION);
    CATCH_REQUIRE(client->state() == RpcClientState::STARTED);
  }

  CATCH_SECTION("a refused connect is rolled back") {
    auto options = make_options({Endpoint{"localhost", 9999}});
    options.max_retry_attempts = 2;
    auto client =
        RpcClient::make(std::move(options), cluster.io_context(), cluster.transport_factory());

    const auto status = start_and_wait_for_handshakes(*client);
    CATCH_REQUIRE(status.error_code() == StatusCode::UNAVAILABLE);
    CATCH_REQUIRE(client->state() == RpcClientState::FAILED);
    CATCH_REQUIRE(client->connections().size() == 0);
  }

  CATCH_SECTION("a connect that never completes times out") {
    FaultyTransports transports{cluster.io_context(), FaultyTransport::Fault::HANG_CONNECT};
    auto options = make_options({Endpoint{"localhost", 9000}});
    options.connection_timeout_ms = 50;
    auto client = RpcClient::make(std::move(options), cluster.io_context(), transports.factory());

    const auto status = start_and_wait(*client);
    CATCH_REQUIRE(status.error_code() == StatusCode::DEADLINE_EXCEEDED);
    CATCH_REQUIRE(client->state() == RpcClientState::FAILED);
    CATCH_REQUIRE(client->connections().size() == 0);
    CATCH_REQUIRE(transports.made().size() == 1);
    CATCH_REQUIRE(transports.made().front()->is_stopped());
  }

  CATCH_SECTION("a failed handshake send is rolled back") {
    FaultyTransports transports{cluster.io_context(), FaultyTransport::Fault::FAIL_SEND};
    auto client = RpcClient::make(make_options({Endpoint{"localhost", 9000}}),
                                  cluster.io_context(), transports.factory());

    const auto status = start_and_wait(*client);
    CATCH_REQUIRE(status.error_code() == StatusCode::UNAVAILABLE);
    CATCH_REQUIRE(client->state() == RpcClientState::FAILED);
    CATCH_REQUIRE(client->connections().size() == 0);
    CATCH_REQUIRE(transports.made().size() == 1);
    CATCH_REQUIRE(transports.made().front()->is_stopped());
    CATCH_REQUIRE(transports.made().front()->n_failed_sends() == 1);
  }

  CATCH_SECTION("a partial start keeps its connections until stop") {
    const auto good = cluster.add_server(9000, {"silo-a"});
    auto client = RpcClient::make(make_options({good, Endpoint{"localhost", 9999}}),
                                  cluster.io_context(), cluster.transport_factory());

    const auto status = start_and_wait(*client);
    CATCH_REQUIRE(status.error_code() == StatusCode::UNAVAILABLE);
    CATCH_REQUIRE(client->state() == RpcClientState::FAILED);
    CATCH_REQUIRE(client->connections().size() == 1);
    CATCH_REQUIRE(client->connections().get_connection("server-localhost:9000") != nullptr);

    client->stop();
    CATCH_REQUIRE(client->state() == RpcClientState::STOPPED);
    CATCH_REQUIRE(client->connections().size() == 0);
    CATCH_REQUIRE(start_and_wait(*client).error_code() == StatusCode::FAILED_PRECONDITION);
  }

  CATCH_SECTION("start again after a partial start") {
    const auto good = cluster.add_server(9000, {"silo-a"});
    auto client = RpcClient::make(make_options({good, Endpoint{"localhost", 9999}}),
                                  cluster.io_context(), cluster.transport_factory());
    CATCH_REQUIRE(start_and_wait(*client).error_code() == StatusCode::UNAVAILABLE);

    cluster.add_server(9999, {"silo-b"});
    CATCH_REQUIRE(start_and_wait(*client).ok());
    CATCH_REQUIRE(client->state() == RpcClientState::STARTED);
    CATCH_REQUIRE(client->connections().size() == 2);
    CATCH_REQUIRE(cluster.count_received<RpcHandshake>(9000) == 1); // not reconnected
    CATCH_REQUIRE(wait_until([&]() { return cluster.count_received<RpcHandshake>(9999) == 1; }));
  }

  CATCH_SECTION("a server that does not acknowledge the handshake") {
    GrainManifest manifest;
    manifest.interface_to_grain["IPlayer"] = "Player";
    TestCluster::ServerConfig config{"silo-a", manifest};
    config.acknowledge = false;
    const auto endpoint = cluster.add_server(9000, config, reply_with("a"));

    auto client = RpcClient::make(make_options({endpoint}), cluster.io_context(),
                                  cluster.transport_factory());
    std::atomic<int> n_acknowledged{0};
    client->handshake_completed().connect([&](const std::string&) { ++n_acknowledged; });
    CATCH_REQUIRE(start_and_wait(*client).ok());
    CATCH_REQUIRE(client->state() == RpcClientState::STARTED);

    // The response follows the handshake on the same link
    Completions completions;
    client->send_request(make_request(), completions.handler());
    CATCH_REQUIRE(completions.wait());
    CATCH_REQUIRE(result_of(*client, completions.at(0).second) == "a");

    CATCH_REQUIRE(n_acknowledged.load() == 0);
    CATCH_REQUIRE(!client->manifests().current()->grain_type_for_interface("IPlayer"));
    CATCH_REQUIRE(client->connections().get_zone_mappings().empty());
  }

  CATCH_SECTION("connect_to_server without a running client") {
    const auto endpoint = cluster.add_server(9000, {"silo-a"});
    auto client =
        RpcClient::make(make_options({}), cluster.io_context(), cluster.transport_factory());

    std::mutex padlock;
    std::optional<Status> result;
    client->connect_to_server(endpoint, "custom-id", [&](Status status) {
      std::lock_guard lock{padlock};
      result = std::move(status);
    });
    CATCH_REQUIRE(wait_until([&]() {
      std::lock_guard lock{padlock};
      return result.has_value();
    }));
    CATCH_REQUIRE(result->ok());
    CATCH_REQUIRE(client->connections().get_connection("custom-id") != nullptr);
  }

  CATCH_SECTION("heartbeats") {
    const auto endpoint = cluster.add_server(9000, {"silo-a"}, never_reply());
    auto options = make_options({endpoint});
    options.heartbeat_interval_ms = 10;
    auto client =
        RpcClient::make(std::move(options), cluster.io_context(), cluster.transport_factory());
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());

    CATCH_REQUIRE(wait_until([&]() { return cluster.count_received<RpcHeartbeat>(9000) >= 2; }));
    client->stop();
  }

  CATCH_SECTION("the default server id") {
    CATCH_REQUIRE(RpcClient::default_server_id(Endpoint{"localhost", 9000}) ==
                  "server-localhost:9000");
  }
}

// ------------------------------------------------------------------------------------------ health

CATCH_TEST_CASE("RpcClient server health", "[rpc-client][health]") {
  TestCluster cluster;
  FaultyTransports transports{cluster.io_context(), FaultyTransport::Fault::FAIL_LATER_SENDS};

  auto options = make_options({Endpoint{"localhost", 9000}});
  options.heartbeat_interval_ms = 5; // heartbeats fail after the handshake
  options.unhealthy_threshold = 2;

  std::mutex padlock;
  std::vector<ServerHealth> changes;
  const auto last_change = [&]() {
    std::lock_guard lock{padlock};
    return changes.empty() ? ServerHealth::UNKNOWN : changes.back();
  };

  CATCH_SECTION("failed heartbeats make a server unhealthy") {
    auto client = RpcClient::make(options, cluster.io_context(), transports.factory());
    client->server_health_changed().connect(
        [&](const std::string& server_id, ServerHealth, ServerHealth current) {
          if (server_id != "server-localhost:9000")
            return;
          std::lock_guard lock{padlock};
          changes.push_back(current);
        });
    CATCH_REQUIRE(start_and_wait(*client).ok());

    CATCH_REQUIRE(wait_until([&]() { return last_change() == ServerHealth::UNHEALTHY; }));
    auto connection = client->connections().get_connection("server-localhost:9000");
    CATCH_REQUIRE(connection != nullptr);
    CATCH_REQUIRE(connection->health() == ServerHealth::UNHEALTHY);
    CATCH_REQUIRE(connection->consecutive_failures() >= 2);
    {
      std::lock_guard lock{padlock};
      CATCH_REQUIRE(changes.front() == ServerHealth::HEALTHY); // the handshake went through
    }
    client->stop();
  }

  CATCH_SECTION("unhealthy servers can be removed") {
    options.remove_unhealthy_servers = true;
    auto client = RpcClient::make(options, cluster.io_context(), transports.factory());
    client->server_health_changed().connect(
        [&](const std::string&, ServerHealth, ServerHealth current) {
          std::lock_guard lock{padlock};
          changes.push_back(current);
        });
    CATCH_REQUIRE(start_and_wait(*client).ok());

    CATCH_REQUIRE(wait_until([&]() { return client->connections().size() == 0; }));
    CATCH_REQUIRE(wait_until([&]() { return last_change() == ServerHealth::UNHEALTHY; }));
    CATCH_REQUIRE(transports.made().front()->is_stopped());
    CATCH_REQUIRE_THROWS_AS(client->send_request(make_request(), [](Status, RpcResponse) {}),
                            RpcException);
  }
}

// ------------------------------------------------------------------------------- zones & manifests

CATCH_TEST_CASE("RpcClient zones and manifests", "[rpc-client]") {
  TestCluster cluster;

  GrainManifest player_manifest;
  player_manifest.interface_to_grain["IPlayer"] = "Player";
  GrainManifest shop_manifest;
  shop_manifest.interface_to_grain["IShop"] = "Shop";

  TestCluster::ServerConfig silo_a{"silo-a", player_manifest, 1};
  silo_a.zone_mappings = std::map<int32_t, std::string>{{7, "server-localhost:9002"}};
  const auto endpoint_a = cluster.add_server(9001, silo_a, reply_with("a"));
  const auto endpoint_b =
      cluster.add_server(9002, {"silo-b", shop_manifest, 2}, reply_with("b"));

  auto client = RpcClient::make(make_options({endpoint_a, endpoint_b}), cluster.io_context(),
                                cluster.transport_factory());
  CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());

  CATCH_SECTION("acknowledgements fill the manifest and zones") {
    const auto manifest = client->manifests().current();
    CATCH_REQUIRE(manifest->grain_type_for_interface("IPlayer") == std::optional<std::string>{"Player"});
    CATCH_REQUIRE(manifest->grain_type_for_interface("IShop") == std::optional<std::string>{"Shop"});

    const auto zones = client->connections().get_zone_mappings();
    CATCH_REQUIRE(zones.at(1) == "server-localhost:9001");
    CATCH_REQUIRE(zones.at(2) == "server-localhost:9002");
    CATCH_REQUIRE(zones.at(7) == "server-localhost:9002");
  }

  CATCH_SECTION("requests follow the target zone") {
    Completions completions;
    client->send_request(make_request(1), completions.handler());
    client->send_request(make_request(2), completions.handler());
    client->send_request(make_request(7), completions.handler());
    CATCH_REQUIRE(completions.wait(3));
    CATCH_REQUIRE(cluster.count_received<RpcRequest>(9001) == 1);
    CATCH_REQUIRE(cluster.count_received<RpcRequest>(9002) == 2);
  }

  CATCH_SECTION("a closed server is forgotten, and its zone fails over") {
    cluster.close_server(9001);
    CATCH_REQUIRE(wait_until([&]() { return client->connections().size() == 1; }));

    CATCH_REQUIRE(!client->connections().get_zone_mappings().contains(1));
    CATCH_REQUIRE(!client->manifests().current()->grain_type_for_interface("IPlayer"));
    CATCH_REQUIRE(client->manifests().current()->grain_type_for_interface("IShop"));

    Completions completions;
    client->send_request(make_request(1), completions.handler());
    CATCH_REQUIRE(completions.wait());
    CATCH_REQUIRE(completions.at(0).first.ok());
    CATCH_REQUIRE(result_of(*client, completions.at(0).second) == "b");
  }
}

// ----------------------------------------------------------------------------------------- streams

CATCH_TEST_CASE("RpcClient streams", "[rpc-client][streams]") {
  TestCluster cluster;
  constexpr auto timeout = std::chrono::milliseconds{2000};

  const auto endpoint = cluster.add_server(
      9000, {"silo-a"}, [](const RpcMessage& message) -> std::vector<RpcMessage> {
        const SerializationSessionFactory serializer;
        const auto* request = std::get_if<AsyncEnumerableRequest>(&message);
        if (request == nullptr || request->method_id != 0)
          return {};
        const auto id = request->stream_id;
        return {AsyncEnumerableItem{id, 0, serializer.serialize_result(std::string{"x"}), false, ""},
                AsyncEnumerableItem{id, 1, serializer.serialize_result(std::string{"y"}), false, ""},
                AsyncEnumerableItem{id, 1, serializer.serialize_result(std::string{"dup"}), false, ""},
                AsyncEnumerableItem{id, 2, {}, true, ""}};
      });

  auto client = RpcClient::make(make_options({endpoint}), cluster.io_context(),
                                cluster.transport_factory());
  CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());

  AsyncEnumerableRequest request;
  request.grain_id = GrainId{"Player", "p1"};
  request.interface_type = "IPlayer";

  CATCH_SECTION("items arrive in order") {
    auto channel = client->open_stream(request);
    CATCH_REQUIRE(!channel->stream_id().is_nil());
    CATCH_REQUIRE(channel->server_id() == "server-localhost:9000");

    const auto& serializer = client->serializer();
    CATCH_REQUIRE(channel->read<std::string>(serializer, timeout) == tl::expected<std::optional<std::string>, Status>{std::optional<std::string>{"x"}});
    CATCH_REQUIRE(channel->read<std::string>(serializer, timeout) == tl::expected<std::optional<std::string>, Status>{std::optional<std::string>{"y"}});
    const auto end = channel->read<std::string>(serializer, timeout);
    CATCH_REQUIRE(end.has_value());
    CATCH_REQUIRE(!end->has_value());
    CATCH_REQUIRE(wait_until([&]() { return client->open_stream_count() == 0; }));
  }

  CATCH_SECTION("items can be consumed by continuation") {
    auto channel = client->open_stream(request);
    const auto& serializer = client->serializer();

    // Chain each read off the previous one, without blocking
    std::mutex padlock;
    std::vector<std::string> seen;
    std::optional<Status> finished;
    std::function<void()> read_next;
    read_next = [&]() {
      channel->async_read([&](StreamChannel::ReadResult item) {
        std::unique_lock lock{padlock};
        if (!item) {
          finished = item.error();
          return;
        }
        if (!item->has_value()) {
          finished = Status{};
          return;
        }
        seen.push_back(*serializer.deserialize<std::string>(to_span_bytes(**item)));
        lock.unlock();
        read_next();
      });
    };
    read_next();

    CATCH_REQUIRE(wait_until([&]() {
      std::lock_guard lock{padlock};
      return finished.has_value();
    }));
    std::lock_guard lock{padlock};
    CATCH_REQUIRE(finished->ok());
    CATCH_REQUIRE(seen == std::vector<std::string>{"x", "y"});
  }

  CATCH_SECTION("next returns futures") {
    auto channel = client->open_stream(request);
    const auto& serializer = client->serializer();

    auto first = channel->next<std::string>(serializer);
    auto second = channel->next<std::string>(serializer);
    auto third = channel->next<std::string>(serializer);
    CATCH_REQUIRE(third.wait_for(timeout) == std::future_status::ready);
    CATCH_REQUIRE(first.get() == std::optional<std::string>{"x"});
    CATCH_REQUIRE(second.get() == std::optional<std::string>{"y"});
    CATCH_REQUIRE(third.get() == std::nullopt);
  }

  CATCH_SECTION("cancel tells the server") {
    request.method_id = 1; // never answered
    auto channel = client->open_stream(request);
    CATCH_REQUIRE(client->open_stream_count() == 1);

    CATCH_REQUIRE(client->cancel_stream(channel->stream_id()));
    CATCH_REQUIRE(!client->cancel_stream(channel->stream_id()));
    CATCH_REQUIRE(channel->state() == StreamChannel::State::CANCELLED);
    CATCH_REQUIRE(
        wait_until([&]() { return cluster.count_received<AsyncEnumerableCancel>(9000) == 1; }));

    const auto cancel = cluster.received(9000).back();
    CATCH_REQUIRE(std::get<AsyncEnumerableCancel>(cancel).stream_id == channel->stream_id());
  }

  CATCH_SECTION("a closed connection fails its streams") {
    request.method_id = 1;
    auto channel = client->open_stream(request);
    cluster.close_server(9000);

    auto item = channel->next();
    CATCH_REQUIRE(item.wait_for(timeout) == std::future_status::ready);
    try {
      item.get();
      CATCH_FAIL("read an item from a closed connection");
    } catch (const RpcException& e) {
      CATCH_REQUIRE(e.error_code() == StatusCode::UNKNOWN);
      CATCH_REQUIRE(e.status().error_message() == "connection closed");
    }
  }
}

} // namespace granville::net::test
