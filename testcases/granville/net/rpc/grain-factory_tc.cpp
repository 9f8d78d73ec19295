
#include "stdinc.hpp"

#include "test-cluster.hpp"

#include "granville/net/rpc/grain-factory.hpp"
#include "granville/net/rpc/method-table.hpp"

#include <catch2/catch.hpp>

namespace granville::net::test {

namespace {

class PlayerProxy : public GrainReference {
public:
  static constexpr std::string_view k_interface_type = "IPlayerGrain";
  static constexpr auto k_methods = make_method_table("GetName", "Move", "Watch", "GetTitle");

  PlayerProxy(std::shared_ptr<RpcClient> client, GrainId grain_id)
      : GrainReference{std::move(client), std::move(grain_id), std::string{k_interface_type}} {}

  async::Future<std::string> get_name() const {
    return invoke<std::string>(k_methods.id_of("GetName"));
  }

  async::Future<void> move(double x, double y) const {
    return invoke<void>(k_methods.id_of("Move"), x, y);
  }

  async::Future<std::string> get_title() const {
    return invoke<std::string>(k_methods.id_of("GetTitle"));
  }

  async::Future<void> fly() const { return invoke<void>(k_methods.id_of("Fly")); }

  std::shared_ptr<StreamChannel> watch(int32_t n) const {
    return invoke_stream(k_methods.id_of("Watch"), n);
  }
};

class ShopProxy : public GrainReference {
public:
  static constexpr std::string_view k_interface_type = "IShopGrain";

  ShopProxy(std::shared_ptr<RpcClient> client, GrainId grain_id)
      : GrainReference{std::move(client), std::move(grain_id), std::string{k_interface_type}} {}
};

/// A player grain: "GetName" answers `{type}/{key}`, "Move" fails when x is negative,
/// and "GetTitle" answers with a truncated payload
std::vector<RpcMessage> player_server(const RpcMessage& message) {
  const SerializationSessionFactory serializer;
  const auto* request = std::get_if<RpcRequest>(&message);
  if (request == nullptr)
    return {};

  switch (request->method_id) {
  case PlayerProxy::k_methods.id_of("GetName"):
    return {make_response(*request, serializer.serialize_result(request->grain_id.to_string()))};
  case PlayerProxy::k_methods.id_of("Move"): {
    auto args =
        serializer.deserialize_arguments<double, double>(to_span_bytes(request->arguments));
    if (!args || std::get<0>(*args) < 0.0) {
      RpcResponse response;
      response.request_id = request->message_id;
      response.error_message = "out of bounds";
      return {response};
    }
    return {make_response(*request, {})};
  }
  case PlayerProxy::k_methods.id_of("GetTitle"):
    // segmented, but the segment count is cut short
    return {make_response(*request, BufferType{std::byte{0xff}, std::byte{0x01}, std::byte{0x00}})};
  }
  return {};
}

RpcClientOptions make_options(std::vector<Endpoint> endpoints) {
  RpcClientOptions options;
  options.server_endpoints = std::move(endpoints);
  options.max_retry_attempts = 0;
  return options;
}

} // namespace

CATCH_TEST_CASE("ProxyRegistry", "[grain-factory]") {
  boost::asio::io_context io_context;
  auto client = RpcClient::make(make_options({}), io_context,
                                []() -> std::shared_ptr<Transport> { return nullptr; });
  ProxyRegistry registry;

  CATCH_REQUIRE(registry.register_proxy<PlayerProxy>());
  CATCH_REQUIRE(registry.register_proxy<ShopProxy>());
  CATCH_REQUIRE(!registry.register_proxy<ShopProxy>()); // replaced
  CATCH_REQUIRE(registry.size() == 2);
  CATCH_REQUIRE(registry.contains("IPlayerGrain"));
  CATCH_REQUIRE(!registry.contains("IPlayer"));

  auto reference = registry.create("IShopGrain", client, GrainId{"Shop", "main"});
  CATCH_REQUIRE(dynamic_cast<ShopProxy*>(reference.get()) != nullptr);
  CATCH_REQUIRE(reference->interface_type() == "IShopGrain");
  CATCH_REQUIRE(reference->grain_id() == GrainId{"Shop", "main"});

  try {
    registry.create("IUnknown", client, GrainId{"X", "1"});
    CATCH_FAIL("created an unregistered proxy");
  } catch (const RpcException& e) {
    CATCH_REQUIRE(e.error_code() == StatusCode::NOT_FOUND);
  }
}

CATCH_TEST_CASE("GrainFactory", "[grain-factory]") {
  TestCluster cluster;

  GrainManifest manifest;
  manifest.interface_to_grain["IPlayerGrain"] = "PlayerGrain";
  const auto endpoint = cluster.add_server(9000, {"silo-a", manifest}, player_server);

  auto client =
      RpcClient::make(make_options({endpoint}), cluster.io_context(), cluster.transport_factory());
  auto registry = std::make_shared<ProxyRegistry>();
  registry->register_proxy<PlayerProxy>();
  const GrainFactory factory{client, registry};

  CATCH_SECTION("refuses a client that is not started") {
    try {
      factory.get_grain<PlayerProxy>("p1");
      CATCH_FAIL("got a grain from an unstarted client");
    } catch (const RpcException& e) {
      CATCH_REQUIRE(e.error_code() == StatusCode::FAILED_PRECONDITION);
    }
  }

  CATCH_SECTION("typed calls") {
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());

    auto player = factory.get_grain<PlayerProxy>("p1");
    CATCH_REQUIRE(player->grain_id() == GrainId{"PlayerGrain", "p1"});
    CATCH_REQUIRE(player->get_name().get() == "PlayerGrain/p1");

    auto moved = player->move(1.0, 2.0);
    CATCH_REQUIRE(moved.wait_for(std::chrono::seconds{2}) == std::future_status::ready);
    CATCH_REQUIRE(!moved.has_exception());

    try {
      player->move(-1.0, 0.0).get();
      CATCH_FAIL("moved out of bounds");
    } catch (const RpcException& e) {
      CATCH_REQUIRE(e.error_code() == StatusCode::UNKNOWN);
      CATCH_REQUIRE(e.status().error_message() == "out of bounds");
    }

    CATCH_REQUIRE_THROWS_AS(player->fly(), RpcException);
  }

  CATCH_SECTION("a malformed result fails only its own call") {
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());
    auto player = factory.get_grain<PlayerProxy>("p1");

    auto title = player->get_title();
    auto name = player->get_name();
    try {
      title.get();
      CATCH_FAIL("decoded a truncated payload");
    } catch (const RpcException& e) {
      CATCH_REQUIRE(e.error_code() == StatusCode::DATA_LOSS);
    }
    CATCH_REQUIRE(name.get() == "PlayerGrain/p1");
    CATCH_REQUIRE(client->state() == RpcClientState::STARTED);
    CATCH_REQUIRE(client->connections().size() == 1);
  }

  CATCH_SECTION("calls time out") {
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());
    auto player = factory.get_grain<PlayerProxy>("p1");
    player->set_timeout_ms(20);

    auto watched = player->watch(3); // the server never answers streams
    CATCH_REQUIRE(watched->read(std::chrono::milliseconds{10}).error().error_code() ==
                  StatusCode::DEADLINE_EXCEEDED);

    auto timed_out = player->invoke<std::string>(42);
    try {
      timed_out.get();
      CATCH_FAIL("an unanswered call returned");
    } catch (const RpcException& e) {
      CATCH_REQUIRE(e.error_code() == StatusCode::DEADLINE_EXCEEDED);
    }
  }

  CATCH_SECTION("type-erased references") {
    CATCH_REQUIRE(start_and_wait_for_handshakes(*client).ok());
    auto reference = factory.get_grain("IPlayerGrain", "p2");
    CATCH_REQUIRE(reference->grain_id() == GrainId{"PlayerGrain", "p2"});
    CATCH_REQUIRE(std::dynamic_pointer_cast<PlayerProxy>(reference) != nullptr);
    CATCH_REQUIRE_THROWS_AS(factory.get_grain("IShopGrain", "s1"), RpcException);
  }

  CATCH_SECTION("an unreported interface is addressed by name") {
    CATCH_REQUIRE(factory.resolve_grain_type("IShopGrain") == "IShopGrain");
  }
}

} // namespace granville::net::test
