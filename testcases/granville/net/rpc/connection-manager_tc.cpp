
#include "stdinc.hpp"

#include "granville/net/in-process-transport.hpp"
#include "granville/net/rpc/connection-manager.hpp"

#include <boost/asio/io_context.hpp>

#include <catch2/catch.hpp>

namespace granville::net::test {

static std::shared_ptr<Connection> make_connection(boost::asio::io_context& io_context,
                                                   const std::string& server_id) {
  auto transport = std::make_shared<InProcessTransport>(io_context, nullptr);
  return Connection::make(server_id, Endpoint{"localhost", 9000}, std::move(transport));
}

static RpcRequest make_request(std::string grain_type, std::optional<int32_t> target_zone_id) {
  RpcRequest request;
  request.message_id = new_guid();
  request.grain_id = GrainId{std::move(grain_type), "key"};
  request.interface_type = "IGrain";
  request.target_zone_id = target_zone_id;
  return request;
}

CATCH_TEST_CASE("ConnectionManagerRouting", "[connection-manager]") {
  boost::asio::io_context io_context;
  ConnectionManager manager;

  auto a = make_connection(io_context, "server-a");
  auto b = make_connection(io_context, "server-b");
  manager.add_connection("server-a", a, 1000);
  manager.add_connection("server-b", b, 2000);

  auto strategy = std::make_shared<GrainTypeZoneDetectionStrategy>(
      std::vector<std::pair<std::string, int32_t>>{{"Forest", 2000}});
  manager.set_zone_detection_strategy(strategy);

  CATCH_SECTION("explicit zone overrides detection") {
    const auto connection = manager.get_connection_for_request(make_request("ForestGrain", 1000));
    CATCH_REQUIRE(connection == a);
  }

  CATCH_SECTION("detected zone") {
    CATCH_REQUIRE(manager.get_connection_for_request(make_request("ForestGrain", std::nullopt)) == b);
  }

  CATCH_SECTION("explicit zone with no live server falls through to detection") {
    CATCH_REQUIRE(manager.get_connection_for_request(make_request("ForestGrain", 3000)) == b);
  }

  CATCH_SECTION("no zone falls back to the first live connection") {
    CATCH_REQUIRE(manager.get_connection_for_request(make_request("DesertGrain", std::nullopt)) == a);
    CATCH_REQUIRE(manager.get_connection_for_request(make_request("", 7)) == a);
  }

  CATCH_SECTION("the fallback prefers established, healthy connections") {
    const auto route = [&manager]() {
      return manager.get_connection_for_request(make_request("DesertGrain", std::nullopt));
    };

    b->transport()->connect(Endpoint{"localhost", 9000}, {});
    io_context.run();
    CATCH_REQUIRE(b->is_established());
    CATCH_REQUIRE(!a->is_established());
    CATCH_REQUIRE(route() == b); // a is still connecting

    a->transport()->connect(Endpoint{"localhost", 9000}, {});
    io_context.restart();
    io_context.run();
    CATCH_REQUIRE(route() == a);

    for (int32_t i = 0; i < k_default_unhealthy_threshold; ++i)
      a->record_failure();
    CATCH_REQUIRE(a->health() == ServerHealth::UNHEALTHY);
    CATCH_REQUIRE(route() == b);

    for (int32_t i = 0; i < k_default_unhealthy_threshold; ++i)
      b->record_failure();
    CATCH_REQUIRE(route() == a); // nothing healthy, so the first established

    a->record_success();
    CATCH_REQUIRE(a->health() == ServerHealth::HEALTHY);
    CATCH_REQUIRE(route() == a);
  }

  CATCH_SECTION("disposed connections are skipped") {
    a->dispose();
    CATCH_REQUIRE(manager.get_connection_for_request(make_request("DesertGrain", 1000)) == b);
    CATCH_REQUIRE(manager.get_connection_for_zone(1000) == nullptr);
    CATCH_REQUIRE(manager.get_connection_for_zone(2000) == b);
  }

  CATCH_SECTION("zones may name servers that are not connected") {
    manager.update_zone_mappings({{3000, "server-c"}});
    CATCH_REQUIRE(manager.get_connection_for_zone(3000) == nullptr);
    CATCH_REQUIRE(manager.get_connection_for_request(make_request("DesertGrain", 3000)) == a);

    auto c = make_connection(io_context, "server-c");
    manager.add_connection("server-c", c);
    CATCH_REQUIRE(manager.get_connection_for_request(make_request("DesertGrain", 3000)) == c);
  }

  CATCH_SECTION("nothing to route to") {
    manager.clear();
    CATCH_REQUIRE(a->is_disposed());
    CATCH_REQUIRE(b->is_disposed());
    try {
      manager.get_connection_for_request(make_request("ForestGrain", 1000));
      CATCH_REQUIRE(false);
    } catch (const RpcException& e) {
      CATCH_REQUIRE(e.status().error_code() == StatusCode::FAILED_PRECONDITION);
      CATCH_REQUIRE(e.status().error_message() == "No RPC connections available");
    }
  }
}

CATCH_TEST_CASE("ConnectionManagerRegistry", "[connection-manager]") {
  boost::asio::io_context io_context;
  ConnectionManager manager;

  CATCH_SECTION("null connection") {
    CATCH_REQUIRE_THROWS_AS(manager.add_connection("server-a", nullptr), std::invalid_argument);
  }

  CATCH_SECTION("replacement disposes the old connection") {
    auto first = make_connection(io_context, "server-a");
    auto second = make_connection(io_context, "server-a");
    manager.add_connection("server-a", first);
    manager.add_connection("server-a", second);
    CATCH_REQUIRE(manager.size() == 1);
    CATCH_REQUIRE(first->is_disposed());
    CATCH_REQUIRE(!second->is_disposed());
    CATCH_REQUIRE(manager.get_connection("server-a") == second);

    // Re-adding the same connection only sets the zone
    manager.add_connection("server-a", second, 5);
    CATCH_REQUIRE(!second->is_disposed());
    CATCH_REQUIRE(manager.get_connection_for_zone(5) == second);
  }

  CATCH_SECTION("removal purges zones") {
    auto a = make_connection(io_context, "server-a");
    auto b = make_connection(io_context, "server-b");
    manager.add_connection("server-a", a, 1000);
    manager.add_connection("server-b", b, 2000);
    manager.update_zone_mappings({{1001, "server-a"}, {2001, "server-b"}});

    CATCH_REQUIRE(manager.remove_connection("server-a"));
    CATCH_REQUIRE(a->is_disposed());
    CATCH_REQUIRE(!manager.remove_connection("server-a"));

    const auto zones = manager.get_zone_mappings();
    CATCH_REQUIRE(zones.size() == 2);
    for (const auto& [zone_id, server_id] : zones)
      CATCH_REQUIRE(server_id != "server-a");
    CATCH_REQUIRE(manager.get_all_connections() == std::vector<std::shared_ptr<Connection>>{b});
  }

  CATCH_SECTION("removal of a replaced connection is a no-op") {
    auto first = make_connection(io_context, "server-a");
    auto second = make_connection(io_context, "server-a");
    manager.add_connection("server-a", first, 1000);
    manager.add_connection("server-a", second);

    CATCH_REQUIRE(!manager.remove_connection("server-a", first.get()));
    CATCH_REQUIRE(manager.get_connection_for_zone(1000) == second);
    CATCH_REQUIRE(manager.remove_connection("server-a", second.get()));
    CATCH_REQUIRE(manager.size() == 0);
    CATCH_REQUIRE(manager.get_zone_mappings().empty());
  }

  CATCH_SECTION("zone failover") {
    auto a = make_connection(io_context, "server-a");
    auto b = make_connection(io_context, "server-b");
    manager.add_connection("server-a", a, 1000);
    manager.add_connection("server-b", b);

    CATCH_REQUIRE(manager.get_connection_for_request(make_request("Grain", 1000)) == a);
    manager.remove_connection("server-a");
    CATCH_REQUIRE(manager.get_connection_for_request(make_request("Grain", 1000)) == b);

    manager.remove_connection("server-b");
    CATCH_REQUIRE_THROWS_AS(manager.get_connection_for_request(make_request("Grain", 1000)),
                            RpcException);
  }
}

} // namespace granville::net::test
