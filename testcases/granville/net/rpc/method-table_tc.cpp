
#include "stdinc.hpp"

#include "granville/net/rpc/method-table.hpp"

#include <catch2/catch.hpp>

namespace granville::net::test {

namespace {
constexpr auto k_player_methods = make_method_table("Move", "GetPosition", "Attack", "Heal");

static_assert(k_player_methods.size() == 4);
static_assert(k_player_methods.id_of("Attack") == 0);
static_assert(k_player_methods.id_of("GetPosition") == 1);
static_assert(k_player_methods.id_of("Heal") == 2);
static_assert(k_player_methods.id_of("Move") == 3);
static_assert(k_player_methods.id_of("Teleport") == -1);
} // namespace

CATCH_TEST_CASE("MethodTable", "[method-table]") {
  CATCH_SECTION("ids are alphabetical") {
    const auto methods = make_method_table("b", "c", "a");
    CATCH_REQUIRE(methods.id_of("a") == 0);
    CATCH_REQUIRE(methods.id_of("b") == 1);
    CATCH_REQUIRE(methods.id_of("c") == 2);
  }

  CATCH_SECTION("names by id") {
    CATCH_REQUIRE(k_player_methods.name_of(0) == "Attack");
    CATCH_REQUIRE(k_player_methods.name_of(3) == "Move");
    CATCH_REQUIRE(k_player_methods.name_of(4).empty());
    CATCH_REQUIRE(k_player_methods.name_of(-1).empty());
  }

  CATCH_SECTION("ids are case sensitive") {
    CATCH_REQUIRE(k_player_methods.contains("Move"));
    CATCH_REQUIRE(!k_player_methods.contains("move"));
  }

  CATCH_SECTION("duplicate names are rejected") {
    CATCH_REQUIRE_THROWS_AS(make_method_table("Move", "Attack", "Move"), std::logic_error);
  }
}

} // namespace granville::net::test
