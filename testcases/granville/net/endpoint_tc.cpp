
#include "stdinc.hpp"

#include "granville/net/endpoint.hpp"

#include <catch2/catch.hpp>

namespace granville::net::test {

CATCH_TEST_CASE("Endpoint", "[endpoint]") {
  CATCH_SECTION("host and port") {
    const auto endpoint = parse_endpoint("game.example.com:12000");
    CATCH_REQUIRE(endpoint.has_value());
    CATCH_REQUIRE(endpoint->host == "game.example.com");
    CATCH_REQUIRE(endpoint->port == 12000);
    CATCH_REQUIRE(endpoint->to_string() == "game.example.com:12000");
  }

  CATCH_SECTION("ipv6") {
    const auto endpoint = parse_endpoint("[::1]:9000");
    CATCH_REQUIRE(endpoint.has_value());
    CATCH_REQUIRE(endpoint->host == "::1");
    CATCH_REQUIRE(endpoint->port == 9000);
  }

  CATCH_SECTION("malformed") {
    for (const auto text : {"", "localhost", "localhost:", ":80", "localhost:0",
                            "localhost:65536", "localhost:80x", "[]:80"}) {
      const auto endpoint = parse_endpoint(text);
      CATCH_REQUIRE(!endpoint.has_value());
      CATCH_REQUIRE(endpoint.error() == make_error_code(ecode::argument_error));
    }
  }
}

} // namespace granville::net::test
