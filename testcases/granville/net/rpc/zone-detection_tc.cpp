
#include "stdinc.hpp"

#include "granville/net/rpc/zone-detection.hpp"

#include <catch2/catch.hpp>

namespace granville::net::test {

CATCH_TEST_CASE("ZoneDetection", "[zone-detection]") {
  const GrainId forest{"ForestGrain", "tree-1"};
  const GrainId desert{"DesertGrain", "dune-1"};

  CATCH_SECTION("grain type patterns match in order") {
    GrainTypeZoneDetectionStrategy strategy{{{"Forest", 1000}, {"Grain", 9000}}};
    CATCH_REQUIRE(strategy.detect_zone(forest, "IForest") == std::optional<int32_t>{1000});
    CATCH_REQUIRE(strategy.detect_zone(desert, "IDesert") == std::optional<int32_t>{9000});
    CATCH_REQUIRE(!strategy.detect_zone(GrainId{"Player", "p"}, "IPlayer").has_value());

    strategy.add_mapping("Grain", 9001); // re-pointed in place, keeps its position
    CATCH_REQUIRE(strategy.detect_zone(forest, "") == std::optional<int32_t>{1000});
    CATCH_REQUIRE(strategy.detect_zone(desert, "") == std::optional<int32_t>{9001});

    CATCH_REQUIRE(strategy.remove_mapping("Forest"));
    CATCH_REQUIRE(!strategy.remove_mapping("Forest"));
    CATCH_REQUIRE(strategy.detect_zone(forest, "") == std::optional<int32_t>{9001});
  }

  CATCH_SECTION("interface types") {
    InterfaceZoneDetectionStrategy strategy;
    strategy.add_mapping("IForest", 1000);
    CATCH_REQUIRE(strategy.detect_zone(desert, "IForest") == std::optional<int32_t>{1000});
    CATCH_REQUIRE(!strategy.detect_zone(forest, "IForestGrain").has_value());
    CATCH_REQUIRE(strategy.remove_mapping("IForest"));
    CATCH_REQUIRE(!strategy.detect_zone(desert, "IForest").has_value());
  }

  CATCH_SECTION("composite takes the first answer") {
    auto by_interface = std::make_shared<InterfaceZoneDetectionStrategy>();
    by_interface->add_mapping("IDesert", 2000);
    auto by_type = std::make_shared<GrainTypeZoneDetectionStrategy>(
        std::vector<std::pair<std::string, int32_t>>{{"Grain", 3000}});

    const CompositeZoneDetectionStrategy composite{{by_interface, nullptr, by_type}};
    CATCH_REQUIRE(composite.detect_zone(desert, "IDesert") == std::optional<int32_t>{2000});
    CATCH_REQUIRE(composite.detect_zone(forest, "IForest") == std::optional<int32_t>{3000});
    CATCH_REQUIRE(!composite.detect_zone(GrainId{"Player", "p"}, "IPlayer").has_value());
  }
}

} // namespace granville::net::test
