
#include "stdinc.hpp"

#include "granville/utils/guid.hpp"

#include <catch2/catch.hpp>

#include <unordered_set>

namespace granville::tests {

CATCH_TEST_CASE("Guid", "[guid]") {
  CATCH_SECTION("nil") {
    CATCH_REQUIRE(nil_guid().is_nil());
    CATCH_REQUIRE(granville::to_string(nil_guid()) == "00000000-0000-0000-0000-000000000000");
  }

  CATCH_SECTION("fresh guids are distinct") {
    std::unordered_set<Guid, GuidHash> guids;
    for (int i = 0; i < 1000; ++i)
      guids.insert(new_guid());
    CATCH_REQUIRE(guids.size() == 1000);
    CATCH_REQUIRE(!guids.contains(nil_guid()));
  }

  CATCH_SECTION("compact form") {
    const auto guid = new_guid();
    const auto compact = to_compact_string(guid);
    CATCH_REQUIRE(compact.size() == 32);
    CATCH_REQUIRE(compact.find('-') == std::string::npos);

    auto canonical = granville::to_string(guid);
    std::erase(canonical, '-');
    CATCH_REQUIRE(compact == canonical);
  }
}

} // namespace granville::tests
