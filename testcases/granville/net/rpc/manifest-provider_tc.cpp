
#include "stdinc.hpp"

#include "granville/net/rpc/manifest-provider.hpp"

#include <catch2/catch.hpp>

namespace granville::net::test {

static ServerManifest make_manifest(std::string grain_type, PropertyMap properties) {
  ServerManifest manifest;
  manifest.grains[std::move(grain_type)] = std::move(properties);
  return manifest;
}

CATCH_TEST_CASE("ManifestMerge", "[manifest]") {
  CATCH_SECTION("first registered server wins") {
    for (int i = 0; i < 3; ++i) {
      ManifestProvider provider;
      provider.update_from_server("server-a", make_manifest("X", {{"placement", "a"}}));
      provider.update_from_server("server-b", make_manifest("X", {{"placement", "b"}}));
      provider.update_from_server("server-b", make_manifest("Y", {{"placement", "b"}}));

      const auto manifest = provider.current();
      CATCH_REQUIRE(manifest->grains.at("X").at("placement") == "a");
      CATCH_REQUIRE(manifest->grains.contains("Y"));
    }

    ManifestProvider reversed;
    reversed.update_from_server("server-b", make_manifest("X", {{"placement", "b"}}));
    reversed.update_from_server("server-a", make_manifest("X", {{"placement", "a"}}));
    CATCH_REQUIRE(reversed.current()->grains.at("X").at("placement") == "b");
  }

  CATCH_SECTION("updating a server keeps its registration order") {
    ManifestProvider provider;
    provider.update_from_server("server-a", make_manifest("X", {{"placement", "a"}}));
    provider.update_from_server("server-b", make_manifest("X", {{"placement", "b"}}));
    provider.update_from_server("server-a", make_manifest("X", {{"placement", "a2"}}));
    CATCH_REQUIRE(provider.current()->grains.at("X").at("placement") == "a2");
    CATCH_REQUIRE(provider.server_ids() == std::vector<std::string>{"server-a", "server-b"});
  }

  CATCH_SECTION("removal exposes the next server's entry") {
    ManifestProvider provider;
    provider.update_from_server("server-a", make_manifest("X", {{"placement", "a"}}));
    provider.update_from_server("server-b", make_manifest("X", {{"placement", "b"}}));
    CATCH_REQUIRE(provider.remove_server_manifest("server-a"));
    CATCH_REQUIRE(!provider.remove_server_manifest("server-a"));
    CATCH_REQUIRE(provider.current()->grains.at("X").at("placement") == "b");
    CATCH_REQUIRE(!provider.get_server_manifest("server-a").has_value());
    CATCH_REQUIRE(provider.get_server_manifest("server-b").has_value());
  }

  CATCH_SECTION("interface to grain lookup") {
    GrainManifest manifest;
    manifest.interface_to_grain["IPlayerGrain"] = "PlayerGrain";
    ManifestProvider provider;
    provider.update_from_server("server-a", manifest);

    CATCH_REQUIRE(provider.grain_type_for_interface("IPlayerGrain") ==
                  std::optional<std::string>{"PlayerGrain"});
    CATCH_REQUIRE(!provider.grain_type_for_interface("IUnknownGrain").has_value());
    CATCH_REQUIRE(provider.current()->interfaces.contains("IPlayerGrain"));
  }
}

CATCH_TEST_CASE("ManifestVersions", "[manifest]") {
  ManifestProvider provider;
  std::vector<uint64_t> notified;
  auto subscription = provider.subscribe(
      [&notified](const ManifestProvider::ManifestPtr& manifest) {
        notified.push_back(manifest->version);
      });

  CATCH_REQUIRE(provider.version() == 0);
  CATCH_REQUIRE(provider.current() != nullptr);
  CATCH_REQUIRE(provider.current()->empty());

  CATCH_SECTION("versions advance on change only") {
    provider.update_from_server("server-a", make_manifest("X", {{"k", "1"}}));
    CATCH_REQUIRE(provider.version() == 1);
    provider.update_from_server("server-a", make_manifest("X", {{"k", "1"}}));
    CATCH_REQUIRE(provider.version() == 1);
    provider.update_from_server("server-b", make_manifest("X", {{"k", "2"}})); // shadowed
    CATCH_REQUIRE(provider.version() == 1);
    provider.update_from_server("server-b", make_manifest("Y", {{"k", "2"}}));
    CATCH_REQUIRE(provider.version() == 2);
    CATCH_REQUIRE(notified == std::vector<uint64_t>{1, 2});
  }

  CATCH_SECTION("emptied manifest keeps its version") {
    provider.update_from_server("server-a", make_manifest("X", {{"k", "1"}}));
    provider.clear();
    CATCH_REQUIRE(provider.current()->empty());
    CATCH_REQUIRE(provider.version() == 1);
    CATCH_REQUIRE(notified == std::vector<uint64_t>{1});

    provider.update_from_server("server-a", make_manifest("X", {{"k", "1"}}));
    CATCH_REQUIRE(provider.version() == 2);
  }

  CATCH_SECTION("snapshots are immutable") {
    provider.update_from_server("server-a", make_manifest("X", {{"k", "1"}}));
    const auto before = provider.current();
    provider.update_from_server("server-a", make_manifest("Z", {{"k", "1"}}));
    CATCH_REQUIRE(before->grains.contains("X"));
    CATCH_REQUIRE(!provider.current()->grains.contains("X"));
  }

  CATCH_SECTION("a throwing subscriber does not break updates") {
    auto bad = provider.subscribe(
        [](const ManifestProvider::ManifestPtr&) { throw std::runtime_error{"subscriber"}; });
    provider.update_from_server("server-a", make_manifest("X", {{"k", "1"}}));
    CATCH_REQUIRE(provider.version() == 1);
    bad.disconnect();
  }

  CATCH_SECTION("a subscriber may read the provider") {
    std::vector<std::string> seen_ids;
    std::optional<ServerManifest> seen_manifest;
    auto reader = provider.subscribe([&](const ManifestProvider::ManifestPtr&) {
      seen_ids = provider.server_ids();
      seen_manifest = provider.get_server_manifest("server-a");
    });
    provider.update_from_server("server-a", make_manifest("X", {{"k", "1"}}));
    CATCH_REQUIRE(seen_ids == std::vector<std::string>{"server-a"});
    CATCH_REQUIRE(seen_manifest.has_value());
    CATCH_REQUIRE(seen_manifest->grains.contains("X"));

    provider.update_from_server("server-b", make_manifest("Y", {{"k", "2"}}));
    CATCH_REQUIRE(seen_ids == std::vector<std::string>{"server-a", "server-b"});
    reader.disconnect();
  }

  subscription.disconnect();
}

} // namespace granville::net::test
