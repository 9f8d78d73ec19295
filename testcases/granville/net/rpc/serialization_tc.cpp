
#include "stdinc.hpp"

#include "granville/net/rpc/manifest.hpp"
#include "granville/net/rpc/serialization-session-factory.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace granville::net::test {

enum class Direction : int8_t { NORTH, EAST, SOUTH, WEST };

struct Waypoint {
  double x{0.0};
  double y{0.0};
  std::string label{};
  std::vector<std::string> tags{};
  std::optional<int32_t> zone_id{};

  bool operator==(const Waypoint&) const = default;
};

void encode(SerializationSession& s, const Waypoint& w) {
  encode_fields(s, w.x, w.y, w.label, w.tags, w.zone_id);
}

std::error_code decode(SerializationSession& s, Waypoint& w) {
  return decode_fields(s, w.x, w.y, w.label, w.tags, w.zone_id);
}

static std::vector<std::byte> bytes(std::initializer_list<uint8_t> values) {
  std::vector<std::byte> out;
  for (auto value : values)
    out.push_back(std::byte{value});
  return out;
}

// -------------------------------------------------------------------------------------- round trip

CATCH_TEST_CASE("SerializationRoundTrip", "[serialization]") {
  const SerializationSessionFactory factory;

  CATCH_SECTION("simple arguments are segmented") {
    const auto guid = new_guid();
    const auto payload = factory.serialize_arguments(std::string{"abc"}, int32_t{5}, -7.25, true,
                                                     guid, Direction::SOUTH, uint64_t{1} << 40);
    CATCH_REQUIRE(payload.front() == k_segmented_marker);

    const auto args =
        factory.deserialize_arguments<std::string, int32_t, double, bool, Guid, Direction, uint64_t>(
            to_span_bytes(payload));
    CATCH_REQUIRE(args.has_value());
    CATCH_REQUIRE(std::get<0>(*args) == "abc");
    CATCH_REQUIRE(std::get<1>(*args) == 5);
    CATCH_REQUIRE(std::get<2>(*args) == -7.25);
    CATCH_REQUIRE(std::get<3>(*args) == true);
    CATCH_REQUIRE(std::get<4>(*args) == guid);
    CATCH_REQUIRE(std::get<5>(*args) == Direction::SOUTH);
    CATCH_REQUIRE(std::get<6>(*args) == (uint64_t{1} << 40));
  }

  CATCH_SECTION("no arguments") {
    const auto payload = factory.serialize_arguments();
    CATCH_REQUIRE(payload.front() == k_native_marker);
    CATCH_REQUIRE(factory.deserialize_arguments<>(to_span_bytes(payload)).has_value());
    CATCH_REQUIRE(factory.deserialize_arguments<>(std::span<const std::byte>{}).has_value());
  }

  CATCH_SECTION("complex arguments are native") {
    const Waypoint waypoint{1.5, -2.0, "camp", {"water", "shade", "water"}, 1000};
    const auto payload = factory.serialize_arguments(waypoint, std::string{"camp"}, int16_t{-3});
    CATCH_REQUIRE(payload.front() == k_native_marker);

    const auto args =
        factory.deserialize_arguments<Waypoint, std::string, int16_t>(to_span_bytes(payload));
    CATCH_REQUIRE(args.has_value());
    CATCH_REQUIRE(std::get<0>(*args) == waypoint);
    CATCH_REQUIRE(std::get<1>(*args) == "camp");
    CATCH_REQUIRE(std::get<2>(*args) == -3);
  }

  CATCH_SECTION("complex result") {
    const Waypoint waypoint{0.0, 3.0, "", {}, std::nullopt};
    const auto payload = factory.serialize_result(waypoint);
    CATCH_REQUIRE(payload.front() == k_native_marker);
    const auto value = factory.deserialize<Waypoint>(to_span_bytes(payload));
    CATCH_REQUIRE(value.has_value());
    CATCH_REQUIRE(*value == waypoint);
  }

  CATCH_SECTION("manifest") {
    GrainManifest manifest;
    manifest.grain_properties["PlayerGrain"] = {{"placement", "random"}};
    manifest.interface_properties["IPlayerGrain"] = {{"version", "2"}};
    manifest.interface_to_grain["IPlayerGrain"] = "PlayerGrain";

    const auto value =
        factory.deserialize<GrainManifest>(to_span_bytes(factory.serialize_result(manifest)));
    CATCH_REQUIRE(value.has_value());
    CATCH_REQUIRE(*value == manifest);
  }

  CATCH_SECTION("simple result") {
    const auto payload = factory.serialize_result(std::string{"abc5"});
    CATCH_REQUIRE(payload.front() == k_segmented_marker);
    const auto value = factory.deserialize<std::string>(to_span_bytes(payload));
    CATCH_REQUIRE(value.has_value());
    CATCH_REQUIRE(*value == "abc5");
  }

  CATCH_SECTION("legacy payload without a marker") {
    auto session = factory.create_session();
    encode(session, int32_t{99});
    const auto payload = session.finish();
    CATCH_REQUIRE(payload.front() == std::byte{uint8_t(WireTag::INT)});

    const auto value = factory.deserialize<int32_t>(to_span_bytes(payload));
    CATCH_REQUIRE(value.has_value());
    CATCH_REQUIRE(*value == 99);
  }

  CATCH_SECTION("an empty payload is only a void result") {
    const auto value = factory.deserialize<std::string>(std::span<const std::byte>{});
    CATCH_REQUIRE(!value.has_value());
    CATCH_REQUIRE(value.error().error_code() == StatusCode::DATA_LOSS);
    CATCH_REQUIRE(factory.deserialize<int32_t>(std::span<const std::byte>{}).error().error_code() ==
                  StatusCode::DATA_LOSS);
    CATCH_REQUIRE(factory.deserialize<void>(std::span<const std::byte>{}).has_value());
  }
}

// ---------------------------------------------------------------------------------------- sessions

CATCH_TEST_CASE("SerializationSessions", "[serialization]") {
  const SerializationSessionFactory factory;

  CATCH_SECTION("back references stay inside one session") {
    auto session = factory.create_session();
    encode(session, std::string{"repeated"});
    encode(session, std::string{"repeated"});
    CATCH_REQUIRE(session.back_references_written() == 1);

    auto fresh = factory.create_session();
    encode(fresh, std::string{"repeated"});
    CATCH_REQUIRE(fresh.back_references_written() == 0);
  }

  CATCH_SECTION("separate calls never share references") {
    const auto first = factory.serialize_result(std::string{"hello"});
    const auto second = factory.serialize_result(std::string{"hello"});
    CATCH_REQUIRE(first == second);

    // Each segment decodes in isolation, even when its value repeats an earlier one
    const auto payload = factory.serialize_arguments(std::string{"same"}, std::string{"same"});
    const auto segments = SerializationSessionFactory::split_segments(
        std::span<const std::byte>{payload}.subspan(1));
    CATCH_REQUIRE(segments.has_value());
    CATCH_REQUIRE(segments->size() == 2);
    CATCH_REQUIRE(std::equal(segments->at(0).begin(), segments->at(0).end(),
                             segments->at(1).begin(), segments->at(1).end()));

    auto session = factory.create_session();
    session.bind(segments->at(1));
    std::string value;
    CATCH_REQUIRE(!decode(session, value));
    CATCH_REQUIRE(value == "same");
    CATCH_REQUIRE(session.at_end());
  }

  CATCH_SECTION("a back reference to nothing is invalid") {
    auto session = factory.create_session();
    const auto data = bytes({uint8_t(WireTag::STRING_REF), 0, 0, 0, 0});
    session.bind(data);
    std::string value;
    CATCH_REQUIRE(decode(session, value) == make_error_code(ecode::invalid_data));
  }

  CATCH_SECTION("sessions are single use") {
    auto session = factory.create_session();
    encode(session, int32_t{1});
    const auto payload = session.finish();
    CATCH_REQUIRE_THROWS_AS(session.finish(), std::logic_error);
    CATCH_REQUIRE_THROWS_AS(encode(session, int32_t{2}), std::logic_error);
    CATCH_REQUIRE_THROWS_AS(session.bind(payload), std::logic_error);

    auto reader = factory.create_session();
    reader.bind(payload);
    CATCH_REQUIRE_THROWS_AS(reader.bind(payload), std::logic_error);
    CATCH_REQUIRE_THROWS_AS(encode(reader, int32_t{2}), std::logic_error);
  }
}

// ---------------------------------------------------------------------------------------- failures

CATCH_TEST_CASE("SerializationFailures", "[serialization]") {
  const SerializationSessionFactory factory;

  CATCH_SECTION("malformed segment names its index") {
    auto good = factory.create_session();
    encode(good, std::string{"fine"});
    // A string that claims 100 bytes, but has 2
    const auto bad = bytes({uint8_t(WireTag::STRING), 0, 0, 0, 100, 'h', 'i'});
    const auto payload = SerializationSessionFactory::join_segments({good.finish(), bad});

    const auto args = factory.deserialize_arguments<std::string, std::string>(
        to_span_bytes(payload));
    CATCH_REQUIRE(!args.has_value());
    CATCH_REQUIRE(args.error().error_code() == StatusCode::DATA_LOSS);
    CATCH_REQUIRE(args.error().error_details().find("segment 1") != std::string_view::npos);
    CATCH_REQUIRE(args.error().error_details().find("7 bytes") != std::string_view::npos);
  }

  CATCH_SECTION("truncated segment container") {
    const auto payload = bytes({0xff, 0, 0, 0, 2, 0, 0, 0, 5, 'a'});
    const auto args = factory.deserialize_arguments<std::string, std::string>(
        to_span_bytes(payload));
    CATCH_REQUIRE(!args.has_value());
    CATCH_REQUIRE(args.error().error_code() == StatusCode::DATA_LOSS);
    CATCH_REQUIRE(args.error().error_details().find("segment 0") != std::string_view::npos);
  }

  CATCH_SECTION("wrong argument count") {
    const auto payload = factory.serialize_arguments(int32_t{1}, int32_t{2});
    const auto args = factory.deserialize_arguments<int32_t>(to_span_bytes(payload));
    CATCH_REQUIRE(!args.has_value());
    CATCH_REQUIRE(args.error().error_code() == StatusCode::DATA_LOSS);
    CATCH_REQUIRE(args.error().error_message() == "argument count mismatch");
  }

  CATCH_SECTION("wrong type") {
    const auto payload = factory.serialize_arguments(std::string{"not a number"});
    const auto args = factory.deserialize_arguments<int32_t>(to_span_bytes(payload));
    CATCH_REQUIRE(!args.has_value());
    CATCH_REQUIRE(args.error().error_code() == StatusCode::DATA_LOSS);
  }

  CATCH_SECTION("out of range") {
    const auto payload = factory.serialize_result(int64_t{1} << 40);
    const auto value = factory.deserialize<int32_t>(to_span_bytes(payload));
    CATCH_REQUIRE(!value.has_value());
    CATCH_REQUIRE(value.error().error_code() == StatusCode::DATA_LOSS);
  }

  CATCH_SECTION("trailing bytes") {
    auto payload = factory.serialize_result(Waypoint{});
    payload.push_back(std::byte{uint8_t(WireTag::NONE)});
    const auto value = factory.deserialize<Waypoint>(to_span_bytes(payload));
    CATCH_REQUIRE(!value.has_value());
    CATCH_REQUIRE(value.error().error_code() == StatusCode::DATA_LOSS);
  }
}

} // namespace granville::net::test
