
#include "stdinc.hpp"

#include "granville/net/rpc/messages.hpp"

#include <catch2/catch.hpp>

namespace granville::net::test {

template <typename T> static T round_trip(const T& message) {
  const auto buffer = encode_message(RpcMessage{message});
  CATCH_REQUIRE(buffer.front() == std::byte{uint8_t(message_type(RpcMessage{message}))});

  auto decoded = decode_message(to_span_bytes(buffer));
  CATCH_REQUIRE(decoded.has_value());
  CATCH_REQUIRE(std::holds_alternative<T>(*decoded));
  return std::get<T>(std::move(*decoded));
}

CATCH_TEST_CASE("MessageCodec", "[messages]") {
  CATCH_SECTION("type bytes") {
    CATCH_REQUIRE(message_type(RpcMessage{RpcHandshake{}}) == MessageType::HANDSHAKE);
    CATCH_REQUIRE(message_type(RpcMessage{RpcRequest{}}) == MessageType::REQUEST);
    CATCH_REQUIRE(message_type(RpcMessage{RpcResponse{}}) == MessageType::RESPONSE);
    CATCH_REQUIRE(message_type(RpcMessage{RpcHeartbeat{}}) == MessageType::HEARTBEAT);
    CATCH_REQUIRE(message_type(RpcMessage{RpcErrorMessage{}}) == MessageType::ERROR);
    CATCH_REQUIRE(message_type(RpcMessage{RpcHandshakeAck{}}) == MessageType::HANDSHAKE_ACK);
    CATCH_REQUIRE(message_type(RpcMessage{AsyncEnumerableRequest{}}) ==
                  MessageType::ASYNC_ENUMERABLE_REQUEST);
    CATCH_REQUIRE(message_type(RpcMessage{AsyncEnumerableItem{}}) ==
                  MessageType::ASYNC_ENUMERABLE_ITEM);
    CATCH_REQUIRE(message_type(RpcMessage{AsyncEnumerableCancel{}}) ==
                  MessageType::ASYNC_ENUMERABLE_CANCEL);
    CATCH_REQUIRE(str(MessageType::HANDSHAKE_ACK) == "HANDSHAKE_ACK");
  }

  CATCH_SECTION("handshake") {
    RpcHandshake handshake{new_guid(), "client-1", k_protocol_version, {"basic-rpc"}};
    const auto decoded = round_trip(handshake);
    CATCH_REQUIRE(decoded.message_id == handshake.message_id);
    CATCH_REQUIRE(decoded.client_id == "client-1");
    CATCH_REQUIRE(decoded.protocol_version == 1);
    CATCH_REQUIRE(decoded.features == std::vector<std::string>{"basic-rpc"});
  }

  CATCH_SECTION("request") {
    RpcRequest request;
    request.message_id = new_guid();
    request.grain_id = GrainId{"PlayerGrain", "player-7"};
    request.interface_type = "IPlayerGrain";
    request.method_id = 2;
    request.arguments = make_send_buffer("args");
    request.target_zone_id = 1000;
    request.return_type_name = "System.String";

    const auto decoded = round_trip(request);
    CATCH_REQUIRE(decoded.message_id == request.message_id);
    CATCH_REQUIRE(decoded.grain_id == request.grain_id);
    CATCH_REQUIRE(decoded.interface_type == "IPlayerGrain");
    CATCH_REQUIRE(decoded.method_id == 2);
    CATCH_REQUIRE(decoded.arguments == request.arguments);
    CATCH_REQUIRE(decoded.timeout_ms == k_default_request_timeout_ms);
    CATCH_REQUIRE(decoded.target_zone_id == std::optional<int32_t>{1000});
    CATCH_REQUIRE(decoded.return_type_name == "System.String");

    request.target_zone_id.reset();
    CATCH_REQUIRE(!round_trip(request).target_zone_id.has_value());
  }

  CATCH_SECTION("response") {
    RpcResponse response{new_guid(), false, {}, "grain exploded"};
    const auto decoded = round_trip(response);
    CATCH_REQUIRE(decoded.request_id == response.request_id);
    CATCH_REQUIRE(!decoded.success);
    CATCH_REQUIRE(decoded.payload.empty());
    CATCH_REQUIRE(decoded.error_message == "grain exploded");
  }

  CATCH_SECTION("heartbeat and error") {
    RpcHeartbeat heartbeat{new_guid(), "client-1", 1700000000123};
    const auto hb = round_trip(heartbeat);
    CATCH_REQUIRE(hb.source_id == "client-1");
    CATCH_REQUIRE(hb.timestamp_ms == 1700000000123);

    RpcErrorMessage error{nil_guid(), "ProtocolError", "bad frame"};
    const auto err = round_trip(error);
    CATCH_REQUIRE(err.request_id.is_nil());
    CATCH_REQUIRE(err.error_type == "ProtocolError");
    CATCH_REQUIRE(err.message == "bad frame");
  }

  CATCH_SECTION("handshake ack") {
    RpcHandshakeAck ack;
    ack.message_id = new_guid();
    ack.server_id = "zone-a";
    ack.manifest = GrainManifest{};
    ack.manifest->interface_to_grain["IPlayerGrain"] = "PlayerGrain";
    ack.zone_id = 1000;
    ack.zone_mappings = std::map<int32_t, std::string>{{1000, "zone-a"}, {2000, "zone-b"}};

    const auto decoded = round_trip(ack);
    CATCH_REQUIRE(decoded.server_id == "zone-a");
    CATCH_REQUIRE(decoded.manifest == ack.manifest);
    CATCH_REQUIRE(decoded.zone_id == ack.zone_id);
    CATCH_REQUIRE(decoded.zone_mappings == ack.zone_mappings);

    const auto bare = round_trip(RpcHandshakeAck{new_guid(), "zone-c"});
    CATCH_REQUIRE(!bare.manifest.has_value());
    CATCH_REQUIRE(!bare.zone_id.has_value());
    CATCH_REQUIRE(!bare.zone_mappings.has_value());
  }

  CATCH_SECTION("streams") {
    AsyncEnumerableRequest request{new_guid(), GrainId{"Feed", "1"}, "IFeedGrain", 0, {}};
    CATCH_REQUIRE(round_trip(request).grain_id == request.grain_id);

    AsyncEnumerableItem item{request.stream_id, 41, make_send_buffer("x"), true, "failed"};
    const auto decoded = round_trip(item);
    CATCH_REQUIRE(decoded.stream_id == request.stream_id);
    CATCH_REQUIRE(decoded.sequence_number == 41);
    CATCH_REQUIRE(decoded.item_payload == item.item_payload);
    CATCH_REQUIRE(decoded.is_complete);
    CATCH_REQUIRE(decoded.error_message == "failed");

    CATCH_REQUIRE(round_trip(AsyncEnumerableCancel{request.stream_id}).stream_id ==
                  request.stream_id);
  }
}

CATCH_TEST_CASE("MessageCodecFailures", "[messages]") {
  CATCH_SECTION("empty") {
    const auto decoded = decode_message(std::span<const std::byte>{});
    CATCH_REQUIRE(!decoded.has_value());
    CATCH_REQUIRE(decoded.error().error_code() == StatusCode::INVALID_ARGUMENT);
  }

  CATCH_SECTION("unknown type") {
    for (const uint8_t type : {uint8_t(0), uint8_t(10), uint8_t(0xff)}) {
      const std::byte payload[] = {std::byte{type}};
      const auto decoded = decode_message(payload);
      CATCH_REQUIRE(!decoded.has_value());
      CATCH_REQUIRE(decoded.error().error_code() == StatusCode::INVALID_ARGUMENT);
    }
  }

  CATCH_SECTION("truncated body") {
    auto buffer = encode_message(RpcMessage{RpcHandshake{new_guid(), "client-1"}});
    buffer.resize(buffer.size() - 3);
    const auto decoded = decode_message(to_span_bytes(buffer));
    CATCH_REQUIRE(!decoded.has_value());
    CATCH_REQUIRE(decoded.error().error_code() == StatusCode::DATA_LOSS);
  }

  CATCH_SECTION("trailing bytes") {
    auto buffer = encode_message(RpcMessage{AsyncEnumerableCancel{new_guid()}});
    buffer.push_back(std::byte{0x01});
    const auto decoded = decode_message(to_span_bytes(buffer));
    CATCH_REQUIRE(!decoded.has_value());
    CATCH_REQUIRE(decoded.error().error_code() == StatusCode::DATA_LOSS);
  }

  CATCH_SECTION("body of another type") {
    auto buffer = encode_message(RpcMessage{RpcHeartbeat{new_guid(), "client-1", 5}});
    buffer[0] = std::byte{uint8_t(MessageType::RESPONSE)};
    CATCH_REQUIRE(!decode_message(to_span_bytes(buffer)).has_value());
  }
}

} // namespace granville::net::test
