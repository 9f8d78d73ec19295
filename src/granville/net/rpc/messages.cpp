
#include "stdinc.hpp"

#include "messages.hpp"

namespace granville::net {

std::string_view str(MessageType type) {
#define CASE(x)                                                                                    \
  case MessageType::x:                                                                             \
    return #x
  switch (type) {
    CASE(HANDSHAKE);
    CASE(REQUEST);
    CASE(RESPONSE);
    CASE(HEARTBEAT);
    CASE(ERROR);
    CASE(HANDSHAKE_ACK);
    CASE(ASYNC_ENUMERABLE_REQUEST);
    CASE(ASYNC_ENUMERABLE_ITEM);
    CASE(ASYNC_ENUMERABLE_CANCEL);
  }
#undef CASE
  return "<unknown message type>";
}

// ----------------------------------------------------------------------------------------- GrainId

void encode(SerializationSession& s, const GrainId& grain_id) {
  encode_fields(s, grain_id.type, grain_id.key);
}

std::error_code decode(SerializationSession& s, GrainId& grain_id) {
  return decode_fields(s, grain_id.type, grain_id.key);
}

// ---------------------------------------------------------------------------------- message bodies

static void encode(SerializationSession& s, const RpcHandshake& m) {
  encode_fields(s, m.message_id, m.client_id, m.protocol_version, m.features);
}
static std::error_code decode(SerializationSession& s, RpcHandshake& m) {
  return decode_fields(s, m.message_id, m.client_id, m.protocol_version, m.features);
}

static void encode(SerializationSession& s, const RpcRequest& m) {
  encode_fields(s, m.message_id, m.grain_id, m.interface_type, m.method_id, m.arguments,
                m.timeout_ms, m.target_zone_id, m.return_type_name);
}
static std::error_code decode(SerializationSession& s, RpcRequest& m) {
  return decode_fields(s, m.message_id, m.grain_id, m.interface_type, m.method_id, m.arguments,
                       m.timeout_ms, m.target_zone_id, m.return_type_name);
}

static void encode(SerializationSession& s, const RpcResponse& m) {
  encode_fields(s, m.request_id, m.success, m.payload, m.error_message);
}
static std::error_code decode(SerializationSession& s, RpcResponse& m) {
  return decode_fields(s, m.request_id, m.success, m.payload, m.error_message);
}

static void encode(SerializationSession& s, const RpcHeartbeat& m) {
  encode_fields(s, m.message_id, m.source_id, m.timestamp_ms);
}
static std::error_code decode(SerializationSession& s, RpcHeartbeat& m) {
  return decode_fields(s, m.message_id, m.source_id, m.timestamp_ms);
}

static void encode(SerializationSession& s, const RpcErrorMessage& m) {
  encode_fields(s, m.request_id, m.error_type, m.message);
}
static std::error_code decode(SerializationSession& s, RpcErrorMessage& m) {
  return decode_fields(s, m.request_id, m.error_type, m.message);
}

static void encode(SerializationSession& s, const RpcHandshakeAck& m) {
  encode_fields(s, m.message_id, m.server_id, m.protocol_version, m.manifest, m.zone_id,
                m.zone_mappings);
}
static std::error_code decode(SerializationSession& s, RpcHandshakeAck& m) {
  return decode_fields(s, m.message_id, m.server_id, m.protocol_version, m.manifest, m.zone_id,
                       m.zone_mappings);
}

static void encode(SerializationSession& s, const AsyncEnumerableRequest& m) {
  encode_fields(s, m.stream_id, m.grain_id, m.interface_type, m.method_id, m.arguments);
}
static std::error_code decode(SerializationSession& s, AsyncEnumerableRequest& m) {
  return decode_fields(s, m.stream_id, m.grain_id, m.interface_type, m.method_id, m.arguments);
}

static void encode(SerializationSession& s, const AsyncEnumerableItem& m) {
  encode_fields(s, m.stream_id, m.sequence_number, m.item_payload, m.is_complete,
                m.error_message);
}
static std::error_code decode(SerializationSession& s, AsyncEnumerableItem& m) {
  return decode_fields(s, m.stream_id, m.sequence_number, m.item_payload, m.is_complete,
                       m.error_message);
}

static void encode(SerializationSession& s, const AsyncEnumerableCancel& m) {
  encode_fields(s, m.stream_id);
}
static std::error_code decode(SerializationSession& s, AsyncEnumerableCancel& m) {
  return decode_fields(s, m.stream_id);
}

// --------------------------------------------------------------------------------- encode/decode

MessageType message_type(const RpcMessage& message) {
  return static_cast<MessageType>(message.index() + 1);
}

BufferType encode_message(const RpcMessage& message) {
  SerializationSession session;
  std::visit([&session](const auto& body) { encode(session, body); }, message);
  auto body = session.finish();

  BufferType buffer;
  buffer.reserve(body.size() + 1);
  buffer.push_back(static_cast<std::byte>(message_type(message)));
  buffer.insert(end(buffer), begin(body), end(body));
  return buffer;
}

template <std::size_t I>
static tl::expected<RpcMessage, Status> decode_body(std::span<const std::byte> body) {
  using MessageT = std::variant_alternative_t<I, RpcMessage>;
  constexpr auto type = static_cast<MessageType>(I + 1);

  SerializationSession session;
  session.bind(body);

  MessageT message{};
  if (auto ec = decode(session, message)) {
    WARN("failed to decode {} message of {} bytes: {}", str(type), body.size(), ec.message());
    return tl::make_unexpected(Status{StatusCode::DATA_LOSS,
                                      fmt::format("malformed {} message", str(type)),
                                      ec.message()});
  }
  if (!session.at_end()) {
    WARN("{} message has {} trailing bytes", str(type), session.remaining());
    return tl::make_unexpected(Status{StatusCode::DATA_LOSS,
                                      fmt::format("malformed {} message", str(type)),
                                      fmt::format("{} trailing bytes", session.remaining())});
  }
  return RpcMessage{std::in_place_index<I>, std::move(message)};
}

template <std::size_t... I>
static tl::expected<RpcMessage, Status>
decode_by_index(std::size_t index, std::span<const std::byte> body, std::index_sequence<I...>) {
  using DecoderFn = tl::expected<RpcMessage, Status> (*)(std::span<const std::byte>);
  static constexpr std::array<DecoderFn, sizeof...(I)> decoders = {&decode_body<I>...};
  return decoders[index](body);
}

tl::expected<RpcMessage, Status> decode_message(std::span<const std::byte> payload) {
  constexpr std::size_t n_types = std::variant_size_v<RpcMessage>;

  if (payload.empty())
    return tl::make_unexpected(Status{StatusCode::INVALID_ARGUMENT, "empty message"});

  const auto type_byte = std::to_integer<unsigned>(payload.front());
  if (type_byte < 1 || type_byte > n_types) {
    WARN("unknown message type {}", type_byte);
    return tl::make_unexpected(
        Status{StatusCode::INVALID_ARGUMENT, fmt::format("unknown message type {}", type_byte)});
  }

  return decode_by_index(type_byte - 1, payload.subspan(1), std::make_index_sequence<n_types>{});
}

} // namespace granville::net
