
#pragma once

#include "codec.hpp"
#include "manifest.hpp"
#include "status.hpp"

#include "granville/net/buffer.hpp"
#include "granville/utils/guid.hpp"

#include <tl/expected.hpp>

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace granville::net {

// ------------------------------------------------------------------------------------- MessageType

/**
 * @brief The first byte of every message on an rpc connection.
 */
enum class MessageType : uint8_t {
  HANDSHAKE = 1,
  REQUEST = 2,
  RESPONSE = 3,
  HEARTBEAT = 4,
  ERROR = 5,
  HANDSHAKE_ACK = 6,
  ASYNC_ENUMERABLE_REQUEST = 7,
  ASYNC_ENUMERABLE_ITEM = 8,
  ASYNC_ENUMERABLE_CANCEL = 9
};

std::string_view str(MessageType type);

inline constexpr int32_t k_protocol_version = 1;
inline constexpr int32_t k_default_request_timeout_ms = 30000;

// ----------------------------------------------------------------------------------------- GrainId

/**
 * @brief Identity of a grain: its type and its key within that type.
 */
struct GrainId {
  std::string type{};
  std::string key{};

  /** @brief `type/key` */
  std::string to_string() const { return type + "/" + key; }

  auto operator<=>(const GrainId&) const = default;
};

void encode(SerializationSession& s, const GrainId& grain_id);
std::error_code decode(SerializationSession& s, GrainId& grain_id);

// ---------------------------------------------------------------------------------------- Messages

/** @brief client -> server, first message on every connection */
struct RpcHandshake {
  Guid message_id{};
  std::string client_id{};
  int32_t protocol_version{k_protocol_version};
  std::vector<std::string> features{};
};

/** @brief client -> server */
struct RpcRequest {
  Guid message_id{};
  GrainId grain_id{};
  std::string interface_type{};
  int32_t method_id{0};          //!< index of the method in alphabetical order
  BufferType arguments{};        //!< marked payload, see SerializationSessionFactory
  int32_t timeout_ms{k_default_request_timeout_ms};
  std::optional<int32_t> target_zone_id{};
  std::string return_type_name{}; //!< hint for servers that cannot infer the result type
};

/** @brief server -> client */
struct RpcResponse {
  Guid request_id{};
  bool success{false};
  BufferType payload{};
  std::string error_message{};
};

/** @brief either direction; logged only */
struct RpcHeartbeat {
  Guid message_id{};
  std::string source_id{};
  int64_t timestamp_ms{0}; //!< milliseconds since the unix epoch
};

/** @brief server -> client; a nil `request_id` is not tied to any request */
struct RpcErrorMessage {
  Guid request_id{};
  std::string error_type{};
  std::string message{};
};

/** @brief server -> client, in reply to RpcHandshake */
struct RpcHandshakeAck {
  Guid message_id{};
  std::string server_id{};
  int32_t protocol_version{k_protocol_version};
  std::optional<GrainManifest> manifest{};
  std::optional<int32_t> zone_id{};
  std::optional<std::map<int32_t, std::string>> zone_mappings{};
};

/** @brief client -> server, opens a stream */
struct AsyncEnumerableRequest {
  Guid stream_id{};
  GrainId grain_id{};
  std::string interface_type{};
  int32_t method_id{0};
  BufferType arguments{};
};

/** @brief server -> client, one stream item or the end of the stream */
struct AsyncEnumerableItem {
  Guid stream_id{};
  int64_t sequence_number{0};
  BufferType item_payload{};
  bool is_complete{false};
  std::string error_message{}; //!< set on a completion item iff the stream failed
};

/** @brief client -> server */
struct AsyncEnumerableCancel {
  Guid stream_id{};
};

/**
 * @brief A decoded message. The variant index is `MessageType - 1`.
 */
using RpcMessage = std::variant<RpcHandshake, RpcRequest, RpcResponse, RpcHeartbeat,
                                RpcErrorMessage, RpcHandshakeAck, AsyncEnumerableRequest,
                                AsyncEnumerableItem, AsyncEnumerableCancel>;

MessageType message_type(const RpcMessage& message);

/**
 * @brief The type byte followed by the body, encoded in a fresh session.
 */
BufferType encode_message(const RpcMessage& message);

/**
 * @brief Decode one message. Fails with `INVALID_ARGUMENT` for an unknown type
 *        byte, and `DATA_LOSS` for a malformed body.
 */
tl::expected<RpcMessage, Status> decode_message(std::span<const std::byte> payload);

} // namespace granville::net
