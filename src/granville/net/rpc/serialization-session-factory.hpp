
#pragma once

#include "codec.hpp"
#include "serialization-session.hpp"
#include "status.hpp"

#include "granville/net/buffer.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <tuple>
#include <vector>

namespace granville::net {

/**
 * @brief Creates fresh serialization sessions, and (de)serializes rpc
 *        argument lists and results with one session per independent value.
 *
 * Payload format:
 * + `0x00` then the whole value (or argument list) encoded in one session.
 * + `0xff` then a 4-byte big-endian segment count, then per segment a 4-byte
 *   big-endian length and the segment bytes. Each segment is one simple
 *   value, encoded in its own session.
 * + Any other leading byte: a legacy payload, decoded whole from byte 0.
 *
 * Decoding never throws on bad input: a malformed payload is reported as a
 * `DATA_LOSS` status naming the failing segment.
 */
class SerializationSessionFactory {
public:
  /** @brief A fresh, single-use session */
  SerializationSession create_session() const { return SerializationSession{}; }

  /**
   * @brief Serialize an argument list.
   * Lists of simple types (arithmetic, enums, strings, guids) use the segmented
   * format; anything else is sent as one native payload.
   */
  template <typename... Args> BufferType serialize_arguments(const Args&... args) const;

  /** @brief Serialize a single result value, with the same format rules */
  template <typename T> BufferType serialize_result(const T& value) const;

  template <typename T>
  tl::expected<T, Status> deserialize(std::span<const std::byte> payload) const;

  template <typename... Args>
  tl::expected<std::tuple<Args...>, Status>
  deserialize_arguments(std::span<const std::byte> payload) const;

  ///@{ @name segmented container
  static BufferType join_segments(const std::vector<BufferType>& segments);

  /** @brief Split the bytes after the `0xff` marker */
  static tl::expected<std::vector<std::span<const std::byte>>, Status>
  split_segments(std::span<const std::byte> body);
  ///@}

private:
  template <typename T> BufferType encode_segment_(const T& value) const;

  template <typename T>
  std::optional<Status> decode_value_(std::span<const std::byte> data,
                                      std::optional<std::size_t> segment_index, T& value) const;

  template <typename Tuple, std::size_t... I>
  std::optional<Status> decode_segments_(const std::vector<std::span<const std::byte>>& segments,
                                         Tuple& values, std::index_sequence<I...>) const;

  template <typename Tuple, std::size_t... I>
  std::optional<Status> decode_native_list_(SerializationSession& session, Tuple& values,
                                            std::index_sequence<I...>) const;

  static Status make_decode_error_(std::error_code ec, std::optional<std::size_t> segment_index,
                                   std::size_t size);
  static Status make_trailing_bytes_error_(std::optional<std::size_t> segment_index,
                                           std::size_t size, std::size_t remaining);
  static Status make_segment_count_error_(std::size_t expected, std::size_t actual);
};

} // namespace granville::net

#include "impl/serialization-session-factory_impl.hpp"
