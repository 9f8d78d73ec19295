
#pragma once

#include <type_traits>
#include <utility>

namespace granville::net {

// ----------------------------------------------------------------------------------- serialization

template <typename T>
BufferType SerializationSessionFactory::encode_segment_(const T& value) const {
  auto session = create_session();
  encode(session, value);
  return session.finish();
}

template <typename... Args>
BufferType SerializationSessionFactory::serialize_arguments(const Args&... args) const {
  constexpr auto N = sizeof...(Args);
  if constexpr (N > 0 && (is_simple_wire_type_v<Args> && ...)) {
    std::vector<BufferType> segments;
    segments.reserve(N);
    (segments.push_back(encode_segment_(args)), ...);
    return join_segments(segments);
  } else {
    auto session = create_session();
    session.write_tag(WireTag::LIST);
    session.write_u32(uint32_t(N));
    (encode(session, args), ...);
    BufferType buffer{k_native_marker};
    buffer << to_span_bytes(session.finish());
    return buffer;
  }
}

template <typename T> BufferType SerializationSessionFactory::serialize_result(const T& value) const {
  if constexpr (is_simple_wire_type_v<T>) {
    return join_segments({encode_segment_(value)});
  } else {
    BufferType buffer{k_native_marker};
    buffer << to_span_bytes(encode_segment_(value));
    return buffer;
  }
}

// --------------------------------------------------------------------------------- deserialization

template <typename T>
std::optional<Status>
SerializationSessionFactory::decode_value_(std::span<const std::byte> data,
                                           std::optional<std::size_t> segment_index,
                                           T& value) const {
  auto session = create_session();
  session.bind(data);
  if (auto ec = decode(session, value))
    return make_decode_error_(ec, segment_index, data.size());
  if (!session.at_end())
    return make_trailing_bytes_error_(segment_index, data.size(), session.remaining());
  return std::nullopt;
}

template <typename T>
tl::expected<T, Status>
SerializationSessionFactory::deserialize(std::span<const std::byte> payload) const {
  if constexpr (std::is_void_v<T>) {
    return {};
  } else {
    if (payload.empty())
      return tl::make_unexpected(
          Status{StatusCode::DATA_LOSS, "empty payload for a non-void value"});

    T value{};

    if (payload[0] == k_segmented_marker) {
      auto segments = split_segments(payload.subspan(1));
      if (!segments)
        return tl::make_unexpected(std::move(segments.error()));
      if (segments->size() != 1)
        return tl::make_unexpected(make_segment_count_error_(1, segments->size()));
      if (auto error = decode_value_((*segments)[0], 0, value))
        return tl::make_unexpected(std::move(*error));
      return value;
    }

    // Native, or a legacy payload without any marker
    const auto body = (payload[0] == k_native_marker) ? payload.subspan(1) : payload;
    if (auto error = decode_value_(body, std::nullopt, value))
      return tl::make_unexpected(std::move(*error));
    return value;
  }
}

template <typename Tuple, std::size_t... I>
std::optional<Status> SerializationSessionFactory::decode_segments_(
    const std::vector<std::span<const std::byte>>& segments, Tuple& values,
    std::index_sequence<I...>) const {
  std::optional<Status> error;
  ((error = error ? error : decode_value_(segments[I], I, std::get<I>(values))), ...);
  return error;
}

template <typename Tuple, std::size_t... I>
std::optional<Status>
SerializationSessionFactory::decode_native_list_(SerializationSession& session, Tuple& values,
                                                 std::index_sequence<I...>) const {
  std::error_code ec;
  ((ec = ec ? ec : decode(session, std::get<I>(values))), ...);
  if (ec)
    return make_decode_error_(ec, std::nullopt, session.remaining());
  return std::nullopt;
}

template <typename... Args>
tl::expected<std::tuple<Args...>, Status>
SerializationSessionFactory::deserialize_arguments(std::span<const std::byte> payload) const {
  constexpr auto N = sizeof...(Args);
  std::tuple<Args...> values{};

  if (payload.empty()) {
    if (N == 0)
      return values;
    return tl::make_unexpected(make_segment_count_error_(N, 0));
  }

  if (payload[0] == k_segmented_marker) {
    auto segments = split_segments(payload.subspan(1));
    if (!segments)
      return tl::make_unexpected(std::move(segments.error()));
    if (segments->size() != N)
      return tl::make_unexpected(make_segment_count_error_(N, segments->size()));
    if (auto error = decode_segments_(*segments, values, std::index_sequence_for<Args...>{}))
      return tl::make_unexpected(std::move(*error));
    return values;
  }

  const auto body = (payload[0] == k_native_marker) ? payload.subspan(1) : payload;
  auto session = create_session();
  session.bind(body);

  WireTag tag = WireTag::NONE;
  uint32_t count = 0;
  if (auto ec = session.read_tag(tag))
    return tl::make_unexpected(make_decode_error_(ec, std::nullopt, body.size()));
  if (tag != WireTag::LIST)
    return tl::make_unexpected(
        make_decode_error_(make_error_code(ecode::type_error), std::nullopt, body.size()));
  if (auto ec = session.read_u32(count))
    return tl::make_unexpected(make_decode_error_(ec, std::nullopt, body.size()));
  if (count != N)
    return tl::make_unexpected(make_segment_count_error_(N, count));
  if (auto error = decode_native_list_(session, values, std::index_sequence_for<Args...>{}))
    return tl::make_unexpected(std::move(*error));
  if (!session.at_end())
    return tl::make_unexpected(
        make_trailing_bytes_error_(std::nullopt, body.size(), session.remaining()));
  return values;
}

} // namespace granville::net
