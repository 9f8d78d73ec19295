
#include "stdinc.hpp"

#include "serialization-session-factory.hpp"

#include "detail/wire-primitives.hpp"

namespace granville::net {

// -------------------------------------------------------------------------------- join segments

BufferType SerializationSessionFactory::join_segments(const std::vector<BufferType>& segments) {
  if (segments.size() > std::numeric_limits<uint32_t>::max())
    throw std::length_error("too many segments to serialize");

  std::size_t total = 1 + sizeof(uint32_t);
  for (const auto& segment : segments)
    total += sizeof(uint32_t) + segment.size();

  BufferType buffer;
  buffer.reserve(total);
  buffer.push_back(k_segmented_marker);
  detail::encode_integer(buffer, uint32_t(segments.size()));
  for (const auto& segment : segments) {
    if (segment.size() > std::numeric_limits<uint32_t>::max())
      throw std::length_error("segment too large to serialize");
    detail::encode_integer(buffer, uint32_t(segment.size()));
    detail::encode_bytes(buffer, to_span_bytes(segment));
  }
  return buffer;
}

// ------------------------------------------------------------------------------- split segments

tl::expected<std::vector<std::span<const std::byte>>, Status>
SerializationSessionFactory::split_segments(std::span<const std::byte> body) {
  auto in = body;
  uint32_t count = 0;
  if (!detail::decode_integer(in, count)) {
    WARN("malformed segmented payload: {} bytes is too short for a segment count", body.size());
    return tl::make_unexpected(Status{StatusCode::DATA_LOSS, "malformed segmented payload",
                                      fmt::format("missing segment count, {} bytes", body.size())});
  }

  std::vector<std::span<const std::byte>> segments;
  segments.reserve(std::min<std::size_t>(count, in.size() / sizeof(uint32_t)));
  for (uint32_t i = 0; i < count; ++i) {
    uint32_t length = 0;
    std::span<const std::byte> segment;
    if (!detail::decode_integer(in, length)) {
      WARN("malformed segmented payload: segment {} of {} has no length prefix, {} bytes remain",
           i, count, in.size());
      return tl::make_unexpected(
          Status{StatusCode::DATA_LOSS, "malformed segmented payload",
                 fmt::format("segment {} has no length prefix, {} bytes remain", i, in.size())});
    }
    if (!detail::decode_bytes(in, length, segment)) {
      WARN("malformed segmented payload: segment {} declares {} bytes but only {} remain", i,
           length, in.size());
      return tl::make_unexpected(Status{
          StatusCode::DATA_LOSS, "malformed segmented payload",
          fmt::format("segment {} declares {} bytes but only {} remain", i, length, in.size())});
    }
    segments.push_back(segment);
  }

  if (!in.empty()) {
    TRACE("segmented payload has {} trailing bytes after {} segments", in.size(), count);
  }

  return segments;
}

// -------------------------------------------------------------------------------------- errors

Status SerializationSessionFactory::make_decode_error_(std::error_code ec,
                                                      std::optional<std::size_t> segment_index,
                                                      std::size_t size) {
  if (segment_index) {
    WARN("failed to decode segment {} ({} bytes): {}", *segment_index, size, ec.message());
    return Status{StatusCode::DATA_LOSS, "malformed segmented payload",
                  fmt::format("segment {} ({} bytes): {}", *segment_index, size, ec.message())};
  }
  WARN("failed to decode native payload ({} bytes): {}", size, ec.message());
  return Status{StatusCode::DATA_LOSS, "malformed native payload",
                fmt::format("{} bytes: {}", size, ec.message())};
}

Status
SerializationSessionFactory::make_trailing_bytes_error_(std::optional<std::size_t> segment_index,
                                                        std::size_t size, std::size_t remaining) {
  if (segment_index) {
    WARN("segment {} ({} bytes) has {} trailing bytes", *segment_index, size, remaining);
    return Status{
        StatusCode::DATA_LOSS, "malformed segmented payload",
        fmt::format("segment {} ({} bytes) has {} trailing bytes", *segment_index, size, remaining)};
  }
  WARN("native payload ({} bytes) has {} trailing bytes", size, remaining);
  return Status{StatusCode::DATA_LOSS, "malformed native payload",
                fmt::format("{} bytes, {} trailing bytes", size, remaining)};
}

Status SerializationSessionFactory::make_segment_count_error_(std::size_t expected,
                                                             std::size_t actual) {
  WARN("payload carries {} values, expected {}", actual, expected);
  return Status{StatusCode::DATA_LOSS, "argument count mismatch",
                fmt::format("expected {} values, found {}", expected, actual)};
}

} // namespace granville::net
