
#include "stdinc.hpp"

#include "serialization-session.hpp"

#include "detail/wire-primitives.hpp"

#include "granville/utils/error-codes.hpp"

#include <stdexcept>

namespace granville::net {

std::string_view str(WireTag tag) {
#define CASE(x)                                                                                    \
  case WireTag::x:                                                                                 \
    return #x
  switch (tag) {
    CASE(NONE);
    CASE(FALSE_VALUE);
    CASE(TRUE_VALUE);
    CASE(INT);
    CASE(UINT);
    CASE(FLOAT);
    CASE(STRING);
    CASE(STRING_REF);
    CASE(BYTES);
    CASE(GUID);
    CASE(LIST);
    CASE(MAP);
    CASE(OBJECT);
  }
#undef CASE
  return "<unknown case>";
}

static bool is_valid_tag(uint8_t value) {
  return value >= uint8_t(WireTag::NONE) && value <= uint8_t(WireTag::OBJECT);
}

// ---------------------------------------------------------------------------------------- encoding

void SerializationSession::begin_encoding_() {
  if (mode_ == Mode::FRESH)
    mode_ = Mode::ENCODING;
  else if (mode_ != Mode::ENCODING)
    throw std::logic_error("serialization session is single-use, and cannot encode again");
}

void SerializationSession::write_tag(WireTag tag) {
  begin_encoding_();
  buffer_.push_back(std::byte{static_cast<uint8_t>(tag)});
}

void SerializationSession::write_u32(uint32_t value) {
  begin_encoding_();
  detail::encode_integer(buffer_, value);
}

void SerializationSession::write_u64(uint64_t value) {
  begin_encoding_();
  detail::encode_integer(buffer_, value);
}

void SerializationSession::write_raw(std::span<const std::byte> data) {
  begin_encoding_();
  detail::encode_bytes(buffer_, data);
}

void SerializationSession::write_string(std::string_view value) {
  begin_encoding_();
  if (value.size() > std::numeric_limits<uint32_t>::max())
    throw std::length_error("string too large to serialize");

  const auto ii = written_strings_.find(std::string{value});
  if (ii != cend(written_strings_)) {
    write_tag(WireTag::STRING_REF);
    write_u32(ii->second);
    ++back_references_written_;
    return;
  }

  written_strings_.emplace(std::string{value}, uint32_t(written_strings_.size()));
  write_tag(WireTag::STRING);
  write_u32(uint32_t(value.size()));
  buffer_ << value;
}

void SerializationSession::write_bytes(std::span<const std::byte> data) {
  if (data.size() > std::numeric_limits<uint32_t>::max())
    throw std::length_error("byte buffer too large to serialize");
  write_tag(WireTag::BYTES);
  write_u32(uint32_t(data.size()));
  write_raw(data);
}

BufferType SerializationSession::finish() {
  if (mode_ != Mode::FRESH && mode_ != Mode::ENCODING)
    throw std::logic_error("serialization session is single-use, and has already finished");
  mode_ = Mode::FINISHED;
  written_strings_.clear();
  return std::move(buffer_);
}

// ---------------------------------------------------------------------------------------- decoding

void SerializationSession::bind(std::span<const std::byte> input) {
  if (mode_ != Mode::FRESH)
    throw std::logic_error("serialization session is single-use, and cannot decode again");
  mode_ = Mode::DECODING;
  input_ = input;
}

void SerializationSession::check_decoding_() const {
  if (mode_ != Mode::DECODING)
    throw std::logic_error("serialization session is not bound to any input");
}

std::error_code SerializationSession::peek_tag(WireTag& tag) const {
  check_decoding_();
  if (input_.empty())
    return make_error_code(ecode::premature_eof);
  const auto value = std::to_integer<uint8_t>(input_[0]);
  if (!is_valid_tag(value))
    return make_error_code(ecode::invalid_data);
  tag = WireTag(value);
  return {};
}

std::error_code SerializationSession::read_tag(WireTag& tag) {
  if (auto ec = peek_tag(tag))
    return ec;
  input_ = input_.subspan(1);
  return {};
}

std::error_code SerializationSession::read_u32(uint32_t& value) {
  check_decoding_();
  return detail::decode_integer(input_, value) ? std::error_code{}
                                               : make_error_code(ecode::premature_eof);
}

std::error_code SerializationSession::read_u64(uint64_t& value) {
  check_decoding_();
  return detail::decode_integer(input_, value) ? std::error_code{}
                                               : make_error_code(ecode::premature_eof);
}

std::error_code SerializationSession::read_raw(std::size_t size, std::span<const std::byte>& out) {
  check_decoding_();
  return detail::decode_bytes(input_, size, out) ? std::error_code{}
                                                 : make_error_code(ecode::premature_eof);
}

std::error_code SerializationSession::read_string(std::string& value) {
  WireTag tag = WireTag::NONE;
  if (auto ec = read_tag(tag))
    return ec;

  uint32_t length_or_index = 0;
  if (tag == WireTag::STRING_REF) {
    if (auto ec = read_u32(length_or_index))
      return ec;
    if (length_or_index >= read_strings_.size())
      return make_error_code(ecode::invalid_data); // refers to nothing in this payload
    value = read_strings_[length_or_index];
    return {};
  }

  if (tag != WireTag::STRING)
    return make_error_code(ecode::type_error);

  std::span<const std::byte> data;
  if (auto ec = read_u32(length_or_index))
    return ec;
  if (auto ec = read_raw(length_or_index, data))
    return ec;
  value.assign(str(data));
  read_strings_.push_back(value);
  return {};
}

std::error_code SerializationSession::read_bytes(BufferType& value) {
  WireTag tag = WireTag::NONE;
  if (auto ec = read_tag(tag))
    return ec;
  if (tag != WireTag::BYTES)
    return make_error_code(ecode::type_error);

  uint32_t length = 0;
  std::span<const std::byte> data;
  if (auto ec = read_u32(length))
    return ec;
  if (auto ec = read_raw(length, data))
    return ec;
  value = make_send_buffer(data);
  return {};
}

} // namespace granville::net
