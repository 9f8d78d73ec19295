
#pragma once

#include "serialization-session.hpp"

#include "granville/utils/error-codes.hpp"
#include "granville/utils/guid.hpp"

#include <bit>
#include <concepts>
#include <cstring>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

/**
 * @defgroup granville-codec Native binary codec
 * @ingroup granville
 *
 * `encode`/`decode` overloads write and read one value in a `SerializationSession`.
 * User types take part by providing their own overloads, in their own
 * namespace, usually built from `encode_fields`/`decode_fields`:
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * struct Point { int32_t x; int32_t y; std::string label; };
 * void encode(SerializationSession& s, const Point& p) { encode_fields(s, p.x, p.y, p.label); }
 * std::error_code decode(SerializationSession& s, Point& p) {
 *   return decode_fields(s, p.x, p.y, p.label);
 * }
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace granville::net {

template <typename T> concept WireInteger = std::integral<T> && !std::same_as<T, bool>;

// ------------------------------------------------------------------------------------- simple types

/**
 * @brief Simple types are sent in the segmented payload format, one session each.
 */
template <typename T> struct is_simple_wire_type
    : std::bool_constant<std::is_arithmetic_v<T> || std::is_enum_v<T>> {};
template <> struct is_simple_wire_type<std::string> : std::true_type {};
template <> struct is_simple_wire_type<std::string_view> : std::true_type {};
template <> struct is_simple_wire_type<const char*> : std::true_type {};
template <> struct is_simple_wire_type<char*> : std::true_type {};
template <> struct is_simple_wire_type<Guid> : std::true_type {};

template <typename T>
inline constexpr bool is_simple_wire_type_v = is_simple_wire_type<std::decay_t<T>>::value;

// ---------------------------------------------------------------------------------------- encoders

inline void encode(SerializationSession& s, bool value) {
  s.write_tag(value ? WireTag::TRUE_VALUE : WireTag::FALSE_VALUE);
}

template <WireInteger T> void encode(SerializationSession& s, T value) {
  if constexpr (std::is_signed_v<T>) {
    s.write_tag(WireTag::INT);
    s.write_u64(static_cast<uint64_t>(static_cast<int64_t>(value)));
  } else {
    s.write_tag(WireTag::UINT);
    s.write_u64(static_cast<uint64_t>(value));
  }
}

template <std::floating_point T> void encode(SerializationSession& s, T value) {
  s.write_tag(WireTag::FLOAT);
  s.write_u64(std::bit_cast<uint64_t>(static_cast<double>(value)));
}

template <typename T>
requires std::is_enum_v<T> void encode(SerializationSession& s, T value) {
  encode(s, static_cast<std::underlying_type_t<T>>(value));
}

inline void encode(SerializationSession& s, std::string_view value) { s.write_string(value); }
inline void encode(SerializationSession& s, const std::string& value) { s.write_string(value); }
inline void encode(SerializationSession& s, const char* value) {
  s.write_string(std::string_view{value});
}

inline void encode(SerializationSession& s, const BufferType& value) { s.write_bytes(value); }

inline void encode(SerializationSession& s, const Guid& value) {
  s.write_tag(WireTag::GUID);
  s.write_raw(std::as_bytes(std::span{value.data, value.static_size()}));
}

template <typename T> void encode(SerializationSession& s, const std::optional<T>& value) {
  if (value)
    encode(s, *value);
  else
    s.write_tag(WireTag::NONE);
}

template <typename T> void encode(SerializationSession& s, const std::vector<T>& values) {
  if (values.size() > std::numeric_limits<uint32_t>::max())
    throw std::length_error("list too large to serialize");
  s.write_tag(WireTag::LIST);
  s.write_u32(uint32_t(values.size()));
  for (const auto& value : values)
    encode(s, value);
}

template <typename K, typename V> void encode(SerializationSession& s, const std::map<K, V>& values) {
  if (values.size() > std::numeric_limits<uint32_t>::max())
    throw std::length_error("map too large to serialize");
  s.write_tag(WireTag::MAP);
  s.write_u32(uint32_t(values.size()));
  for (const auto& [key, value] : values) {
    encode(s, key);
    encode(s, value);
  }
}

/** @brief Writes an OBJECT with `fields` in order */
template <typename... Fields> void encode_fields(SerializationSession& s, const Fields&... fields) {
  s.write_tag(WireTag::OBJECT);
  s.write_u32(uint32_t(sizeof...(Fields)));
  (encode(s, fields), ...);
}

// ---------------------------------------------------------------------------------------- decoders

namespace detail {
inline std::error_code expect_tag(SerializationSession& s, WireTag expected) {
  WireTag tag = WireTag::NONE;
  if (auto ec = s.read_tag(tag))
    return ec;
  return (tag == expected) ? std::error_code{} : make_error_code(ecode::type_error);
}

template <WireInteger T> bool fits(int64_t value) {
  if constexpr (std::is_signed_v<T>)
    return value >= int64_t(std::numeric_limits<T>::lowest()) &&
           value <= int64_t(std::numeric_limits<T>::max());
  else
    return value >= 0 && uint64_t(value) <= uint64_t(std::numeric_limits<T>::max());
}

template <WireInteger T> bool fits(uint64_t value) {
  return value <= uint64_t(std::numeric_limits<T>::max());
}
} // namespace detail

inline std::error_code decode(SerializationSession& s, bool& value) {
  WireTag tag = WireTag::NONE;
  if (auto ec = s.read_tag(tag))
    return ec;
  if (tag != WireTag::TRUE_VALUE && tag != WireTag::FALSE_VALUE)
    return make_error_code(ecode::type_error);
  value = (tag == WireTag::TRUE_VALUE);
  return {};
}

template <WireInteger T> std::error_code decode(SerializationSession& s, T& value) {
  WireTag tag = WireTag::NONE;
  uint64_t raw = 0;
  if (auto ec = s.read_tag(tag))
    return ec;
  if (tag != WireTag::INT && tag != WireTag::UINT)
    return make_error_code(ecode::type_error);
  if (auto ec = s.read_u64(raw))
    return ec;

  if (tag == WireTag::INT) {
    const auto signed_value = static_cast<int64_t>(raw);
    if (!detail::fits<T>(signed_value))
      return make_error_code(ecode::value_out_of_range);
    value = static_cast<T>(signed_value);
  } else {
    if (!detail::fits<T>(raw))
      return make_error_code(ecode::value_out_of_range);
    value = static_cast<T>(raw);
  }
  return {};
}

template <std::floating_point T> std::error_code decode(SerializationSession& s, T& value) {
  uint64_t raw = 0;
  if (auto ec = detail::expect_tag(s, WireTag::FLOAT))
    return ec;
  if (auto ec = s.read_u64(raw))
    return ec;
  value = static_cast<T>(std::bit_cast<double>(raw));
  return {};
}

template <typename T>
requires std::is_enum_v<T> std::error_code decode(SerializationSession& s, T& value) {
  std::underlying_type_t<T> raw{};
  if (auto ec = decode(s, raw))
    return ec;
  value = static_cast<T>(raw);
  return {};
}

inline std::error_code decode(SerializationSession& s, std::string& value) {
  return s.read_string(value);
}

inline std::error_code decode(SerializationSession& s, BufferType& value) {
  return s.read_bytes(value);
}

inline std::error_code decode(SerializationSession& s, Guid& value) {
  std::span<const std::byte> data;
  if (auto ec = detail::expect_tag(s, WireTag::GUID))
    return ec;
  if (auto ec = s.read_raw(value.static_size(), data))
    return ec;
  std::memcpy(value.data, data.data(), data.size());
  return {};
}

template <typename T> std::error_code decode(SerializationSession& s, std::optional<T>& value) {
  WireTag tag = WireTag::NONE;
  if (auto ec = s.peek_tag(tag))
    return ec;
  if (tag == WireTag::NONE) {
    value.reset();
    return s.read_tag(tag);
  }
  T inner{};
  if (auto ec = decode(s, inner))
    return ec;
  value = std::move(inner);
  return {};
}

template <typename T> std::error_code decode(SerializationSession& s, std::vector<T>& values) {
  uint32_t count = 0;
  if (auto ec = detail::expect_tag(s, WireTag::LIST))
    return ec;
  if (auto ec = s.read_u32(count))
    return ec;
  if (count > s.remaining()) // every element takes at least one byte
    return make_error_code(ecode::premature_eof);

  values.clear();
  values.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    T value{};
    if (auto ec = decode(s, value))
      return ec;
    values.push_back(std::move(value));
  }
  return {};
}

template <typename K, typename V>
std::error_code decode(SerializationSession& s, std::map<K, V>& values) {
  uint32_t count = 0;
  if (auto ec = detail::expect_tag(s, WireTag::MAP))
    return ec;
  if (auto ec = s.read_u32(count))
    return ec;
  if (count > s.remaining())
    return make_error_code(ecode::premature_eof);

  values.clear();
  for (uint32_t i = 0; i < count; ++i) {
    K key{};
    V value{};
    if (auto ec = decode(s, key))
      return ec;
    if (auto ec = decode(s, value))
      return ec;
    values.insert_or_assign(std::move(key), std::move(value));
  }
  return {};
}

/** @brief Reads an OBJECT written by `encode_fields` with the same field list */
template <typename... Fields>
std::error_code decode_fields(SerializationSession& s, Fields&... fields) {
  uint32_t count = 0;
  if (auto ec = detail::expect_tag(s, WireTag::OBJECT))
    return ec;
  if (auto ec = s.read_u32(count))
    return ec;
  if (count != sizeof...(Fields))
    return make_error_code(ecode::type_error);

  std::error_code ec;
  ((ec = ec ? ec : decode(s, fields)), ...);
  return ec;
}

} // namespace granville::net
