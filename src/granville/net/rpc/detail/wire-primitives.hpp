
#pragma once

#include "granville/net/buffer.hpp"

#include <boost/endian/conversion.hpp>

#include <cstring>
#include <span>
#include <type_traits>

namespace granville::net::detail {

// Integers go over the wire in network byte order

template <typename T> void encode_integer(BufferType& buffer, T value) {
  static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>);
  boost::endian::native_to_big_inplace(value);
  const auto offset = buffer.size();
  buffer.resize(offset + sizeof(T));
  std::memcpy(&buffer[offset], &value, sizeof(T));
}

template <typename T> bool decode_integer(std::span<const std::byte>& in, T& value) {
  static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>);
  if (in.size() < sizeof(T))
    return false;
  std::memcpy(&value, in.data(), sizeof(T));
  boost::endian::big_to_native_inplace(value);
  in = in.subspan(sizeof(T));
  return true;
}

inline void encode_bytes(BufferType& buffer, std::span<const std::byte> data) {
  buffer.insert(buffer.end(), data.begin(), data.end());
}

inline bool decode_bytes(std::span<const std::byte>& in, std::size_t size,
                         std::span<const std::byte>& out) {
  if (in.size() < size)
    return false;
  out = in.first(size);
  in = in.subspan(size);
  return true;
}

} // namespace granville::net::detail
