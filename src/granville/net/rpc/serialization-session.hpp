
#pragma once

#include "granville/net/buffer.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace granville::net {

/**
 * @brief The leading byte of every argument/result payload.
 */
inline constexpr std::byte k_native_marker{0x00};    //!< whole payload, one session
inline constexpr std::byte k_segmented_marker{0xff}; //!< count + length-prefixed segments

/**
 * @brief Type tags of the native binary encoding.
 * @note No tag is ever `0x00` or `0xff`, so an unmarked (legacy) payload can
 *       never be mistaken for a marked one.
 */
enum class WireTag : uint8_t {
  NONE = 0x01,
  FALSE_VALUE = 0x02,
  TRUE_VALUE = 0x03,
  INT = 0x04,        // i64
  UINT = 0x05,       // u64
  FLOAT = 0x06,      // ieee754 binary64
  STRING = 0x07,     // u32 length + utf-8 bytes
  STRING_REF = 0x08, // u32 index of an earlier string in the same session
  BYTES = 0x09,      // u32 length + bytes
  GUID = 0x0a,       // 16 bytes
  LIST = 0x0b,       // u32 count + elements
  MAP = 0x0c,        // u32 count + key/value pairs
  OBJECT = 0x0d      // u32 field count + fields
};

std::string_view str(WireTag tag);

// ------------------------------------------------------------------------- SerializationSession

/**
 * @brief A single-use encode or decode context.
 *
 * A session either encodes one payload (`write_*` then `finish`) or decodes
 * one payload (`bind` then `read_*`). Repeated strings inside that one payload
 * are written as back-references to their first occurrence, so the payload is
 * always decodable in isolation. Nothing is remembered across sessions:
 * each independent serialize/deserialize call must use a fresh session.
 *
 * Using a session a second time throws `std::logic_error`.
 */
class SerializationSession {
private:
  enum class Mode : int8_t { FRESH, ENCODING, DECODING, FINISHED };

  Mode mode_{Mode::FRESH};

  BufferType buffer_{};
  std::unordered_map<std::string, uint32_t> written_strings_{};
  std::size_t back_references_written_{0};

  std::span<const std::byte> input_{};
  std::vector<std::string> read_strings_{};

public:
  SerializationSession() = default;
  SerializationSession(const SerializationSession&) = delete;
  SerializationSession(SerializationSession&&) = default;
  SerializationSession& operator=(const SerializationSession&) = delete;
  SerializationSession& operator=(SerializationSession&&) = default;

  ///@{ @name encoding
  void write_tag(WireTag tag);
  void write_u32(uint32_t value);
  void write_u64(uint64_t value);
  void write_raw(std::span<const std::byte> data);
  void write_string(std::string_view value);
  void write_bytes(std::span<const std::byte> data);

  /** @brief Ends the session, returning the encoded payload. */
  BufferType finish();

  /** @brief Number of STRING_REF tokens written so far */
  std::size_t back_references_written() const noexcept { return back_references_written_; }
  ///@}

  ///@{ @name decoding
  /** @brief Start decoding `input`; the memory must outlive the session. */
  void bind(std::span<const std::byte> input);

  std::error_code read_tag(WireTag& tag);
  std::error_code peek_tag(WireTag& tag) const;
  std::error_code read_u32(uint32_t& value);
  std::error_code read_u64(uint64_t& value);
  std::error_code read_raw(std::size_t size, std::span<const std::byte>& out);

  /** @brief Reads a STRING or a STRING_REF, tag included */
  std::error_code read_string(std::string& value);

  /** @brief Reads a BYTES value, tag included */
  std::error_code read_bytes(BufferType& value);

  std::size_t remaining() const noexcept { return input_.size(); }
  bool at_end() const noexcept { return input_.empty(); }
  ///@}

private:
  void begin_encoding_();
  void check_decoding_() const;
};

} // namespace granville::net
