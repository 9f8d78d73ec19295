
#pragma once

#include "granville/utils/error-codes.hpp"

#include <tl/expected.hpp>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace granville::net {

/**
 * @brief A network address of an rpc server.
 */
struct Endpoint {
  std::string host{};
  uint16_t port{0};

  /** @brief `host:port` */
  std::string to_string() const;

  auto operator<=>(const Endpoint&) const = default;
};

/**
 * @brief Parse `host:port`. The port is mandatory, and the host is everything
 *        before the last `:`. An IPv6 host may be written in brackets: `[::1]:9000`.
 */
tl::expected<Endpoint, std::error_code> parse_endpoint(std::string_view text);

} // namespace granville::net
