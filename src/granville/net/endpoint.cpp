
#include "stdinc.hpp"

#include "endpoint.hpp"

#include <charconv>

namespace granville::net {

std::string Endpoint::to_string() const { return fmt::format("{}:{}", host, port); }

tl::expected<Endpoint, std::error_code> parse_endpoint(std::string_view text) {
  const auto pos = text.rfind(':');
  if (pos == std::string_view::npos || pos == 0 || pos + 1 == text.size())
    return tl::make_unexpected(make_error_code(ecode::argument_error));

  auto host = text.substr(0, pos);
  const auto port_str = text.substr(pos + 1);

  if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  if (host.empty())
    return tl::make_unexpected(make_error_code(ecode::argument_error));

  uint32_t port = 0;
  const auto* first = port_str.data();
  const auto* last = port_str.data() + port_str.size();
  const auto [ptr, ec] = std::from_chars(first, last, port);
  if (ec != std::errc{} || ptr != last || port == 0 || port > 65535)
    return tl::make_unexpected(make_error_code(ecode::argument_error));

  return Endpoint{std::string{host}, static_cast<uint16_t>(port)};
}

} // namespace granville::net
