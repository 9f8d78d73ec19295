
#pragma once

#include "granville/net/endpoint.hpp"
#include "granville/net/rpc/connection.hpp"
#include "granville/utils/guid.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace granville::net {

inline constexpr std::size_t k_default_max_message_size = 16 * 1024 * 1024;

/**
 * @brief Settings for one `RpcClient`.
 */
struct RpcClientOptions {
  std::string client_id = to_compact_string(new_guid());
  std::vector<Endpoint> server_endpoints{};

  int32_t connection_timeout_ms{30000};
  int32_t request_timeout_ms{30000}; //!< for requests that do not set their own
  int32_t max_retry_attempts{3};     //!< retries after the first failed connect
  int32_t retry_delay_ms{1000};
  int32_t heartbeat_interval_ms{0}; //!< 0 disables heartbeats
  std::size_t max_message_size{k_default_max_message_size};

  int32_t unhealthy_threshold{k_default_unhealthy_threshold}; //!< consecutive send failures
  bool remove_unhealthy_servers{false}; //!< drop a server's connection once it is unhealthy
};

} // namespace granville::net
