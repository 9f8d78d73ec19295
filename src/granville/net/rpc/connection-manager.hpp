
#pragma once

#include "connection.hpp"
#include "messages.hpp"
#include "zone-detection.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace granville::net {

/**
 * @brief Owns the live server connections and the zone -> server mapping, and
 *        picks the connection for each outgoing request.
 *
 * Routing priority:
 * 1. The request's explicit target zone, if it maps to a live connection.
 * 2. The zone the detection strategy derives from the grain id and interface,
 *    if it maps to a live connection.
 * 3. The first live connection, in registration order. Established
 *    connections whose server is not `UNHEALTHY` come first, then other
 *    established connections, then connections still connecting.
 * 4. Throws `RpcException` with `FAILED_PRECONDITION`.
 *
 * A zone may name a server that is not (or no longer) connected; such a zone
 * routes nowhere until a later update points it somewhere live.
 */
class ConnectionManager {
private:
  mutable std::mutex padlock_;
  std::vector<std::shared_ptr<Connection>> connections_; // registration order
  std::map<int32_t, std::string> zone_to_server_;
  std::shared_ptr<const ZoneDetectionStrategy> zone_detection_strategy_;

public:
  ConnectionManager() = default;
  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;
  ~ConnectionManager();

  /**
   * @brief Register `connection` under `server_id`.
   * A different instance already registered under that id is disposed and
   * replaced. Re-adding the same instance only refreshes the zone mapping.
   */
  void add_connection(const std::string& server_id, std::shared_ptr<Connection> connection,
                      std::optional<int32_t> zone_id = std::nullopt);

  /** @brief Merge `zone_mappings`, last write wins per zone */
  void update_zone_mappings(const std::map<int32_t, std::string>& zone_mappings);

  void set_zone_detection_strategy(std::shared_ptr<const ZoneDetectionStrategy> strategy);

  ///@{ @name routing
  /** @throw RpcException `FAILED_PRECONDITION` "No RPC connections available" */
  std::shared_ptr<Connection> get_connection_for_request(const RpcRequest& request) const;

  /** @brief Same routing, for callers without a request envelope (e.g., streams) */
  std::shared_ptr<Connection> get_connection_for(const GrainId& grain_id,
                                                 std::string_view interface_type,
                                                 std::optional<int32_t> target_zone_id) const;
  ///@}

  ///@{ @name removal
  /**
   * @brief Dispose the connection registered under `server_id`, and purge
   *        every zone that pointed at it.
   * @return true iff a connection was removed
   */
  bool remove_connection(const std::string& server_id);

  /** @brief As above, but only if `expected` is the registered instance */
  bool remove_connection(const std::string& server_id, const Connection* expected);

  /** @brief Dispose everything */
  void clear();
  ///@}

  ///@{ @name getters
  std::shared_ptr<Connection> get_connection(std::string_view server_id) const;
  std::shared_ptr<Connection> get_connection_for_zone(int32_t zone_id) const;
  std::map<int32_t, std::string> get_zone_mappings() const;
  std::vector<std::shared_ptr<Connection>> get_all_connections() const;
  std::size_t size() const;
  ///@}

private:
  std::shared_ptr<Connection> find_locked_(std::string_view server_id) const;
  std::shared_ptr<Connection> live_connection_for_zone_locked_(int32_t zone_id) const;
  std::shared_ptr<Connection> remove_locked_(const std::string& server_id,
                                             const Connection* expected, std::size_t& n_zones);
};

} // namespace granville::net
