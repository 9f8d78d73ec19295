
#include "stdinc.hpp"

#include "connection-manager.hpp"

namespace granville::net {

ConnectionManager::~ConnectionManager() { clear(); }

// ----------------------------------------------------------------------------------- add connection

void ConnectionManager::add_connection(const std::string& server_id,
                                       std::shared_ptr<Connection> connection,
                                       std::optional<int32_t> zone_id) {
  if (connection == nullptr)
    throw std::invalid_argument("cannot add a null connection");

  std::shared_ptr<Connection> replaced;
  {
    std::lock_guard lock{padlock_};
    auto ii = std::find_if(begin(connections_), end(connections_),
                           [&server_id](const auto& c) { return c->server_id() == server_id; });
    if (ii == end(connections_)) {
      connections_.push_back(connection);
    } else if (ii->get() != connection.get()) {
      replaced = std::exchange(*ii, connection);
    }

    if (zone_id)
      zone_to_server_.insert_or_assign(*zone_id, server_id);
  }

  if (replaced != nullptr) {
    replaced->dispose();
    INFO("replaced connection to server {}", server_id);
  }

  if (zone_id) {
    INFO("added connection to server {} (zone {})", server_id, *zone_id);
  } else {
    INFO("added connection to server {}", server_id);
  }
}

void ConnectionManager::update_zone_mappings(const std::map<int32_t, std::string>& zone_mappings) {
  {
    std::lock_guard lock{padlock_};
    for (const auto& [zone_id, server_id] : zone_mappings)
      zone_to_server_.insert_or_assign(zone_id, server_id);
  }
  LOG_DEBUG("updated zone mappings: {} zones", zone_mappings.size());
}

void ConnectionManager::set_zone_detection_strategy(
    std::shared_ptr<const ZoneDetectionStrategy> strategy) {
  std::lock_guard lock{padlock_};
  zone_detection_strategy_ = std::move(strategy);
}

// ----------------------------------------------------------------------------------------- routing

std::shared_ptr<Connection> ConnectionManager::get_connection_for_request(
    const RpcRequest& request) const {
  return get_connection_for(request.grain_id, request.interface_type, request.target_zone_id);
}

std::shared_ptr<Connection>
ConnectionManager::get_connection_for(const GrainId& grain_id, std::string_view interface_type,
                                      std::optional<int32_t> target_zone_id) const {
  std::shared_ptr<const ZoneDetectionStrategy> strategy;

  { // 1. explicit zone
    std::lock_guard lock{padlock_};
    if (target_zone_id) {
      if (auto connection = live_connection_for_zone_locked_(*target_zone_id)) {
        LOG_DEBUG("routing {} to explicit zone {} via server {}", grain_id.to_string(),
                  *target_zone_id, connection->server_id());
        return connection;
      }
    }
    strategy = zone_detection_strategy_;
  }

  if (target_zone_id) {
    WARN("no live server for explicit zone {}, trying zone detection", *target_zone_id);
  }

  // 2. detected zone. The strategy runs without the lock held.
  std::optional<int32_t> detected_zone;
  if (strategy != nullptr && !grain_id.type.empty())
    detected_zone = strategy->detect_zone(grain_id, interface_type);

  std::lock_guard lock{padlock_};
  if (detected_zone) {
    if (auto connection = live_connection_for_zone_locked_(*detected_zone)) {
      LOG_DEBUG("zone detection routed {} to zone {} via server {}", grain_id.to_string(),
                *detected_zone, connection->server_id());
      return connection;
    }
    WARN("zone detection returned zone {}, but no live server serves it", *detected_zone);
  }

  // 3. first live connection, best first
  std::shared_ptr<Connection> established;
  std::shared_ptr<Connection> connecting;
  for (const auto& connection : connections_) {
    if (connection->is_disposed())
      continue;
    if (!connection->is_established()) {
      if (!connecting)
        connecting = connection;
    } else if (connection->health() != ServerHealth::UNHEALTHY) {
      LOG_DEBUG("no zone routing for {}, using server {}", grain_id.to_string(),
                connection->server_id());
      return connection;
    } else if (!established) {
      established = connection;
    }
  }

  if (auto fallback = established ? established : connecting) {
    LOG_DEBUG("no healthy connection for {}, using server {} ({}, {})", grain_id.to_string(),
              fallback->server_id(), fallback->is_established() ? "established" : "connecting",
              str(fallback->health()));
    return fallback;
  }

  // 4.
  throw RpcException{Status{StatusCode::FAILED_PRECONDITION, "No RPC connections available"}};
}

// ----------------------------------------------------------------------------------------- removal

bool ConnectionManager::remove_connection(const std::string& server_id) {
  return remove_connection(server_id, nullptr);
}

bool ConnectionManager::remove_connection(const std::string& server_id,
                                          const Connection* expected) {
  std::size_t n_zones = 0;
  std::shared_ptr<Connection> removed;
  {
    std::lock_guard lock{padlock_};
    removed = remove_locked_(server_id, expected, n_zones);
  }

  if (removed == nullptr)
    return false;

  removed->dispose();
  INFO("removed connection to server {} and {} zone mappings", server_id, n_zones);
  return true;
}

void ConnectionManager::clear() {
  std::vector<std::shared_ptr<Connection>> removed;
  {
    std::lock_guard lock{padlock_};
    removed = std::move(connections_);
    connections_.clear();
    zone_to_server_.clear();
  }
  for (auto& connection : removed)
    connection->dispose();
}

std::shared_ptr<Connection> ConnectionManager::remove_locked_(const std::string& server_id,
                                                              const Connection* expected,
                                                              std::size_t& n_zones) {
  auto ii = std::find_if(begin(connections_), end(connections_),
                         [&server_id](const auto& c) { return c->server_id() == server_id; });
  if (ii == end(connections_))
    return nullptr;
  if (expected != nullptr && ii->get() != expected)
    return nullptr; // a replacement is registered now

  auto removed = std::move(*ii);
  connections_.erase(ii);
  n_zones = std::erase_if(zone_to_server_,
                          [&server_id](const auto& entry) { return entry.second == server_id; });
  return removed;
}

// ----------------------------------------------------------------------------------------- getters

std::shared_ptr<Connection> ConnectionManager::get_connection(std::string_view server_id) const {
  std::lock_guard lock{padlock_};
  return find_locked_(server_id);
}

std::shared_ptr<Connection> ConnectionManager::get_connection_for_zone(int32_t zone_id) const {
  std::lock_guard lock{padlock_};
  return live_connection_for_zone_locked_(zone_id);
}

std::map<int32_t, std::string> ConnectionManager::get_zone_mappings() const {
  std::lock_guard lock{padlock_};
  return zone_to_server_;
}

std::vector<std::shared_ptr<Connection>> ConnectionManager::get_all_connections() const {
  std::lock_guard lock{padlock_};
  return connections_;
}

std::size_t ConnectionManager::size() const {
  std::lock_guard lock{padlock_};
  return connections_.size();
}

std::shared_ptr<Connection> ConnectionManager::find_locked_(std::string_view server_id) const {
  for (const auto& connection : connections_)
    if (connection->server_id() == server_id)
      return connection;
  return nullptr;
}

std::shared_ptr<Connection>
ConnectionManager::live_connection_for_zone_locked_(int32_t zone_id) const {
  auto ii = zone_to_server_.find(zone_id);
  if (ii == cend(zone_to_server_))
    return nullptr;
  auto connection = find_locked_(ii->second);
  return (connection != nullptr && !connection->is_disposed()) ? connection : nullptr;
}

} // namespace granville::net
