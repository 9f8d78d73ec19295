
#include "stdinc.hpp"

#include "manifest-provider.hpp"

namespace granville::net {

namespace {
// Merges `from` into `into`, first owner wins; `owners` remembers who set each key
void merge_first_wins(std::map<std::string, PropertyMap>& into,
                      std::map<std::string, std::string>& owners,
                      const std::map<std::string, PropertyMap>& from, const std::string& server_id,
                      std::string_view kind) {
  for (const auto& [key, properties] : from) {
    auto [ii, inserted] = into.try_emplace(key, properties);
    if (inserted) {
      owners.emplace(key, server_id);
    } else if (ii->second != properties) {
      WARN("conflicting manifest entry for {} '{}': keeping server {}, dropping server {}", kind,
           key, owners[key], server_id);
    }
  }
}
} // namespace

ManifestProvider::ManifestProvider() : current_{std::make_shared<const CompositeManifest>()} {}

// ------------------------------------------------------------------------------------------ update

void ManifestProvider::update_from_server(const std::string& server_id,
                                          const GrainManifest& manifest) {
  update_from_server(server_id, to_server_manifest(manifest));
}

void ManifestProvider::update_from_server(const std::string& server_id, ServerManifest manifest) {
  const auto n_grains = manifest.grains.size();
  const auto n_interfaces = manifest.interfaces.size();

  std::lock_guard order_lock{update_padlock_};
  ManifestPtr advanced;
  {
    std::lock_guard lock{servers_padlock_};
    auto ii = std::find_if(begin(servers_), end(servers_),
                           [&server_id](const auto& entry) { return entry.first == server_id; });
    if (ii == end(servers_))
      servers_.emplace_back(server_id, std::move(manifest));
    else
      ii->second = std::move(manifest);
    advanced = rebuild_locked_();
  }

  INFO("updated manifest for server {}: {} grains, {} interfaces", server_id, n_grains,
       n_interfaces);
  notify_(advanced);
}

bool ManifestProvider::remove_server_manifest(const std::string& server_id) {
  std::lock_guard order_lock{update_padlock_};
  ManifestPtr advanced;
  {
    std::lock_guard lock{servers_padlock_};
    const auto n_removed = std::erase_if(
        servers_, [&server_id](const auto& entry) { return entry.first == server_id; });
    if (n_removed == 0)
      return false;
    advanced = rebuild_locked_();
  }

  INFO("removed manifest for server {}", server_id);
  notify_(advanced);
  return true;
}

void ManifestProvider::clear() {
  std::lock_guard order_lock{update_padlock_};
  ManifestPtr advanced;
  {
    std::lock_guard lock{servers_padlock_};
    servers_.clear();
    advanced = rebuild_locked_();
  }
  notify_(advanced);
}

// ----------------------------------------------------------------------------------------- getters

ManifestProvider::ManifestPtr ManifestProvider::current() const {
  std::lock_guard lock{snapshot_padlock_};
  return current_;
}

std::vector<std::string> ManifestProvider::server_ids() const {
  std::lock_guard lock{servers_padlock_};
  std::vector<std::string> ids;
  ids.reserve(servers_.size());
  for (const auto& entry : servers_)
    ids.push_back(entry.first);
  return ids;
}

std::optional<ServerManifest> ManifestProvider::get_server_manifest(std::string_view server_id) const {
  std::lock_guard lock{servers_padlock_};
  for (const auto& [id, manifest] : servers_)
    if (id == server_id)
      return manifest;
  return std::nullopt;
}

// ----------------------------------------------------------------------------------------- rebuild

ManifestProvider::ManifestPtr ManifestProvider::rebuild_locked_() {
  auto merged = std::make_shared<CompositeManifest>();
  std::map<std::string, std::string> grain_owners;
  std::map<std::string, std::string> interface_owners;
  for (const auto& [server_id, manifest] : servers_) {
    merge_first_wins(merged->grains, grain_owners, manifest.grains, server_id, "grain");
    merge_first_wins(merged->interfaces, interface_owners, manifest.interfaces, server_id,
                     "interface");
  }

  const auto previous = current();
  const bool is_changed =
      merged->grains != previous->grains || merged->interfaces != previous->interfaces;
  if (!is_changed)
    return nullptr;

  const bool advances = !merged->empty();
  merged->version = advances ? previous->version + 1 : previous->version;
  ManifestPtr snapshot = std::move(merged);
  {
    std::lock_guard lock{snapshot_padlock_};
    current_ = snapshot;
  }

  if (!advances)
    return nullptr;
  LOG_DEBUG("composite manifest advanced to version {}: {} grains, {} interfaces",
            snapshot->version, snapshot->grains.size(), snapshot->interfaces.size());
  return snapshot;
}

void ManifestProvider::notify_(const ManifestPtr& advanced) {
  if (advanced == nullptr)
    return;
  try {
    updates_(advanced);
  } catch (const std::exception& e) {
    LOG_ERR("manifest subscriber threw: {}", e.what());
  }
}

} // namespace granville::net
