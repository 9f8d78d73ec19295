
#pragma once

#include "manifest.hpp"

#include <boost/signals2/connection.hpp>
#include <boost/signals2/signal.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace granville::net {

/**
 * @brief Keeps one manifest per connected server, and the composite view
 *        over all of them.
 *
 * Servers are merged in registration order, and the first server to report a
 * grain (or interface) type wins. A later, different value for the same type
 * is dropped with a warning.
 *
 * The composite's version advances only when the merged content is non-empty
 * and differs from the previous snapshot. Subscribers are told of each
 * version advance, in version order. They run after the server table is
 * unlocked, so a subscriber may read the provider, but must not update it.
 */
class ManifestProvider {
public:
  using ManifestPtr = std::shared_ptr<const CompositeManifest>;
  using UpdateSignal = boost::signals2::signal<void(const ManifestPtr& manifest)>;

private:
  std::mutex update_padlock_; // one update (and its notification) at a time

  mutable std::mutex servers_padlock_;
  std::vector<std::pair<std::string, ServerManifest>> servers_; // registration order

  mutable std::mutex snapshot_padlock_;
  ManifestPtr current_;

  UpdateSignal updates_;

public:
  ManifestProvider();
  ManifestProvider(const ManifestProvider&) = delete;
  ManifestProvider& operator=(const ManifestProvider&) = delete;

  /** @brief Set (or replace) the contribution of `server_id`, and rebuild */
  void update_from_server(const std::string& server_id, const GrainManifest& manifest);
  void update_from_server(const std::string& server_id, ServerManifest manifest);

  /** @return true iff `server_id` had a contribution */
  bool remove_server_manifest(const std::string& server_id);

  /** @brief Drop every contribution */
  void clear();

  /** @brief The latest snapshot; never null */
  ManifestPtr current() const;
  uint64_t version() const { return current()->version; }

  std::vector<std::string> server_ids() const;
  std::optional<ServerManifest> get_server_manifest(std::string_view server_id) const;

  std::optional<std::string> grain_type_for_interface(std::string_view interface_type) const {
    return current()->grain_type_for_interface(interface_type);
  }

  /**
   * @brief Call `callback` with each new version.
   * Hold the result in a `boost::signals2::scoped_connection` to unsubscribe
   * when it goes out of scope.
   */
  boost::signals2::connection subscribe(std::function<void(const ManifestPtr&)> callback) {
    return updates_.connect(std::move(callback));
  }

private:
  /** @return The new snapshot iff the version advanced */
  ManifestPtr rebuild_locked_();
  void notify_(const ManifestPtr& advanced);
};

} // namespace granville::net
