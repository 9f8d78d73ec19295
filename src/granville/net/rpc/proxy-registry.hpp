
#pragma once

#include "grain-reference.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace granville::net {

/**
 * @brief Interface type -> proxy factory. Populated explicitly at startup.
 *
 * A proxy `P` is registrable if it derives from `GrainReference`, declares
 * `P::k_interface_type`, and is constructible from `(client, grain_id)`.
 */
class ProxyRegistry {
public:
  using Factory =
      std::function<std::shared_ptr<GrainReference>(std::shared_ptr<RpcClient>, GrainId)>;

private:
  mutable std::mutex padlock_;
  std::unordered_map<std::string, Factory> factories_;

public:
  template <typename P> bool register_proxy() {
    static_assert(std::is_base_of_v<GrainReference, P>, "proxies derive from GrainReference");
    return register_factory(std::string{P::k_interface_type},
                            [](std::shared_ptr<RpcClient> client, GrainId grain_id) {
                              return std::make_shared<P>(std::move(client), std::move(grain_id));
                            });
  }

  /** @return false iff `interface_type` was registered already; the new factory replaces it */
  bool register_factory(std::string interface_type, Factory factory);

  /** @throw RpcException `NOT_FOUND` if no proxy is registered for `interface_type` */
  std::shared_ptr<GrainReference> create(std::string_view interface_type,
                                         std::shared_ptr<RpcClient> client,
                                         GrainId grain_id) const;

  bool contains(std::string_view interface_type) const;
  std::vector<std::string> interface_types() const;
  std::size_t size() const;
};

} // namespace granville::net
