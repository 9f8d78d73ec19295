
#pragma once

#include "grain-reference.hpp"
#include "proxy-registry.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace granville::net {

/**
 * @brief Hands out grain references for a started client.
 *
 * The grain type behind an interface comes from the servers' manifests; an
 * interface no server has reported is addressed by its own name.
 */
class GrainFactory {
private:
  std::shared_ptr<RpcClient> client_;
  std::shared_ptr<const ProxyRegistry> registry_;

public:
  explicit GrainFactory(std::shared_ptr<RpcClient> client,
                        std::shared_ptr<const ProxyRegistry> registry = nullptr);

  /** @throw RpcException `FAILED_PRECONDITION` if the client is not started */
  template <typename P> std::shared_ptr<P> get_grain(std::string key) const {
    throw_if_not_started_();
    const std::string_view interface_type = P::k_interface_type;
    return std::make_shared<P>(client_,
                               GrainId{resolve_grain_type(interface_type), std::move(key)});
  }

  /**
   * @brief A type-erased reference through the registry.
   * @throw RpcException `FAILED_PRECONDITION` if the client is not started, or
   *        there is no registry; `NOT_FOUND` for an unregistered interface
   */
  std::shared_ptr<GrainReference> get_grain(std::string_view interface_type,
                                            std::string key) const;

  /** @brief The grain type implementing `interface_type` */
  std::string resolve_grain_type(std::string_view interface_type) const;

private:
  void throw_if_not_started_() const;
};

} // namespace granville::net
