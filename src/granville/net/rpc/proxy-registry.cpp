
#include "stdinc.hpp"

#include "proxy-registry.hpp"

namespace granville::net {

bool ProxyRegistry::register_factory(std::string interface_type, Factory factory) {
  if (!factory)
    throw std::invalid_argument("cannot register an empty proxy factory");

  std::lock_guard lock{padlock_};
  const bool is_new = !factories_.contains(interface_type);
  if (!is_new) {
    WARN("replacing the proxy registered for {}", interface_type);
  }
  factories_.insert_or_assign(std::move(interface_type), std::move(factory));
  return is_new;
}

std::shared_ptr<GrainReference> ProxyRegistry::create(std::string_view interface_type,
                                                      std::shared_ptr<RpcClient> client,
                                                      GrainId grain_id) const {
  Factory factory;
  {
    std::lock_guard lock{padlock_};
    auto ii = factories_.find(std::string{interface_type});
    if (ii != cend(factories_))
      factory = ii->second;
  }

  if (!factory)
    throw RpcException{Status{StatusCode::NOT_FOUND,
                              fmt::format("no proxy registered for {}", interface_type)}};
  return factory(std::move(client), std::move(grain_id));
}

bool ProxyRegistry::contains(std::string_view interface_type) const {
  std::lock_guard lock{padlock_};
  return factories_.contains(std::string{interface_type});
}

std::vector<std::string> ProxyRegistry::interface_types() const {
  std::lock_guard lock{padlock_};
  std::vector<std::string> types;
  types.reserve(factories_.size());
  for (const auto& entry : factories_)
    types.push_back(entry.first);
  std::sort(begin(types), end(types));
  return types;
}

std::size_t ProxyRegistry::size() const {
  std::lock_guard lock{padlock_};
  return factories_.size();
}

} // namespace granville::net
