
#include "stdinc.hpp"

#include "grain-factory.hpp"

namespace granville::net {

GrainFactory::GrainFactory(std::shared_ptr<RpcClient> client,
                           std::shared_ptr<const ProxyRegistry> registry)
    : client_{std::move(client)}, registry_{std::move(registry)} {
  if (client_ == nullptr)
    throw std::invalid_argument("grain factory requires an rpc client");
}

std::shared_ptr<GrainReference> GrainFactory::get_grain(std::string_view interface_type,
                                                        std::string key) const {
  throw_if_not_started_();
  if (registry_ == nullptr)
    throw RpcException{
        Status{StatusCode::FAILED_PRECONDITION, "grain factory has no proxy registry"}};
  return registry_->create(interface_type, client_,
                           GrainId{resolve_grain_type(interface_type), std::move(key)});
}

std::string GrainFactory::resolve_grain_type(std::string_view interface_type) const {
  if (auto grain_type = client_->manifests().grain_type_for_interface(interface_type))
    return std::move(*grain_type);
  LOG_DEBUG("no server reported a grain type for {}, using the interface name", interface_type);
  return std::string{interface_type};
}

void GrainFactory::throw_if_not_started_() const {
  if (client_->state() != RpcClientState::STARTED)
    throw RpcException{Status{StatusCode::FAILED_PRECONDITION, "RPC client is not connected"}};
}

} // namespace granville::net
