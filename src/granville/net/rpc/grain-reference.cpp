
#include "stdinc.hpp"

#include "grain-reference.hpp"

namespace granville::net {

GrainReference::GrainReference(std::shared_ptr<RpcClient> client, GrainId grain_id,
                               std::string interface_type)
    : client_{std::move(client)}, grain_id_{std::move(grain_id)},
      interface_type_{std::move(interface_type)} {
  if (client_ == nullptr)
    throw std::invalid_argument("grain reference requires an rpc client");
}

} // namespace granville::net
