
#pragma once

#include "codec.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace granville::net {

using PropertyMap = std::map<std::string, std::string>;

/**
 * @brief The catalog a server reports in its handshake acknowledgement.
 */
struct GrainManifest {
  std::map<std::string, PropertyMap> grain_properties{};     //!< grain type -> properties
  std::map<std::string, PropertyMap> interface_properties{}; //!< interface type -> properties
  std::map<std::string, std::string> interface_to_grain{};   //!< interface type -> grain type

  bool operator==(const GrainManifest&) const = default;
};

void encode(SerializationSession& s, const GrainManifest& manifest);
std::error_code decode(SerializationSession& s, GrainManifest& manifest);

/**
 * @brief One server's contribution to the composite manifest.
 */
struct ServerManifest {
  std::map<std::string, PropertyMap> grains{};
  std::map<std::string, PropertyMap> interfaces{};

  bool empty() const { return grains.empty() && interfaces.empty(); }
  bool operator==(const ServerManifest&) const = default;
};

/**
 * @brief Convert the wire form. Every `interface_to_grain` entry becomes the
 *        grain property `interface.{iface} = iface` on the mapped grain type.
 */
ServerManifest to_server_manifest(const GrainManifest& manifest);

/**
 * @brief The merged view over every connected server.
 */
struct CompositeManifest {
  uint64_t version{0};
  std::map<std::string, PropertyMap> grains{};
  std::map<std::string, PropertyMap> interfaces{};

  bool empty() const { return grains.empty() && interfaces.empty(); }

  /** @brief The grain type implementing `interface_type`, if any server reported one */
  std::optional<std::string> grain_type_for_interface(std::string_view interface_type) const;
};

} // namespace granville::net
