
#include "stdinc.hpp"

#include "manifest.hpp"

namespace granville::net {

static constexpr std::string_view k_interface_property_prefix = "interface.";

void encode(SerializationSession& s, const GrainManifest& manifest) {
  encode_fields(s, manifest.grain_properties, manifest.interface_properties,
                manifest.interface_to_grain);
}

std::error_code decode(SerializationSession& s, GrainManifest& manifest) {
  return decode_fields(s, manifest.grain_properties, manifest.interface_properties,
                       manifest.interface_to_grain);
}

ServerManifest to_server_manifest(const GrainManifest& manifest) {
  ServerManifest out;
  out.grains = manifest.grain_properties;
  out.interfaces = manifest.interface_properties;

  for (const auto& [interface_type, grain_type] : manifest.interface_to_grain) {
    auto key = std::string{k_interface_property_prefix} + interface_type;
    out.grains[grain_type].insert_or_assign(std::move(key), interface_type);
    out.interfaces.try_emplace(interface_type); // the interface is known, even without properties
  }

  return out;
}

std::optional<std::string>
CompositeManifest::grain_type_for_interface(std::string_view interface_type) const {
  const auto key = std::string{k_interface_property_prefix}.append(interface_type);
  for (const auto& [grain_type, properties] : grains)
    if (properties.contains(key))
      return grain_type;
  return std::nullopt;
}

} // namespace granville::net
