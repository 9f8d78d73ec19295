
#include "stdinc.hpp"

#include "zone-detection.hpp"

namespace granville::net {

// ---------------------------------------------------------------- GrainTypeZoneDetectionStrategy

GrainTypeZoneDetectionStrategy::GrainTypeZoneDetectionStrategy(
    std::vector<std::pair<std::string, int32_t>> patterns) {
  for (auto& [pattern, zone_id] : patterns)
    add_mapping(std::move(pattern), zone_id);
}

std::optional<int32_t>
GrainTypeZoneDetectionStrategy::detect_zone(const GrainId& grain_id, std::string_view) const {
  std::lock_guard lock{padlock_};
  for (const auto& [pattern, zone_id] : patterns_) {
    if (grain_id.type.find(pattern) != std::string::npos) {
      TRACE("grain type {} matched pattern '{}', zone {}", grain_id.type, pattern, zone_id);
      return zone_id;
    }
  }
  return std::nullopt;
}

void GrainTypeZoneDetectionStrategy::add_mapping(std::string pattern, int32_t zone_id) {
  std::lock_guard lock{padlock_};
  auto ii = std::find_if(begin(patterns_), end(patterns_),
                         [&pattern](const auto& entry) { return entry.first == pattern; });
  if (ii != end(patterns_))
    ii->second = zone_id;
  else
    patterns_.emplace_back(std::move(pattern), zone_id);
}

bool GrainTypeZoneDetectionStrategy::remove_mapping(std::string_view pattern) {
  std::lock_guard lock{padlock_};
  return std::erase_if(patterns_, [pattern](const auto& entry) { return entry.first == pattern; }) >
         0;
}

// ---------------------------------------------------------------- InterfaceZoneDetectionStrategy

std::optional<int32_t>
InterfaceZoneDetectionStrategy::detect_zone(const GrainId&, std::string_view interface_type) const {
  std::lock_guard lock{padlock_};
  auto ii = zones_.find(std::string{interface_type});
  if (ii == cend(zones_))
    return std::nullopt;
  return ii->second;
}

void InterfaceZoneDetectionStrategy::add_mapping(std::string interface_type, int32_t zone_id) {
  std::lock_guard lock{padlock_};
  zones_.insert_or_assign(std::move(interface_type), zone_id);
}

bool InterfaceZoneDetectionStrategy::remove_mapping(const std::string& interface_type) {
  std::lock_guard lock{padlock_};
  return zones_.erase(interface_type) > 0;
}

// ---------------------------------------------------------------- CompositeZoneDetectionStrategy

std::optional<int32_t>
CompositeZoneDetectionStrategy::detect_zone(const GrainId& grain_id,
                                            std::string_view interface_type) const {
  for (const auto& strategy : strategies_)
    if (strategy)
      if (auto zone_id = strategy->detect_zone(grain_id, interface_type))
        return zone_id;
  return std::nullopt;
}

} // namespace granville::net
