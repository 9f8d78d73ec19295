
#pragma once

#include "messages.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace granville::net {

/**
 * @brief Decides which zone (and so which server) should serve a grain.
 */
class ZoneDetectionStrategy {
public:
  virtual ~ZoneDetectionStrategy() = default;

  /** @brief The zone for `grain_id`, or nothing if any zone will do */
  virtual std::optional<int32_t> detect_zone(const GrainId& grain_id,
                                             std::string_view interface_type) const = 0;
};

/**
 * @brief Maps grain types to zones by substring patterns. Patterns are
 *        tried in the order they were added; the first match wins.
 */
class GrainTypeZoneDetectionStrategy final : public ZoneDetectionStrategy {
private:
  mutable std::mutex padlock_;
  std::vector<std::pair<std::string, int32_t>> patterns_;

public:
  GrainTypeZoneDetectionStrategy() = default;
  explicit GrainTypeZoneDetectionStrategy(std::vector<std::pair<std::string, int32_t>> patterns);

  std::optional<int32_t> detect_zone(const GrainId& grain_id,
                                     std::string_view interface_type) const override;

  /** @brief Add a pattern, or re-point an existing one (keeping its position) */
  void add_mapping(std::string pattern, int32_t zone_id);

  /** @return true iff `pattern` was present */
  bool remove_mapping(std::string_view pattern);
};

/**
 * @brief Maps interface types to zones, matched exactly.
 */
class InterfaceZoneDetectionStrategy final : public ZoneDetectionStrategy {
private:
  mutable std::mutex padlock_;
  std::unordered_map<std::string, int32_t> zones_;

public:
  std::optional<int32_t> detect_zone(const GrainId& grain_id,
                                     std::string_view interface_type) const override;

  void add_mapping(std::string interface_type, int32_t zone_id);
  bool remove_mapping(const std::string& interface_type);
};

/**
 * @brief Asks each strategy in turn; the first answer wins.
 */
class CompositeZoneDetectionStrategy final : public ZoneDetectionStrategy {
private:
  std::vector<std::shared_ptr<const ZoneDetectionStrategy>> strategies_;

public:
  explicit CompositeZoneDetectionStrategy(
      std::vector<std::shared_ptr<const ZoneDetectionStrategy>> strategies)
      : strategies_{std::move(strategies)} {}

  std::optional<int32_t> detect_zone(const GrainId& grain_id,
                                     std::string_view interface_type) const override;
};

} // namespace granville::net
