
#pragma once

#include "messages.hpp"
#include "rpc-client.hpp"
#include "status.hpp"
#include "stream-channel.hpp"

#include "granville/async/future.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace granville::net {

/**
 * @brief The client side of one grain: calls on it are rpc requests.
 *
 * Typed proxies derive from `GrainReference`, declare their interface type
 * and method table, and give each interface method a typed wrapper around
 * `invoke`:
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * class PlayerProxy : public GrainReference {
 * public:
 *   static constexpr std::string_view k_interface_type = "IPlayerGrain";
 *   static constexpr auto k_methods = make_method_table("GetName", "Move");
 *
 *   using GrainReference::GrainReference;
 *
 *   async::Future<std::string> get_name() const {
 *     return invoke<std::string>(k_methods.id_of("GetName"));
 *   }
 *   async::Future<void> move(double x, double y) const {
 *     return invoke<void>(k_methods.id_of("Move"), x, y);
 *   }
 * };
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class GrainReference {
private:
  std::shared_ptr<RpcClient> client_;
  GrainId grain_id_;
  std::string interface_type_;
  std::optional<int32_t> target_zone_id_{};
  int32_t timeout_ms_{0}; // 0 is the client's default

public:
  GrainReference(std::shared_ptr<RpcClient> client, GrainId grain_id, std::string interface_type);
  virtual ~GrainReference() = default;

  const GrainId& grain_id() const { return grain_id_; }
  const std::string& interface_type() const { return interface_type_; }
  const std::shared_ptr<RpcClient>& client() const { return client_; }

  /** @brief Pin every call on this reference to `zone_id` (or unpin it) */
  void set_target_zone(std::optional<int32_t> zone_id) { target_zone_id_ = zone_id; }
  std::optional<int32_t> target_zone() const { return target_zone_id_; }

  void set_timeout_ms(int32_t timeout_ms) { timeout_ms_ = timeout_ms; }
  int32_t timeout_ms() const { return timeout_ms_; }

  /**
   * @brief Call method `method_id` with `args`, and deserialize the result as `R`.
   *
   * Failures reach the future as `RpcException`: the server's error, a
   * timeout, a send failure, or an undecodable result.
   * @throw RpcException when the request cannot be routed
   */
  template <typename R, typename... Args>
  async::Future<R> invoke(int32_t method_id, const Args&... args) const;

  /** @brief `invoke`, with a result type name for servers that cannot infer it */
  template <typename R, typename... Args>
  async::Future<R> invoke_with_type_hint(int32_t method_id, std::string_view return_type_name,
                                         const Args&... args) const;

  /** @brief Open an async-enumerable stream of results */
  template <typename... Args>
  std::shared_ptr<StreamChannel> invoke_stream(int32_t method_id, const Args&... args) const;

private:
  template <typename... Args>
  RpcRequest make_request_(int32_t method_id, std::string_view return_type_name,
                           const Args&... args) const;
};

} // namespace granville::net

#include "impl/grain-reference_impl.hpp"
