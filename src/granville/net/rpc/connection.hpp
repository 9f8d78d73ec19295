
#pragma once

#include "granville/net/buffer.hpp"
#include "granville/net/endpoint.hpp"
#include "granville/net/transport.hpp"

#include <boost/signals2/connection.hpp>
#include <boost/signals2/signal.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>

namespace granville::net {

/**
 * @brief The health of one server, as seen by its connection.
 *
 * `UNKNOWN` until the first message goes through. Any successful send, or any
 * received message, makes it `HEALTHY`; `unhealthy_threshold` consecutive
 * send failures make it `UNHEALTHY`.
 */
enum class ServerHealth : int8_t { UNKNOWN, HEALTHY, UNHEALTHY };

std::string_view str(ServerHealth health);

inline constexpr int32_t k_default_unhealthy_threshold = 3;

/**
 * @brief One server connection: a transport bound to one endpoint, and tagged
 *        with the id of the server on the other end.
 *
 * Transport events are re-emitted, with the server id attached, through the
 * connection's own signals. A disposed connection forwards nothing, and
 * refuses to send, but leaves the transport itself running: the owner of the
 * transport decides when to stop it.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
  using CompletionHandler = Transport::CompletionHandler;
  using DataSignal = boost::signals2::signal<void(const std::string& server_id,
                                                  std::span<const std::byte> payload)>;
  using ConnectionSignal =
      boost::signals2::signal<void(const std::string& server_id, const Endpoint& endpoint)>;
  using HealthSignal = boost::signals2::signal<void(const std::string& server_id,
                                                    ServerHealth previous, ServerHealth current)>;

private:
  std::string server_id_;
  Endpoint endpoint_;
  std::shared_ptr<Transport> transport_;
  std::size_t max_message_size_{0}; // 0 is unlimited

  std::atomic<bool> is_disposed_{false};
  std::atomic<bool> is_established_{false};
  std::atomic<ServerHealth> health_{ServerHealth::UNKNOWN};
  std::atomic<int32_t> consecutive_failures_{0};
  std::atomic<int32_t> unhealthy_threshold_{k_default_unhealthy_threshold};

  mutable std::mutex padlock_;
  boost::signals2::scoped_connection data_subscription_;
  boost::signals2::scoped_connection established_subscription_;
  boost::signals2::scoped_connection closed_subscription_;

  DataSignal on_data_;
  ConnectionSignal on_established_;
  ConnectionSignal on_closed_;
  HealthSignal on_health_changed_;

  Connection(std::string server_id, Endpoint endpoint, std::shared_ptr<Transport> transport,
             std::size_t max_message_size);

public:
  /**
   * @brief Wrap `transport`, and subscribe to its events.
   * @param max_message_size Larger sends fail with `message_too_large`; 0 is unlimited.
   */
  static std::shared_ptr<Connection> make(std::string server_id, Endpoint endpoint,
                                          std::shared_ptr<Transport> transport,
                                          std::size_t max_message_size = 0);

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;
  ~Connection();

  const std::string& server_id() const { return server_id_; }
  const Endpoint& endpoint() const { return endpoint_; }
  const std::shared_ptr<Transport>& transport() const { return transport_; }
  bool is_disposed() const { return is_disposed_.load(std::memory_order_acquire); }

  /** @brief True once the transport has connected, and until it closes */
  bool is_established() const { return is_established_.load(std::memory_order_acquire); }

  ///@{ @name health
  ServerHealth health() const { return health_.load(std::memory_order_acquire); }
  int32_t consecutive_failures() const {
    return consecutive_failures_.load(std::memory_order_acquire);
  }
  void set_unhealthy_threshold(int32_t threshold) {
    unhealthy_threshold_.store(std::max(threshold, 1), std::memory_order_release);
  }

  /** @brief The server answered, or took a message */
  void record_success();

  /** @brief A send to the server failed */
  void record_failure();
  ///@}

  /**
   * @brief Send one message over the transport.
   * Fails with `connection_disposed` after `dispose()`, and `message_too_large`
   * when `buffer` exceeds the maximum message size. Those failures complete
   * before `send` returns.
   */
  void send(BufferType&& buffer, CompletionHandler completion);

  /** @brief Unsubscribe from the transport. Idempotent. */
  void dispose();

  DataSignal& on_data() { return on_data_; }
  ConnectionSignal& on_established() { return on_established_; }
  ConnectionSignal& on_closed() { return on_closed_; }
  HealthSignal& on_health_changed() { return on_health_changed_; }

private:
  void subscribe_();
  void handle_data_(std::span<const std::byte> payload);
  void handle_established_(const Endpoint& endpoint);
  void handle_closed_(const Endpoint& endpoint);
  void set_health_(ServerHealth health);
};

} // namespace granville::net
