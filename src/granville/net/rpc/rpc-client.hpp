
#pragma once

#include "connection-manager.hpp"
#include "manifest-provider.hpp"
#include "messages.hpp"
#include "pending-request-table.hpp"
#include "rpc-client-options.hpp"
#include "serialization-session-factory.hpp"
#include "status.hpp"
#include "stream-channel.hpp"
#include "zone-detection.hpp"

#include "granville/net/transport.hpp"
#include "granville/portable/asio/asio-timer-factory.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/signals2/signal.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

namespace granville::net {

enum class RpcClientState : int8_t { CREATED, STARTING, STARTED, FAILED, STOPPING, STOPPED };

std::string_view str(RpcClientState state);

/**
 * @brief A client of several independent rpc servers.
 *
 * Keeps one connection per server, routes each request to a server through
 * the `ConnectionManager`, and correlates responses with requests by id. Each
 * server's handshake acknowledgement feeds the zone mapping and the
 * composite manifest.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * boost::asio::io_context io_context;
 * AsioExecutionContext context{io_context, 2};
 * context.run();
 *
 * RpcClientOptions options;
 * options.server_endpoints.push_back({"game.example.com", 12000});
 * auto client = RpcClient::make(options, io_context, make_websocket_transport_factory(io_context));
 * client->start([](Status status) { INFO("started: {}", status.to_string()); });
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * Completion handlers run on whichever thread resolves them: a transport
 * strand, a timer, or the thread calling `stop()`.
 */
class RpcClient : public std::enable_shared_from_this<RpcClient> {
public:
  using StatusHandler = std::function<void(Status status)>;
  using ResponseHandler = PendingRequestTable::CompletionHandler;
  using HandshakeSignal = boost::signals2::signal<void(const std::string& server_id)>;
  using HealthSignal = Connection::HealthSignal;

private:
  struct ConnectAttempt;

  RpcClientOptions options_;
  boost::asio::io_context& io_context_;
  TransportFactory transport_factory_;
  SteadyTimerFactory timer_factory_;

  std::atomic<RpcClientState> state_{RpcClientState::CREATED};

  ConnectionManager connections_;
  ManifestProvider manifests_;
  SerializationSessionFactory serializer_;
  std::shared_ptr<PendingRequestTable> pending_;
  StreamManager streams_;

  std::mutex transports_padlock_;
  std::unordered_map<std::string, std::shared_ptr<Transport>> transports_; // by server id

  std::mutex heartbeat_padlock_;
  std::unique_ptr<boost::asio::steady_timer> heartbeat_timer_;

  HandshakeSignal handshake_completed_;
  HealthSignal server_health_changed_;

  RpcClient(RpcClientOptions options, boost::asio::io_context& io_context,
            TransportFactory transport_factory);

public:
  /**
   * @param transport_factory Makes one transport per server connection
   * @param zone_detection_strategy Optional; see `ConnectionManager`
   */
  static std::shared_ptr<RpcClient>
  make(RpcClientOptions options, boost::asio::io_context& io_context,
       TransportFactory transport_factory,
       std::shared_ptr<const ZoneDetectionStrategy> zone_detection_strategy = nullptr);

  RpcClient(const RpcClient&) = delete;
  RpcClient& operator=(const RpcClient&) = delete;
  ~RpcClient();

  ///@{ @name lifecycle
  /**
   * @brief Connect to every configured endpoint, retrying each as configured.
   * `completion` receives `OK` once all are connected, or the first failure.
   * A failed start leaves the client `FAILED`, keeping the connections that
   * did succeed: `start` again retries only the missing ones, and `stop`
   * closes them. With no endpoints, the client starts idle.
   */
  void start(StatusHandler completion);

  /**
   * @brief Connect to one server, and send it the handshake.
   * On failure the connection is unregistered, and its transport stopped,
   * before `completion` runs.
   * @param server_id Defaults to `server-{host}:{port}`
   */
  void connect_to_server(const Endpoint& endpoint, std::optional<std::string> server_id,
                         StatusHandler completion);

  /**
   * @brief Fail every pending request with `CANCELLED`, cancel all streams,
   *        and close every connection. Idempotent.
   */
  void stop();
  ///@}

  ///@{ @name requests
  /**
   * @brief Route and send `request`; `completion` runs exactly once.
   * A nil `message_id` is replaced with a fresh one.
   * @throw RpcException `FAILED_PRECONDITION` when there is no connection to
   *        route to, or the client is stopped; `ALREADY_EXISTS` when a request
   *        with the same id is pending.
   */
  void send_request(RpcRequest request, ResponseHandler completion);

  /**
   * @brief Route and open an async-enumerable stream.
   * @throw RpcException as for `send_request`
   */
  std::shared_ptr<StreamChannel> open_stream(AsyncEnumerableRequest request,
                                             std::optional<int32_t> target_zone_id = std::nullopt);

  /** @brief Tear down `stream_id`, and tell its server. Idempotent. */
  bool cancel_stream(const Guid& stream_id);
  ///@}

  ///@{ @name getters
  RpcClientState state() const { return state_.load(std::memory_order_acquire); }
  const RpcClientOptions& options() const { return options_; }
  ConnectionManager& connections() { return connections_; }
  const ConnectionManager& connections() const { return connections_; }
  ManifestProvider& manifests() { return manifests_; }
  const ManifestProvider& manifests() const { return manifests_; }
  const SerializationSessionFactory& serializer() const { return serializer_; }
  std::size_t pending_request_count() const { return pending_->size(); }
  bool has_pending_request(const Guid& request_id) const { return pending_->contains(request_id); }
  std::size_t open_stream_count() const { return streams_.size(); }
  boost::asio::io_context& io_context() { return io_context_; }

  /** @brief Fires after each handshake acknowledgement has been applied */
  HandshakeSignal& handshake_completed() { return handshake_completed_; }

  /**
   * @brief Fires when a server's health changes; see `ServerHealth`.
   * With `remove_unhealthy_servers`, an unhealthy server is removed before
   * this fires.
   */
  HealthSignal& server_health_changed() { return server_health_changed_; }
  ///@}

  static std::string default_server_id(const Endpoint& endpoint);

private:
  void connect_with_retries_(const Endpoint& endpoint, int32_t retry, StatusHandler completion);
  void finish_connect_(const std::shared_ptr<ConnectAttempt>& attempt, Status status);
  void rollback_connect_(const ConnectAttempt& attempt);
  void release_transport_(const std::string& server_id, const Transport* expected);

  void on_data_(const std::string& server_id, std::span<const std::byte> payload);
  void on_closed_(const std::string& server_id, const Connection* connection,
                  const Transport* transport);
  void on_health_changed_(const std::string& server_id, ServerHealth previous,
                          ServerHealth current, const Connection* connection,
                          const Transport* transport);
  bool remove_server_(const std::string& server_id, const Connection* connection,
                      const Transport* transport, std::string_view reason);

  void handle_(const std::string& server_id, RpcHandshakeAck&& ack);
  void handle_(const std::string& server_id, RpcResponse&& response);
  void handle_(const std::string& server_id, RpcHeartbeat&& heartbeat);
  void handle_(const std::string& server_id, RpcErrorMessage&& error);
  void handle_(const std::string& server_id, AsyncEnumerableItem&& item);
  template <typename T> void handle_(const std::string& server_id, T&& unexpected);

  void send_stream_cancel_(const std::string& server_id, const Guid& stream_id);

  void arm_heartbeat_();
  void send_heartbeats_();

  void throw_if_stopped_() const;
};

} // namespace granville::net
