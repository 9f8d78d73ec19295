
#include "stdinc.hpp"

#include "rpc-client.hpp"

namespace granville::net {

std::string_view str(RpcClientState state) {
#define CASE(x)                                                                                    \
  case RpcClientState::x:                                                                          \
    return #x
  switch (state) {
    CASE(CREATED);
    CASE(STARTING);
    CASE(STARTED);
    CASE(FAILED);
    CASE(STOPPING);
    CASE(STOPPED);
  }
#undef CASE
  return "<unknown state>";
}

static constexpr std::string_view k_basic_rpc_feature = "basic-rpc";

/// One connect to one server, finished exactly once: by the handshake send, by
/// a failure, or by the connect timeout.
struct RpcClient::ConnectAttempt {
  std::string server_id;
  Endpoint endpoint;
  std::shared_ptr<Connection> connection;
  std::shared_ptr<Transport> transport;
  std::unique_ptr<boost::asio::steady_timer> timer;
  StatusHandler completion;
  std::atomic<bool> is_finished{false};
};

// -------------------------------------------------------------------------------------------- make

RpcClient::RpcClient(RpcClientOptions options, boost::asio::io_context& io_context,
                     TransportFactory transport_factory)
    : options_{std::move(options)}, io_context_{io_context},
      transport_factory_{std::move(transport_factory)},
      timer_factory_{make_steady_timer_factory(io_context)},
      pending_{PendingRequestTable::make(timer_factory_)} {
  if (!transport_factory_)
    throw std::invalid_argument("rpc client requires a transport factory");
}

std::shared_ptr<RpcClient>
RpcClient::make(RpcClientOptions options, boost::asio::io_context& io_context,
                TransportFactory transport_factory,
                std::shared_ptr<const ZoneDetectionStrategy> zone_detection_strategy) {
  std::shared_ptr<RpcClient> client{
      new RpcClient{std::move(options), io_context, std::move(transport_factory)}};
  if (zone_detection_strategy)
    client->connections_.set_zone_detection_strategy(std::move(zone_detection_strategy));
  return client;
}

RpcClient::~RpcClient() { stop(); }

std::string RpcClient::default_server_id(const Endpoint& endpoint) {
  return fmt::format("server-{}", endpoint.to_string());
}

// ------------------------------------------------------------------------------------------- start

void RpcClient::start(StatusHandler completion) {
  auto expected = RpcClientState::CREATED;
  const bool is_starting =
      state_.compare_exchange_strong(expected, RpcClientState::STARTING,
                                     std::memory_order_acq_rel) ||
      (expected == RpcClientState::FAILED &&
       state_.compare_exchange_strong(expected, RpcClientState::STARTING,
                                      std::memory_order_acq_rel));
  if (!is_starting) {
    if (completion)
      completion(Status{StatusCode::FAILED_PRECONDITION,
                        fmt::format("cannot start an rpc client that is {}", str(expected))});
    return;
  }

  // After a failed start, only the servers without a live connection are retried
  std::vector<Endpoint> endpoints;
  for (const auto& endpoint : options_.server_endpoints) {
    auto connection = connections_.get_connection(default_server_id(endpoint));
    if (connection == nullptr || !connection->is_established())
      endpoints.push_back(endpoint);
  }

  if (options_.server_endpoints.empty()) {
    state_.store(RpcClientState::STARTED, std::memory_order_release);
    INFO("rpc client {} started with no server endpoints", options_.client_id);
    arm_heartbeat_();
    if (completion)
      completion(Status{});
    return;
  }

  if (endpoints.empty()) {
    expected = RpcClientState::STARTING;
    if (state_.compare_exchange_strong(expected, RpcClientState::STARTED)) {
      INFO("rpc client {} started, {} connections", options_.client_id, connections_.size());
      arm_heartbeat_();
    }
    if (completion)
      completion(state() == RpcClientState::STARTED ? Status{}
                                                    : Status{StatusCode::CANCELLED, "client stopped"});
    return;
  }

  INFO("rpc client {} connecting to {} servers", options_.client_id, endpoints.size());

  struct StartBarrier {
    std::mutex padlock;
    std::size_t remaining;
    std::optional<Status> error;
    StatusHandler completion;
  };
  auto barrier = std::make_shared<StartBarrier>();
  barrier->remaining = endpoints.size();
  barrier->completion = std::move(completion);

  auto on_connected = [self = shared_from_this(), barrier](Status status) {
    std::optional<Status> error;
    {
      std::lock_guard lock{barrier->padlock};
      if (!status.ok() && !barrier->error)
        barrier->error = std::move(status);
      if (--barrier->remaining > 0)
        return;
      error = barrier->error;
    }

    auto expected = RpcClientState::STARTING;
    if (error) {
      LOG_ERR("rpc client {} failed to start: {}, {} connections kept", self->options_.client_id,
              error->to_string(), self->connections_.size());
      self->state_.compare_exchange_strong(expected, RpcClientState::FAILED);
    } else if (self->state_.compare_exchange_strong(expected, RpcClientState::STARTED)) {
      INFO("rpc client {} started, {} connections", self->options_.client_id,
           self->connections_.size());
      self->arm_heartbeat_();
    } else {
      error = Status{StatusCode::CANCELLED, "client stopped"};
    }

    if (barrier->completion)
      barrier->completion(error ? std::move(*error) : Status{});
  };

  for (const auto& endpoint : endpoints)
    connect_with_retries_(endpoint, 0, on_connected);
}

void RpcClient::connect_with_retries_(const Endpoint& endpoint, int32_t retry,
                                      StatusHandler completion) {
  connect_to_server(endpoint, std::nullopt,
                    [self = shared_from_this(), endpoint, retry,
                     completion = std::move(completion)](Status status) {
                      const bool is_starting = self->state() == RpcClientState::STARTING;
                      if (status.ok() || retry >= self->options_.max_retry_attempts ||
                          !is_starting) {
                        completion(std::move(status));
                        return;
                      }

                      WARN("connect to {} failed ({}), retry {} of {} in {}ms",
                           endpoint.to_string(), status.to_string(), retry + 1,
                           self->options_.max_retry_attempts, self->options_.retry_delay_ms);

                      std::shared_ptr<boost::asio::steady_timer> timer = self->timer_factory_();
                      timer->expires_after(std::chrono::milliseconds{self->options_.retry_delay_ms});
                      timer->async_wait([self, timer, endpoint, retry,
                                         completion](const boost::system::error_code& ec) {
                        if (ec) {
                          completion(Status{StatusCode::CANCELLED, "connect retry cancelled"});
                          return;
                        }
                        self->connect_with_retries_(endpoint, retry + 1, completion);
                      });
                    });
}

// ------------------------------------------------------------------------------- connect to server

void RpcClient::connect_to_server(const Endpoint& endpoint, std::optional<std::string> server_id,
                                  StatusHandler completion) {
  auto attempt = std::make_shared<ConnectAttempt>();
  attempt->server_id = server_id ? std::move(*server_id) : default_server_id(endpoint);
  attempt->endpoint = endpoint;
  attempt->completion = std::move(completion);

  const auto s = state();
  if (s == RpcClientState::STOPPING || s == RpcClientState::STOPPED) {
    if (attempt->completion)
      attempt->completion(Status{StatusCode::FAILED_PRECONDITION, "client stopped"});
    return;
  }

  attempt->transport = transport_factory_();
  if (attempt->transport == nullptr) {
    LOG_ERR("transport factory returned no transport for {}", endpoint.to_string());
    if (attempt->completion)
      attempt->completion(Status{StatusCode::INTERNAL, "transport factory returned no transport"});
    return;
  }

  auto& connection = attempt->connection;
  connection = Connection::make(attempt->server_id, endpoint, attempt->transport,
                                options_.max_message_size);

  std::weak_ptr<RpcClient> weak = weak_from_this();
  connection->on_data().connect(
      [weak](const std::string& id, std::span<const std::byte> payload) {
        if (auto self = weak.lock())
          self->on_data_(id, payload);
      });
  connection->on_closed().connect([weak, raw_connection = connection.get(),
                                   raw_transport = attempt->transport.get()](
                                      const std::string& id, const Endpoint&) {
    if (auto self = weak.lock())
      self->on_closed_(id, raw_connection, raw_transport);
  });
  connection->set_unhealthy_threshold(options_.unhealthy_threshold);
  connection->on_health_changed().connect(
      [weak, raw_connection = connection.get(), raw_transport = attempt->transport.get()](
          const std::string& id, ServerHealth previous, ServerHealth current) {
        if (auto self = weak.lock())
          self->on_health_changed_(id, previous, current, raw_connection, raw_transport);
      });

  // Registered before connecting, so that nothing the server sends is missed
  std::shared_ptr<Transport> replaced;
  {
    std::lock_guard lock{transports_padlock_};
    auto& slot = transports_[attempt->server_id];
    replaced = std::exchange(slot, attempt->transport);
  }
  connections_.add_connection(attempt->server_id, connection);
  if (replaced != nullptr)
    replaced->stop();

  if (options_.connection_timeout_ms > 0) {
    attempt->timer = timer_factory_();
    attempt->timer->expires_after(std::chrono::milliseconds{options_.connection_timeout_ms});
    attempt->timer->async_wait(
        [self = shared_from_this(), attempt](const boost::system::error_code& ec) {
          if (!ec)
            self->finish_connect_(
                attempt, Status{StatusCode::DEADLINE_EXCEEDED,
                                fmt::format("connect to {} timed out after {}ms",
                                            attempt->endpoint.to_string(),
                                            self->options_.connection_timeout_ms)});
        });
  }

  TRACE("connecting to {} at {}", attempt->server_id, endpoint.to_string());
  attempt->transport->connect(endpoint, [self = shared_from_this(), attempt](std::error_code ec) {
    if (ec) {
      self->finish_connect_(attempt,
                            Status{StatusCode::UNAVAILABLE,
                                   fmt::format("failed to connect to {}",
                                               attempt->endpoint.to_string()),
                                   ec.message()});
      return;
    }
    if (attempt->is_finished.load(std::memory_order_acquire))
      return; // timed out; already rolled back

    RpcHandshake handshake;
    handshake.message_id = new_guid();
    handshake.client_id = self->options_.client_id;
    handshake.protocol_version = k_protocol_version;
    handshake.features = {std::string{k_basic_rpc_feature}};

    attempt->connection->send(
        encode_message(RpcMessage{std::move(handshake)}), [self, attempt](std::error_code ec) {
          if (ec)
            self->finish_connect_(attempt,
                                  Status{StatusCode::UNAVAILABLE,
                                         fmt::format("failed to send handshake to {}",
                                                     attempt->server_id),
                                         ec.message()});
          else
            self->finish_connect_(attempt, Status{});
        });
  });
}

void RpcClient::finish_connect_(const std::shared_ptr<ConnectAttempt>& attempt, Status status) {
  if (attempt->is_finished.exchange(true, std::memory_order_acq_rel))
    return;

  if (attempt->timer)
    attempt->timer->cancel();

  const auto s = state();
  if (status.ok() && (s == RpcClientState::STOPPING || s == RpcClientState::STOPPED))
    status = Status{StatusCode::CANCELLED, "client stopped"};

  if (status.ok()) {
    INFO("connected to {} at {}, handshake sent", attempt->server_id,
         attempt->endpoint.to_string());
  } else {
    WARN("connect to {} at {} failed: {}", attempt->server_id, attempt->endpoint.to_string(),
         status.to_string());
    rollback_connect_(*attempt);
  }

  if (attempt->completion)
    attempt->completion(std::move(status));
}

void RpcClient::rollback_connect_(const ConnectAttempt& attempt) {
  connections_.remove_connection(attempt.server_id, attempt.connection.get());
  attempt.connection->dispose();
  release_transport_(attempt.server_id, attempt.transport.get());
  attempt.transport->stop();
}

void RpcClient::release_transport_(const std::string& server_id, const Transport* expected) {
  std::shared_ptr<Transport> released;
  {
    std::lock_guard lock{transports_padlock_};
    auto ii = transports_.find(server_id);
    if (ii == end(transports_) || (expected != nullptr && ii->second.get() != expected))
      return;
    released = std::move(ii->second);
    transports_.erase(ii);
  }
  released->stop();
}

// -------------------------------------------------------------------------------------------- stop

void RpcClient::stop() {
  auto s = state();
  do {
    if (s == RpcClientState::STOPPING || s == RpcClientState::STOPPED)
      return;
  } while (!state_.compare_exchange_weak(s, RpcClientState::STOPPING, std::memory_order_acq_rel));

  {
    std::lock_guard lock{heartbeat_padlock_};
    if (heartbeat_timer_)
      heartbeat_timer_->cancel();
    heartbeat_timer_.reset();
  }

  const auto n_streams = streams_.cancel_all();

  std::unordered_map<std::string, std::shared_ptr<Transport>> transports;
  {
    std::lock_guard lock{transports_padlock_};
    transports.swap(transports_);
  }
  connections_.clear(); // disposed first, so stopping the transports is silent
  for (auto& [server_id, transport] : transports)
    transport->stop();

  manifests_.clear();

  const auto n_failed = pending_->fail_all(Status{StatusCode::CANCELLED, "client stopped"});

  state_.store(RpcClientState::STOPPED, std::memory_order_release);
  INFO("rpc client {} stopped: {} transports closed, {} pending requests and {} streams cancelled",
       options_.client_id, transports.size(), n_failed, n_streams);
}

// ---------------------------------------------------------------------------------------- requests

void RpcClient::throw_if_stopped_() const {
  const auto s = state();
  if (s == RpcClientState::STOPPING || s == RpcClientState::STOPPED)
    throw RpcException{Status{StatusCode::FAILED_PRECONDITION, "RPC client is stopped"}};
}

void RpcClient::send_request(RpcRequest request, ResponseHandler completion) {
  throw_if_stopped_();

  if (request.message_id.is_nil())
    request.message_id = new_guid();

  auto connection = connections_.get_connection_for_request(request); // may throw

  const auto request_id = request.message_id;
  const auto timeout = std::chrono::milliseconds{
      request.timeout_ms > 0 ? request.timeout_ms : options_.request_timeout_ms};

  auto buffer = encode_message(RpcMessage{std::move(request)});

  if (!pending_->add(request_id, timeout, std::move(completion)))
    throw RpcException{Status{
        StatusCode::ALREADY_EXISTS,
        fmt::format("request {} is already pending", granville::to_string(request_id))}};

  TRACE("sending request {} to {}, {} bytes", granville::to_string(request_id),
        connection->server_id(), buffer.size());
  connection->send(std::move(buffer), [pending = pending_, request_id,
                                       server_id = connection->server_id()](std::error_code ec) {
    if (ec) {
      WARN("failed to send request {} to {}: {}", granville::to_string(request_id), server_id,
           ec.message());
      pending->complete(request_id,
                        Status{StatusCode::UNAVAILABLE,
                               fmt::format("failed to send request to {}", server_id),
                               ec.message()});
    }
  });
}

// ----------------------------------------------------------------------------------------- streams

std::shared_ptr<StreamChannel> RpcClient::open_stream(AsyncEnumerableRequest request,
                                                      std::optional<int32_t> target_zone_id) {
  throw_if_stopped_();

  if (request.stream_id.is_nil())
    request.stream_id = new_guid();

  auto connection =
      connections_.get_connection_for(request.grain_id, request.interface_type, target_zone_id);

  const auto stream_id = request.stream_id;
  const auto& server_id = connection->server_id();
  std::weak_ptr<RpcClient> weak = weak_from_this();
  auto channel = streams_.open(stream_id, server_id, [weak, server_id](const Guid& id) {
    if (auto self = weak.lock())
      self->send_stream_cancel_(server_id, id);
  });

  connection->send(encode_message(RpcMessage{std::move(request)}),
                   [weak, stream_id](std::error_code ec) {
                     if (!ec)
                       return;
                     WARN("failed to open stream {}: {}", granville::to_string(stream_id),
                          ec.message());
                     if (auto self = weak.lock())
                       self->streams_.fail(stream_id,
                                           fmt::format("failed to open stream: {}", ec.message()));
                   });
  return channel;
}

bool RpcClient::cancel_stream(const Guid& stream_id) { return streams_.cancel(stream_id); }

void RpcClient::send_stream_cancel_(const std::string& server_id, const Guid& stream_id) {
  auto connection = connections_.get_connection(server_id);
  if (connection == nullptr || connection->is_disposed()) {
    LOG_DEBUG("stream {} cancelled, but server {} is gone", granville::to_string(stream_id),
              server_id);
    return;
  }

  AsyncEnumerableCancel cancel;
  cancel.stream_id = stream_id;
  connection->send(encode_message(RpcMessage{cancel}), [stream_id](std::error_code ec) {
    if (ec) {
      LOG_DEBUG("failed to send cancel for stream {}: {}", granville::to_string(stream_id),
                ec.message());
    }
  });
}

// ---------------------------------------------------------------------------------------- dispatch

void RpcClient::on_data_(const std::string& server_id, std::span<const std::byte> payload) {
  auto message = decode_message(payload);
  if (!message) {
    WARN("dropping undecodable {} byte message from {}: {}", payload.size(), server_id,
         message.error().to_string());
    return;
  }

  try {
    std::visit([this, &server_id](auto&& body) { handle_(server_id, std::move(body)); },
               std::move(*message));
  } catch (const std::exception& e) {
    LOG_ERR("error handling {} message from {}: {}", str(message_type(*message)), server_id,
            e.what());
  }
}

void RpcClient::handle_(const std::string& server_id, RpcHandshakeAck&& ack) {
  INFO("handshake acknowledged by {} (server id '{}', protocol {}), manifest: {}", server_id,
       ack.server_id, ack.protocol_version, ack.manifest.has_value());

  if (ack.zone_id) {
    if (auto connection = connections_.get_connection(server_id))
      connections_.add_connection(server_id, std::move(connection), *ack.zone_id);
  }

  if (ack.zone_mappings)
    connections_.update_zone_mappings(*ack.zone_mappings);

  if (ack.manifest) {
    manifests_.update_from_server(server_id, *ack.manifest);
  } else {
    WARN("handshake acknowledgement from {} has no grain manifest", server_id);
  }

  handshake_completed_(server_id);
}

void RpcClient::handle_(const std::string& server_id, RpcResponse&& response) {
  const auto request_id = response.request_id;
  Status status;
  if (!response.success)
    status = Status{StatusCode::UNKNOWN,
                    response.error_message.empty() ? "RPC call failed" : response.error_message};

  if (!pending_->complete(request_id, std::move(status), std::move(response))) {
    LOG_DEBUG("dropping response from {} for unknown request {}", server_id,
              granville::to_string(request_id));
  }
}

void RpcClient::handle_(const std::string& server_id, RpcHeartbeat&& heartbeat) {
  LOG_DEBUG("heartbeat from {} (source '{}', timestamp {})", server_id, heartbeat.source_id,
            heartbeat.timestamp_ms);
}

void RpcClient::handle_(const std::string& server_id, RpcErrorMessage&& error) {
  const bool completed =
      !error.request_id.is_nil() &&
      pending_->complete(error.request_id, Status{StatusCode::INTERNAL, error.message,
                                                  error.error_type});
  if (!completed) {
    WARN("error from {}: {}: {}", server_id, error.error_type, error.message);
  }
}

void RpcClient::handle_(const std::string&, AsyncEnumerableItem&& item) { streams_.deliver(item); }

template <typename T> void RpcClient::handle_(const std::string& server_id, T&& message) {
  using MessageT = std::decay_t<T>;
  const auto type = message_type(RpcMessage{std::in_place_type<MessageT>});
  WARN("dropping unexpected {} message from {}", str(type), server_id);
}

// ------------------------------------------------------------------------------------------ closed

void RpcClient::on_closed_(const std::string& server_id, const Connection* connection,
                           const Transport* transport) {
  if (remove_server_(server_id, connection, transport, "connection closed"))
    INFO("connection to {} closed", server_id);
}

bool RpcClient::remove_server_(const std::string& server_id, const Connection* connection,
                               const Transport* transport, std::string_view reason) {
  if (!connections_.remove_connection(server_id, connection))
    return false; // replaced, or already removed

  manifests_.remove_server_manifest(server_id);
  streams_.fail_server(server_id, std::string{reason});
  release_transport_(server_id, transport);
  return true;
}

// ------------------------------------------------------------------------------------------ health

void RpcClient::on_health_changed_(const std::string& server_id, ServerHealth previous,
                                   ServerHealth current, const Connection* connection,
                                   const Transport* transport) {
  if (current == ServerHealth::UNHEALTHY && options_.remove_unhealthy_servers) {
    if (remove_server_(server_id, connection, transport, "server unhealthy"))
      WARN("removed unhealthy server {}", server_id);
  }

  try {
    server_health_changed_(server_id, previous, current);
  } catch (const std::exception& e) {
    LOG_ERR("server health subscriber threw: {}", e.what());
  }
}

// --------------------------------------------------------------------------------------- heartbeat

void RpcClient::arm_heartbeat_() {
  if (options_.heartbeat_interval_ms <= 0)
    return;

  std::lock_guard lock{heartbeat_padlock_};
  if (state() != RpcClientState::STARTED)
    return;
  if (!heartbeat_timer_)
    heartbeat_timer_ = timer_factory_();

  heartbeat_timer_->expires_after(std::chrono::milliseconds{options_.heartbeat_interval_ms});
  heartbeat_timer_->async_wait(
      [weak = weak_from_this()](const boost::system::error_code& ec) {
        if (ec)
          return;
        if (auto self = weak.lock()) {
          self->send_heartbeats_();
          self->arm_heartbeat_();
        }
      });
}

void RpcClient::send_heartbeats_() {
  const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch());

  for (const auto& connection : connections_.get_all_connections()) {
    RpcHeartbeat heartbeat;
    heartbeat.message_id = new_guid();
    heartbeat.source_id = options_.client_id;
    heartbeat.timestamp_ms = now.count();
    connection->send(encode_message(RpcMessage{std::move(heartbeat)}),
                     [server_id = connection->server_id()](std::error_code ec) {
                       if (ec) {
                         LOG_DEBUG("failed to send heartbeat to {}: {}", server_id, ec.message());
                       }
                     });
  }
}

} // namespace granville::net
