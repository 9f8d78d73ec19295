
#include "stdinc.hpp"

#include "connection.hpp"

namespace granville::net {

std::string_view str(ServerHealth health) {
  switch (health) {
  case ServerHealth::UNKNOWN:
    return "UNKNOWN";
  case ServerHealth::HEALTHY:
    return "HEALTHY";
  case ServerHealth::UNHEALTHY:
    return "UNHEALTHY";
  }
  return "<unknown health>";
}

Connection::Connection(std::string server_id, Endpoint endpoint,
                       std::shared_ptr<Transport> transport, std::size_t max_message_size)
    : server_id_{std::move(server_id)}, endpoint_{std::move(endpoint)},
      transport_{std::move(transport)}, max_message_size_{max_message_size} {
  if (transport_ == nullptr)
    throw std::invalid_argument("connection requires a transport");
}

std::shared_ptr<Connection> Connection::make(std::string server_id, Endpoint endpoint,
                                             std::shared_ptr<Transport> transport,
                                             std::size_t max_message_size) {
  std::shared_ptr<Connection> connection{new Connection{
      std::move(server_id), std::move(endpoint), std::move(transport), max_message_size}};
  connection->subscribe_();
  return connection;
}

Connection::~Connection() { dispose(); }

// --------------------------------------------------------------------------------------- subscribe

void Connection::subscribe_() {
  std::weak_ptr<Connection> weak = weak_from_this();
  std::lock_guard lock{padlock_};

  data_subscription_ = transport_->data_received().connect(
      [weak](const Endpoint&, std::span<const std::byte> payload) {
        if (auto self = weak.lock())
          self->handle_data_(payload);
      });

  established_subscription_ =
      transport_->connection_established().connect([weak](const Endpoint& endpoint) {
        if (auto self = weak.lock())
          self->handle_established_(endpoint);
      });

  closed_subscription_ = transport_->connection_closed().connect([weak](const Endpoint& endpoint) {
    if (auto self = weak.lock())
      self->handle_closed_(endpoint);
  });
}

// -------------------------------------------------------------------------------------------- send

void Connection::send(BufferType&& buffer, CompletionHandler completion) {
  if (is_disposed()) {
    if (completion)
      completion(make_error_code(ecode::connection_disposed));
    return;
  }

  if (max_message_size_ > 0 && buffer.size() > max_message_size_) {
    WARN("refusing to send {} byte message to {}: maximum message size is {} bytes", buffer.size(),
         server_id_, max_message_size_);
    if (completion)
      completion(make_error_code(ecode::message_too_large));
    return;
  }

  transport_->send(std::move(buffer), [weak = weak_from_this(),
                                       completion = std::move(completion)](std::error_code ec) {
    if (auto self = weak.lock()) {
      if (ec)
        self->record_failure();
      else
        self->record_success();
    }
    if (completion)
      completion(ec);
  });
}

// ------------------------------------------------------------------------------------------ health

void Connection::record_success() {
  consecutive_failures_.store(0, std::memory_order_release);
  set_health_(ServerHealth::HEALTHY);
}

void Connection::record_failure() {
  const auto n_failures = consecutive_failures_.fetch_add(1, std::memory_order_acq_rel) + 1;
  if (n_failures >= unhealthy_threshold_.load(std::memory_order_acquire))
    set_health_(ServerHealth::UNHEALTHY);
}

void Connection::set_health_(ServerHealth health) {
  const auto previous = health_.exchange(health, std::memory_order_acq_rel);
  if (previous == health || is_disposed())
    return;

  INFO("server {} health changed from {} to {}", server_id_, str(previous), str(health));
  try {
    on_health_changed_(server_id_, previous, health);
  } catch (const std::exception& e) {
    LOG_ERR("health subscriber for {} threw: {}", server_id_, e.what());
  }
}

// ----------------------------------------------------------------------------------------- dispose

void Connection::dispose() {
  if (is_disposed_.exchange(true, std::memory_order_acq_rel))
    return;

  std::lock_guard lock{padlock_};
  data_subscription_.disconnect();
  established_subscription_.disconnect();
  closed_subscription_.disconnect();
  TRACE("connection to {} disposed", server_id_);
}

// ---------------------------------------------------------------------------------- event handlers

void Connection::handle_data_(std::span<const std::byte> payload) {
  if (is_disposed())
    return;
  record_success();
  on_data_(server_id_, payload);
}

void Connection::handle_established_(const Endpoint& endpoint) {
  is_established_.store(true, std::memory_order_release);
  if (!is_disposed())
    on_established_(server_id_, endpoint);
}

void Connection::handle_closed_(const Endpoint& endpoint) {
  is_established_.store(false, std::memory_order_release);
  if (!is_disposed())
    on_closed_(server_id_, endpoint);
}

} // namespace granville::net
