
#pragma once

#include "granville/net/in-process-transport.hpp"
#include "granville/net/rpc/messages.hpp"
#include "granville/net/rpc/rpc-client.hpp"
#include "granville/portable/asio/asio-execution-context.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/signals2/connection.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace granville::net::test {

/**
 * @brief Poll `predicate` until it holds, or `timeout` passes.
 */
template <typename Predicate>
bool wait_until(Predicate predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds{2000}) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }
  return true;
}

inline RpcResponse make_response(const RpcRequest& request, BufferType payload) {
  RpcResponse response;
  response.request_id = request.message_id;
  response.success = true;
  response.payload = std::move(payload);
  return response;
}

// ------------------------------------------------------------------------------------ TestCluster

/**
 * @brief In-process rpc servers, one per port on `localhost`.
 *
 * Each server answers the handshake with its configured acknowledgement, and
 * hands every other message to its `MessageHandler`; whatever the handler
 * returns is sent back to the client in order.
 */
class TestCluster {
public:
  using MessageHandler = std::function<std::vector<RpcMessage>(const RpcMessage& message)>;

  struct ServerConfig {
    std::string server_id{};
    std::optional<GrainManifest> manifest{};
    std::optional<int32_t> zone_id{};
    std::optional<std::map<int32_t, std::string>> zone_mappings{};
    bool acknowledge{true}; //!< answer the handshake
  };

private:
  struct Server {
    ServerConfig config;
    MessageHandler on_message;
    std::vector<RpcMessage> received{};
    std::vector<std::shared_ptr<InProcessTransport>> links{};
  };

  boost::asio::io_context io_context_;
  AsioExecutionContext pool_{io_context_, 2};

  // Destroyed before the io_context, since the links hold strands
  mutable std::mutex padlock_;
  std::map<uint16_t, Server> servers_;

public:
  TestCluster() { pool_.run(); }
  TestCluster(const TestCluster&) = delete;
  TestCluster& operator=(const TestCluster&) = delete;
  ~TestCluster() { pool_.stop(); }

  boost::asio::io_context& io_context() { return io_context_; }

  Endpoint add_server(uint16_t port, ServerConfig config, MessageHandler on_message = {}) {
    std::lock_guard lock{padlock_};
    servers_.insert_or_assign(port, Server{std::move(config), std::move(on_message)});
    return Endpoint{"localhost", port};
  }

  /** @brief Makes transports that connect to this cluster; unknown ports refuse */
  TransportFactory transport_factory() {
    return [this]() -> std::shared_ptr<Transport> {
      auto port = std::make_shared<std::atomic<uint16_t>>(0);
      return std::make_shared<InProcessTransport>(
          io_context_,
          [this, port](std::shared_ptr<InProcessTransport> link, BufferType message) {
            on_message_(port->load(), std::move(link), message);
          },
          [this, port](const Endpoint& endpoint) -> std::error_code {
            std::lock_guard lock{padlock_};
            if (!servers_.contains(endpoint.port))
              return make_error_code(ecode::connection_refused);
            port->store(endpoint.port);
            return {};
          });
    };
  }

  /** @brief The server closes every link it has */
  void close_server(uint16_t port) {
    std::vector<std::shared_ptr<InProcessTransport>> links;
    {
      std::lock_guard lock{padlock_};
      auto ii = servers_.find(port);
      if (ii == end(servers_))
        return;
      links = ii->second.links;
    }
    for (auto& link : links)
      link->close_from_peer();
  }

  std::vector<RpcMessage> received(uint16_t port) const {
    std::lock_guard lock{padlock_};
    auto ii = servers_.find(port);
    return (ii == cend(servers_)) ? std::vector<RpcMessage>{} : ii->second.received;
  }

  template <typename T> std::size_t count_received(uint16_t port) const {
    std::size_t count = 0;
    for (const auto& message : received(port))
      if (std::holds_alternative<T>(message))
        ++count;
    return count;
  }

private:
  void on_message_(uint16_t port, std::shared_ptr<InProcessTransport> link,
                   const BufferType& buffer) {
    auto message = decode_message(to_span_bytes(buffer));
    if (!message) {
      LOG_ERR("test server on port {} received garbage: {}", port, message.error().to_string());
      return;
    }

    std::vector<RpcMessage> replies;
    MessageHandler on_message;
    {
      std::lock_guard lock{padlock_};
      auto ii = servers_.find(port);
      if (ii == end(servers_))
        return;
      auto& server = ii->second;
      server.received.push_back(*message);
      if (std::find(begin(server.links), end(server.links), link) == end(server.links))
        server.links.push_back(link);

      if (std::holds_alternative<RpcHandshake>(*message)) {
        if (server.config.acknowledge) {
          RpcHandshakeAck ack;
          ack.message_id = new_guid();
          ack.server_id = server.config.server_id;
          ack.manifest = server.config.manifest;
          ack.zone_id = server.config.zone_id;
          ack.zone_mappings = server.config.zone_mappings;
          replies.push_back(std::move(ack));
        }
      } else {
        on_message = server.on_message;
      }
    }

    if (on_message)
      replies = on_message(*message);
    for (const auto& reply : replies)
      link->deliver(encode_message(reply));
  }
};

// -------------------------------------------------------------------------------- FaultyTransport

/**
 * @brief A transport that misbehaves.
 *
 * `HANG_CONNECT` never completes a connect. `FAIL_SEND` connects, then fails
 * every send with `connection_closed`. `FAIL_LATER_SENDS` takes the first send
 * (the handshake) and fails the rest.
 */
class FaultyTransport : public Transport, public std::enable_shared_from_this<FaultyTransport> {
public:
  enum class Fault : int8_t { HANG_CONNECT, FAIL_SEND, FAIL_LATER_SENDS };

private:
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  Fault fault_;
  std::optional<Endpoint> endpoint_{};   // strand only
  bool is_connected_{false};             // strand only
  CompletionHandler hung_connect_{};     // strand only
  std::atomic<bool> is_stopped_{false};
  int n_sends_{0};                       // strand only
  std::atomic<int> n_failed_sends_{0};

public:
  FaultyTransport(boost::asio::io_context& io_context, Fault fault)
      : strand_{boost::asio::make_strand(io_context)}, fault_{fault} {}

  void connect(const Endpoint& endpoint, CompletionHandler completion) override {
    boost::asio::post(strand_, [this, self = shared_from_this(), endpoint,
                                completion = std::move(completion)]() mutable {
      if (is_stopped_.load()) {
        if (completion)
          completion(make_error_code(ecode::connection_closed));
        return;
      }
      if (fault_ == Fault::HANG_CONNECT) {
        hung_connect_ = std::move(completion);
        return;
      }
      endpoint_ = endpoint;
      is_connected_ = true;
      connection_established()(endpoint);
      if (completion)
        completion({});
    });
  }

  void send(BufferType&&, CompletionHandler completion) override {
    boost::asio::post(strand_, [this, self = shared_from_this(),
                                completion = std::move(completion)]() {
      const bool is_first = (n_sends_++ == 0);
      std::error_code ec;
      if (!is_connected_)
        ec = make_error_code(ecode::not_connected);
      else if (fault_ != Fault::FAIL_LATER_SENDS || !is_first)
        ec = make_error_code(ecode::connection_closed);
      if (ec)
        n_failed_sends_.fetch_add(1);
      if (completion)
        completion(ec);
    });
  }

  void stop() override {
    if (is_stopped_.exchange(true))
      return;
    boost::asio::post(strand_, [this, self = shared_from_this()]() {
      hung_connect_ = nullptr;
      if (std::exchange(is_connected_, false))
        connection_closed()(*endpoint_);
    });
  }

  bool is_stopped() const { return is_stopped_.load(); }
  int n_failed_sends() const { return n_failed_sends_.load(); }
};

/**
 * @brief Hands out `FaultyTransport`s, and keeps them for inspection.
 */
class FaultyTransports {
private:
  boost::asio::io_context& io_context_;
  FaultyTransport::Fault fault_;
  mutable std::mutex padlock_;
  std::vector<std::shared_ptr<FaultyTransport>> made_;

public:
  FaultyTransports(boost::asio::io_context& io_context, FaultyTransport::Fault fault)
      : io_context_{io_context}, fault_{fault} {}

  TransportFactory factory() {
    return [this]() -> std::shared_ptr<Transport> {
      auto transport = std::make_shared<FaultyTransport>(io_context_, fault_);
      std::lock_guard lock{padlock_};
      made_.push_back(transport);
      return transport;
    };
  }

  std::vector<std::shared_ptr<FaultyTransport>> made() const {
    std::lock_guard lock{padlock_};
    return made_;
  }
};

// -------------------------------------------------------------------------------- start_client

/**
 * @brief Start `client`, and wait for the outcome.
 */
inline Status start_and_wait(RpcClient& client) {
  std::mutex padlock;
  std::optional<Status> result;
  client.start([&](Status status) {
    std::lock_guard lock{padlock};
    result = std::move(status);
  });
  if (!wait_until([&]() {
        std::lock_guard lock{padlock};
        return result.has_value();
      }))
    return Status{StatusCode::DEADLINE_EXCEEDED, "start did not complete"};
  std::lock_guard lock{padlock};
  return *result;
}

/**
 * @brief Start `client`, and wait until every configured server has
 *        acknowledged the handshake.
 */
inline Status start_and_wait_for_handshakes(RpcClient& client) {
  std::atomic<std::size_t> n_acknowledged{0};
  boost::signals2::scoped_connection subscription = client.handshake_completed().connect(
      [&n_acknowledged](const std::string&) { n_acknowledged.fetch_add(1); });

  std::mutex padlock;
  std::optional<Status> result;
  client.start([&](Status status) {
    std::lock_guard lock{padlock};
    result = std::move(status);
  });

  const auto is_finished = [&]() {
    std::lock_guard lock{padlock};
    return result.has_value();
  };
  if (!wait_until(is_finished))
    return Status{StatusCode::DEADLINE_EXCEEDED, "start did not complete"};

  std::lock_guard lock{padlock};
  if (result->ok() &&
      !wait_until([&]() { return n_acknowledged.load() >= client.options().server_endpoints.size(); }))
    return Status{StatusCode::DEADLINE_EXCEEDED, "handshakes were not acknowledged"};
  return *result;
}

} // namespace granville::net::test
