
#pragma once

#include "transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>

namespace granville::net {

/**
 * @brief A transport whose "server" is a handler in the same process.
 *
 * Every message sent by the client is handed to the `PeerHandler`, which can
 * answer through `deliver`. All events run on one strand, so delivery order
 * is preserved. Serialization still happens in full: the bytes on this
 * transport are exactly the bytes that would go over a socket.
 */
class InProcessTransport : public Transport,
                           public std::enable_shared_from_this<InProcessTransport> {
public:
  /** @brief Receives each message the client sends. */
  using PeerHandler =
      std::function<void(std::shared_ptr<InProcessTransport> link, BufferType message)>;

  /** @brief Decides whether a connect is accepted; return an error to refuse. */
  using Acceptor = std::function<std::error_code(const Endpoint& endpoint)>;

private:
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  PeerHandler peer_handler_;
  Acceptor acceptor_;
  std::optional<Endpoint> endpoint_{}; // set on connect
  bool is_connected_{false};           // only touched on the strand
  std::atomic<uint64_t> messages_sent_{0};

public:
  InProcessTransport(boost::asio::io_context& io_context, PeerHandler peer_handler,
                     Acceptor acceptor = {});

  void connect(const Endpoint& endpoint, CompletionHandler completion) override;
  void send(BufferType&& buffer, CompletionHandler completion) override;
  void stop() override;

  /** @brief The peer pushes `message` to the client. Dropped if not connected. */
  void deliver(BufferType message);

  /** @brief The peer closes the link. */
  void close_from_peer();

  /** @brief Number of messages handed to the peer so far */
  uint64_t messages_sent() const { return messages_sent_.load(std::memory_order_acquire); }

private:
  void close_on_strand_();
};

} // namespace granville::net
