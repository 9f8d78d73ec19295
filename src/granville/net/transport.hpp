
#pragma once

#include "buffer.hpp"
#include "endpoint.hpp"

#include <boost/signals2/signal.hpp>

#include <functional>
#include <memory>
#include <span>
#include <system_error>

namespace granville::net {

// ------------------------------------------------------------------------------------- Transport

/**
 * @brief A message-oriented link to one remote endpoint.
 *
 * Implementations deliver the events of one connection in arrival order,
 * on whatever context they run their I/O. Handlers must not block.
 *
 * Events are multicast: any number of subscribers may connect to, and
 * disconnect from, the signals at any time.
 */
class Transport {
public:
  using CompletionHandler = std::function<void(std::error_code ec)>;
  using DataReceivedSignal =
      boost::signals2::signal<void(const Endpoint& endpoint, std::span<const std::byte> payload)>;
  using ConnectionSignal = boost::signals2::signal<void(const Endpoint& endpoint)>;

private:
  DataReceivedSignal data_received_;
  ConnectionSignal connection_established_;
  ConnectionSignal connection_closed_;

public:
  virtual ~Transport() = default;

  /**
   * @brief Connect to `endpoint`, then call `completion`.
   * On success, `connection_established` fires before `completion` runs.
   */
  virtual void connect(const Endpoint& endpoint, CompletionHandler completion) = 0;

  /**
   * @brief Send one message. `completion` reports the outcome of the write.
   */
  virtual void send(BufferType&& buffer, CompletionHandler completion) = 0;

  /**
   * @brief Disconnect. Fires `connection_closed` iff the transport was established.
   * Idempotent.
   */
  virtual void stop() = 0;

  DataReceivedSignal& data_received() { return data_received_; }
  ConnectionSignal& connection_established() { return connection_established_; }
  ConnectionSignal& connection_closed() { return connection_closed_; }
};

/**
 * @brief Creates a fresh, unconnected transport for each server connection.
 */
using TransportFactory = std::function<std::shared_ptr<Transport>()>;

} // namespace granville::net
