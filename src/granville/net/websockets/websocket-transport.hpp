
#pragma once

#include "granville/net/transport.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace boost::asio {
class io_context;
}

namespace granville::net::detail {
class WebsocketClientSession;
}

namespace granville::net {

struct WebsocketTransportConfig {
  std::string target{"/"};  //!< request target of the websocket handshake
  bool verify_peer{true};   //!< verify the server's certificate and host name
  std::string ca_file{};    //!< extra certificate authorities (PEM); default paths are always used
  std::chrono::milliseconds handshake_timeout{30 * 1000}; //!< TCP connect + TLS handshake
};

/**
 * @brief A transport over a TLS websocket, one binary websocket message per
 *        rpc message.
 *
 * Connecting resolves the host, opens the TCP connection, performs the TLS
 * handshake (with SNI), and then the websocket handshake. Writes are queued,
 * so that at most one is in flight. All I/O runs on one strand.
 */
class WebsocketTransport : public Transport,
                           public std::enable_shared_from_this<WebsocketTransport> {
public:
  using Config = WebsocketTransportConfig;

private:
  boost::asio::io_context& io_context_;
  Config config_;
  std::shared_ptr<detail::WebsocketClientSession> session_;

public:
  WebsocketTransport(boost::asio::io_context& io_context, Config config = {});
  WebsocketTransport(const WebsocketTransport&) = delete;
  WebsocketTransport& operator=(const WebsocketTransport&) = delete;
  ~WebsocketTransport() override;

  /**
   * @brief `completion` receives `already_connected` if a connect was made before.
   * A bad `ca_file` fails the connect with the TLS error.
   */
  void connect(const Endpoint& endpoint, CompletionHandler completion) override;
  void send(BufferType&& buffer, CompletionHandler completion) override;

  /** @brief Send a websocket close frame, or abandon a connect in progress */
  void stop() override;

  const Config& config() const { return config_; }
};

/**
 * @brief Makes a fresh websocket transport for each server connection.
 */
TransportFactory make_websocket_transport_factory(boost::asio::io_context& io_context,
                                                  WebsocketTransport::Config config = {});

} // namespace granville::net
