
#include "stdinc.hpp"

#include "websocket-transport.hpp"

#include "granville/utils/error-codes.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>

#include <deque>
#include <memory>
#include <string>
#include <utility>

namespace granville::net::detail {

namespace asio = boost::asio;
namespace beast = boost::beast;

enum class WebsocketOperation : int {
  RESOLVE,   // Looking up the host
  CONNECT,   // TCP connect
  HANDSHAKE, // TLS or websocket handshake
  READ,      // During read operation
  WRITE,     // During a write operation
  CLOSE      // The websocket stream is being closed
};

constexpr std::string_view str(WebsocketOperation op) {
#define CASE(x)                                                                                    \
  case WebsocketOperation::x:                                                                      \
    return #x
  switch (op) {
    CASE(RESOLVE);
    CASE(CONNECT);
    CASE(HANDSHAKE);
    CASE(READ);
    CASE(WRITE);
    CASE(CLOSE);
  }
#undef CASE
  return "<unknown case>";
}

// -------------------------------------------------------------------------- WebsocketClientSession

class WebsocketClientSession : public std::enable_shared_from_this<WebsocketClientSession> {
private:
  enum class State : int { IDLE, CONNECTING, CONNECTED, CLOSING, CLOSED };

  struct PendingWrite {
    BufferType data;
    Transport::CompletionHandler completion;
  };

  std::weak_ptr<WebsocketTransport> owner_;
  WebsocketTransport::Config config_;
  asio::ssl::context ssl_context_;
  asio::strand<asio::io_context::executor_type> strand_;
  asio::ip::tcp::resolver resolver_;
  beast::websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
  beast::flat_buffer buffer_;

  // Only touched on the strand
  State state_{State::IDLE};
  Endpoint endpoint_;
  std::string host_header_;
  Transport::CompletionHandler connect_completion_;
  std::deque<PendingWrite> writes_;

public:
  WebsocketClientSession(asio::io_context& io_context, std::weak_ptr<WebsocketTransport> owner,
                         WebsocketTransport::Config config)
      : owner_{std::move(owner)}, config_{std::move(config)},
        ssl_context_{asio::ssl::context::tlsv12_client}, strand_{asio::make_strand(io_context)},
        resolver_{strand_}, ws_{strand_, ssl_context_} {}

  // ------------------------------------------------------------------------------------- connect

  void connect(const Endpoint& endpoint, Transport::CompletionHandler completion) {
    asio::post(strand_, [self = shared_from_this(), endpoint, completion = std::move(completion)]() {
      self->on_connect_request_(endpoint, std::move(completion));
    });
  }

  void send(BufferType&& buffer, Transport::CompletionHandler completion) {
    asio::post(strand_, [self = shared_from_this(), buffer = std::move(buffer),
                         completion = std::move(completion)]() mutable {
      self->on_send_request_(std::move(buffer), std::move(completion));
    });
  }

  void close() {
    asio::post(strand_, [self = shared_from_this()]() { self->on_close_request_(); });
  }

private:
  void on_connect_request_(const Endpoint& endpoint, Transport::CompletionHandler completion) {
    if (state_ != State::IDLE) {
      if (completion)
        completion(make_error_code(ecode::already_connected));
      return;
    }

    endpoint_ = endpoint;
    if (auto ec = configure_tls_()) {
      state_ = State::CLOSED;
      if (completion)
        completion(ec);
      return;
    }

    state_ = State::CONNECTING;
    connect_completion_ = std::move(completion);

    resolver_.async_resolve(
        endpoint_.host, std::to_string(endpoint_.port),
        beast::bind_front_handler(&WebsocketClientSession::on_resolve_, shared_from_this()));
  }

  std::error_code configure_tls_() {
    beast::error_code ec;
    ssl_context_.set_default_verify_paths(ec);
    if (ec) {
      WARN("could not load the default certificate authorities: {}", ec.message());
    }

    if (!config_.ca_file.empty()) {
      ssl_context_.load_verify_file(config_.ca_file, ec);
      if (ec) {
        LOG_ERR("could not load certificate authorities from '{}': {}", config_.ca_file,
                ec.message());
        return ec;
      }
    }

    if (config_.verify_peer) {
      ws_.next_layer().set_verify_mode(asio::ssl::verify_peer);
      ws_.next_layer().set_verify_callback(asio::ssl::host_name_verification(endpoint_.host));
    } else {
      ws_.next_layer().set_verify_mode(asio::ssl::verify_none);
    }
    return {};
  }

  void on_resolve_(beast::error_code ec, asio::ip::tcp::resolver::results_type results) {
    if (ec) {
      fail_connect_(WebsocketOperation::RESOLVE, ec);
      return;
    }

    beast::get_lowest_layer(ws_).expires_after(config_.handshake_timeout);
    beast::get_lowest_layer(ws_).async_connect(
        results,
        beast::bind_front_handler(&WebsocketClientSession::on_tcp_connect_, shared_from_this()));
  }

  void on_tcp_connect_(beast::error_code ec,
                       asio::ip::tcp::resolver::results_type::endpoint_type ep) {
    if (ec) {
      fail_connect_(WebsocketOperation::CONNECT, ec);
      return;
    }

    beast::get_lowest_layer(ws_).expires_after(config_.handshake_timeout);

// Set SNI Hostname (many hosts need this to handshake successfully)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
    const bool set_tls_successful =
        SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), endpoint_.host.c_str());
#pragma GCC diagnostic pop
    if (!set_tls_successful) {
      ec = beast::error_code{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
      fail_connect_(WebsocketOperation::HANDSHAKE, ec);
      return;
    }

    // The Host HTTP header of the websocket handshake
    // See https://tools.ietf.org/html/rfc7230#section-5.4
    host_header_ = endpoint_.host + ':' + std::to_string(ep.port());

    ws_.next_layer().async_handshake(
        asio::ssl::stream_base::client,
        beast::bind_front_handler(&WebsocketClientSession::on_tls_handshake_, shared_from_this()));
  }

  void on_tls_handshake_(beast::error_code ec) {
    if (ec) {
      fail_connect_(WebsocketOperation::HANDSHAKE, ec);
      return;
    }

    // The websocket stream has its own timeout system
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(
        beast::websocket::stream_base::decorator([](beast::websocket::request_type& req) {
          req.set(beast::http::field::user_agent,
                  std::string{BOOST_BEAST_VERSION_STRING} + " granville-rpc-client");
        }));
    ws_.binary(true);

    ws_.async_handshake(
        host_header_, config_.target,
        beast::bind_front_handler(&WebsocketClientSession::on_ws_handshake_, shared_from_this()));
  }

  void on_ws_handshake_(beast::error_code ec) {
    if (ec) {
      fail_connect_(WebsocketOperation::HANDSHAKE, ec);
      return;
    }

    if (state_ != State::CONNECTING) { // stopped while connecting
      fail_connect_(WebsocketOperation::HANDSHAKE, asio::error::operation_aborted);
      return;
    }

    state_ = State::CONNECTED;
    TRACE("websocket connected to {}", endpoint_.to_string());
    emit_([this](Transport& owner) { owner.connection_established()(endpoint_); });
    if (auto completion = std::exchange(connect_completion_, nullptr))
      completion(std::error_code{});

    do_read_();
  }

  void fail_connect_(WebsocketOperation op, beast::error_code ec) {
    WARN("websocket {} to {} failed: {}", str(op), endpoint_.to_string(), ec.message());
    state_ = State::CLOSED;
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);
    if (auto completion = std::exchange(connect_completion_, nullptr))
      completion(std::error_code{ec});
  }

  // ---------------------------------------------------------------------------------------- read

  void do_read_() {
    ws_.async_read(buffer_,
                   beast::bind_front_handler(&WebsocketClientSession::on_read_, shared_from_this()));
  }

  void on_read_(beast::error_code ec, std::size_t) {
    if (ec) {
      if (ec != beast::websocket::error::closed && ec != asio::error::operation_aborted) {
        WARN("websocket {} to {} failed: {}", str(WebsocketOperation::READ),
             endpoint_.to_string(), ec.message());
      }
      finish_close_();
      return;
    }

    const auto data = buffer_.cdata();
    const auto payload = std::span<const std::byte>{static_cast<const std::byte*>(data.data()),
                                                    data.size()};
    emit_([this, payload](Transport& owner) { owner.data_received()(endpoint_, payload); });

    buffer_.consume(buffer_.size());
    if (state_ == State::CONNECTED || state_ == State::CLOSING)
      do_read_();
  }

  // --------------------------------------------------------------------------------------- write

  void on_send_request_(BufferType&& buffer, Transport::CompletionHandler completion) {
    if (state_ != State::CONNECTED) {
      if (completion)
        completion(make_error_code(ecode::not_connected));
      return;
    }
    writes_.push_back(PendingWrite{std::move(buffer), std::move(completion)});
    if (writes_.size() == 1)
      do_write_();
  }

  void do_write_() {
    const auto& data = writes_.front().data;
    ws_.async_write(asio::buffer(data.data(), data.size()),
                    beast::bind_front_handler(&WebsocketClientSession::on_write_,
                                              shared_from_this()));
  }

  void on_write_(beast::error_code ec, std::size_t) {
    auto write = std::move(writes_.front());
    writes_.pop_front();

    if (ec) {
      WARN("websocket {} to {} failed: {}", str(WebsocketOperation::WRITE), endpoint_.to_string(),
           ec.message());
    }
    if (write.completion)
      write.completion(std::error_code{ec});

    if (!writes_.empty()) {
      if (state_ == State::CONNECTED)
        do_write_();
      else
        fail_writes_();
    }
  }

  void fail_writes_() {
    auto writes = std::move(writes_);
    writes_.clear();
    for (auto& write : writes)
      if (write.completion)
        write.completion(make_error_code(ecode::connection_closed));
  }

  // --------------------------------------------------------------------------------------- close

  void on_close_request_() {
    switch (state_) {
    case State::IDLE:
      state_ = State::CLOSED;
      return;
    case State::CONNECTING:
      state_ = State::CLOSED;
      resolver_.cancel();
      beast::get_lowest_layer(ws_).cancel();
      return;
    case State::CONNECTED:
      state_ = State::CLOSING;
      ws_.async_close(beast::websocket::close_code::normal,
                      [self = shared_from_this()](beast::error_code ec) {
                        if (ec && ec != asio::error::operation_aborted) {
                          LOG_DEBUG("websocket {} to {}: {}", str(WebsocketOperation::CLOSE),
                                    self->endpoint_.to_string(), ec.message());
                        }
                        self->finish_close_();
                      });
      return;
    case State::CLOSING:
    case State::CLOSED:
      return;
    }
  }

  void finish_close_() {
    const bool was_established = (state_ == State::CONNECTED || state_ == State::CLOSING);
    state_ = State::CLOSED; // queued writes fail when the write in flight completes
    if (was_established) {
      TRACE("websocket to {} closed", endpoint_.to_string());
      emit_([this](Transport& owner) { owner.connection_closed()(endpoint_); });
    }
  }

  // ---------------------------------------------------------------------------------------- emit

  template <typename F> void emit_(F&& f) {
    auto owner = owner_.lock();
    if (owner == nullptr)
      return;
    try {
      f(static_cast<Transport&>(*owner));
    } catch (const std::exception& e) {
      LOG_ERR("websocket event handler threw: {}", e.what());
    }
  }
};

} // namespace granville::net::detail

namespace granville::net {

// ------------------------------------------------------------------------------ WebsocketTransport

WebsocketTransport::WebsocketTransport(boost::asio::io_context& io_context, Config config)
    : io_context_{io_context}, config_{std::move(config)} {}

WebsocketTransport::~WebsocketTransport() {
  if (session_)
    session_->close();
}

void WebsocketTransport::connect(const Endpoint& endpoint, CompletionHandler completion) {
  if (session_ != nullptr) {
    if (completion)
      completion(make_error_code(ecode::already_connected));
    return;
  }
  session_ = std::make_shared<detail::WebsocketClientSession>(io_context_, weak_from_this(),
                                                              config_);
  session_->connect(endpoint, std::move(completion));
}

void WebsocketTransport::send(BufferType&& buffer, CompletionHandler completion) {
  if (session_ == nullptr) {
    if (completion)
      completion(make_error_code(ecode::not_connected));
    return;
  }
  session_->send(std::move(buffer), std::move(completion));
}

void WebsocketTransport::stop() {
  if (session_ != nullptr)
    session_->close();
}

TransportFactory make_websocket_transport_factory(boost::asio::io_context& io_context,
                                                  WebsocketTransport::Config config) {
  return [&io_context, config = std::move(config)]() -> std::shared_ptr<Transport> {
    return std::make_shared<WebsocketTransport>(io_context, config);
  };
}

} // namespace granville::net
