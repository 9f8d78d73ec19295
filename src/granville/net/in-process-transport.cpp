
#include "stdinc.hpp"

#include "in-process-transport.hpp"

#include <boost/asio/post.hpp>

namespace granville::net {

namespace asio = boost::asio;

InProcessTransport::InProcessTransport(asio::io_context& io_context, PeerHandler peer_handler,
                                       Acceptor acceptor)
    : strand_{asio::make_strand(io_context)}, peer_handler_{std::move(peer_handler)},
      acceptor_{std::move(acceptor)} {}

// ----------------------------------------------------------------------------------------- connect

void InProcessTransport::connect(const Endpoint& endpoint, CompletionHandler completion) {
  asio::post(strand_, [this, self = shared_from_this(), endpoint,
                       completion = std::move(completion)]() {
    if (is_connected_) {
      if (completion)
        completion(make_error_code(ecode::already_connected));
      return;
    }

    const auto ec = acceptor_ ? acceptor_(endpoint) : std::error_code{};
    if (ec) {
      TRACE("in-process connect to {} refused: {}", endpoint.to_string(), ec.message());
      if (completion)
        completion(ec);
      return;
    }

    endpoint_ = endpoint;
    is_connected_ = true;
    connection_established()(endpoint);
    if (completion)
      completion({});
  });
}

// -------------------------------------------------------------------------------------------- send

void InProcessTransport::send(BufferType&& buffer, CompletionHandler completion) {
  asio::post(strand_, [this, self = shared_from_this(), buffer = std::move(buffer),
                       completion = std::move(completion)]() mutable {
    if (!is_connected_) {
      if (completion)
        completion(make_error_code(ecode::not_connected));
      return;
    }

    messages_sent_.fetch_add(1, std::memory_order_acq_rel);
    if (peer_handler_)
      peer_handler_(self, std::move(buffer));
    if (completion)
      completion({});
  });
}

// -------------------------------------------------------------------------------------------- stop

void InProcessTransport::stop() {
  asio::post(strand_, [this, self = shared_from_this()]() { close_on_strand_(); });
}

void InProcessTransport::close_from_peer() { stop(); }

void InProcessTransport::close_on_strand_() {
  if (!is_connected_)
    return;
  is_connected_ = false;
  connection_closed()(*endpoint_);
}

// ----------------------------------------------------------------------------------------- deliver

void InProcessTransport::deliver(BufferType message) {
  asio::post(strand_, [this, self = shared_from_this(), message = std::move(message)]() {
    if (!is_connected_) {
      TRACE("in-process deliver dropped, not connected");
      return;
    }
    data_received()(*endpoint_, to_span_bytes(message));
  });
}

} // namespace granville::net
