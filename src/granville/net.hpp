
#pragma once

/**
 * @defgroup granville-net Networking
 * @ingroup granville
 *
 * An rpc client of several independent servers:
 * + Transports carry one binary message at a time (`WebsocketTransport`,
 *   and `InProcessTransport` for tests).
 * + `RpcClient` keeps one `Connection` per server, routes requests by zone
 *   through the `ConnectionManager`, and merges every server's manifest.
 * + `GrainReference` and typed proxies turn method calls into requests.
 */

#include "granville/portable/asio/asio-execution-context.hpp"
#include "granville/portable/asio/asio-timer-factory.hpp"

#include "granville/net/endpoint.hpp"
#include "granville/net/in-process-transport.hpp"
#include "granville/net/transport.hpp"
#include "granville/net/websockets/websocket-transport.hpp"

#include "granville/net/rpc/grain-factory.hpp"
#include "granville/net/rpc/grain-reference.hpp"
#include "granville/net/rpc/method-table.hpp"
#include "granville/net/rpc/proxy-registry.hpp"
#include "granville/net/rpc/rpc-client.hpp"
