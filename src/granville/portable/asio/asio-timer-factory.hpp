
#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <functional>
#include <memory>

namespace granville::net {

/**
 * @brief Type erase the creation of steady-timer objects.
 *
 * Timers are handed out on the heap, because pending-request entries are
 * moved around in tables while their timer is armed.
 */
using SteadyTimerFactory = std::function<std::unique_ptr<boost::asio::steady_timer>()>;

inline SteadyTimerFactory make_steady_timer_factory(boost::asio::io_context& io_context) {
  return [&io_context]() { return std::make_unique<boost::asio::steady_timer>(io_context); };
}

} // namespace granville::net
