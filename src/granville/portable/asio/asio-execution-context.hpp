
#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cassert>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace granville::net {

/**
 * @defgroup granville-asio-beast Granville Asio/Beast
 *
 * We use Asio for two things: an execution context, and managing timers.
 * Beast is used to manage websockets.
 */

/**
 * @brief Runs a `boost::asio::io_context` on a pool of threads.
 *
 * The pool keeps running until `stop()` (or destruction), even when there is
 * no outstanding work.
 */
class AsioExecutionContext {
private:
  using WorkGuardType = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  boost::asio::io_context& io_context_;
  std::size_t size_;
  std::vector<std::thread> pool_;
  std::optional<WorkGuardType> work_guard_;

public:
  using ExecutorType = boost::asio::io_context::executor_type;
  using SteadyTimerType = boost::asio::steady_timer;

  AsioExecutionContext(boost::asio::io_context& io_context, std::size_t thread_pool_size = 0)
      : io_context_{io_context}, size_{thread_pool_size == 0 ? std::thread::hardware_concurrency()
                                                             : thread_pool_size} {
    pool_.reserve(size_);
  }

  AsioExecutionContext(const AsioExecutionContext&) = delete;
  AsioExecutionContext& operator=(const AsioExecutionContext&) = delete;

  ~AsioExecutionContext() { stop(); }

  /** @brief Run the pool */
  void run() {
    assert(!is_running());
    work_guard_.emplace(io_context_.get_executor());
    for (std::size_t i = 0; i < size_; ++i)
      pool_.emplace_back([this]() { io_context_.run(); });
  }

  /** @brief Stop the io_context, and join the pool. Idempotent. */
  void stop() {
    work_guard_.reset();
    io_context_.stop();
    for (auto& thread : pool_)
      if (thread.joinable())
        thread.join();
    pool_.clear();
  }

  /** @brief true iff the execution context is running */
  bool is_running() const noexcept { return pool_.size() > 0; }

  /** @brief Number of threads executing io requests in parallel */
  std::size_t size() const noexcept { return size_; }

  /** @brief Return the executor for running jobs on the pool */
  ExecutorType get_executor() const { return io_context_.get_executor(); }

  /** @brief Create a new steady timer bound to this execution context */
  SteadyTimerType make_steady_timer() const { return SteadyTimerType{io_context_}; }

  /** @brief Direct access to the underlying io_context */
  boost::asio::io_context& io_context() { return io_context_; }
};

} // namespace granville::net
