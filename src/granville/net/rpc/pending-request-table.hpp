
#pragma once

#include "messages.hpp"
#include "status.hpp"

#include "granville/portable/asio/asio-timer-factory.hpp"
#include "granville/utils/guid.hpp"

#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace granville::net {

/**
 * @brief Outstanding requests, keyed by request id, each with a deadline.
 *
 * Every entry completes exactly once: by a response, by its deadline, or by
 * `fail_all`. Whichever comes first removes the entry, and the others find
 * nothing to complete. Completion handlers run after the table lock is
 * released.
 */
class PendingRequestTable : public std::enable_shared_from_this<PendingRequestTable> {
public:
  using CompletionHandler = std::function<void(Status status, RpcResponse response)>;

private:
  struct PendingRequest {
    CompletionHandler completion;
    std::unique_ptr<boost::asio::steady_timer> timeout;
    std::chrono::milliseconds deadline{0};
  };

  SteadyTimerFactory timer_factory_;

  mutable std::mutex padlock_;
  std::unordered_map<Guid, PendingRequest, GuidHash> outstanding_;

  explicit PendingRequestTable(SteadyTimerFactory timer_factory)
      : timer_factory_{std::move(timer_factory)} {}

public:
  static std::shared_ptr<PendingRequestTable> make(SteadyTimerFactory timer_factory) {
    return std::shared_ptr<PendingRequestTable>{new PendingRequestTable{std::move(timer_factory)}};
  }

  /**
   * @brief Register `request_id`, and arm its deadline.
   * @return false iff `request_id` is already pending; nothing is registered.
   */
  bool add(const Guid& request_id, std::chrono::milliseconds timeout,
           CompletionHandler completion);

  /**
   * @brief Complete and remove `request_id`.
   * @return false iff the request is not pending (never was, or already completed).
   */
  bool complete(const Guid& request_id, Status status, RpcResponse response = {});

  /** @brief Complete every pending request with `status` */
  std::size_t fail_all(const Status& status);

  bool contains(const Guid& request_id) const;
  std::size_t size() const;

private:
  void on_timeout_(const Guid& request_id);
};

} // namespace granville::net
