
#include "stdinc.hpp"

#include "pending-request-table.hpp"

namespace granville::net {

// --------------------------------------------------------------------------------------------- add

bool PendingRequestTable::add(const Guid& request_id, std::chrono::milliseconds timeout,
                              CompletionHandler completion) {
  PendingRequest pending;
  pending.completion = std::move(completion);
  pending.deadline = timeout;
  if (timeout.count() > 0 && timer_factory_)
    pending.timeout = timer_factory_();

  boost::asio::steady_timer* timer = pending.timeout.get();
  {
    std::lock_guard lock{padlock_};
    if (!outstanding_.try_emplace(request_id, std::move(pending)).second)
      return false;

    // Armed under the lock, so that the timer cannot fire before the entry exists
    if (timer != nullptr) {
      timer->expires_after(timeout);
      timer->async_wait(
          [weak = weak_from_this(), request_id](const boost::system::error_code& ec) {
            if (!ec) {
              if (auto self = weak.lock())
                self->on_timeout_(request_id);
            }
          });
    }
  }
  return true;
}

// ---------------------------------------------------------------------------------------- complete

bool PendingRequestTable::complete(const Guid& request_id, Status status, RpcResponse response) {
  PendingRequest pending;
  { // Grab the completion handler, if it still exists
    std::lock_guard lock{padlock_};
    auto ii = outstanding_.find(request_id);
    if (ii == end(outstanding_))
      return false;
    pending = std::move(ii->second);
    outstanding_.erase(ii);
    if (pending.timeout)
      pending.timeout->cancel();
  }

  if (pending.completion) {
    try {
      pending.completion(std::move(status), std::move(response));
    } catch (const std::exception& e) {
      LOG_ERR("completion handler for request {} threw: {}", granville::to_string(request_id),
              e.what());
    }
  }
  return true;
}

void PendingRequestTable::on_timeout_(const Guid& request_id) {
  std::chrono::milliseconds deadline{0};
  {
    std::lock_guard lock{padlock_};
    auto ii = outstanding_.find(request_id);
    if (ii == end(outstanding_))
      return;
    deadline = ii->second.deadline;
  }

  const auto id = granville::to_string(request_id);
  WARN("rpc request {} timed out after {}ms", id, deadline.count());
  complete(request_id,
           Status{StatusCode::DEADLINE_EXCEEDED,
                  fmt::format("RPC request {} timed out after {}ms", id, deadline.count())});
}

// ---------------------------------------------------------------------------------------- fail all

std::size_t PendingRequestTable::fail_all(const Status& status) {
  std::unordered_map<Guid, PendingRequest, GuidHash> failed;
  {
    std::lock_guard lock{padlock_};
    failed.swap(outstanding_);
    for (auto& [request_id, pending] : failed)
      if (pending.timeout)
        pending.timeout->cancel();
  }

  for (auto& [request_id, pending] : failed) {
    if (!pending.completion)
      continue;
    try {
      pending.completion(status, RpcResponse{request_id});
    } catch (const std::exception& e) {
      LOG_ERR("completion handler for request {} threw: {}", granville::to_string(request_id),
              e.what());
    }
  }
  return failed.size();
}

// ----------------------------------------------------------------------------------------- getters

bool PendingRequestTable::contains(const Guid& request_id) const {
  std::lock_guard lock{padlock_};
  return outstanding_.contains(request_id);
}

std::size_t PendingRequestTable::size() const {
  std::lock_guard lock{padlock_};
  return outstanding_.size();
}

} // namespace granville::net
