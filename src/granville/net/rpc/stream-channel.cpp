
#include "stdinc.hpp"

#include "stream-channel.hpp"

namespace granville::net {

std::string_view str(StreamChannel::State state) {
  switch (state) {
  case StreamChannel::State::OPEN:
    return "OPEN";
  case StreamChannel::State::COMPLETED:
    return "COMPLETED";
  case StreamChannel::State::FAILED:
    return "FAILED";
  case StreamChannel::State::CANCELLED:
    return "CANCELLED";
  }
  return "<unknown state>";
}

// ----------------------------------------------------------------------------------- StreamChannel

bool StreamChannel::push(const AsyncEnumerableItem& item) {
  ItemHandler waiter;
  {
    std::unique_lock lock{padlock_};
    if (state_ != State::OPEN)
      return false;

    if (item.sequence_number < next_sequence_) {
      LOG_DEBUG("stream {} dropping stale item {}, expected {}", granville::to_string(stream_id_),
                item.sequence_number, next_sequence_);
      return false;
    }
    next_sequence_ = item.sequence_number + 1;

    if (item.is_complete) {
      if (item.error_message.empty()) {
        state_ = State::COMPLETED;
      } else {
        state_ = State::FAILED;
        error_message_ = item.error_message;
      }
      finish_waiters_(lock);
      cv_.notify_all();
      return true;
    }

    if (waiters_.empty()) {
      items_.push_back(item.item_payload);
    } else {
      waiter = std::move(waiters_.front());
      waiters_.pop_front();
    }
  }

  if (!waiter) {
    cv_.notify_all();
    return true;
  }

  try {
    waiter(std::optional<BufferType>{item.item_payload});
  } catch (const std::exception& e) {
    LOG_ERR("stream {} read handler threw: {}", granville::to_string(stream_id_), e.what());
  }
  return true;
}

void StreamChannel::fail(std::string error_message) {
  std::unique_lock lock{padlock_};
  if (state_ != State::OPEN)
    return;
  state_ = State::FAILED;
  error_message_ = std::move(error_message);
  finish_waiters_(lock);
  cv_.notify_all();
}

// Called with `lock` held, on the transition out of OPEN; returns with it released
void StreamChannel::finish_waiters_(std::unique_lock<std::mutex>& lock) {
  auto waiters = std::move(waiters_);
  waiters_.clear();
  const auto result = finished_result_locked_();
  lock.unlock();

  for (auto& waiter : waiters) {
    try {
      waiter(result);
    } catch (const std::exception& e) {
      LOG_ERR("stream {} read handler threw: {}", granville::to_string(stream_id_), e.what());
    }
  }
}

StreamChannel::ReadResult StreamChannel::finished_result_locked_() const {
  switch (state_) {
  case State::CANCELLED:
    return tl::make_unexpected(Status{StatusCode::CANCELLED, "stream cancelled"});
  case State::FAILED:
    return tl::make_unexpected(Status{StatusCode::UNKNOWN, error_message_});
  case State::COMPLETED:
  case State::OPEN:
    break;
  }
  return std::optional<BufferType>{};
}

bool StreamChannel::cancel() {
  CancelHandler on_cancel;
  {
    std::unique_lock lock{padlock_};
    if (state_ == State::CANCELLED)
      return false;
    if (state_ == State::OPEN) // otherwise the server is done with this stream already
      on_cancel = std::move(on_cancel_);
    state_ = State::CANCELLED;
    items_.clear();
    finish_waiters_(lock);
  }
  cv_.notify_all();

  if (on_cancel) {
    try {
      on_cancel(stream_id_);
    } catch (const std::exception& e) {
      WARN("cancel handler for stream {} threw: {}", granville::to_string(stream_id_), e.what());
    }
  }
  return true;
}

std::optional<BufferType> StreamChannel::try_read() {
  std::lock_guard lock{padlock_};
  if (items_.empty())
    return std::nullopt;
  auto item = std::move(items_.front());
  items_.pop_front();
  return item;
}

StreamChannel::ReadResult StreamChannel::read(std::chrono::milliseconds timeout) {
  std::unique_lock lock{padlock_};
  const bool is_signalled =
      cv_.wait_for(lock, timeout, [this]() { return !items_.empty() || state_ != State::OPEN; });

  if (state_ == State::CANCELLED)
    return tl::make_unexpected(Status{StatusCode::CANCELLED, "stream cancelled"});

  if (!items_.empty()) {
    auto item = std::move(items_.front());
    items_.pop_front();
    return std::optional<BufferType>{std::move(item)};
  }

  if (!is_signalled)
    return tl::make_unexpected(Status{StatusCode::DEADLINE_EXCEEDED,
                                      fmt::format("no stream item within {}ms", timeout.count())});

  if (state_ == State::FAILED)
    return tl::make_unexpected(Status{StatusCode::UNKNOWN, error_message_});

  return std::optional<BufferType>{}; // completed
}

void StreamChannel::async_read(ItemHandler handler) {
  std::unique_lock lock{padlock_};
  if (state_ == State::OPEN && items_.empty()) {
    waiters_.push_back(std::move(handler));
    return;
  }

  ReadResult result = finished_result_locked_();
  if (state_ != State::CANCELLED && !items_.empty()) {
    result = std::optional<BufferType>{std::move(items_.front())};
    items_.pop_front();
  }
  lock.unlock();
  handler(std::move(result));
}

async::Future<std::optional<BufferType>> StreamChannel::next() {
  async::Promise<std::optional<BufferType>> promise;
  auto future = promise.get_future();
  async_read([promise](ReadResult item) {
    if (item)
      promise.set_value(std::move(*item));
    else
      promise.set_exception(RpcException{std::move(item.error())});
  });
  return future;
}

StreamChannel::State StreamChannel::state() const {
  std::lock_guard lock{padlock_};
  return state_;
}

std::size_t StreamChannel::buffered() const {
  std::lock_guard lock{padlock_};
  return items_.size();
}

int64_t StreamChannel::next_sequence() const {
  std::lock_guard lock{padlock_};
  return next_sequence_;
}

std::size_t StreamChannel::waiting() const {
  std::lock_guard lock{padlock_};
  return waiters_.size();
}

// ----------------------------------------------------------------------------------- StreamManager

std::shared_ptr<StreamChannel> StreamManager::open(const Guid& stream_id, std::string server_id,
                                                   StreamChannel::CancelHandler on_cancel) {
  auto channel = std::make_shared<StreamChannel>(stream_id, std::move(server_id),
                                                 std::move(on_cancel));
  std::lock_guard lock{padlock_};
  if (!channels_.try_emplace(stream_id, channel).second)
    throw RpcException{
        Status{StatusCode::ALREADY_EXISTS,
               fmt::format("stream {} already exists", granville::to_string(stream_id))}};
  return channel;
}

bool StreamManager::deliver(const AsyncEnumerableItem& item) {
  std::shared_ptr<StreamChannel> channel = get(item.stream_id);
  if (channel == nullptr) {
    WARN("item {} for unknown stream {}", item.sequence_number,
         granville::to_string(item.stream_id));
    return false;
  }

  const bool accepted = channel->push(item);
  if (channel->is_finished()) {
    std::lock_guard lock{padlock_};
    auto ii = channels_.find(item.stream_id);
    if (ii != end(channels_) && ii->second == channel)
      channels_.erase(ii);
  }
  return accepted;
}

bool StreamManager::cancel(const Guid& stream_id) {
  std::shared_ptr<StreamChannel> channel;
  {
    std::lock_guard lock{padlock_};
    auto ii = channels_.find(stream_id);
    if (ii == end(channels_))
      return false;
    channel = std::move(ii->second);
    channels_.erase(ii);
  }
  return channel->cancel();
}

bool StreamManager::fail(const Guid& stream_id, std::string error_message) {
  std::shared_ptr<StreamChannel> channel;
  {
    std::lock_guard lock{padlock_};
    auto ii = channels_.find(stream_id);
    if (ii == end(channels_))
      return false;
    channel = std::move(ii->second);
    channels_.erase(ii);
  }
  channel->fail(std::move(error_message));
  return true;
}

std::size_t StreamManager::fail_server(std::string_view server_id,
                                       const std::string& error_message) {
  std::vector<std::shared_ptr<StreamChannel>> failed;
  {
    std::lock_guard lock{padlock_};
    for (auto ii = begin(channels_); ii != end(channels_);) {
      if (ii->second->server_id() == server_id) {
        failed.push_back(std::move(ii->second));
        ii = channels_.erase(ii);
      } else {
        ++ii;
      }
    }
  }
  for (auto& channel : failed)
    channel->fail(error_message);
  return failed.size();
}

std::size_t StreamManager::cancel_all() {
  std::unordered_map<Guid, std::shared_ptr<StreamChannel>, GuidHash> cancelled;
  {
    std::lock_guard lock{padlock_};
    cancelled.swap(channels_);
  }
  for (auto& [stream_id, channel] : cancelled)
    channel->cancel();
  return cancelled.size();
}

std::shared_ptr<StreamChannel> StreamManager::get(const Guid& stream_id) const {
  std::lock_guard lock{padlock_};
  auto ii = channels_.find(stream_id);
  return (ii == cend(channels_)) ? nullptr : ii->second;
}

bool StreamManager::contains(const Guid& stream_id) const {
  std::lock_guard lock{padlock_};
  return channels_.contains(stream_id);
}

std::size_t StreamManager::size() const {
  std::lock_guard lock{padlock_};
  return channels_.size();
}

} // namespace granville::net
