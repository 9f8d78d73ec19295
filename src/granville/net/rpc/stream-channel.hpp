
#pragma once

#include "messages.hpp"
#include "serialization-session-factory.hpp"
#include "status.hpp"

#include "granville/async/future.hpp"
#include "granville/net/buffer.hpp"
#include "granville/utils/guid.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace granville::net {

// ----------------------------------------------------------------------------------- StreamChannel

/**
 * @brief The client end of one async-enumerable stream.
 *
 * Items are buffered in arrival order. An item whose sequence number is below
 * the next expected one is a duplicate (or stale), and is dropped. The stream
 * ends with a completion item, an error, or a cancel; after a cancel the
 * buffered items are discarded and nothing more is delivered.
 *
 * Items are consumed either by blocking (`read`), or by continuation
 * (`async_read`, `next`). Handlers waiting on `async_read` run on the thread
 * that pushes, fails or cancels the stream, outside the channel's lock.
 */
class StreamChannel {
public:
  enum class State : int8_t { OPEN, COMPLETED, FAILED, CANCELLED };

  /** @brief Runs once, on the first cancel; tells the server to stop */
  using CancelHandler = std::function<void(const Guid& stream_id)>;

  using ReadResult = tl::expected<std::optional<BufferType>, Status>;
  using ItemHandler = std::function<void(ReadResult result)>;

private:
  Guid stream_id_;
  std::string server_id_;
  CancelHandler on_cancel_;

  mutable std::mutex padlock_;
  std::condition_variable cv_;
  std::deque<BufferType> items_;
  std::deque<ItemHandler> waiters_; // only while `items_` is empty
  int64_t next_sequence_{0};
  State state_{State::OPEN};
  std::string error_message_;

public:
  StreamChannel(const Guid& stream_id, std::string server_id, CancelHandler on_cancel = {})
      : stream_id_{stream_id}, server_id_{std::move(server_id)}, on_cancel_{std::move(on_cancel)} {
  }

  StreamChannel(const StreamChannel&) = delete;
  StreamChannel& operator=(const StreamChannel&) = delete;

  const Guid& stream_id() const { return stream_id_; }
  const std::string& server_id() const { return server_id_; }

  ///@{ @name producer side
  /** @return false iff the item was dropped (stale sequence, or the stream is finished) */
  bool push(const AsyncEnumerableItem& item);

  /** @brief End the stream with an error. No-op if already finished. */
  void fail(std::string error_message);

  /** @return true on the first call only */
  bool cancel();
  ///@}

  ///@{ @name consumer side
  /** @brief The next buffered item, without waiting */
  std::optional<BufferType> try_read();

  /**
   * @brief Wait up to `timeout` for the next item.
   * @return An item; or nothing at the end of a completed stream; or a status:
   *         `UNKNOWN` with the server's message for a failed stream,
   *         `CANCELLED` for a cancelled stream, `DEADLINE_EXCEEDED` on timeout.
   */
  ReadResult read(std::chrono::milliseconds timeout);

  /** @brief `read`, then deserialize the item as `T` */
  template <typename T>
  tl::expected<std::optional<T>, Status> read(const SerializationSessionFactory& serializer,
                                              std::chrono::milliseconds timeout) {
    auto item = read(timeout);
    if (!item)
      return tl::make_unexpected(std::move(item.error()));
    if (!item->has_value())
      return std::optional<T>{};
    auto value = serializer.deserialize<T>(to_span_bytes(**item));
    if (!value)
      return tl::make_unexpected(std::move(value.error()));
    return std::optional<T>{std::move(*value)};
  }

  /**
   * @brief Call `handler` with the next item, as `read` would report it but
   *        without a timeout. Runs `handler` immediately if an item is
   *        buffered, or the stream is finished; otherwise waiters are served
   *        in the order they called.
   */
  void async_read(ItemHandler handler);

  /**
   * @brief The next item as a future: empty at the end of a completed stream.
   * A failed or cancelled stream sets an `RpcException`.
   */
  async::Future<std::optional<BufferType>> next();

  /** @brief `next`, then deserialize the item as `T` */
  template <typename T>
  async::Future<std::optional<T>> next(const SerializationSessionFactory& serializer) {
    async::Promise<std::optional<T>> promise;
    auto future = promise.get_future();
    async_read([promise, serializer](ReadResult item) {
      if (!item) {
        promise.set_exception(RpcException{std::move(item.error())});
        return;
      }
      if (!item->has_value()) {
        promise.set_value(std::optional<T>{});
        return;
      }
      auto value = serializer.deserialize<T>(to_span_bytes(**item));
      if (!value)
        promise.set_exception(RpcException{std::move(value.error())});
      else
        promise.set_value(std::optional<T>{std::move(*value)});
    });
    return future;
  }
  ///@}

  ///@{ @name getters
  State state() const;
  bool is_finished() const { return state() != State::OPEN; }
  std::size_t buffered() const;
  int64_t next_sequence() const;
  std::size_t waiting() const;
  ///@}

private:
  ReadResult finished_result_locked_() const;
  void finish_waiters_(std::unique_lock<std::mutex>& lock);
};

std::string_view str(StreamChannel::State state);

// ----------------------------------------------------------------------------------- StreamManager

/**
 * @brief The open streams of one client, keyed by stream id.
 */
class StreamManager {
private:
  mutable std::mutex padlock_;
  std::unordered_map<Guid, std::shared_ptr<StreamChannel>, GuidHash> channels_;

public:
  /** @throw RpcException `ALREADY_EXISTS` if `stream_id` is open */
  std::shared_ptr<StreamChannel> open(const Guid& stream_id, std::string server_id,
                                      StreamChannel::CancelHandler on_cancel = {});

  /**
   * @brief Forward `item` to its channel. Finished channels leave the table.
   * @return false iff there is no such stream, or the item was dropped
   */
  bool deliver(const AsyncEnumerableItem& item);

  /** @brief Cancel and forget `stream_id`. Idempotent. */
  bool cancel(const Guid& stream_id);

  /** @brief Fail and forget `stream_id` */
  bool fail(const Guid& stream_id, std::string error_message);

  /** @brief Fail every stream served by `server_id` */
  std::size_t fail_server(std::string_view server_id, const std::string& error_message);

  std::size_t cancel_all();

  std::shared_ptr<StreamChannel> get(const Guid& stream_id) const;
  bool contains(const Guid& stream_id) const;
  std::size_t size() const;
};

} // namespace granville::net
