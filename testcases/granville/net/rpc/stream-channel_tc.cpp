
#include "stdinc.hpp"

#include "granville/net/rpc/stream-channel.hpp"

#include <catch2/catch.hpp>

#include <thread>

namespace granville::net::test {

static AsyncEnumerableItem make_item(const Guid& stream_id, int64_t sequence, std::string value) {
  const SerializationSessionFactory serializer;
  return AsyncEnumerableItem{stream_id, sequence, serializer.serialize_result(value), false, ""};
}

static AsyncEnumerableItem make_end(const Guid& stream_id, int64_t sequence,
                                    std::string error_message = "") {
  return AsyncEnumerableItem{stream_id, sequence, {}, true, std::move(error_message)};
}

CATCH_TEST_CASE("StreamChannel", "[streams]") {
  const SerializationSessionFactory serializer;
  const auto id = new_guid();
  constexpr auto timeout = std::chrono::milliseconds{500};

  CATCH_SECTION("items arrive in order, then the end") {
    StreamChannel channel{id, "server-a"};
    CATCH_REQUIRE(channel.push(make_item(id, 0, "a")));
    CATCH_REQUIRE(channel.push(make_item(id, 1, "b")));
    CATCH_REQUIRE(!channel.push(make_item(id, 1, "stale")));
    CATCH_REQUIRE(!channel.push(make_item(id, 0, "stale")));
    CATCH_REQUIRE(channel.push(make_end(id, 2)));
    CATCH_REQUIRE(!channel.push(make_item(id, 3, "late")));

    CATCH_REQUIRE(channel.state() == StreamChannel::State::COMPLETED);
    CATCH_REQUIRE(channel.buffered() == 2);
    CATCH_REQUIRE(channel.read<std::string>(serializer, timeout) == tl::expected<std::optional<std::string>, Status>{std::optional<std::string>{"a"}});
    CATCH_REQUIRE(channel.read<std::string>(serializer, timeout) == tl::expected<std::optional<std::string>, Status>{std::optional<std::string>{"b"}});

    const auto end = channel.read<std::string>(serializer, timeout);
    CATCH_REQUIRE(end.has_value());
    CATCH_REQUIRE(!end->has_value());
  }

  CATCH_SECTION("failure is reported after buffered items") {
    StreamChannel channel{id, "server-a"};
    channel.push(make_item(id, 0, "a"));
    channel.push(make_end(id, 1, "grain exploded"));
    CATCH_REQUIRE(channel.state() == StreamChannel::State::FAILED);
    CATCH_REQUIRE(channel.read(timeout).has_value());

    const auto failure = channel.read(timeout);
    CATCH_REQUIRE(!failure.has_value());
    CATCH_REQUIRE(failure.error().error_code() == StatusCode::UNKNOWN);
    CATCH_REQUIRE(failure.error().error_message() == "grain exploded");
  }

  CATCH_SECTION("read times out") {
    StreamChannel channel{id, "server-a"};
    const auto item = channel.read(std::chrono::milliseconds{10});
    CATCH_REQUIRE(!item.has_value());
    CATCH_REQUIRE(item.error().error_code() == StatusCode::DEADLINE_EXCEEDED);
    CATCH_REQUIRE(!channel.try_read().has_value());
  }

  CATCH_SECTION("read wakes on push") {
    StreamChannel channel{id, "server-a"};
    std::thread producer{[&]() {
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
      channel.push(make_item(id, 0, "late"));
    }};
    const auto item = channel.read<std::string>(serializer, timeout);
    producer.join();
    CATCH_REQUIRE(item == tl::expected<std::optional<std::string>, Status>{std::optional<std::string>{"late"}});
  }

  CATCH_SECTION("cancel is idempotent") {
    int n_cancels = 0;
    StreamChannel channel{id, "server-a", [&](const Guid& stream_id) {
                            CATCH_REQUIRE(stream_id == id);
                            ++n_cancels;
                          }};
    channel.push(make_item(id, 0, "dropped"));
    CATCH_REQUIRE(channel.cancel());
    CATCH_REQUIRE(!channel.cancel());
    CATCH_REQUIRE(n_cancels == 1);
    CATCH_REQUIRE(channel.buffered() == 0);

    const auto item = channel.read(timeout);
    CATCH_REQUIRE(!item.has_value());
    CATCH_REQUIRE(item.error().error_code() == StatusCode::CANCELLED);
  }

  CATCH_SECTION("a finished stream is not cancelled remotely") {
    int n_cancels = 0;
    StreamChannel channel{id, "server-a", [&](const Guid&) { ++n_cancels; }};
    channel.push(make_end(id, 0));
    CATCH_REQUIRE(channel.cancel());
    CATCH_REQUIRE(n_cancels == 0);
  }

  CATCH_SECTION("async_read is served buffered items first, then waits") {
    StreamChannel channel{id, "server-a"};
    channel.push(make_item(id, 0, "a"));

    std::vector<std::string> seen;
    const auto collect = [&](StreamChannel::ReadResult item) {
      CATCH_REQUIRE(item.has_value());
      seen.push_back(item->has_value() ? *serializer.deserialize<std::string>(to_span_bytes(**item))
                                       : std::string{"<end>"});
    };
    channel.async_read(collect);
    CATCH_REQUIRE(seen == std::vector<std::string>{"a"});

    channel.async_read(collect);
    channel.async_read(collect);
    channel.async_read(collect);
    CATCH_REQUIRE(channel.waiting() == 3);
    CATCH_REQUIRE(seen.size() == 1);

    channel.push(make_item(id, 1, "b"));
    channel.push(make_item(id, 2, "c"));
    CATCH_REQUIRE(channel.buffered() == 0); // handed straight to the waiters
    CATCH_REQUIRE(seen == std::vector<std::string>{"a", "b", "c"});

    channel.push(make_end(id, 3));
    CATCH_REQUIRE(seen == std::vector<std::string>{"a", "b", "c", "<end>"});
    CATCH_REQUIRE(channel.waiting() == 0);

    channel.async_read(collect); // finished: answered at once
    CATCH_REQUIRE(seen.back() == "<end>");
  }

  CATCH_SECTION("next resolves as items arrive") {
    StreamChannel channel{id, "server-a"};
    auto first = channel.next<std::string>(serializer);
    auto second = channel.next<std::string>(serializer);
    CATCH_REQUIRE(!first.is_ready());

    std::thread producer{[&]() {
      channel.push(make_item(id, 0, "a"));
      channel.push(make_item(id, 1, "b"));
      channel.push(make_end(id, 2));
    }};
    CATCH_REQUIRE(first.get() == std::optional<std::string>{"a"});
    CATCH_REQUIRE(second.get() == std::optional<std::string>{"b"});
    CATCH_REQUIRE(channel.next<std::string>(serializer).get() == std::nullopt);
    producer.join();
  }

  CATCH_SECTION("waiting readers see a failure or a cancel") {
    StreamChannel failed{id, "server-a"};
    auto read_failed = failed.next();
    failed.fail("connection closed");
    try {
      read_failed.get();
      CATCH_FAIL("read an item from a failed stream");
    } catch (const RpcException& e) {
      CATCH_REQUIRE(e.error_code() == StatusCode::UNKNOWN);
      CATCH_REQUIRE(e.status().error_message() == "connection closed");
    }

    StreamChannel cancelled{id, "server-a"};
    auto read_cancelled = cancelled.next();
    cancelled.cancel();
    try {
      read_cancelled.get();
      CATCH_FAIL("read an item from a cancelled stream");
    } catch (const RpcException& e) {
      CATCH_REQUIRE(e.error_code() == StatusCode::CANCELLED);
    }
  }
}

CATCH_TEST_CASE("StreamManager", "[streams]") {
  StreamManager streams;
  const auto a = new_guid();
  const auto b = new_guid();

  CATCH_SECTION("open and deliver") {
    auto channel = streams.open(a, "server-a");
    CATCH_REQUIRE_THROWS_AS(streams.open(a, "server-a"), RpcException);
    CATCH_REQUIRE(streams.contains(a));

    CATCH_REQUIRE(streams.deliver(make_item(a, 0, "x")));
    CATCH_REQUIRE(!streams.deliver(make_item(b, 0, "unknown stream")));
    CATCH_REQUIRE(channel->buffered() == 1);

    CATCH_REQUIRE(streams.deliver(make_end(a, 1)));
    CATCH_REQUIRE(!streams.contains(a)); // finished streams leave the table
    CATCH_REQUIRE(channel->try_read().has_value());
  }

  CATCH_SECTION("server failure fails only its streams") {
    auto on_a = streams.open(a, "server-a");
    auto on_b = streams.open(b, "server-b");
    CATCH_REQUIRE(streams.fail_server("server-a", "connection closed") == 1);
    CATCH_REQUIRE(on_a->state() == StreamChannel::State::FAILED);
    CATCH_REQUIRE(on_b->state() == StreamChannel::State::OPEN);
    CATCH_REQUIRE(streams.size() == 1);
  }

  CATCH_SECTION("cancel all") {
    int n_cancels = 0;
    auto on_a = streams.open(a, "server-a", [&](const Guid&) { ++n_cancels; });
    auto on_b = streams.open(b, "server-b", [&](const Guid&) { ++n_cancels; });
    CATCH_REQUIRE(streams.cancel(a));
    CATCH_REQUIRE(!streams.cancel(a));
    CATCH_REQUIRE(streams.cancel_all() == 1);
    CATCH_REQUIRE(n_cancels == 2);
    CATCH_REQUIRE(streams.size() == 0);
    CATCH_REQUIRE(on_b->state() == StreamChannel::State::CANCELLED);
  }
}

} // namespace granville::net::test
