
#include "stdinc.hpp"

#include "test-cluster.hpp"

#include "granville/net/rpc/pending-request-table.hpp"

#include <catch2/catch.hpp>

#include <thread>

namespace granville::net::test {

struct Outcomes {
  std::mutex padlock;
  std::vector<Status> statuses;

  PendingRequestTable::CompletionHandler handler() {
    return [this](Status status, RpcResponse) {
      std::lock_guard lock{padlock};
      statuses.push_back(std::move(status));
    };
  }

  std::size_t size() {
    std::lock_guard lock{padlock};
    return statuses.size();
  }

  Status at(std::size_t index) {
    std::lock_guard lock{padlock};
    return statuses.at(index);
  }
};

CATCH_TEST_CASE("PendingRequestTable", "[pending-requests]") {
  boost::asio::io_context io_context;
  AsioExecutionContext pool{io_context, 2};
  pool.run();
  auto table = PendingRequestTable::make(make_steady_timer_factory(io_context));

  CATCH_SECTION("complete once") {
    Outcomes outcomes;
    const auto id = new_guid();
    CATCH_REQUIRE(table->add(id, std::chrono::milliseconds{0}, outcomes.handler()));
    CATCH_REQUIRE(table->contains(id));

    CATCH_REQUIRE(table->complete(id, Status{}, RpcResponse{id, true}));
    CATCH_REQUIRE(!table->complete(id, Status{}, RpcResponse{id, true}));
    CATCH_REQUIRE(!table->complete(id, Status{StatusCode::UNKNOWN, "late"}));
    CATCH_REQUIRE(outcomes.size() == 1);
    CATCH_REQUIRE(outcomes.at(0).ok());
    CATCH_REQUIRE(!table->contains(id));
  }

  CATCH_SECTION("duplicate ids are refused") {
    Outcomes outcomes;
    const auto id = new_guid();
    CATCH_REQUIRE(table->add(id, std::chrono::milliseconds{0}, outcomes.handler()));
    CATCH_REQUIRE(!table->add(id, std::chrono::milliseconds{0}, outcomes.handler()));
    CATCH_REQUIRE(table->size() == 1);
  }

  CATCH_SECTION("timeout") {
    Outcomes outcomes;
    const auto id = new_guid();
    const auto started = std::chrono::steady_clock::now();
    CATCH_REQUIRE(table->add(id, std::chrono::milliseconds{50}, outcomes.handler()));
    CATCH_REQUIRE(wait_until([&]() { return outcomes.size() == 1; }));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    CATCH_REQUIRE(elapsed >= std::chrono::milliseconds{50});
    CATCH_REQUIRE(elapsed < std::chrono::milliseconds{1000});
    CATCH_REQUIRE(outcomes.at(0).error_code() == StatusCode::DEADLINE_EXCEEDED);
    CATCH_REQUIRE(outcomes.at(0).error_message().find("timed out after 50ms") !=
                  std::string_view::npos);
    CATCH_REQUIRE(!table->contains(id));
    CATCH_REQUIRE(!table->complete(id, Status{}));
  }

  CATCH_SECTION("completion cancels the timeout") {
    Outcomes outcomes;
    const auto id = new_guid();
    CATCH_REQUIRE(table->add(id, std::chrono::milliseconds{20}, outcomes.handler()));
    CATCH_REQUIRE(table->complete(id, Status{}));
    std::this_thread::sleep_for(std::chrono::milliseconds{60});
    CATCH_REQUIRE(outcomes.size() == 1);
    CATCH_REQUIRE(outcomes.at(0).ok());
  }

  CATCH_SECTION("racing completions deliver exactly one outcome") {
    for (int round = 0; round < 50; ++round) {
      Outcomes outcomes;
      const auto id = new_guid();
      CATCH_REQUIRE(table->add(id, std::chrono::milliseconds{1}, outcomes.handler()));

      std::atomic<int> n_completed{0};
      std::vector<std::thread> threads;
      for (int i = 0; i < 4; ++i)
        threads.emplace_back([&]() {
          if (table->complete(id, Status{}))
            ++n_completed;
        });
      for (auto& thread : threads)
        thread.join();

      std::this_thread::sleep_for(std::chrono::milliseconds{3});
      CATCH_REQUIRE(n_completed.load() <= 1);
      CATCH_REQUIRE(wait_until([&]() { return outcomes.size() == 1; }));
      std::this_thread::sleep_for(std::chrono::milliseconds{2});
      CATCH_REQUIRE(outcomes.size() == 1);
    }
  }

  CATCH_SECTION("fail all") {
    Outcomes outcomes;
    const auto a = new_guid();
    const auto b = new_guid();
    CATCH_REQUIRE(table->add(a, std::chrono::milliseconds{10000}, outcomes.handler()));
    CATCH_REQUIRE(table->add(b, std::chrono::milliseconds{0}, outcomes.handler()));

    CATCH_REQUIRE(table->fail_all(Status{StatusCode::CANCELLED, "client stopped"}) == 2);
    CATCH_REQUIRE(table->size() == 0);
    CATCH_REQUIRE(outcomes.size() == 2);
    CATCH_REQUIRE(outcomes.at(0).error_code() == StatusCode::CANCELLED);
    CATCH_REQUIRE(outcomes.at(1).error_message() == "client stopped");
    CATCH_REQUIRE(table->fail_all(Status{StatusCode::CANCELLED}) == 0);
  }

  CATCH_SECTION("a throwing handler is contained") {
    const auto id = new_guid();
    CATCH_REQUIRE(table->add(id, std::chrono::milliseconds{0},
                             [](Status, RpcResponse) { throw std::runtime_error{"handler"}; }));
    CATCH_REQUIRE(table->complete(id, Status{}));
  }

  table.reset();
  pool.stop();
}

} // namespace granville::net::test
