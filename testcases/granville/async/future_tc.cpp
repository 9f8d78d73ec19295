
#include "stdinc.hpp"

#include "granville/async.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <thread>

namespace granville::async
{
CATCH_TEST_CASE("Future", "[future]")
{
   CATCH_SECTION("value")
   {
      Promise<int> promise;
      auto future = promise.get_future();
      CATCH_REQUIRE(future.valid());
      CATCH_REQUIRE(!future.is_ready());

      std::thread thread{[promise]() { promise.set_value(42); }};
      CATCH_REQUIRE(future.get() == 42);
      CATCH_REQUIRE(!future.valid());
      thread.join();
   }

   CATCH_SECTION("void")
   {
      Promise<void> promise;
      auto future = promise.get_future();
      promise.set_value();
      CATCH_REQUIRE(future.is_ready());
      CATCH_REQUIRE(!future.has_exception());
      future.get();
   }

   CATCH_SECTION("exception")
   {
      Promise<std::string> promise;
      auto future = promise.get_future();
      promise.set_exception(std::runtime_error{"boom"});
      CATCH_REQUIRE(future.has_exception());
      CATCH_REQUIRE_THROWS_AS(future.get(), std::runtime_error);
   }

   CATCH_SECTION("set twice")
   {
      Promise<int> promise;
      auto future = promise.get_future();
      promise.set_value(1);
      CATCH_REQUIRE_THROWS_AS(promise.set_value(2), std::future_error);
      CATCH_REQUIRE(future.get() == 1);
   }

   CATCH_SECTION("on-ready")
   {
      Promise<int> promise;
      auto future = promise.get_future();
      int calls   = 0;
      future.on_ready([&calls]() { ++calls; });
      CATCH_REQUIRE(calls == 0);
      promise.set_value(7);
      CATCH_REQUIRE(calls == 1);
      CATCH_REQUIRE(future.get() == 7);
   }

   CATCH_SECTION("wait-for")
   {
      Promise<int> promise;
      auto future = promise.get_future();
      CATCH_REQUIRE(future.wait_for(std::chrono::milliseconds{5}) == std::future_status::timeout);
      promise.set_value(3);
      CATCH_REQUIRE(future.wait_for(std::chrono::milliseconds{5}) == std::future_status::ready);
   }
}

} // namespace granville::async
