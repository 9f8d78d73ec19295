
#pragma once

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>

/**
 * @defgroup async Async
 * @ingroup granville
 *
 * A Promise/Future pair for delivering the result of an rpc call. Unlike
 * `std::future`, a continuation can be attached with `on_ready`, so that
 * callers running inside an asio context never have to block.
 */

namespace granville::async
{
template<typename R> class Promise;
template<typename R> class Future;

namespace detail
{
   template<typename R> class SharedState
   {
    public:
      static constexpr bool is_void_result = std::is_same_v<R, void>;

    private:
      using ResultType = std::conditional_t<is_void_result, int8_t, R>;

      mutable std::mutex padlock_       = {};
      std::condition_variable cv_       = {};
      std::exception_ptr exception_ptr_ = {};
      std::optional<ResultType> value_  = {};
      std::atomic<bool> is_set_         = false;
      bool future_is_retrieved_         = false;
      std::function<void()> then_       = {};

      // Call with the lock held; returns the continuation to run after unlocking
      std::function<void()> notify_locked_()
      {
         is_set_.store(true, std::memory_order_release);
         cv_.notify_all();
         return std::move(then_);
      }

      void throw_if_set_locked_() const
      {
         if(is_set_.load(std::memory_order_acquire))
            throw std::future_error{std::future_errc::promise_already_satisfied};
      }

    public:
      bool is_ready() const { return is_set_.load(std::memory_order_acquire); }

      void flag_future_has_been_retrieved()
      {
         std::lock_guard lock{padlock_};
         if(future_is_retrieved_)
            throw std::future_error{std::future_errc::future_already_retrieved};
         future_is_retrieved_ = true;
      }

      bool has_exception_ptr() const
      {
         std::lock_guard lock{padlock_};
         return exception_ptr_ != nullptr;
      }

      void set_exception_ptr(std::exception_ptr ex_ptr)
      {
         std::function<void()> then;
         {
            std::lock_guard lock{padlock_};
            throw_if_set_locked_();
            exception_ptr_ = ex_ptr;
            then           = notify_locked_();
         }
         if(then) then();
      }

      template<typename T = R>
      std::enable_if_t<!std::is_same_v<T, void>, void> set_value(T&& new_value)
      {
         std::function<void()> then;
         {
            std::lock_guard lock{padlock_};
            throw_if_set_locked_();
            value_ = std::forward<T>(new_value);
            then   = notify_locked_();
         }
         if(then) then();
      }

      template<typename T = R> std::enable_if_t<std::is_same_v<T, void>, void> set_value()
      {
         std::function<void()> then;
         {
            std::lock_guard lock{padlock_};
            throw_if_set_locked_();
            value_ = int8_t{0};
            then   = notify_locked_();
         }
         if(then) then();
      }

      void wait()
      {
         std::unique_lock lock{padlock_};
         cv_.wait(lock, [this]() { return is_ready(); });
      }

      template<typename Rep, typename Period>
      std::future_status wait_for(const std::chrono::duration<Rep, Period>& duration)
      {
         std::unique_lock lock{padlock_};
         return cv_.wait_for(lock, duration, [this]() { return is_ready(); })
                    ? std::future_status::ready
                    : std::future_status::timeout;
      }

      R get()
      {
         wait();
         if(exception_ptr_ != nullptr) std::rethrow_exception(exception_ptr_);
         if constexpr(!is_void_result) {
            assert(value_.has_value());
            return std::move(*value_);
         }
      }

      /// `f` runs exactly once: immediately if already set, otherwise on the setting thread
      void on_ready(std::function<void()> f)
      {
         {
            std::lock_guard lock{padlock_};
            assert(!then_);
            if(!is_ready()) {
               then_ = std::move(f);
               return;
            }
         }
         f();
      }
   };

} // namespace detail

// ------------------------------------------------------------------------------------------ Future

/**
 * @ingroup async
 * @brief Provides a way to access the result of an asynchronous operation.
 *
 * It is possible to _blocking wait_ on the result, or alternatively set an `on_ready`
 * function which will execute when the value of the Future is set.
 */
template<typename R> class Future final
{
 private:
   using shared_state_type = detail::SharedState<R>;
   std::shared_ptr<shared_state_type> shared_state_{};

   friend class Promise<R>;

   explicit Future(std::shared_ptr<shared_state_type> shared_state)
       : shared_state_{std::move(shared_state)}
   {
      shared_state_->flag_future_has_been_retrieved();
   }

   void check_state_() const
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
   }

 public:
   ///@{ @name construction/assignment
   Future() noexcept                      = default;
   Future(const Future& o)                = delete;
   Future(Future&& o) noexcept            = default;
   ~Future()                              = default;
   Future& operator=(const Future& o)     = delete;
   Future& operator=(Future&& o) noexcept = default;
   ///@}

   ///@{ @name getters
   /** @brief True iff the Future is still associated with some Promise. */
   bool valid() const noexcept { return shared_state_ != nullptr; }

   /** @brief True iff the Future's value is set and can be retrieved without blocking. */
   bool is_ready() const noexcept { return valid() && shared_state_->is_ready(); }

   /** @brief True iff the Future contains an exception which will be thrown when calling get(). */
   bool has_exception() const
   {
      check_state_();
      return shared_state_->has_exception_ptr();
   }
   ///@}

   ///@{ @name operations
   /**
    * @brief Gets the result of the Future, performing a blocking wait if not yet set.
    *
    * Only one thread should call `get()` on any given Future, and the
    * Future is no longer valid afterwards.
    *
    * @exception std::future_error `future_errc::no_state` if the Future is not valid.
    * @exception ... Rethrows the exception set on the Promise.
    */
   R get()
   {
      check_state_();
      auto shared_state = std::move(shared_state_);
      return shared_state->get();
   }

   /**
    * @brief Run `f` once the value (or exception) is set.
    *
    * Runs immediately on this thread if the Future is already ready.
    */
   void on_ready(std::function<void()> f)
   {
      check_state_();
      shared_state_->on_ready(std::move(f));
   }
   ///@}

   ///@{ @name wait
   void wait() const
   {
      check_state_();
      shared_state_->wait();
   }

   template<typename Rep, typename Period>
   std::future_status wait_for(const std::chrono::duration<Rep, Period>& duration) const
   {
      check_state_();
      return shared_state_->wait_for(duration);
   }
   ///@}
};

// ----------------------------------------------------------------------------------------- Promise

/**
 * @ingroup async
 * @brief The writing end of a Promise/Future pair. Copyable, so that it can be
 *        captured in `std::function` completion handlers.
 */
template<typename R> class Promise final
{
 private:
   using shared_state_type = detail::SharedState<R>;
   std::shared_ptr<shared_state_type> shared_state_{std::make_shared<shared_state_type>()};

 public:
   /**
    * @exception std::future_error `future_already_retrieved` on the second call.
    */
   Future<R> get_future() { return Future<R>{shared_state_}; }

   template<typename T = R>
   std::enable_if_t<!std::is_same_v<T, void>, void> set_value(T&& value) const
   {
      shared_state_->set_value(std::forward<T>(value));
   }

   template<typename T = R> std::enable_if_t<std::is_same_v<T, void>, void> set_value() const
   {
      shared_state_->set_value();
   }

   void set_exception(std::exception_ptr ex_ptr) const { shared_state_->set_exception_ptr(ex_ptr); }

   template<typename E> void set_exception(E&& exception) const
   {
      set_exception(std::make_exception_ptr(std::forward<E>(exception)));
   }
};

} // namespace granville::async
