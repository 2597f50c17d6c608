#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace maestro {

template <typename T = void>
class task;

namespace detail {

// Resumes whoever awaited the finished coroutine, or returns to the shard
// loop when nobody did.
struct resume_awaiter {
  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }

  template <typename Promise>
  auto await_suspend(std::coroutine_handle<Promise> done) const noexcept
      -> std::coroutine_handle<> {
    auto next = done.promise().awaiting;
    return next ? next : std::noop_coroutine();
  }

  auto await_resume() const noexcept -> void {
  }
};

struct task_state {
  std::coroutine_handle<> awaiting;

  auto initial_suspend() const noexcept -> std::suspend_always {
    return {};
  }
  auto final_suspend() const noexcept -> resume_awaiter {
    return {};
  }
  // Failures travel as Result values; nothing may throw out of a body.
  [[noreturn]] auto unhandled_exception() const noexcept -> void {
    std::terminate();
  }
};

template <typename T>
struct task_promise : task_state {
  std::optional<T> value;

  auto get_return_object() noexcept -> task<T>;

  template <typename U>
  auto return_value(U&& v) -> void {
    value.emplace(std::forward<U>(v));
  }
};

template <>
struct task_promise<void> : task_state {
  auto get_return_object() noexcept -> task<void>;

  auto return_void() const noexcept -> void {
  }
};

}  // namespace detail

// Lazily started coroutine. Awaiting it starts the body and transfers
// control straight into it; the result comes back the same way.
template <typename T>
class [[nodiscard]] task {
public:
  using promise_type = detail::task_promise<T>;

  task() noexcept = default;
  explicit task(std::coroutine_handle<promise_type> frame) noexcept
      : frame_(frame) {
  }

  task(task&& other) noexcept : frame_(std::exchange(other.frame_, {})) {
  }
  auto operator=(task&& other) noexcept -> task& {
    if (this != &other) {
      reset();
      frame_ = std::exchange(other.frame_, {});
    }
    return *this;
  }

  task(const task&) = delete;
  auto operator=(const task&) -> task& = delete;

  ~task() {
    reset();
  }

  auto operator co_await() && noexcept {
    struct awaiter {
      std::coroutine_handle<promise_type> frame;

      explicit awaiter(std::coroutine_handle<promise_type> f) noexcept
          : frame(f) {
      }
      awaiter(const awaiter&) = delete;
      ~awaiter() {
        if (frame) {
          frame.destroy();
        }
      }

      [[nodiscard]] auto await_ready() const noexcept -> bool {
        return !frame || frame.done();
      }
      auto await_suspend(std::coroutine_handle<> caller) noexcept
          -> std::coroutine_handle<> {
        frame.promise().awaiting = caller;
        return frame;
      }
      auto await_resume() -> T {
        if constexpr (!std::is_void_v<T>) {
          return std::move(*frame.promise().value);
        }
      }
    };
    return awaiter{std::exchange(frame_, {})};
  }

private:
  auto reset() noexcept -> void {
    if (auto f = std::exchange(frame_, {})) {
      f.destroy();
    }
  }

  std::coroutine_handle<promise_type> frame_;
};

template <typename T>
auto detail::task_promise<T>::get_return_object() noexcept -> task<T> {
  return task<T>{
      std::coroutine_handle<task_promise<T>>::from_promise(*this)};
}

inline auto detail::task_promise<void>::get_return_object() noexcept
    -> task<void> {
  return task<void>{
      std::coroutine_handle<task_promise<void>>::from_promise(*this)};
}

// Body of anything handed to Runtime::spawn.
using spawn_task = task<void>;

// Root frame that owns a spawned task and frees itself when the task
// returns. Shards only ever resume these handles.
class detached_task {
public:
  struct promise_type {
    auto get_return_object() noexcept -> detached_task {
      return detached_task{
          std::coroutine_handle<promise_type>::from_promise(*this)};
    }
    auto initial_suspend() const noexcept -> std::suspend_always {
      return {};
    }
    auto final_suspend() const noexcept -> std::suspend_never {
      return {};
    }
    auto return_void() const noexcept -> void {
    }
    [[noreturn]] auto unhandled_exception() const noexcept -> void {
      std::terminate();
    }
  };

  [[nodiscard]] auto handle() const noexcept -> std::coroutine_handle<> {
    return root_;
  }

private:
  explicit detached_task(std::coroutine_handle<promise_type> root) noexcept
      : root_(root) {
  }

  std::coroutine_handle<promise_type> root_;
};

[[nodiscard]] inline auto detach(spawn_task body) -> detached_task {
  co_await std::move(body);
}

}  // namespace maestro
