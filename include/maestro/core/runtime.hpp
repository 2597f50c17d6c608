#pragma once

#include "maestro/core/coroutine.hpp"
#include "maestro/core/io_ring.hpp"
#include "maestro/core/shard.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace maestro {

// Fixed set of shard threads. Spawned tasks land on a shard round-robin
// and stay there; anything a task awaits resumes it on the same shard.
class Runtime {
public:
  explicit Runtime(unsigned num_shards = 0);
  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  auto start() -> void;
  // Joins the shard threads and destroys every frame still parked on them.
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Queues `handle` on `target` from any thread.
  auto schedule_on(shard_id target, std::coroutine_handle<> handle) -> void;
  // Queues `handle` on the next shard in turn.
  auto schedule_external(std::coroutine_handle<> handle) -> void;

  auto spawn(spawn_task&& t) -> void {
    schedule_external(detach(std::move(t)).handle());
  }
  auto spawn_on(shard_id target, spawn_task&& t) -> void {
    schedule_on(target, detach(std::move(t)).handle());
  }

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return static_cast<unsigned>(shards_.size());
  }
  [[nodiscard]] auto current_shard() const noexcept -> shard_id;
  [[nodiscard]] auto is_current_shard() const noexcept -> bool {
    return current_shard() != kInvalidShard;
  }

  // Shard threads only; the timer belongs to the calling shard.
  [[nodiscard]] auto arm_timer(timer_data* data,
                               std::chrono::milliseconds duration) -> bool;
  // Must run on the shard that armed `data`.
  auto cancel_timer(timer_data* data) -> void;

  // Timers armed across all shards and not yet fired or cancelled.
  [[nodiscard]] auto pending_timers() const noexcept -> std::size_t;

private:
  auto run_shard(Shard& shard) -> void;

  std::vector<std::unique_ptr<Shard>> shards_;
  std::vector<std::thread> threads_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<unsigned> next_shard_{0};
};

namespace detail {
inline thread_local shard_id current_shard_id = kInvalidShard;
inline thread_local Runtime* current_runtime = nullptr;
}  // namespace detail

class sleep_awaiter {
public:
  explicit sleep_awaiter(std::chrono::milliseconds duration) noexcept
      : duration_{duration} {
  }

  sleep_awaiter(const sleep_awaiter&) = delete;
  sleep_awaiter& operator=(const sleep_awaiter&) = delete;

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return duration_.count() <= 0 || detail::current_runtime == nullptr;
  }
  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;
  auto await_resume() const noexcept -> void {
  }

  // Handle for Runtime::cancel_timer while the sleep is pending.
  [[nodiscard]] auto timer() noexcept -> timer_data* {
    return &data_;
  }
  [[nodiscard]] auto cancelled() const noexcept -> bool {
    return data_.result == -ECANCELED;
  }

private:
  timer_data data_{};
  std::chrono::milliseconds duration_;
};

// Parks the calling coroutine; its shard keeps running other work.
[[nodiscard]] inline auto async_sleep(std::chrono::milliseconds duration) noexcept
    -> sleep_awaiter {
  return sleep_awaiter{duration};
}

}  // namespace maestro
