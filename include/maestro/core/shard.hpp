#pragma once

#include "maestro/core/io_ring.hpp"
#include "maestro/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <map>
#include <unordered_set>

namespace maestro {

// State of one reactor thread: its run queue, an inbox other threads post
// into, and the timers armed from coroutines running on it. Everything but
// post_remote, wake and armed_timers belongs to the shard thread.
class Shard {
public:
  using clock = std::chrono::steady_clock;

  explicit Shard(shard_id id);
  ~Shard();

  Shard(const Shard&) = delete;
  Shard& operator=(const Shard&) = delete;

  [[nodiscard]] auto id() const noexcept -> shard_id {
    return id_;
  }

  auto post_local(std::coroutine_handle<> h) -> void;
  [[nodiscard]] auto post_remote(std::coroutine_handle<> h) -> bool;
  // Interrupts idle() from any thread.
  auto wake() -> void;

  auto arm_timer(timer_data* data, std::chrono::milliseconds after) -> void;
  // Resumes the sleeper early with -ECANCELED. Unknown timers are ignored.
  auto cancel_timer(timer_data* data) -> void;

  auto open() -> void;
  // Runs ready coroutines, due fallback timers and ring completions.
  // Returns true if any of them made progress.
  auto poll_once() -> bool;
  auto idle() -> void;
  // Destroys every frame still queued or asleep. Shard thread must be gone.
  auto drain() -> void;

  [[nodiscard]] auto armed_timers() const noexcept -> std::size_t {
    return armed_count_.load(std::memory_order_relaxed);
  }

private:
  auto run_ready() -> bool;
  auto fire_due_timers() -> bool;
  auto reap_completions() -> bool;
  auto complete_timer(timer_data* data, std::int32_t result) -> void;
  auto consume_wakeups() -> void;

  shard_id id_;
  int wake_fd_ = -1;
  IoRing ring_;

  std::deque<std::coroutine_handle<>> ready_;
  MpscRing<std::coroutine_handle<>> inbox_{4096};

  std::unordered_set<timer_data*> armed_;
  // Deadline order for timers that could not go through io_uring.
  std::multimap<clock::time_point, timer_data*> fallback_;
  std::atomic<std::size_t> armed_count_{0};
};

}  // namespace maestro
