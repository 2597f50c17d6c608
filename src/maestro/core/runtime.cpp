#include "maestro/core/runtime.hpp"

#include "maestro/util/log.hpp"

#include <algorithm>
#include <format>
#include <numeric>

namespace maestro {

Runtime::Runtime(unsigned num_shards) {
  if (num_shards == 0) {
    num_shards = std::max(1u, std::thread::hardware_concurrency());
  }
  shards_.reserve(num_shards);
  for (shard_id id = 0; id < num_shards; ++id) {
    shards_.push_back(std::make_unique<Shard>(id));
  }
}

Runtime::~Runtime() {
  stop();
}

auto Runtime::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  stopping_.store(false, std::memory_order_release);
  for (auto& shard : shards_) {
    threads_.emplace_back([this, s = shard.get()] { run_shard(*s); });
  }
  log::debug("Runtime started with {} shard(s)", shards_.size());
}

auto Runtime::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  stopping_.store(true, std::memory_order_release);
  for (auto& shard : shards_) {
    shard->wake();
  }
  for (auto& thread : threads_) {
    thread.join();
  }
  threads_.clear();
  for (auto& shard : shards_) {
    shard->drain();
  }
  log::debug("Runtime stopped");
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::current_shard() const noexcept -> shard_id {
  return detail::current_runtime == this ? detail::current_shard_id
                                         : kInvalidShard;
}

auto Runtime::run_shard(Shard& shard) -> void {
  detail::current_shard_id = shard.id();
  detail::current_runtime = this;
  log::set_thread_tag(std::format("shard-{}", shard.id()));

  shard.open();
  while (!stopping_.load(std::memory_order_acquire)) {
    if (!shard.poll_once()) {
      shard.idle();
    }
  }

  log::set_thread_tag({});
  detail::current_runtime = nullptr;
  detail::current_shard_id = kInvalidShard;
}

auto Runtime::schedule_on(shard_id target, std::coroutine_handle<> handle)
    -> void {
  if (!handle || target >= shards_.size()) {
    return;
  }
  if (stopping_.load(std::memory_order_acquire)) {
    log::debug("Runtime stopping, dropping coroutine for shard {}", target);
    return;
  }
  auto& shard = *shards_[target];
  if (current_shard() == target) {
    shard.post_local(handle);
    return;
  }
  while (!shard.post_remote(handle)) {
    shard.wake();
    std::this_thread::yield();
  }
  shard.wake();
}

auto Runtime::schedule_external(std::coroutine_handle<> handle) -> void {
  auto turn = next_shard_.fetch_add(1, std::memory_order_relaxed);
  schedule_on(static_cast<shard_id>(turn % shards_.size()), handle);
}

auto Runtime::arm_timer(timer_data* data, std::chrono::milliseconds duration)
    -> bool {
  auto id = current_shard();
  if (id == kInvalidShard) {
    log::error("arm_timer called off a shard thread");
    return false;
  }
  shards_[id]->arm_timer(data, duration);
  return true;
}

auto Runtime::cancel_timer(timer_data* data) -> void {
  auto id = current_shard();
  if (id == kInvalidShard) {
    log::error("cancel_timer called off a shard thread");
    return;
  }
  shards_[id]->cancel_timer(data);
}

auto Runtime::pending_timers() const noexcept -> std::size_t {
  return std::accumulate(shards_.begin(), shards_.end(), std::size_t{0},
                         [](std::size_t sum, const auto& shard) {
                           return sum + shard->armed_timers();
                         });
}

auto sleep_awaiter::await_suspend(std::coroutine_handle<> handle) noexcept
    -> bool {
  data_.coroutine = handle.address();
  if (!detail::current_runtime->arm_timer(&data_, duration_)) {
    data_.coroutine = nullptr;
    return false;
  }
  return true;
}

}  // namespace maestro
