#include "maestro/core/shard.hpp"

#include "maestro/util/log.hpp"

#include <sys/eventfd.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <thread>
#include <utility>

#include <unistd.h>

namespace maestro {

namespace {

constexpr auto kRingIdle = std::chrono::milliseconds(1000);
constexpr auto kFallbackNap = std::chrono::milliseconds(1);

}  // namespace

Shard::Shard(shard_id id) : id_(id), wake_fd_(eventfd(0, EFD_NONBLOCK)) {
  if (wake_fd_ < 0) {
    log::error("Shard {}: eventfd failed, cross-thread wakeups disabled", id);
  }
  if (!ring_.valid()) {
    log::debug("Shard {}: io_uring unavailable, timers use the fallback set",
               id);
  }
}

Shard::~Shard() {
  if (wake_fd_ >= 0) {
    close(wake_fd_);
  }
}

auto Shard::post_local(std::coroutine_handle<> h) -> void {
  if (h && !h.done()) {
    ready_.push_back(h);
  }
}

auto Shard::post_remote(std::coroutine_handle<> h) -> bool {
  return inbox_.try_push(h);
}

auto Shard::wake() -> void {
  if (wake_fd_ < 0) {
    return;
  }
  const std::uint64_t one = 1;
  while (write(wake_fd_, &one, sizeof(one)) < 0 && errno == EINTR) {
  }
}

auto Shard::open() -> void {
  ring_.watch_wakeups(wake_fd_);
}

auto Shard::arm_timer(timer_data* data, std::chrono::milliseconds after)
    -> void {
  data->ts = to_timespec(after);
  data->deadline = clock::now() + after;
  data->in_ring = ring_.arm_timeout(data);
  if (data->in_ring) {
    ring_.flush();
  } else {
    fallback_.emplace(data->deadline, data);
  }
  armed_.insert(data);
  armed_count_.fetch_add(1, std::memory_order_relaxed);
}

auto Shard::cancel_timer(timer_data* data) -> void {
  if (!armed_.contains(data)) {
    return;
  }
  if (data->in_ring) {
    // If the removal cannot be queued the timer simply runs to its deadline.
    if (ring_.remove_timeout(data)) {
      ring_.flush();
    }
    return;
  }
  auto [first, last] = fallback_.equal_range(data->deadline);
  for (auto it = first; it != last; ++it) {
    if (it->second == data) {
      fallback_.erase(it);
      break;
    }
  }
  complete_timer(data, -ECANCELED);
}

auto Shard::complete_timer(timer_data* data, std::int32_t result) -> void {
  if (armed_.erase(data) == 0) {
    return;
  }
  armed_count_.fetch_sub(1, std::memory_order_relaxed);
  data->result = result;
  if (auto* frame = std::exchange(data->coroutine, nullptr)) {
    ready_.push_back(std::coroutine_handle<>::from_address(frame));
  }
}

auto Shard::poll_once() -> bool {
  bool progressed = run_ready();
  progressed |= fire_due_timers();
  ring_.flush();
  progressed |= reap_completions();
  return progressed || !ready_.empty() || inbox_.ready();
}

auto Shard::run_ready() -> bool {
  std::deque<std::coroutine_handle<>> batch;
  batch.swap(ready_);
  while (auto h = inbox_.pop()) {
    batch.push_back(*h);
  }
  for (auto h : batch) {
    // Root frames free themselves, so the handle is dead after resume().
    if (h) {
      h.resume();
    }
  }
  return !batch.empty();
}

auto Shard::fire_due_timers() -> bool {
  const auto now = clock::now();
  bool fired = false;
  while (!fallback_.empty() && fallback_.begin()->first <= now) {
    auto* data = fallback_.begin()->second;
    fallback_.erase(fallback_.begin());
    complete_timer(data, -ETIME);
    fired = true;
  }
  return fired;
}

auto Shard::reap_completions() -> bool {
  auto seen = ring_.reap([this](void* tag, std::int32_t res, unsigned flags) {
    if (tag == reinterpret_cast<void*>(kWakeEventToken)) {
      consume_wakeups();
      if ((flags & IORING_CQE_F_MORE) == 0) {
        ring_.watch_wakeups(wake_fd_);
      }
    } else if (tag != nullptr) {
      complete_timer(static_cast<timer_data*>(tag), res);
    }
  });
  return seen > 0;
}

auto Shard::consume_wakeups() -> void {
  std::uint64_t count = 0;
  while (read(wake_fd_, &count, sizeof(count)) > 0) {
  }
}

auto Shard::idle() -> void {
  if (ring_.valid()) {
    ring_.flush();
    ring_.wait_for(kRingIdle);
    return;
  }
  auto nap = kFallbackNap;
  if (!fallback_.empty()) {
    auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
        fallback_.begin()->first - clock::now());
    nap = std::clamp(until, std::chrono::milliseconds(0), kFallbackNap);
  }
  std::this_thread::sleep_for(nap);
}

auto Shard::drain() -> void {
  for (auto h : ready_) {
    h.destroy();
  }
  ready_.clear();
  while (auto h = inbox_.pop()) {
    h->destroy();
  }
  for (auto* data : armed_) {
    if (auto* frame = std::exchange(data->coroutine, nullptr)) {
      std::coroutine_handle<>::from_address(frame).destroy();
    }
  }
  armed_.clear();
  fallback_.clear();
  armed_count_.store(0, std::memory_order_relaxed);
}

}  // namespace maestro
