#pragma once

#include <chrono>
#include <cstdint>

#include <liburing.h>

namespace maestro {

using shard_id = unsigned;
inline constexpr shard_id kInvalidShard = ~0u;

// Tag of the multishot poll on a shard's wake eventfd.
inline constexpr std::uintptr_t kWakeEventToken = 0x1;

// One armed sleep. Lives in the sleeping coroutine's frame and is owned by
// the shard that armed it until the timer completes or is cancelled.
struct timer_data {
  void* coroutine = nullptr;
  std::int32_t result = 0;
  __kernel_timespec ts{};
  std::chrono::steady_clock::time_point deadline{};
  // Submitted to io_uring rather than kept in the shard's fallback set.
  bool in_ring = false;
};

// The slice of io_uring a shard needs: relative timeouts, their removal and
// the wake poll. Every call is made from the owning shard thread.
class IoRing {
public:
  static constexpr unsigned kEntries = 256;

  IoRing();
  ~IoRing();

  IoRing(const IoRing&) = delete;
  IoRing& operator=(const IoRing&) = delete;

  [[nodiscard]] auto valid() const noexcept -> bool {
    return ready_;
  }

  [[nodiscard]] auto arm_timeout(timer_data* data) -> bool;
  // The timer's own completion then arrives with -ECANCELED.
  [[nodiscard]] auto remove_timeout(timer_data* data) -> bool;
  auto watch_wakeups(int fd) -> void;

  auto flush() -> void;
  auto wait_for(std::chrono::milliseconds limit) -> void;

  // Hands each completion's tag, result and flags to `fn`.
  template <typename Fn>
  auto reap(Fn&& fn) -> unsigned {
    if (!ready_) {
      return 0;
    }
    unsigned head = 0;
    unsigned seen = 0;
    io_uring_cqe* cqe = nullptr;
    io_uring_for_each_cqe(&ring_, head, cqe) {
      fn(io_uring_cqe_get_data(cqe), cqe->res, cqe->flags);
      ++seen;
    }
    io_uring_cq_advance(&ring_, seen);
    return seen;
  }

private:
  [[nodiscard]] auto next_sqe() -> io_uring_sqe*;

  io_uring ring_{};
  bool ready_ = false;
  unsigned queued_ = 0;
};

[[nodiscard]] constexpr auto to_timespec(std::chrono::milliseconds d) noexcept
    -> __kernel_timespec {
  return {.tv_sec = d.count() / 1000, .tv_nsec = (d.count() % 1000) * 1000000};
}

}  // namespace maestro
