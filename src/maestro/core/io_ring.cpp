#include "maestro/core/io_ring.hpp"

#include "maestro/util/log.hpp"

#include <cstring>

#include <poll.h>

namespace maestro {

IoRing::IoRing() : ready_(io_uring_queue_init(kEntries, &ring_, 0) == 0) {
}

IoRing::~IoRing() {
  if (ready_) {
    io_uring_queue_exit(&ring_);
  }
}

auto IoRing::next_sqe() -> io_uring_sqe* {
  if (!ready_) {
    return nullptr;
  }
  auto* sqe = io_uring_get_sqe(&ring_);
  if (sqe == nullptr) {
    // Submission queue full: push what is queued and try once more.
    flush();
    sqe = io_uring_get_sqe(&ring_);
  }
  if (sqe != nullptr) {
    ++queued_;
  }
  return sqe;
}

auto IoRing::arm_timeout(timer_data* data) -> bool {
  auto* sqe = next_sqe();
  if (sqe == nullptr) {
    return false;
  }
  io_uring_prep_timeout(sqe, &data->ts, 0, 0);
  io_uring_sqe_set_data(sqe, data);
  return true;
}

auto IoRing::remove_timeout(timer_data* data) -> bool {
  auto* sqe = next_sqe();
  if (sqe == nullptr) {
    return false;
  }
  io_uring_prep_timeout_remove(sqe, reinterpret_cast<std::uint64_t>(data), 0);
  io_uring_sqe_set_data(sqe, nullptr);
  return true;
}

auto IoRing::watch_wakeups(int fd) -> void {
  if (fd < 0) {
    return;
  }
  auto* sqe = next_sqe();
  if (sqe == nullptr) {
    return;
  }
  io_uring_prep_poll_multishot(sqe, fd, POLLIN);
  io_uring_sqe_set_data(sqe, reinterpret_cast<void*>(kWakeEventToken));
  flush();
}

auto IoRing::flush() -> void {
  if (queued_ == 0) {
    return;
  }
  queued_ = 0;
  if (auto rc = io_uring_submit(&ring_); rc < 0) {
    log::warn("io_uring submit failed: {}", std::strerror(-rc));
  }
}

auto IoRing::wait_for(std::chrono::milliseconds limit) -> void {
  if (!ready_) {
    return;
  }
  auto ts = to_timespec(limit);
  io_uring_cqe* cqe = nullptr;
  // Only used to block; completions are reaped by the shard loop.
  (void)io_uring_wait_cqe_timeout(&ring_, &cqe, &ts);
}

}  // namespace maestro
