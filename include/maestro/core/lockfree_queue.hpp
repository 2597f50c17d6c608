#pragma once

#include <algorithm>
#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace maestro {

// Fixed-size ring with many producers and exactly one consumer: a shard's
// inbox or the log writer. Each cell carries a turn counter; a producer
// claims a ticket and may fill the cell once its turn comes round, the
// consumer empties it and hands the cell to the next lap.
template <typename T>
class MpscRing {
public:
  explicit MpscRing(std::size_t min_capacity)
      : cells_(std::bit_ceil(std::max<std::size_t>(min_capacity, 2))),
        mask_(cells_.size() - 1) {
    for (std::size_t i = 0; i < cells_.size(); ++i) {
      cells_[i].turn.store(i, std::memory_order_relaxed);
    }
  }

  MpscRing(const MpscRing&) = delete;
  MpscRing& operator=(const MpscRing&) = delete;

  // Any thread. False when the ring is full.
  [[nodiscard]] auto try_push(T value) -> bool {
    auto ticket = enqueued_.load(std::memory_order_relaxed);
    for (;;) {
      auto& cell = cells_[ticket & mask_];
      auto turn = cell.turn.load(std::memory_order_acquire);
      if (turn == ticket) {
        if (enqueued_.compare_exchange_weak(ticket, ticket + 1,
                                            std::memory_order_relaxed)) {
          cell.value.emplace(std::move(value));
          cell.turn.store(ticket + 1, std::memory_order_release);
          return true;
        }
      } else if (turn < ticket) {
        return false;
      } else {
        ticket = enqueued_.load(std::memory_order_relaxed);
      }
    }
  }

  // Consumer thread only.
  [[nodiscard]] auto pop() -> std::optional<T> {
    auto& cell = cells_[dequeued_ & mask_];
    if (cell.turn.load(std::memory_order_acquire) != dequeued_ + 1) {
      return std::nullopt;
    }
    std::optional<T> out{std::move(cell.value)};
    cell.value.reset();
    cell.turn.store(dequeued_ + cells_.size(), std::memory_order_release);
    ++dequeued_;
    return out;
  }

  // Consumer thread only. Moves up to `max` values into `out` in FIFO order
  // and returns how many were taken.
  auto drain_into(std::vector<T>& out, std::size_t max) -> std::size_t {
    std::size_t taken = 0;
    while (taken < max) {
      auto value = pop();
      if (!value) {
        break;
      }
      out.push_back(std::move(*value));
      ++taken;
    }
    return taken;
  }

  // Consumer thread only: whether the next pop() would succeed.
  [[nodiscard]] auto ready() const -> bool {
    const auto& cell = cells_[dequeued_ & mask_];
    return cell.turn.load(std::memory_order_acquire) == dequeued_ + 1;
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return cells_.size();
  }

private:
  struct Cell {
    std::atomic<std::uint64_t> turn{0};
    std::optional<T> value;
  };

  std::vector<Cell> cells_;
  std::size_t mask_;
  alignas(64) std::atomic<std::uint64_t> enqueued_{0};
  alignas(64) std::uint64_t dequeued_ = 0;
};

}  // namespace maestro
