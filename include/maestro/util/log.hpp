#pragma once

#include "maestro/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace maestro::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  switch (level) {
  case Level::Trace:
    return "TRACE";
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  }
  return "?";
}

// Unrecognised names map to Info.
[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

// What a line is about. Empty members are left out of the output.
struct Fields {
  std::string_view task;
  std::string_view step;
  int attempt = 0;
};

struct Record {
  Level level = Level::Info;
  std::chrono::system_clock::time_point time;
  std::string thread;
  std::string task;
  std::string step;
  int attempt = 0;
  std::string message;
};

// 2026-01-01 12:00:00.000 WARN  [shard-0] task=<id> step=fetch#2 message
[[nodiscard]] inline auto format_record(const Record& r) -> std::string {
  auto out = std::format(
      "{:%F %T} {:<5}",
      std::chrono::floor<std::chrono::milliseconds>(r.time),
      level_name(r.level));
  if (!r.thread.empty()) {
    std::format_to(std::back_inserter(out), " [{}]", r.thread);
  }
  if (!r.task.empty()) {
    std::format_to(std::back_inserter(out), " task={}", r.task);
  }
  if (!r.step.empty()) {
    std::format_to(std::back_inserter(out), " step={}", r.step);
    if (r.attempt > 0) {
      std::format_to(std::back_inserter(out), "#{}", r.attempt);
    }
  }
  std::format_to(std::back_inserter(out), " {}\n", r.message);
  return out;
}

using Sink = std::function<void(const Record&)>;

namespace detail {
inline thread_local std::string thread_tag;
}  // namespace detail

// Names the calling thread in every line it logs, e.g. "shard-3".
inline auto set_thread_tag(std::string tag) -> void {
  detail::thread_tag = std::move(tag);
}

// Records are built on the caller's thread and handed to the sink by one
// writer thread. Before start(), after stop() and whenever the queue is
// full, the caller delivers its own record.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;
  static constexpr auto kWriterNap = std::chrono::microseconds(200);

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  MpscRing<Record> queue_{kQueueCapacity};
  std::thread writer_;

  std::mutex sink_mu_;
  Sink sink_;

  auto deliver(const Record& r) -> void {
    std::lock_guard lock(sink_mu_);
    if (sink_) {
      sink_(r);
    } else {
      std::print(stderr, "{}", format_record(r));
    }
  }

  auto writer_loop() -> void {
    std::vector<Record> batch;
    batch.reserve(kBatchSize);
    for (;;) {
      bool live = running_.load(std::memory_order_acquire);
      batch.clear();
      if (queue_.drain_into(batch, kBatchSize) == 0) {
        if (!live) {
          return;
        }
        std::this_thread::sleep_for(kWriterNap);
        continue;
      }
      for (const auto& r : batch) {
        deliver(r);
      }
    }
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  // Flushes everything already queued.
  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);
    if (!running_.exchange(false))
      return;
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // An empty sink restores plain stderr output.
  auto set_sink(Sink sink) -> void {
    std::lock_guard lock(sink_mu_);
    sink_ = std::move(sink);
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= level_.load(std::memory_order_acquire);
  }

  auto submit(Record r) -> void {
    if (accepting_.load(std::memory_order_acquire)) {
      // try_push consumes its argument, so keep a copy for the fallback.
      if (queue_.try_push(r)) {
        return;
      }
    }
    deliver(r);
  }

  template <typename... Args>
  auto log(Level level, const Fields& fields, std::format_string<Args...> fmt,
           Args&&... args) -> void {
    if (!enabled(level))
      return;
    submit(Record{.level = level,
                  .time = std::chrono::system_clock::now(),
                  .thread = detail::thread_tag,
                  .task = std::string(fields.task),
                  .step = std::string(fields.step),
                  .attempt = fields.attempt,
                  .message = std::format(fmt, std::forward<Args>(args)...)});
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_sink(Sink sink) -> void {
  logger().set_sink(std::move(sink));
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, {}, fmt, std::forward<Args>(args)...);
}
template <typename... Args>
auto trace(const Fields& f, std::format_string<Args...> fmt, Args&&... args)
    -> void {
  logger().log(Level::Trace, f, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, {}, fmt, std::forward<Args>(args)...);
}
template <typename... Args>
auto debug(const Fields& f, std::format_string<Args...> fmt, Args&&... args)
    -> void {
  logger().log(Level::Debug, f, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, {}, fmt, std::forward<Args>(args)...);
}
template <typename... Args>
auto info(const Fields& f, std::format_string<Args...> fmt, Args&&... args)
    -> void {
  logger().log(Level::Info, f, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, {}, fmt, std::forward<Args>(args)...);
}
template <typename... Args>
auto warn(const Fields& f, std::format_string<Args...> fmt, Args&&... args)
    -> void {
  logger().log(Level::Warn, f, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, {}, fmt, std::forward<Args>(args)...);
}
template <typename... Args>
auto error(const Fields& f, std::format_string<Args...> fmt, Args&&... args)
    -> void {
  logger().log(Level::Error, f, fmt, std::forward<Args>(args)...);
}

}  // namespace maestro::log
