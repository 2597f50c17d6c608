#pragma once

#include "maestro/core/error.hpp"
#include "maestro/task/task.hpp"
#include "maestro/util/id.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace maestro {

struct TaskFilter {
  std::optional<TaskState> state;
  bool terminal_only{false};

  [[nodiscard]] auto matches(const Task& task) const noexcept -> bool {
    if (state && task.state != *state)
      return false;
    return !terminal_only || task.terminal();
  }
};

// Thread-safe store of task records. The index lock guards only the
// id -> entry map; each entry carries its own mutex for mutation.
class TaskRegistry {
public:
  explicit TaskRegistry(std::size_t max_tasks = 1024);

  TaskRegistry(const TaskRegistry&) = delete;
  auto operator=(const TaskRegistry&) -> TaskRegistry& = delete;

  [[nodiscard]] auto create_task(std::string objective) -> Result<TaskId>;

  [[nodiscard]] auto get(const TaskId& id) const -> Result<Task>;

  // Runs `fn` on the record in place under the task's lock. When `fn`
  // fails, the scalar fields and any history it appended are rolled back.
  // Plan and checkpoint writes are kept, so `fn` makes them only after its
  // last fallible call. `fn` must return a Result.
  template <typename F>
    requires std::invocable<F&, Task&>
  auto update(const TaskId& id, F&& fn) -> std::invoke_result_t<F&, Task&> {
    auto entry = find(id);
    if (!entry) {
      return fail(Error::NotFound);
    }
    std::lock_guard lock(entry->mu);
    auto& task = entry->task;
    const auto saved = Rollback::of(task);
    auto result = fn(task);
    if (result) {
      task.updated_at = Clock::now();
    } else {
      saved.restore(task);
    }
    return result;
  }

  // Reads a record under its lock without copying it.
  template <typename F>
    requires std::invocable<F&, const Task&>
  auto inspect(const TaskId& id, F&& fn) const
      -> Result<std::invoke_result_t<F&, const Task&>> {
    auto entry = find(id);
    if (!entry) {
      return fail(Error::NotFound);
    }
    std::lock_guard lock(entry->mu);
    return fn(std::as_const(entry->task));
  }

  [[nodiscard]] auto list(const TaskFilter& filter = {}) const
      -> std::vector<TaskId>;

  // Only terminal tasks can be removed.
  [[nodiscard]] auto remove(const TaskId& id) -> Result<void>;

  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return max_tasks_;
  }

private:
  struct Rollback {
    TaskState state;
    std::size_t cursor;
    bool driver_active;
    InterruptRequest interrupt;
    std::size_t history_size;
    Clock::time_point updated_at;

    static auto of(const Task& t) -> Rollback {
      return {t.state,     t.cursor,         t.driver_active,
              t.interrupt, t.history.size(), t.updated_at};
    }

    auto restore(Task& t) const -> void {
      t.state = state;
      t.cursor = cursor;
      t.driver_active = driver_active;
      t.interrupt = interrupt;
      t.updated_at = updated_at;
      if (t.history.size() > history_size) {
        t.history.erase(t.history.begin() +
                            static_cast<std::ptrdiff_t>(history_size),
                        t.history.end());
      }
    }
  };

  struct Entry {
    mutable std::mutex mu;
    Task task;
  };

  [[nodiscard]] auto find(const TaskId& id) const -> std::shared_ptr<Entry>;

  // Used only to roll back a task whose planning failed.
  auto erase(const TaskId& id) -> void;
  friend class Orchestrator;

  std::size_t max_tasks_;
  mutable std::shared_mutex index_mu_;
  std::unordered_map<TaskId, std::shared_ptr<Entry>> index_;
};

}  // namespace maestro
