#pragma once

#include "maestro/core/coroutine.hpp"
#include "maestro/core/error.hpp"
#include "maestro/executor/provider.hpp"
#include "maestro/executor/step_executor.hpp"
#include "maestro/orchestrator/planner.hpp"
#include "maestro/task/task.hpp"
#include "maestro/task/task_registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

namespace maestro {

class Runtime;

struct OrchestratorOptions {
  // Start the drive loop as soon as planning succeeds.
  bool auto_start{true};
};

struct OrchestratorCallbacks {
  std::function<void(const TaskId& id, TaskState from, TaskState to)>
      on_state_change;
  std::function<void(const TaskId& id, const StepOutcome& outcome)>
      on_step_outcome;
};

// Owns the task state machine: plans submitted objectives, drives their
// steps rank by rank and settles them into a terminal state.
class Orchestrator {
public:
  Orchestrator(Runtime& runtime, TaskRegistry& registry,
               StepExecutor& executor, const CapabilityRegistry& capabilities,
               IPlanner& planner, OrchestratorOptions options = {});
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  auto operator=(const Orchestrator&) -> Orchestrator& = delete;

  // Safe while drivers run; callbacks already in progress finish with the
  // previous set.
  auto set_callbacks(OrchestratorCallbacks callbacks) -> void;

  [[nodiscard]] auto submit_task(std::string objective) -> Result<TaskId>;

  // Claims the task's driver slot and schedules its drive loop.
  [[nodiscard]] auto drive(const TaskId& id) -> Result<void>;

  // Blocks until the task is terminal, or paused with no active driver.
  [[nodiscard]] auto wait(const TaskId& id, std::chrono::milliseconds timeout)
      -> Result<TaskState>;

  // Rejects new submissions and waits up to `grace` for drivers to exit.
  auto shutdown(std::chrono::milliseconds grace) -> void;

  [[nodiscard]] auto active_drivers() const noexcept -> int {
    return active_drivers_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto registry() noexcept -> TaskRegistry& {
    return registry_;
  }

  // Applies `fn` through the registry, then publishes any state change it
  // made and wakes waiters.
  template <typename F>
    requires std::invocable<F&, Task&>
  auto mutate(const TaskId& id, F&& fn) -> std::invoke_result_t<F&, Task&> {
    TaskState from{};
    TaskState to{};
    auto result = registry_.update(id, [&](Task& t) {
      from = t.state;
      auto r = fn(t);
      to = t.state;
      return r;
    });
    if (result) {
      publish(id, from, to);
    }
    return result;
  }

private:
  [[nodiscard]] auto current_callbacks() const
      -> std::shared_ptr<const OrchestratorCallbacks>;
  auto publish(const TaskId& id, TaskState from, TaskState to) -> void;
  auto notify_waiters() -> void;
  [[nodiscard]] auto validate(const Plan& plan) const -> Result<void>;
  auto abandon(const TaskId& id) -> void;

  auto drive_loop(TaskId id) -> spawn_task;
  auto run_rank(TaskId id, std::vector<Step> steps, StepContext context)
      -> task<std::vector<Result<StepOutcome>>>;

  Runtime& runtime_;
  TaskRegistry& registry_;
  StepExecutor& executor_;
  const CapabilityRegistry& capabilities_;
  IPlanner& planner_;
  OrchestratorOptions options_;
  mutable std::mutex callbacks_mu_;
  std::shared_ptr<const OrchestratorCallbacks> callbacks_;

  std::atomic<bool> shutting_down_{false};
  std::atomic<int> active_drivers_{0};

  mutable std::mutex wait_mu_;
  std::condition_variable wait_cv_;
};

}  // namespace maestro
