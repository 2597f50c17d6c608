#pragma once

#include "maestro/core/coroutine.hpp"
#include "maestro/core/error.hpp"
#include "maestro/executor/cancellation.hpp"
#include "maestro/executor/provider.hpp"
#include "maestro/task/task.hpp"
#include "maestro/task/task_registry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>

namespace maestro {

using OutcomeListener =
    std::function<void(const TaskId& task_id, const StepOutcome& outcome)>;

// Runs one step against its provider with retry, backoff and a per-attempt
// timeout. Every attempt lands in the task history before execute returns.
class StepExecutor {
public:
  StepExecutor(TaskRegistry& registry, const CapabilityRegistry& capabilities,
               std::chrono::milliseconds default_timeout);

  StepExecutor(const StepExecutor&) = delete;
  auto operator=(const StepExecutor&) -> StepExecutor& = delete;

  auto set_outcome_listener(OutcomeListener listener) -> void;

  // Resolves to the step's final outcome: a success, the terminal failure,
  // a skip, or an attempt discarded because the task is being cancelled.
  // Errors are reserved for hard failures such as UnknownCapability.
  [[nodiscard]] auto execute(TaskId task_id, Step step, StepContext context,
                             CancellationToken token)
      -> task<Result<StepOutcome>>;

  [[nodiscard]] auto default_timeout() const noexcept
      -> std::chrono::milliseconds {
    return default_timeout_;
  }

private:
  // Appends the outcome, marking it discarded when a cancel is pending.
  [[nodiscard]] auto record(const TaskId& task_id, StepOutcome& outcome)
      -> Result<void>;

  TaskRegistry& registry_;
  const CapabilityRegistry& capabilities_;
  std::chrono::milliseconds default_timeout_;
  OutcomeListener listener_;
};

}  // namespace maestro
