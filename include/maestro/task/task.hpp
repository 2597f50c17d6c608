#pragma once

#include "maestro/core/error.hpp"
#include "maestro/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace maestro {

using Clock = std::chrono::system_clock;

enum class TaskState : std::uint8_t {
  Planning,
  Running,
  Paused,
  Completed,
  Failed,
  Cancelled,
};

[[nodiscard]] constexpr auto is_terminal(TaskState state) noexcept -> bool {
  return state == TaskState::Completed || state == TaskState::Failed ||
         state == TaskState::Cancelled;
}

// Planning -> Running, Running <-> Paused, Running -> Completed|Failed,
// any non-terminal -> Cancelled.
[[nodiscard]] constexpr auto can_transition(TaskState from,
                                            TaskState to) noexcept -> bool {
  switch (to) {
    case TaskState::Running:
      return from == TaskState::Planning || from == TaskState::Paused;
    case TaskState::Paused:
    case TaskState::Completed:
    case TaskState::Failed:
      return from == TaskState::Running;
    case TaskState::Cancelled:
      return !is_terminal(from);
    case TaskState::Planning:
      return false;
  }
  return false;
}

enum class ExhaustionPolicy : std::uint8_t {
  Fail,
  Skip,
};

enum class InterruptRequest : std::uint8_t {
  None,
  Pause,
  Cancel,
};

struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds base_delay{100};
  std::chrono::milliseconds max_delay{5000};
  ExhaustionPolicy on_exhaustion{ExhaustionPolicy::Fail};

  // Delay before attempt `failed_attempts + 1`.
  [[nodiscard]] auto backoff(int failed_attempts) const noexcept
      -> std::chrono::milliseconds;
};

struct StepId {
  std::size_t index{0};
  std::string name;

  auto operator==(const StepId& other) const -> bool = default;
};

struct Step {
  StepId id;
  std::string capability;
  nlohmann::json input;
  RetryPolicy retry;
  int rank{0};
  // Zero means the engine-wide default.
  std::chrono::milliseconds timeout{0};
};

struct Plan {
  std::vector<Step> steps;
  bool parallel{false};
};

struct StepSuccess {
  nlohmann::json output;
};

struct StepFailure {
  Error kind{Error::ProviderError};
  std::string message;
  bool timed_out{false};
  bool terminal{false};
};

struct StepSkipped {
  std::string reason;
};

using StepResult = std::variant<StepSuccess, StepFailure, StepSkipped>;

struct StepOutcome {
  StepId step_id;
  int attempt{1};
  StepResult result;
  Clock::time_point started_at{};
  Clock::time_point finished_at{};
  bool discarded{false};

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return std::holds_alternative<StepSuccess>(result);
  }
  [[nodiscard]] auto skipped() const noexcept -> bool {
    return std::holds_alternative<StepSkipped>(result);
  }
  [[nodiscard]] auto failure() const noexcept -> const StepFailure* {
    return std::get_if<StepFailure>(&result);
  }
  [[nodiscard]] auto terminal_failure() const noexcept -> bool {
    auto* f = failure();
    return f != nullptr && f->terminal;
  }
  [[nodiscard]] auto duration() const noexcept -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(finished_at -
                                                                 started_at);
  }
};

struct Task {
  TaskId id;
  std::string objective;
  Plan plan;
  TaskState state{TaskState::Planning};
  std::size_t cursor{0};
  nlohmann::json checkpoint = nlohmann::json::object();
  Clock::time_point created_at{};
  Clock::time_point updated_at{};
  std::vector<StepOutcome> history;

  // Driver bookkeeping, owned by the orchestrator.
  bool driver_active{false};
  InterruptRequest interrupt{InterruptRequest::None};

  [[nodiscard]] auto total_steps() const noexcept -> std::size_t {
    return plan.steps.size();
  }
  [[nodiscard]] auto terminal() const noexcept -> bool {
    return is_terminal(state);
  }
  [[nodiscard]] auto has_terminal_failure() const noexcept -> bool;

  // One past the last step of the rank starting at `begin`. Sequential
  // plans dispatch one step per rank.
  [[nodiscard]] auto rank_end(std::size_t begin) const noexcept
      -> std::size_t;

  // Applies a validated transition and stamps updated_at.
  [[nodiscard]] auto transition(TaskState to) -> Result<void>;
};

// Stores the cursor in the checkpoint, keeping recorded outputs.
auto write_checkpoint(Task& task) -> void;
// Adds a successful step's output to the checkpoint.
auto record_output(Task& task, const StepOutcome& outcome) -> void;

// Step ranks must be non-decreasing along the plan.
[[nodiscard]] auto ranks_ordered(const Plan& plan) noexcept -> bool;

[[nodiscard]] auto to_json(const StepOutcome& outcome) -> nlohmann::json;
[[nodiscard]] auto to_json(const Task& task) -> nlohmann::json;

}  // namespace maestro
