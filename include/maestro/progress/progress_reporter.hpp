#pragma once

#include "maestro/core/error.hpp"
#include "maestro/task/task.hpp"
#include "maestro/task/task_registry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>

namespace maestro {

struct ProgressView {
  TaskId task_id;
  TaskState state{TaskState::Planning};
  std::size_t cursor{0};
  std::size_t total_steps{0};
  double percent_complete{0.0};
  std::optional<StepOutcome> last_outcome;
  std::size_t attempts{0};
  // Extrapolated from the wall time of finished steps; empty until one
  // step has finished, or when the task ended without completing.
  std::optional<std::chrono::milliseconds> eta;
};

// Read-only view over the registry. No clocks are read, so the same task
// state always yields the same view.
class ProgressReporter {
public:
  explicit ProgressReporter(const TaskRegistry& registry)
      : registry_(registry) {
  }

  [[nodiscard]] auto report(const TaskId& id) const -> Result<ProgressView>;

  [[nodiscard]] static auto view_of(const Task& task) -> ProgressView;

private:
  const TaskRegistry& registry_;
};

[[nodiscard]] auto to_json(const ProgressView& view) -> nlohmann::json;

}  // namespace maestro
