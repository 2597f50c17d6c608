#pragma once

#include "maestro/assessment/aggregator.hpp"
#include "maestro/config/config.hpp"
#include "maestro/core/error.hpp"
#include "maestro/core/runtime.hpp"
#include "maestro/executor/provider.hpp"
#include "maestro/executor/step_executor.hpp"
#include "maestro/orchestrator/interruption.hpp"
#include "maestro/orchestrator/orchestrator.hpp"
#include "maestro/orchestrator/planner.hpp"
#include "maestro/progress/progress_reporter.hpp"
#include "maestro/task/task_registry.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace maestro {

struct EngineOptions {
  bool builtin_providers{true};
  bool builtin_assessors{true};
  bool auto_start{true};
};

// Orchestration API facade. Owns the runtime and every component; planner,
// providers and assessors are injected.
class Engine {
public:
  Engine(Config config, std::shared_ptr<IPlanner> planner,
         EngineOptions options = {});
  ~Engine();

  Engine(const Engine&) = delete;
  auto operator=(const Engine&) -> Engine& = delete;

  // Lifecycle
  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Plug-ins; register before start.
  [[nodiscard]] auto capabilities() noexcept -> CapabilityRegistry& {
    return capabilities_;
  }
  [[nodiscard]] auto aggregator() noexcept -> AssessmentAggregator& {
    return aggregator_;
  }
  auto set_callbacks(OrchestratorCallbacks callbacks) -> void;

  // Task operations
  [[nodiscard]] auto submit_task(std::string objective) -> Result<TaskId>;
  [[nodiscard]] auto drive(const TaskId& id) -> Result<void>;
  [[nodiscard]] auto pause(const TaskId& id) -> Result<void>;
  [[nodiscard]] auto resume(const TaskId& id) -> Result<void>;
  [[nodiscard]] auto cancel(const TaskId& id) -> Result<void>;
  [[nodiscard]] auto wait(const TaskId& id,
                          std::chrono::milliseconds timeout)
      -> Result<TaskState>;

  // Queries
  [[nodiscard]] auto report(const TaskId& id) const -> Result<ProgressView>;
  [[nodiscard]] auto get_assessment(const TaskId& id)
      -> Result<AssessmentReport>;
  [[nodiscard]] auto get(const TaskId& id) const -> Result<Task>;
  [[nodiscard]] auto list(const TaskFilter& filter = {}) const
      -> Result<std::vector<TaskId>>;
  [[nodiscard]] auto remove(const TaskId& id) -> Result<void>;

  [[nodiscard]] auto config() const noexcept -> const Config& {
    return config_;
  }

private:
  Config config_;

  // Core runtime; declared first so it is destroyed last.
  Runtime runtime_;

  TaskRegistry registry_;
  CapabilityRegistry capabilities_;
  StepExecutor executor_;
  std::shared_ptr<IPlanner> planner_;
  Orchestrator orchestrator_;
  InterruptionController interruption_;
  AssessmentAggregator aggregator_;
  ProgressReporter progress_;

  std::atomic<bool> running_{false};
};

}  // namespace maestro
