#include "maestro/app/engine.hpp"

#include "maestro/assessment/builtin_assessors.hpp"
#include "maestro/executor/builtin_providers.hpp"
#include "maestro/util/log.hpp"

namespace maestro {

Engine::Engine(Config config, std::shared_ptr<IPlanner> planner,
               EngineOptions options)
    : config_(std::move(config)),
      runtime_(config_.engine.shards),
      registry_(config_.engine.max_tasks),
      executor_(registry_, capabilities_,
                std::chrono::milliseconds(config_.engine.step_timeout_ms)),
      planner_(std::move(planner)),
      orchestrator_(runtime_, registry_, executor_, capabilities_, *planner_,
                    OrchestratorOptions{.auto_start = options.auto_start}),
      interruption_(orchestrator_),
      aggregator_(config_.assessment),
      progress_(registry_) {
  if (options.builtin_providers) {
    register_builtin_providers(capabilities_);
  }
  if (options.builtin_assessors) {
    register_builtin_assessors(
        aggregator_,
        std::chrono::milliseconds(config_.assessment.latency_budget_ms));
  }
}

Engine::~Engine() {
  stop();
}

auto Engine::start() -> void {
  if (running_.exchange(true))
    return;
  log::set_level(config_.engine.log_level);
  runtime_.start();
  log::info("Engine started with {} shard(s), capacity {} task(s)",
            runtime_.shard_count(), registry_.capacity());
}

auto Engine::stop() -> void {
  if (!running_.exchange(false))
    return;

  log::info("Stopping engine...");
  orchestrator_.shutdown(
      std::chrono::milliseconds(config_.engine.shutdown_grace_ms));
  runtime_.stop();
  log::info("Engine stopped");
}

auto Engine::is_running() const noexcept -> bool {
  return running_.load();
}

auto Engine::set_callbacks(OrchestratorCallbacks callbacks) -> void {
  orchestrator_.set_callbacks(std::move(callbacks));
}

auto Engine::submit_task(std::string objective) -> Result<TaskId> {
  return orchestrator_.submit_task(std::move(objective));
}

auto Engine::drive(const TaskId& id) -> Result<void> {
  return orchestrator_.drive(id);
}

auto Engine::pause(const TaskId& id) -> Result<void> {
  return interruption_.pause(id);
}

auto Engine::resume(const TaskId& id) -> Result<void> {
  return interruption_.resume(id);
}

auto Engine::cancel(const TaskId& id) -> Result<void> {
  return interruption_.cancel(id);
}

auto Engine::wait(const TaskId& id, std::chrono::milliseconds timeout)
    -> Result<TaskState> {
  return orchestrator_.wait(id, timeout);
}

auto Engine::report(const TaskId& id) const -> Result<ProgressView> {
  return progress_.report(id);
}

auto Engine::get_assessment(const TaskId& id) -> Result<AssessmentReport> {
  auto task = registry_.get(id);
  if (!task) {
    return fail(task.error());
  }
  if (task->state != TaskState::Completed) {
    return fail(Error::InvalidTransition);
  }
  return aggregator_.aggregate(*task);
}

auto Engine::get(const TaskId& id) const -> Result<Task> {
  return registry_.get(id);
}

auto Engine::list(const TaskFilter& filter) const
    -> Result<std::vector<TaskId>> {
  return ok(registry_.list(filter));
}

auto Engine::remove(const TaskId& id) -> Result<void> {
  if (auto r = registry_.remove(id); !r) {
    return r;
  }
  aggregator_.forget(id);
  return ok();
}

}  // namespace maestro
