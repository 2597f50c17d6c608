#include "maestro/orchestrator/orchestrator.hpp"

#include "maestro/core/runtime.hpp"
#include "maestro/task/state_strings.hpp"
#include "maestro/util/log.hpp"

#include <exception>
#include <format>
#include <memory>
#include <optional>

namespace maestro {

namespace {

// Join point for the siblings of one parallel rank. The counter starts at
// n + 1 so the awaiting driver holds the last reference until it suspends.
// The driver resumes on the shard it dispatched from.
struct RankJoin {
  RankJoin(std::size_t n, Runtime& rt)
      : remaining(n + 1), results(n), runtime(&rt), home(rt.current_shard()) {
  }

  std::atomic<std::size_t> remaining;
  std::vector<Result<StepOutcome>> results;
  CancellationSource abort;
  std::coroutine_handle<> continuation;
  Runtime* runtime;
  shard_id home;

  auto arrive() -> void {
    if (remaining.fetch_sub(1, std::memory_order_acq_rel) != 1) {
      return;
    }
    if (home != kInvalidShard) {
      runtime->schedule_on(home, continuation);
    } else {
      runtime->schedule_external(continuation);
    }
  }
};

class rank_awaiter {
public:
  explicit rank_awaiter(std::shared_ptr<RankJoin> join) noexcept
      : join_(std::move(join)) {
  }

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }

  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool {
    join_->continuation = handle;
    return join_->remaining.fetch_sub(1, std::memory_order_acq_rel) != 1;
  }

  auto await_resume() const noexcept -> void {
  }

private:
  std::shared_ptr<RankJoin> join_;
};

auto run_sibling(StepExecutor* executor, std::shared_ptr<RankJoin> join,
                 std::size_t slot, TaskId id, Step step,
                 StepContext context) -> spawn_task {
  auto name = step.id.name;
  auto result = co_await executor->execute(id, std::move(step),
                                           std::move(context),
                                           join->abort.token());
  if (!result || result->terminal_failure()) {
    if (join->abort.cancel(name)) {
      log::debug(log::Fields{.task = id.value(), .step = name},
                 "failed, aborting its rank");
    }
  }
  join->results[slot] = std::move(result);
  join->arrive();
}

enum class Next : std::uint8_t {
  Stop,
  Dispatch,
};

}  // namespace

Orchestrator::Orchestrator(Runtime& runtime, TaskRegistry& registry,
                           StepExecutor& executor,
                           const CapabilityRegistry& capabilities,
                           IPlanner& planner, OrchestratorOptions options)
    : runtime_(runtime),
      registry_(registry),
      executor_(executor),
      capabilities_(capabilities),
      planner_(planner),
      options_(options),
      callbacks_(std::make_shared<const OrchestratorCallbacks>()) {
  executor_.set_outcome_listener(
      [this](const TaskId& id, const StepOutcome& outcome) {
        auto callbacks = current_callbacks();
        if (callbacks->on_step_outcome) {
          callbacks->on_step_outcome(id, outcome);
        }
      });
}

Orchestrator::~Orchestrator() {
  executor_.set_outcome_listener({});
}

auto Orchestrator::set_callbacks(OrchestratorCallbacks callbacks) -> void {
  auto next =
      std::make_shared<const OrchestratorCallbacks>(std::move(callbacks));
  std::lock_guard lock(callbacks_mu_);
  callbacks_ = std::move(next);
}

auto Orchestrator::current_callbacks() const
    -> std::shared_ptr<const OrchestratorCallbacks> {
  std::lock_guard lock(callbacks_mu_);
  return callbacks_;
}

auto Orchestrator::publish(const TaskId& id, TaskState from, TaskState to)
    -> void {
  if (from != to) {
    log::info(log::Fields{.task = id.value()}, "{} -> {}", from, to);
    auto callbacks = current_callbacks();
    if (callbacks->on_state_change) {
      callbacks->on_state_change(id, from, to);
    }
  }
  notify_waiters();
}

auto Orchestrator::notify_waiters() -> void {
  {
    std::lock_guard lock(wait_mu_);
  }
  wait_cv_.notify_all();
}

auto Orchestrator::validate(const Plan& plan) const -> Result<void> {
  if (plan.steps.empty()) {
    log::warn("Plan has no steps");
    return fail(Error::PlanningFailed);
  }
  for (const auto& step : plan.steps) {
    if (!capabilities_.contains(step.capability)) {
      log::warn("Step '{}' needs unknown capability '{}'", step.id.name,
                step.capability);
      return fail(Error::UnknownCapability);
    }
  }
  if (!ranks_ordered(plan)) {
    log::warn("Plan ranks are out of order");
    return fail(Error::PlanningFailed);
  }
  return ok();
}

auto Orchestrator::abandon(const TaskId& id) -> void {
  registry_.erase(id);
  log::debug("Task {} dropped after failed planning", id);
}

auto Orchestrator::submit_task(std::string objective) -> Result<TaskId> {
  if (shutting_down_.load(std::memory_order_acquire)) {
    return fail(Error::ShuttingDown);
  }

  auto id = registry_.create_task(objective);
  if (!id) {
    return fail(id.error());
  }

  Result<Plan> plan = fail(Error::PlanningFailed);
  try {
    plan = planner_.plan(objective);
  } catch (const std::exception& e) {
    log::error("Planner threw for '{}': {}", objective, e.what());
    plan = fail(Error::PlanningFailed);
  }
  if (!plan) {
    log::warn("Planning failed for '{}': {}", objective,
              plan.error().message());
    abandon(*id);
    return fail(Error::PlanningFailed);
  }

  for (std::size_t i = 0; i < plan->steps.size(); ++i) {
    auto& step_id = plan->steps[i].id;
    step_id.index = i;
    if (step_id.name.empty()) {
      step_id.name = std::format("step-{}", i);
    }
  }

  if (auto v = validate(*plan); !v) {
    abandon(*id);
    return fail(v.error());
  }

  auto steps = plan->steps.size();
  auto started = mutate(*id, [&plan](Task& t) -> Result<void> {
    if (auto r = t.transition(TaskState::Running); !r) {
      return r;
    }
    t.plan = std::move(*plan);
    write_checkpoint(t);
    return ok();
  });
  if (!started) {
    log::warn("Task {} could not start: {}", *id, started.error().message());
    return fail(started.error());
  }
  log::info("Task {} planned '{}' with {} step(s)", *id, objective, steps);

  if (options_.auto_start) {
    if (auto d = drive(*id); !d) {
      return fail(d.error());
    }
  }
  return id;
}

auto Orchestrator::drive(const TaskId& id) -> Result<void> {
  if (shutting_down_.load(std::memory_order_acquire)) {
    return fail(Error::ShuttingDown);
  }

  auto claimed = mutate(id, [](Task& t) -> Result<void> {
    if (t.state != TaskState::Running) {
      return fail(Error::InvalidTransition);
    }
    if (t.driver_active) {
      return fail(Error::AlreadyRunning);
    }
    t.driver_active = true;
    return ok();
  });
  if (!claimed) {
    return claimed;
  }

  active_drivers_.fetch_add(1, std::memory_order_acq_rel);
  runtime_.spawn(drive_loop(id));
  return ok();
}

auto Orchestrator::run_rank(TaskId id, std::vector<Step> steps,
                            StepContext context)
    -> task<std::vector<Result<StepOutcome>>> {
  std::vector<Result<StepOutcome>> results;
  if (steps.size() == 1) {
    results.push_back(co_await executor_.execute(
        std::move(id), std::move(steps.front()), std::move(context),
        CancellationToken::none()));
    co_return results;
  }

  auto join = std::make_shared<RankJoin>(steps.size(), runtime_);
  for (std::size_t i = 0; i < steps.size(); ++i) {
    runtime_.spawn(
        run_sibling(&executor_, join, i, id, std::move(steps[i]), context));
  }
  co_await rank_awaiter{join};
  co_return std::move(join->results);
}

auto Orchestrator::drive_loop(TaskId id) -> spawn_task {
  struct Guard {
    Orchestrator* self;
    ~Guard() {
      std::lock_guard lock(self->wait_mu_);
      self->active_drivers_.fetch_sub(1, std::memory_order_acq_rel);
      self->wait_cv_.notify_all();
    }
  } guard{this};

  log::debug(log::Fields{.task = id.value()}, "driver started");

  while (true) {
    std::size_t rank_end = 0;
    std::vector<Step> rank;
    StepContext context;

    auto boundary = mutate(id, [&](Task& t) -> Result<Next> {
      if (t.state != TaskState::Running) {
        t.interrupt = InterruptRequest::None;
        t.driver_active = false;
        return Next::Stop;
      }
      // Every step has settled; a late pause or cancel has nothing to stop.
      if (t.cursor >= t.total_steps()) {
        if (auto r = t.transition(TaskState::Completed); !r) {
          return fail(r.error());
        }
        t.interrupt = InterruptRequest::None;
        t.driver_active = false;
        return Next::Stop;
      }
      if (t.interrupt == InterruptRequest::Cancel) {
        if (auto r = t.transition(TaskState::Cancelled); !r) {
          return fail(r.error());
        }
        t.interrupt = InterruptRequest::None;
        t.driver_active = false;
        return Next::Stop;
      }
      if (t.interrupt == InterruptRequest::Pause) {
        if (auto r = t.transition(TaskState::Paused); !r) {
          return fail(r.error());
        }
        t.interrupt = InterruptRequest::None;
        t.driver_active = false;
        write_checkpoint(t);
        return Next::Stop;
      }

      rank_end = t.rank_end(t.cursor);
      rank.assign(t.plan.steps.begin() + static_cast<std::ptrdiff_t>(t.cursor),
                  t.plan.steps.begin() + static_cast<std::ptrdiff_t>(rank_end));
      context = std::make_shared<const nlohmann::json>(t.checkpoint);
      return Next::Dispatch;
    });
    if (!boundary) {
      log::error(log::Fields{.task = id.value()}, "driver stopped: {}",
                 boundary.error().message());
      break;
    }
    if (*boundary == Next::Stop) {
      break;
    }

    log::debug(log::Fields{.task = id.value()},
               "dispatching {} step(s) up to {}", rank.size(), rank_end);
    std::vector<StepId> rank_ids;
    rank_ids.reserve(rank.size());
    for (const auto& step : rank) {
      rank_ids.push_back(step.id);
    }

    auto results = co_await run_rank(id, std::move(rank), std::move(context));

    bool discarded = false;
    bool failed = false;
    std::vector<StepOutcome> hard_failures;
    for (std::size_t i = 0; i < results.size(); ++i) {
      const auto& r = results[i];
      if (!r) {
        hard_failures.push_back(StepOutcome{
            .step_id = rank_ids[i],
            .attempt = 1,
            .result = StepFailure{.kind = error_of(r.error()),
                                  .message = r.error().message(),
                                  .timed_out = false,
                                  .terminal = true},
            .started_at = Clock::now(),
            .finished_at = Clock::now()});
        failed = true;
      } else if (r->discarded) {
        discarded = true;
      } else if (r->terminal_failure()) {
        failed = true;
      }
    }

    auto settled = mutate(id, [&](Task& t) -> Result<Next> {
      if (t.interrupt == InterruptRequest::Cancel && (failed || discarded)) {
        // Settle as Cancelled at the boundary.
        return Next::Dispatch;
      }
      if (failed) {
        for (auto& outcome : hard_failures) {
          t.history.push_back(outcome);
        }
        t.interrupt = InterruptRequest::None;
        t.driver_active = false;
        if (auto r = t.transition(TaskState::Failed); !r) {
          return fail(r.error());
        }
        return Next::Stop;
      }
      if (discarded) {
        return Next::Dispatch;
      }

      for (const auto& r : results) {
        record_output(t, *r);
      }
      t.cursor = rank_end;
      write_checkpoint(t);
      return Next::Dispatch;
    });
    if (!settled) {
      log::error(log::Fields{.task = id.value()}, "driver stopped: {}",
                 settled.error().message());
      break;
    }
    if (*settled == Next::Stop) {
      break;
    }
  }

  log::debug(log::Fields{.task = id.value()}, "driver exited");
}

auto Orchestrator::wait(const TaskId& id, std::chrono::milliseconds timeout)
    -> Result<TaskState> {
  Result<TaskState> outcome = fail(Error::Timeout);
  auto settled = [&] {
    auto state = registry_.inspect(
        id, [](const Task& t) -> std::optional<TaskState> {
          if (t.terminal() ||
              (t.state == TaskState::Paused && !t.driver_active)) {
            return t.state;
          }
          return std::nullopt;
        });
    if (!state) {
      outcome = fail(state.error());
      return true;
    }
    if (*state) {
      outcome = **state;
      return true;
    }
    return false;
  };

  std::unique_lock lock(wait_mu_);
  if (!wait_cv_.wait_for(lock, timeout, settled)) {
    return fail(Error::Timeout);
  }
  return outcome;
}

auto Orchestrator::shutdown(std::chrono::milliseconds grace) -> void {
  if (shutting_down_.exchange(true)) {
    return;
  }
  std::unique_lock lock(wait_mu_);
  bool drained = wait_cv_.wait_for(lock, grace, [this] {
    return active_drivers_.load(std::memory_order_acquire) == 0;
  });
  if (!drained) {
    log::warn("Shutdown grace expired with {} driver(s) still active",
              active_drivers_.load());
  } else {
    log::debug("Orchestrator drained");
  }
}

}  // namespace maestro
