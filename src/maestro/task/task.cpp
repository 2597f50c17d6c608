#include "maestro/task/task.hpp"

#include "maestro/task/state_strings.hpp"

#include <algorithm>
#include <concepts>
#include <ranges>

namespace maestro {

namespace {

auto epoch_ms(Clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace

auto RetryPolicy::backoff(int failed_attempts) const noexcept
    -> std::chrono::milliseconds {
  if (failed_attempts < 1 || base_delay.count() <= 0) {
    return std::chrono::milliseconds{0};
  }
  auto delay = base_delay;
  for (int i = 1; i < failed_attempts && delay < max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, max_delay);
}

auto Task::has_terminal_failure() const noexcept -> bool {
  return std::ranges::any_of(history, [](const StepOutcome& o) {
    return !o.discarded && o.terminal_failure();
  });
}

auto Task::rank_end(std::size_t begin) const noexcept -> std::size_t {
  const auto& steps = plan.steps;
  if (begin >= steps.size()) {
    return steps.size();
  }
  if (!plan.parallel) {
    return begin + 1;
  }
  auto end = begin + 1;
  while (end < steps.size() && steps[end].rank == steps[begin].rank) {
    ++end;
  }
  return end;
}

auto Task::transition(TaskState to) -> Result<void> {
  if (!can_transition(state, to)) {
    return fail(Error::InvalidTransition);
  }
  state = to;
  updated_at = Clock::now();
  return ok();
}

auto write_checkpoint(Task& task) -> void {
  if (!task.checkpoint.is_object()) {
    task.checkpoint = nlohmann::json::object();
  }
  task.checkpoint["cursor"] = task.cursor;
  if (!task.checkpoint.contains("outputs")) {
    task.checkpoint["outputs"] = nlohmann::json::object();
  }
}

auto record_output(Task& task, const StepOutcome& outcome) -> void {
  const auto* success = std::get_if<StepSuccess>(&outcome.result);
  if (success == nullptr) {
    return;
  }
  write_checkpoint(task);
  task.checkpoint["outputs"][outcome.step_id.name] = success->output;
}

auto ranks_ordered(const Plan& plan) noexcept -> bool {
  return std::ranges::is_sorted(plan.steps, {}, &Step::rank);
}

auto to_json(const StepOutcome& outcome) -> nlohmann::json {
  nlohmann::json j = {{"step", outcome.step_id.name},
                      {"index", outcome.step_id.index},
                      {"attempt", outcome.attempt},
                      {"started_at", epoch_ms(outcome.started_at)},
                      {"finished_at", epoch_ms(outcome.finished_at)},
                      {"discarded", outcome.discarded}};

  std::visit(
      [&j](const auto& r) {
        using R = std::decay_t<decltype(r)>;
        if constexpr (std::same_as<R, StepSuccess>) {
          j["result"] = "success";
          j["output"] = r.output;
        } else if constexpr (std::same_as<R, StepFailure>) {
          j["result"] = "failure";
          j["error"] = make_error_code(r.kind).message();
          j["message"] = r.message;
          j["timed_out"] = r.timed_out;
          j["terminal"] = r.terminal;
        } else {
          j["result"] = "skipped";
          j["reason"] = r.reason;
        }
      },
      outcome.result);
  return j;
}

auto to_json(const Task& task) -> nlohmann::json {
  auto steps = nlohmann::json::array();
  for (const auto& step : task.plan.steps) {
    steps.push_back({{"name", step.id.name},
                     {"capability", step.capability},
                     {"rank", step.rank},
                     {"max_attempts", step.retry.max_attempts},
                     {"on_exhaustion",
                      exhaustion_policy_name(step.retry.on_exhaustion)}});
  }

  auto history = nlohmann::json::array();
  for (const auto& outcome : task.history) {
    history.push_back(to_json(outcome));
  }

  return {{"id", task.id.str()},
          {"objective", task.objective},
          {"state", task_state_name(task.state)},
          {"parallel", task.plan.parallel},
          {"cursor", task.cursor},
          {"total_steps", task.total_steps()},
          {"checkpoint", task.checkpoint},
          {"created_at", epoch_ms(task.created_at)},
          {"updated_at", epoch_ms(task.updated_at)},
          {"steps", std::move(steps)},
          {"history", std::move(history)}};
}

}  // namespace maestro
