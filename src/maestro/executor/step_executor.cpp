#include "maestro/executor/step_executor.hpp"

#include "maestro/core/runtime.hpp"
#include "maestro/util/log.hpp"

#include <algorithm>
#include <format>
#include <string>

namespace maestro {

namespace {

auto at(const TaskId& id, const Step& step, int attempt = 0) -> log::Fields {
  return {.task = id.value(), .step = step.id.name, .attempt = attempt};
}

}  // namespace

StepExecutor::StepExecutor(TaskRegistry& registry,
                           const CapabilityRegistry& capabilities,
                           std::chrono::milliseconds default_timeout)
    : registry_(registry),
      capabilities_(capabilities),
      default_timeout_(default_timeout) {
}

auto StepExecutor::set_outcome_listener(OutcomeListener listener) -> void {
  listener_ = std::move(listener);
}

auto StepExecutor::record(const TaskId& task_id, StepOutcome& outcome)
    -> Result<void> {
  auto r = registry_.update(task_id, [&outcome](Task& t) -> Result<void> {
    if (t.interrupt == InterruptRequest::Cancel ||
        t.state == TaskState::Cancelled) {
      outcome.discarded = true;
    }
    t.history.push_back(outcome);
    return ok();
  });
  if (r && listener_) {
    listener_(task_id, outcome);
  }
  return r;
}

auto StepExecutor::execute(TaskId task_id, Step step, StepContext context,
                           CancellationToken token)
    -> task<Result<StepOutcome>> {
  auto provider = capabilities_.find(step.capability);
  if (!provider) {
    log::error(at(task_id, step), "unknown capability '{}'", step.capability);
    co_return fail(Error::UnknownCapability);
  }

  auto timeout = step.timeout.count() > 0 ? step.timeout : default_timeout_;
  int max_attempts = std::max(1, step.retry.max_attempts);

  for (int attempt = 1;; ++attempt) {
    if (attempt > 1) {
      auto delay = step.retry.backoff(attempt - 1);
      log::warn(at(task_id, step, attempt), "retrying in {}ms ({} allowed)",
                delay.count(), max_attempts);
      co_await async_sleep(delay);

      auto cancelling = registry_.inspect(task_id, [](const Task& t) {
        return t.interrupt == InterruptRequest::Cancel ||
               t.state == TaskState::Cancelled;
      });
      if (!cancelling) {
        co_return fail(cancelling.error());
      }
      if (*cancelling) {
        log::debug(at(task_id, step, attempt), "cancelled during backoff");
        StepOutcome dropped{.step_id = step.id,
                            .attempt = attempt,
                            .result = StepSkipped{"task cancelled"},
                            .started_at = Clock::now(),
                            .finished_at = Clock::now()};
        if (auto r = record(task_id, dropped); !r) {
          co_return fail(r.error());
        }
        co_return dropped;
      }
    }

    if (token.is_cancelled()) {
      auto reason = token.cause().empty()
                        ? std::string("rank aborted")
                        : std::format("rank aborted by '{}'", token.cause());
      log::debug(at(task_id, step, attempt), "skipped, {}", reason);
      StepOutcome skipped{.step_id = step.id,
                          .attempt = attempt,
                          .result = StepSkipped{std::move(reason)},
                          .started_at = Clock::now(),
                          .finished_at = Clock::now()};
      if (auto r = record(task_id, skipped); !r) {
        co_return fail(r.error());
      }
      co_return skipped;
    }

    log::debug(at(task_id, step, attempt), "invoking '{}'", step.capability);

    ProviderRequest request{.task_id = task_id,
                            .step_id = step.id,
                            .attempt = attempt,
                            .input = step.input,
                            .context = context,
                            .timeout = timeout};

    StepOutcome outcome{.step_id = step.id, .attempt = attempt};
    outcome.started_at = Clock::now();
    auto result = co_await invoke_async(provider, std::move(request));
    outcome.finished_at = Clock::now();

    bool exhausted = attempt >= max_attempts;
    if (result.ok()) {
      outcome.result = StepSuccess{std::move(result.output)};
    } else {
      outcome.result =
          StepFailure{.kind = Error::ProviderError,
                      .message = std::move(result.error),
                      .timed_out = result.timed_out,
                      .terminal = exhausted && step.retry.on_exhaustion ==
                                                   ExhaustionPolicy::Fail};
    }

    if (auto r = record(task_id, outcome); !r) {
      co_return fail(r.error());
    }

    if (outcome.discarded || outcome.succeeded()) {
      co_return outcome;
    }

    const auto* failure = outcome.failure();
    if (!exhausted) {
      log::warn(at(task_id, step, attempt), "failed: {}", failure->message);
      continue;
    }

    if (failure->terminal) {
      log::error(at(task_id, step, attempt), "failed for good: {}",
                 failure->message);
      co_return outcome;
    }

    StepOutcome skipped{.step_id = step.id,
                        .attempt = attempt,
                        .result = StepSkipped{"retries exhausted"},
                        .started_at = outcome.finished_at,
                        .finished_at = Clock::now()};
    if (auto r = record(task_id, skipped); !r) {
      co_return fail(r.error());
    }
    log::warn(at(task_id, step, attempt), "skipped, retries exhausted");
    co_return skipped;
  }
}

}  // namespace maestro
