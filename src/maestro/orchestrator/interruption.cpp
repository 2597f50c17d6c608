#include "maestro/orchestrator/interruption.hpp"

#include "maestro/util/log.hpp"

namespace maestro {

auto InterruptionController::pause(const TaskId& id) -> Result<void> {
  bool deferred = false;
  auto r = orchestrator_.mutate(id, [&deferred](Task& t) -> Result<void> {
    if (t.state != TaskState::Running) {
      return fail(Error::InvalidTransition);
    }
    if (t.driver_active) {
      // A pending cancel wins over a later pause.
      if (t.interrupt == InterruptRequest::None) {
        t.interrupt = InterruptRequest::Pause;
      }
      deferred = true;
      return ok();
    }
    if (auto paused = t.transition(TaskState::Paused); !paused) {
      return paused;
    }
    write_checkpoint(t);
    return ok();
  });
  if (r && deferred) {
    log::debug(log::Fields{.task = id.value()}, "pause requested");
  }
  return r;
}

auto InterruptionController::resume(const TaskId& id) -> Result<void> {
  auto r = orchestrator_.mutate(id, [](Task& t) -> Result<void> {
    if (t.state != TaskState::Paused) {
      return fail(Error::InvalidTransition);
    }
    if (t.checkpoint.contains("cursor")) {
      auto saved = t.checkpoint["cursor"].get<std::size_t>();
      if (saved <= t.total_steps()) {
        t.cursor = saved;
      }
    }
    t.interrupt = InterruptRequest::None;
    return t.transition(TaskState::Running);
  });
  if (!r) {
    return r;
  }
  return orchestrator_.drive(id);
}

auto InterruptionController::cancel(const TaskId& id) -> Result<void> {
  bool deferred = false;
  auto r = orchestrator_.mutate(id, [&deferred](Task& t) -> Result<void> {
    if (t.terminal()) {
      return fail(Error::InvalidTransition);
    }
    if (t.driver_active) {
      t.interrupt = InterruptRequest::Cancel;
      deferred = true;
      return ok();
    }
    return t.transition(TaskState::Cancelled);
  });
  if (r && deferred) {
    log::debug(log::Fields{.task = id.value()}, "cancel requested");
  }
  return r;
}

}  // namespace maestro
