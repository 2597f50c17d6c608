#pragma once

#include "maestro/core/error.hpp"
#include "maestro/orchestrator/orchestrator.hpp"
#include "maestro/util/id.hpp"

namespace maestro {

// Pause, resume and cancel at step boundaries. A request against a task
// with no active driver takes effect immediately; otherwise the driver
// honours it once the in-flight rank settles.
class InterruptionController {
public:
  explicit InterruptionController(Orchestrator& orchestrator)
      : orchestrator_(orchestrator) {
  }

  [[nodiscard]] auto pause(const TaskId& id) -> Result<void>;
  [[nodiscard]] auto resume(const TaskId& id) -> Result<void>;
  [[nodiscard]] auto cancel(const TaskId& id) -> Result<void>;

private:
  Orchestrator& orchestrator_;
};

}  // namespace maestro
