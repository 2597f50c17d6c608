#include "maestro/orchestrator/planner.hpp"

#include "maestro/util/log.hpp"

namespace maestro {

auto CatalogPlanner::plan(std::string_view objective) -> Result<Plan> {
  const auto* def = catalog_.find(objective);
  if (def == nullptr) {
    log::warn("No plan for objective '{}'", objective);
    return fail(Error::PlanningFailed);
  }
  return def->plan;
}

}  // namespace maestro
