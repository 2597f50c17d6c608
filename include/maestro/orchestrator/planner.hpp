#pragma once

#include "maestro/config/plan_catalog.hpp"
#include "maestro/core/error.hpp"
#include "maestro/task/task.hpp"

#include <string_view>

namespace maestro {

// Decomposes an objective into an ordered plan.
class IPlanner {
public:
  virtual ~IPlanner() = default;

  [[nodiscard]] virtual auto plan(std::string_view objective)
      -> Result<Plan> = 0;
};

// Looks objectives up in a plan catalog. Unknown objectives fail planning.
class CatalogPlanner : public IPlanner {
public:
  explicit CatalogPlanner(PlanCatalog catalog) : catalog_(std::move(catalog)) {
  }

  [[nodiscard]] auto plan(std::string_view objective) -> Result<Plan> override;

  [[nodiscard]] auto catalog() const noexcept -> const PlanCatalog& {
    return catalog_;
  }

private:
  PlanCatalog catalog_;
};

}  // namespace maestro
