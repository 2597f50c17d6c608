#pragma once

#include "maestro/core/error.hpp"
#include "maestro/task/task.hpp"

#include <string>
#include <vector>

namespace maestro {

struct Assessment {
  std::string dimension;
  // Expected in [0, 1]; anything else is rejected by the aggregator.
  double score{0.0};
  std::vector<std::string> findings;
};

class IAssessor {
public:
  virtual ~IAssessor() = default;

  [[nodiscard]] virtual auto assess(const Task& task) -> Result<Assessment> = 0;
};

}  // namespace maestro
