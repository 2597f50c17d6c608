#pragma once

#include "maestro/assessment/aggregator.hpp"
#include "maestro/assessment/assessor.hpp"

#include <chrono>

namespace maestro {

// "reliability": successful attempts over all recorded attempts.
class ReliabilityAssessor : public IAssessor {
public:
  [[nodiscard]] auto assess(const Task& task) -> Result<Assessment> override;
};

// "latency": share of successful attempts that finished within the budget.
class LatencyAssessor : public IAssessor {
public:
  explicit LatencyAssessor(std::chrono::milliseconds budget) : budget_(budget) {
  }

  [[nodiscard]] auto assess(const Task& task) -> Result<Assessment> override;

private:
  std::chrono::milliseconds budget_;
};

auto register_builtin_assessors(AssessmentAggregator& aggregator,
                                std::chrono::milliseconds latency_budget)
    -> void;

}  // namespace maestro
