#include "maestro/assessment/builtin_assessors.hpp"

#include <format>
#include <map>

namespace maestro {

auto ReliabilityAssessor::assess(const Task& task) -> Result<Assessment> {
  std::size_t attempts = 0;
  std::size_t successes = 0;
  std::map<std::string, int> failures;

  for (const auto& outcome : task.history) {
    if (outcome.discarded || outcome.skipped()) {
      continue;
    }
    ++attempts;
    if (outcome.succeeded()) {
      ++successes;
    } else {
      ++failures[outcome.step_id.name];
    }
  }
  if (attempts == 0) {
    return fail(Error::NoAssessmentAvailable);
  }

  Assessment a{.dimension = "reliability",
               .score = static_cast<double>(successes) /
                        static_cast<double>(attempts)};
  for (const auto& [step, count] : failures) {
    a.findings.push_back(
        std::format("step '{}' failed {} attempt(s)", step, count));
  }
  return a;
}

auto LatencyAssessor::assess(const Task& task) -> Result<Assessment> {
  std::size_t total = 0;
  std::size_t within = 0;
  Assessment a{.dimension = "latency"};

  for (const auto& outcome : task.history) {
    if (outcome.discarded || !outcome.succeeded()) {
      continue;
    }
    ++total;
    auto took = outcome.duration();
    if (took <= budget_) {
      ++within;
    } else {
      a.findings.push_back(std::format("step '{}' took {}ms (budget {}ms)",
                                       outcome.step_id.name, took.count(),
                                       budget_.count()));
    }
  }
  if (total == 0) {
    return fail(Error::NoAssessmentAvailable);
  }

  a.score = static_cast<double>(within) / static_cast<double>(total);
  return a;
}

auto register_builtin_assessors(AssessmentAggregator& aggregator,
                                std::chrono::milliseconds latency_budget)
    -> void {
  aggregator.add("reliability", std::make_shared<ReliabilityAssessor>());
  aggregator.add("latency", std::make_shared<LatencyAssessor>(latency_budget));
}

}  // namespace maestro
