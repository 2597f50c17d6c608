#pragma once

#include "maestro/assessment/assessor.hpp"
#include "maestro/config/system_config.hpp"
#include "maestro/core/error.hpp"
#include "maestro/task/task.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace maestro {

struct Improvement {
  std::string dimension;
  double score{0.0};
  std::vector<std::string> findings;
};

struct AssessmentReport {
  TaskId subject_task_id;
  std::map<std::string, double> dimension_scores;
  double overall_score{0.0};
  std::vector<std::string> strengths;
  std::vector<Improvement> improvement_opportunities;
  std::vector<std::string> warnings;
};

// Runs every registered assessor over a task and folds the scores into a
// weighted report. Assessors that fail or misbehave become warnings.
class AssessmentAggregator {
public:
  explicit AssessmentAggregator(AssessmentConfig config = {});

  AssessmentAggregator(const AssessmentAggregator&) = delete;
  auto operator=(const AssessmentAggregator&) -> AssessmentAggregator& = delete;

  auto add(std::string name, std::shared_ptr<IAssessor> assessor) -> void;
  [[nodiscard]] auto assessor_count() const -> std::size_t;

  [[nodiscard]] auto aggregate(const Task& task) -> Result<AssessmentReport>;

  // Drops a cached report, if any.
  auto forget(const TaskId& id) -> void;

  [[nodiscard]] auto config() const noexcept -> const AssessmentConfig& {
    return config_;
  }

private:
  [[nodiscard]] auto compute(const Task& task) const
      -> Result<AssessmentReport>;

  AssessmentConfig config_;
  std::vector<std::pair<std::string, std::shared_ptr<IAssessor>>> assessors_;

  mutable std::mutex mu_;
  std::unordered_map<TaskId, AssessmentReport> cache_;
};

[[nodiscard]] auto to_json(const AssessmentReport& report) -> nlohmann::json;

}  // namespace maestro
