#include "maestro/assessment/aggregator.hpp"

#include "maestro/util/log.hpp"

#include <algorithm>
#include <exception>
#include <format>

namespace maestro {

AssessmentAggregator::AssessmentAggregator(AssessmentConfig config)
    : config_(std::move(config)) {
}

auto AssessmentAggregator::add(std::string name,
                               std::shared_ptr<IAssessor> assessor) -> void {
  std::lock_guard lock(mu_);
  assessors_.emplace_back(std::move(name), std::move(assessor));
}

auto AssessmentAggregator::assessor_count() const -> std::size_t {
  std::lock_guard lock(mu_);
  return assessors_.size();
}

auto AssessmentAggregator::aggregate(const Task& task)
    -> Result<AssessmentReport> {
  if (config_.cache_reports) {
    std::lock_guard lock(mu_);
    if (auto it = cache_.find(task.id); it != cache_.end()) {
      return it->second;
    }
  }

  auto report = compute(task);
  if (report && config_.cache_reports) {
    std::lock_guard lock(mu_);
    cache_.insert_or_assign(task.id, *report);
  }
  return report;
}

auto AssessmentAggregator::forget(const TaskId& id) -> void {
  std::lock_guard lock(mu_);
  cache_.erase(id);
}

auto AssessmentAggregator::compute(const Task& task) const
    -> Result<AssessmentReport> {
  decltype(assessors_) assessors;
  {
    std::lock_guard lock(mu_);
    assessors = assessors_;
  }

  AssessmentReport report;
  report.subject_task_id = task.id;
  std::map<std::string, std::vector<std::string>> findings;

  for (const auto& [name, assessor] : assessors) {
    Result<Assessment> result = fail(Error::Unknown);
    try {
      result = assessor->assess(task);
    } catch (const std::exception& e) {
      report.warnings.push_back(
          std::format("assessor '{}' threw: {}", name, e.what()));
      log::warn("Assessor '{}' threw on task {}: {}", name, task.id, e.what());
      continue;
    }

    if (!result) {
      report.warnings.push_back(std::format("assessor '{}' failed: {}", name,
                                            result.error().message()));
      log::warn("Assessor '{}' failed on task {}: {}", name, task.id,
                result.error().message());
      continue;
    }

    auto& a = *result;
    if (!(a.score >= 0.0 && a.score <= 1.0)) {
      report.warnings.push_back(std::format(
          "assessor '{}' scored '{}' out of range: {}", name, a.dimension,
          a.score));
      log::warn("Assessor '{}' produced out-of-range score {}", name, a.score);
      continue;
    }
    if (report.dimension_scores.contains(a.dimension)) {
      report.warnings.push_back(std::format(
          "assessor '{}' duplicated dimension '{}'", name, a.dimension));
      log::warn("Assessor '{}' duplicated dimension '{}'", name, a.dimension);
      continue;
    }

    report.dimension_scores.emplace(a.dimension, a.score);
    findings.emplace(a.dimension, std::move(a.findings));
  }

  if (report.dimension_scores.empty()) {
    log::warn("No assessment available for task {}", task.id);
    return fail(Error::NoAssessmentAvailable);
  }

  double weighted = 0.0;
  double total_weight = 0.0;
  for (const auto& [dimension, score] : report.dimension_scores) {
    auto w = config_.weight_of(dimension);
    weighted += w * score;
    total_weight += w;
  }
  report.overall_score = weighted / total_weight;

  std::vector<std::pair<std::string, double>> strengths;
  for (const auto& [dimension, score] : report.dimension_scores) {
    if (score >= config_.strength_threshold) {
      strengths.emplace_back(dimension, score);
    }
    if (score < config_.improvement_threshold) {
      report.improvement_opportunities.push_back(
          {dimension, score, findings[dimension]});
    }
  }

  // Ties fall back to the dimension name.
  std::ranges::sort(strengths, [](const auto& a, const auto& b) {
    if (a.second != b.second)
      return a.second > b.second;
    return a.first < b.first;
  });
  std::ranges::sort(report.improvement_opportunities,
                    [](const Improvement& a, const Improvement& b) {
                      if (a.score != b.score)
                        return a.score < b.score;
                      return a.dimension < b.dimension;
                    });
  for (auto& [dimension, _] : strengths) {
    report.strengths.push_back(std::move(dimension));
  }

  log::debug("Task {} assessed: overall {:.3f} over {} dimension(s)", task.id,
             report.overall_score, report.dimension_scores.size());
  return report;
}

auto to_json(const AssessmentReport& report) -> nlohmann::json {
  auto improvements = nlohmann::json::array();
  for (const auto& imp : report.improvement_opportunities) {
    improvements.push_back({{"dimension", imp.dimension},
                            {"score", imp.score},
                            {"findings", imp.findings}});
  }
  return {{"task_id", report.subject_task_id.str()},
          {"dimension_scores", report.dimension_scores},
          {"overall_score", report.overall_score},
          {"strengths", report.strengths},
          {"improvement_opportunities", std::move(improvements)},
          {"warnings", report.warnings}};
}

}  // namespace maestro
