#include "maestro/progress/progress_reporter.hpp"

#include "maestro/task/state_strings.hpp"

#include <algorithm>
#include <vector>

namespace maestro {

namespace {

// Mean wall time of the steps before the cursor, first start to last finish.
auto mean_step_time(const Task& task) -> std::optional<std::chrono::milliseconds> {
  if (task.cursor == 0) {
    return std::nullopt;
  }

  struct Span {
    Clock::time_point first{Clock::time_point::max()};
    Clock::time_point last{Clock::time_point::min()};
  };
  std::vector<Span> spans(task.cursor);
  for (const auto& outcome : task.history) {
    if (outcome.discarded || outcome.step_id.index >= task.cursor) {
      continue;
    }
    auto& span = spans[outcome.step_id.index];
    span.first = std::min(span.first, outcome.started_at);
    span.last = std::max(span.last, outcome.finished_at);
  }

  std::chrono::milliseconds total{0};
  std::size_t counted = 0;
  for (const auto& span : spans) {
    if (span.last < span.first) {
      continue;
    }
    total += std::chrono::duration_cast<std::chrono::milliseconds>(
        span.last - span.first);
    ++counted;
  }
  if (counted == 0) {
    return std::nullopt;
  }
  return total / static_cast<long>(counted);
}

}  // namespace

auto ProgressReporter::report(const TaskId& id) const -> Result<ProgressView> {
  auto task = registry_.get(id);
  if (!task) {
    return fail(task.error());
  }
  return view_of(*task);
}

auto ProgressReporter::view_of(const Task& task) -> ProgressView {
  ProgressView view;
  view.task_id = task.id;
  view.state = task.state;
  view.cursor = task.cursor;
  view.total_steps = task.total_steps();
  view.attempts = task.history.size();
  if (view.total_steps > 0) {
    view.percent_complete = 100.0 * static_cast<double>(view.cursor) /
                            static_cast<double>(view.total_steps);
  }
  if (!task.history.empty()) {
    view.last_outcome = task.history.back();
  }

  if (task.state == TaskState::Completed) {
    view.eta = std::chrono::milliseconds{0};
  } else if (!task.terminal()) {
    if (auto mean = mean_step_time(task)) {
      view.eta = *mean * static_cast<long>(view.total_steps - view.cursor);
    }
  }
  return view;
}

auto to_json(const ProgressView& view) -> nlohmann::json {
  nlohmann::json j = {{"task_id", view.task_id.str()},
                      {"state", task_state_name(view.state)},
                      {"cursor", view.cursor},
                      {"total_steps", view.total_steps},
                      {"percent_complete", view.percent_complete},
                      {"attempts", view.attempts}};
  j["last_outcome"] =
      view.last_outcome ? to_json(*view.last_outcome) : nlohmann::json(nullptr);
  j["eta_ms"] = view.eta ? nlohmann::json(view.eta->count())
                         : nlohmann::json(nullptr);
  return j;
}

}  // namespace maestro
