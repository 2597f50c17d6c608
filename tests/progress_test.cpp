#include "maestro/progress/progress_reporter.hpp"

#include "test_utils.hpp"

#include <chrono>

#include "gtest/gtest.h"

using namespace maestro;

namespace {

using std::chrono::milliseconds;

const auto kEpoch = Clock::time_point{} + std::chrono::hours(1);

auto outcome(std::size_t index, StepResult result, milliseconds start,
             milliseconds took) -> StepOutcome {
  StepOutcome o;
  o.step_id = StepId{index, "s" + std::to_string(index + 1)};
  o.result = std::move(result);
  o.started_at = kEpoch + start;
  o.finished_at = o.started_at + took;
  return o;
}

auto running_task(std::size_t steps) -> Task {
  Task task;
  task.id = TaskId{"progress"};
  task.plan = test::sequential_plan(steps, "echo");
  task.state = TaskState::Running;
  return task;
}

}  // namespace

TEST(ProgressReporterTest, FreshTaskHasNoEta) {
  auto view = ProgressReporter::view_of(running_task(4));
  EXPECT_EQ(view.cursor, 0u);
  EXPECT_EQ(view.total_steps, 4u);
  EXPECT_DOUBLE_EQ(view.percent_complete, 0.0);
  EXPECT_EQ(view.attempts, 0u);
  EXPECT_FALSE(view.last_outcome.has_value());
  EXPECT_FALSE(view.eta.has_value());
}

TEST(ProgressReporterTest, EtaExtrapolatesFinishedSteps) {
  auto task = running_task(4);
  task.cursor = 2;
  // Step 1 took 100ms over two attempts with a gap; step 2 took 100ms.
  task.history = {
      outcome(0, StepFailure{.message = "flaky"}, milliseconds(0),
              milliseconds(40)),
      outcome(0, StepSuccess{}, milliseconds(60), milliseconds(40)),
      outcome(1, StepSuccess{}, milliseconds(200), milliseconds(100)),
  };

  auto view = ProgressReporter::view_of(task);
  EXPECT_DOUBLE_EQ(view.percent_complete, 50.0);
  EXPECT_EQ(view.attempts, 3u);
  ASSERT_TRUE(view.last_outcome.has_value());
  EXPECT_EQ(view.last_outcome->step_id.index, 1u);
  ASSERT_TRUE(view.eta.has_value());
  EXPECT_EQ(*view.eta, milliseconds(200));
}

TEST(ProgressReporterTest, DiscardedAttemptsDoNotCount) {
  auto task = running_task(2);
  task.cursor = 1;
  auto late = outcome(0, StepSuccess{}, milliseconds(0), milliseconds(900));
  late.discarded = true;
  task.history = {late,
                  outcome(0, StepSuccess{}, milliseconds(1000), milliseconds(50))};

  auto view = ProgressReporter::view_of(task);
  ASSERT_TRUE(view.eta.has_value());
  EXPECT_EQ(*view.eta, milliseconds(50));
}

TEST(ProgressReporterTest, TerminalStates) {
  auto task = running_task(2);
  task.cursor = 2;
  task.history = {outcome(0, StepSuccess{}, milliseconds(0), milliseconds(10)),
                  outcome(1, StepSuccess{}, milliseconds(10), milliseconds(10))};

  task.state = TaskState::Completed;
  auto completed = ProgressReporter::view_of(task);
  EXPECT_DOUBLE_EQ(completed.percent_complete, 100.0);
  EXPECT_EQ(completed.eta, milliseconds(0));

  task.cursor = 1;
  task.state = TaskState::Failed;
  EXPECT_FALSE(ProgressReporter::view_of(task).eta.has_value());

  task.state = TaskState::Cancelled;
  EXPECT_FALSE(ProgressReporter::view_of(task).eta.has_value());
}

TEST(ProgressReporterTest, ReportReadsRegistry) {
  TaskRegistry registry;
  ProgressReporter reporter(registry);
  auto id = *registry.create_task("watch me");

  auto view = reporter.report(id);
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->task_id, id);
  EXPECT_EQ(view->state, TaskState::Planning);

  auto missing = reporter.report(TaskId{"nope"});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::NotFound));
}

TEST(ProgressReporterTest, JsonIsStableForTheSameState) {
  auto task = running_task(3);
  task.cursor = 1;
  task.history = {outcome(0, StepSuccess{nlohmann::json{{"k", "v"}}},
                          milliseconds(0), milliseconds(30))};

  auto a = to_json(ProgressReporter::view_of(task));
  auto b = to_json(ProgressReporter::view_of(task));
  EXPECT_EQ(a.dump(), b.dump());
  EXPECT_EQ(a["state"], "running");
  EXPECT_EQ(a["eta_ms"], 60);
  EXPECT_EQ(a["last_outcome"]["output"]["k"], "v");
}
