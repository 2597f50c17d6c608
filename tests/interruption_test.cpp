#include "maestro/app/engine.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

#include "gtest/gtest.h"

using namespace maestro;

namespace {

constexpr auto kWaitTimeout = std::chrono::seconds(5);

struct Attempt {
  std::size_t index;
  int attempt;
  bool succeeded;

  auto operator==(const Attempt&) const -> bool = default;
};

auto attempts_from(const Task& task, std::size_t first_index)
    -> std::vector<Attempt> {
  std::vector<Attempt> out;
  for (const auto& o : task.history) {
    if (o.step_id.index >= first_index) {
      out.push_back({o.step_id.index, o.attempt, o.succeeded()});
    }
  }
  return out;
}

// Step 2 goes through the gate so a test can hold the driver while the
// cursor sits at 1; the rest echo.
auto five_step_plan() -> Plan {
  auto plan = test::sequential_plan(5, "echo");
  plan.steps[1].capability = "gate";
  return plan;
}

}  // namespace

class InterruptionTest : public ::testing::Test {
protected:
  void SetUp() override {
    planner_ = std::make_shared<test::StaticPlanner>();
    planner_->add("five", five_step_plan());
    planner_->add("held", test::sequential_plan(2, "gate"));
    gate_ = std::make_shared<test::GatedProvider>();
  }

  void TearDown() override {
    gate_->open();
    engine_.reset();
  }

  auto start_engine(bool auto_start = true) -> void {
    engine_ = std::make_unique<Engine>(
        test::test_config(), planner_,
        EngineOptions{.builtin_providers = true,
                      .builtin_assessors = false,
                      .auto_start = auto_start});
    engine_->capabilities().add("gate", gate_);
    engine_->start();
  }

  auto submit(std::string objective) -> TaskId {
    auto id = engine_->submit_task(std::move(objective));
    EXPECT_TRUE(id.has_value());
    return id.value_or(TaskId{});
  }

  auto settle(const TaskId& id) -> TaskState {
    auto state = engine_->wait(id, kWaitTimeout);
    EXPECT_TRUE(state.has_value());
    return state.value_or(TaskState::Planning);
  }

  auto task(const TaskId& id) -> Task {
    return engine_->get(id).value_or(Task{});
  }

  std::shared_ptr<test::StaticPlanner> planner_;
  std::shared_ptr<test::GatedProvider> gate_;
  std::unique_ptr<Engine> engine_;
};

TEST_F(InterruptionTest, PauseAtCursorTwoThenResumeRunsRemainingSteps) {
  start_engine();

  // Reference run without interruption.
  auto reference = submit("five");
  ASSERT_TRUE(gate_->wait_for_pending(1, kWaitTimeout));
  gate_->release();
  ASSERT_EQ(settle(reference), TaskState::Completed);
  auto expected = attempts_from(task(reference), 2);
  ASSERT_EQ(expected.size(), 3u);

  auto id = submit("five");
  ASSERT_TRUE(gate_->wait_for_pending(1, kWaitTimeout));
  ASSERT_TRUE(engine_->pause(id).has_value());
  gate_->release();

  ASSERT_EQ(settle(id), TaskState::Paused);
  auto paused = task(id);
  EXPECT_EQ(paused.cursor, 2u);
  EXPECT_EQ(paused.checkpoint["cursor"], 2);
  EXPECT_EQ(paused.history.size(), 2u);
  EXPECT_FALSE(paused.driver_active);

  ASSERT_TRUE(engine_->resume(id).has_value());
  ASSERT_EQ(settle(id), TaskState::Completed);

  auto done = task(id);
  EXPECT_EQ(done.cursor, 5u);
  EXPECT_EQ(attempts_from(done, 2), expected);
  EXPECT_EQ(attempts_from(done, 0).size(), 5u);
}

TEST_F(InterruptionTest, PauseDuringFinalStepStillCompletes) {
  start_engine();
  auto id = submit("held");
  ASSERT_TRUE(gate_->wait_for_pending(1, kWaitTimeout));
  gate_->release();

  // Second and last step is now in flight.
  ASSERT_TRUE(gate_->wait_for_pending(1, kWaitTimeout));
  ASSERT_TRUE(engine_->pause(id).has_value());
  gate_->release();

  ASSERT_EQ(settle(id), TaskState::Completed);
  auto t = task(id);
  EXPECT_EQ(t.cursor, t.total_steps());
  EXPECT_EQ(t.interrupt, InterruptRequest::None);
  EXPECT_FALSE(t.driver_active);
  EXPECT_FALSE(t.has_terminal_failure());
}

TEST_F(InterruptionTest, CancelAfterFinalAttemptRecordedStillCompletes) {
  start_engine();
  auto id = submit("held");
  ASSERT_TRUE(gate_->wait_for_pending(1, kWaitTimeout));

  // The listener runs after the attempt is recorded and before the driver
  // settles the rank.
  std::atomic<bool> cancelled{false};
  engine_->set_callbacks(OrchestratorCallbacks{
      .on_state_change = {},
      .on_step_outcome =
          [this, &cancelled](const TaskId& task_id, const StepOutcome& o) {
            if (o.step_id.name == "s2" && o.succeeded()) {
              cancelled = engine_->cancel(task_id).has_value();
            }
          }});
  gate_->release();
  ASSERT_TRUE(gate_->wait_for_pending(1, kWaitTimeout));
  gate_->release();

  ASSERT_EQ(settle(id), TaskState::Completed);
  EXPECT_TRUE(cancelled.load());
  auto t = task(id);
  EXPECT_EQ(t.cursor, 2u);
  EXPECT_EQ(t.interrupt, InterruptRequest::None);
  engine_->set_callbacks({});
}

TEST_F(InterruptionTest, PauseWithoutDriverTakesEffectImmediately) {
  start_engine(false);
  auto id = submit("five");

  ASSERT_TRUE(engine_->pause(id).has_value());
  auto paused = task(id);
  EXPECT_EQ(paused.state, TaskState::Paused);
  EXPECT_EQ(paused.checkpoint["cursor"], 0);

  gate_->open();
  ASSERT_TRUE(engine_->resume(id).has_value());
  EXPECT_EQ(settle(id), TaskState::Completed);
  EXPECT_EQ(task(id).history.size(), 5u);
}

TEST_F(InterruptionTest, PauseRequiresRunning) {
  start_engine();
  gate_->open();
  auto id = submit("held");
  ASSERT_EQ(settle(id), TaskState::Completed);

  auto r = engine_->pause(id);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidTransition));
}

TEST_F(InterruptionTest, SecondPauseWhilePausedIsRejected) {
  start_engine(false);
  auto id = submit("held");
  ASSERT_TRUE(engine_->pause(id).has_value());

  auto again = engine_->pause(id);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::InvalidTransition));
}

TEST_F(InterruptionTest, ResumeRejectsEveryStateButPaused) {
  start_engine(false);
  planner_->add("broken", test::sequential_plan(1, "fails"));
  engine_->capabilities().add("fails", std::make_shared<test::FailingProvider>());

  auto running = submit("held");

  auto cancelled = submit("held");
  ASSERT_TRUE(engine_->cancel(cancelled).has_value());

  auto completed = submit("held");
  gate_->open();
  ASSERT_TRUE(engine_->drive(completed).has_value());
  ASSERT_EQ(settle(completed), TaskState::Completed);

  auto failed = submit("broken");
  ASSERT_TRUE(engine_->drive(failed).has_value());
  ASSERT_EQ(settle(failed), TaskState::Failed);

  for (const auto& id : {running, cancelled, completed, failed}) {
    auto before = task(id);
    auto r = engine_->resume(id);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), make_error_code(Error::InvalidTransition));
    EXPECT_EQ(task(id).state, before.state);
  }

  auto ghost = engine_->resume(TaskId{"ghost"});
  ASSERT_FALSE(ghost.has_value());
  EXPECT_EQ(ghost.error(), make_error_code(Error::NotFound));
}

TEST_F(InterruptionTest, CancelDiscardsInFlightAttempt) {
  start_engine();
  auto id = submit("held");
  ASSERT_TRUE(gate_->wait_for_pending(1, kWaitTimeout));

  ASSERT_TRUE(engine_->cancel(id).has_value());
  EXPECT_EQ(task(id).state, TaskState::Running);
  gate_->release();

  EXPECT_EQ(settle(id), TaskState::Cancelled);
  auto t = task(id);
  EXPECT_EQ(t.cursor, 0u);
  ASSERT_EQ(t.history.size(), 1u);
  EXPECT_TRUE(t.history[0].discarded);
  EXPECT_FALSE(t.checkpoint["outputs"].contains("s1"));
  EXPECT_EQ(gate_->calls(), 1);
}

TEST_F(InterruptionTest, CancelStopsRetries) {
  RetryPolicy patient{.max_attempts = 10,
                      .base_delay = std::chrono::milliseconds(1),
                      .max_delay = std::chrono::milliseconds(1)};
  Plan plan;
  plan.steps = {test::make_step("stuck", "gate", 0, patient)};
  planner_->add("retrying", plan);
  start_engine();

  auto id = submit("retrying");
  ASSERT_TRUE(gate_->wait_for_pending(1, kWaitTimeout));
  ASSERT_TRUE(engine_->cancel(id).has_value());
  gate_->release_with_failure("boom");

  EXPECT_EQ(settle(id), TaskState::Cancelled);
  EXPECT_EQ(gate_->calls(), 1);
  EXPECT_EQ(task(id).history.size(), 1u);
}

TEST_F(InterruptionTest, CancelDuringBackoffStartsNoNewAttempt) {
  RetryPolicy slow{.max_attempts = 3,
                   .base_delay = std::chrono::milliseconds(400),
                   .max_delay = std::chrono::milliseconds(400)};
  Plan plan;
  plan.steps = {test::make_step("stuck", "gate", 0, slow)};
  planner_->add("backing-off", plan);
  start_engine();

  auto id = submit("backing-off");
  ASSERT_TRUE(gate_->wait_for_pending(1, kWaitTimeout));
  gate_->release_with_failure("boom");
  ASSERT_TRUE(test::wait_until([&] { return task(id).history.size() == 1; },
                               std::chrono::milliseconds(2000)));

  ASSERT_TRUE(engine_->cancel(id).has_value());
  EXPECT_EQ(settle(id), TaskState::Cancelled);
  EXPECT_EQ(gate_->calls(), 1);

  auto t = task(id);
  ASSERT_EQ(t.history.size(), 2u);
  EXPECT_FALSE(t.history[0].discarded);
  EXPECT_TRUE(t.history[1].skipped());
  EXPECT_TRUE(t.history[1].discarded);
  EXPECT_EQ(t.cursor, 0u);
}

TEST_F(InterruptionTest, CancelWinsOverPause) {
  start_engine();
  auto id = submit("held");
  ASSERT_TRUE(gate_->wait_for_pending(1, kWaitTimeout));

  ASSERT_TRUE(engine_->cancel(id).has_value());
  ASSERT_TRUE(engine_->pause(id).has_value());
  gate_->release();

  EXPECT_EQ(settle(id), TaskState::Cancelled);
}

TEST_F(InterruptionTest, CancelWithoutDriverTakesEffectImmediately) {
  start_engine(false);
  auto id = submit("held");

  ASSERT_TRUE(engine_->cancel(id).has_value());
  EXPECT_EQ(task(id).state, TaskState::Cancelled);
  auto d = engine_->drive(id);
  ASSERT_FALSE(d.has_value());
  EXPECT_EQ(d.error(), make_error_code(Error::InvalidTransition));
}

TEST_F(InterruptionTest, CancelPausedTask) {
  start_engine(false);
  auto id = submit("held");
  ASSERT_TRUE(engine_->pause(id).has_value());

  ASSERT_TRUE(engine_->cancel(id).has_value());
  EXPECT_EQ(task(id).state, TaskState::Cancelled);
}

TEST_F(InterruptionTest, CancelTerminalTaskIsRejected) {
  start_engine();
  gate_->open();
  auto id = submit("held");
  ASSERT_EQ(settle(id), TaskState::Completed);

  auto r = engine_->cancel(id);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidTransition));
  EXPECT_EQ(task(id).state, TaskState::Completed);
}

TEST_F(InterruptionTest, PausedReportIsStable) {
  start_engine();
  auto id = submit("five");
  ASSERT_TRUE(gate_->wait_for_pending(1, kWaitTimeout));
  ASSERT_TRUE(engine_->pause(id).has_value());
  gate_->release();
  ASSERT_EQ(settle(id), TaskState::Paused);

  auto first = engine_->report(id);
  auto second = engine_->report(id);
  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->state, TaskState::Paused);
  EXPECT_EQ(first->cursor, 2u);
  EXPECT_TRUE(first->eta.has_value());
  EXPECT_EQ(to_json(*first).dump(), to_json(*second).dump());
}
