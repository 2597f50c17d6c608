#include "maestro/executor/builtin_providers.hpp"
#include "maestro/executor/step_executor.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <memory>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

using namespace maestro;

namespace {

constexpr auto kDefaultTimeout = std::chrono::milliseconds(2000);
constexpr auto kWaitTimeout = std::chrono::seconds(2);

}  // namespace

class StepExecutorTest : public ::testing::Test {
protected:
  void SetUp() override {
    runtime_.start();
    capabilities_.add("echo", std::make_shared<EchoProvider>());
    task_id_ = *registry_.create_task("executor test");
    ASSERT_TRUE(registry_.update(task_id_, [](Task& t) -> Result<void> {
      return t.transition(TaskState::Running);
    }));
  }

  void TearDown() override {
    runtime_.stop();
  }

  auto run(Step step, CancellationToken token = CancellationToken::none())
      -> Result<StepOutcome> {
    return test::run_on(runtime_,
                        executor_.execute(task_id_, std::move(step),
                                          empty_context(), token));
  }

  static auto empty_context() -> StepContext {
    return std::make_shared<const nlohmann::json>(nlohmann::json::object());
  }

  auto history() -> std::vector<StepOutcome> {
    return registry_.get(task_id_)->history;
  }

  Runtime runtime_{2};
  TaskRegistry registry_;
  CapabilityRegistry capabilities_;
  StepExecutor executor_{registry_, capabilities_, kDefaultTimeout};
  TaskId task_id_;
};

TEST_F(StepExecutorTest, SuccessOnFirstAttempt) {
  auto step = test::make_step("greet", "echo");
  step.input = {{"msg", "hi"}};

  auto outcome = run(step);
  ASSERT_TRUE(outcome.has_value());
  ASSERT_TRUE(outcome->succeeded());
  EXPECT_EQ(outcome->attempt, 1);
  EXPECT_EQ(std::get<StepSuccess>(outcome->result).output["msg"], "hi");

  auto recorded = history();
  ASSERT_EQ(recorded.size(), 1u);
  EXPECT_EQ(recorded[0].step_id.name, "greet");
  EXPECT_LE(recorded[0].started_at, recorded[0].finished_at);
}

TEST_F(StepExecutorTest, RetriesUntilSuccess) {
  auto flaky = std::make_shared<test::FlakyProvider>(2);
  capabilities_.add("flaky", flaky);

  auto outcome = run(test::make_step("fetch", "flaky", 0, test::fast_retry(3)));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->succeeded());
  EXPECT_EQ(outcome->attempt, 3);
  EXPECT_EQ(flaky->calls(), 3);

  auto recorded = history();
  ASSERT_EQ(recorded.size(), 3u);
  for (int i = 0; i < 2; ++i) {
    ASSERT_NE(recorded[i].failure(), nullptr);
    EXPECT_FALSE(recorded[i].failure()->terminal);
    EXPECT_EQ(recorded[i].attempt, i + 1);
  }
  EXPECT_TRUE(recorded[2].succeeded());
}

TEST_F(StepExecutorTest, ExhaustedRetriesFailTerminally) {
  auto failing = std::make_shared<test::FailingProvider>();
  capabilities_.add("broken", failing);

  auto outcome = run(test::make_step("fetch", "broken", 0, test::fast_retry(2)));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->terminal_failure());
  EXPECT_EQ(failing->calls(), 2);

  auto recorded = history();
  ASSERT_EQ(recorded.size(), 2u);
  EXPECT_FALSE(recorded[0].terminal_failure());
  EXPECT_TRUE(recorded[1].terminal_failure());
  EXPECT_EQ(recorded[1].failure()->kind, Error::ProviderError);
  EXPECT_EQ(recorded[1].failure()->message, "always fails");
}

TEST_F(StepExecutorTest, ExhaustedRetriesCanSkip) {
  capabilities_.add("broken", std::make_shared<test::FailingProvider>());

  auto outcome = run(test::make_step(
      "optional", "broken", 0, test::fast_retry(2, ExhaustionPolicy::Skip)));
  ASSERT_TRUE(outcome.has_value());
  ASSERT_TRUE(outcome->skipped());
  EXPECT_EQ(std::get<StepSkipped>(outcome->result).reason, "retries exhausted");

  auto recorded = history();
  ASSERT_EQ(recorded.size(), 3u);
  EXPECT_FALSE(recorded[1].terminal_failure());
  EXPECT_TRUE(recorded[2].skipped());
}

TEST_F(StepExecutorTest, UnknownCapabilityIsAnError) {
  auto outcome = run(test::make_step("lost", "nope"));
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error(), make_error_code(Error::UnknownCapability));
  EXPECT_TRUE(history().empty());
}

TEST_F(StepExecutorTest, ProviderTimeoutIsRecordedAsFailure) {
  auto gate = std::make_shared<test::GatedProvider>();
  capabilities_.add("gate", gate);

  auto step = test::make_step("stuck", "gate", 0, test::fast_retry(1));
  step.timeout = std::chrono::milliseconds(20);

  auto outcome = run(step);
  ASSERT_TRUE(outcome.has_value());
  const auto* failure = outcome->failure();
  ASSERT_NE(failure, nullptr);
  EXPECT_TRUE(failure->timed_out);
  EXPECT_TRUE(failure->terminal);
  EXPECT_EQ(failure->kind, Error::ProviderError);

  // A late completion after the timeout is ignored.
  gate->release();
  EXPECT_EQ(history().size(), 1u);
}

TEST_F(StepExecutorTest, ThrowingProviderBecomesFailure) {
  capabilities_.add("throws", std::make_shared<test::ThrowingProvider>());

  auto outcome = run(test::make_step("boom", "throws", 0, test::fast_retry(1)));
  ASSERT_TRUE(outcome.has_value());
  ASSERT_NE(outcome->failure(), nullptr);
  EXPECT_EQ(outcome->failure()->message, "provider exploded");
}

TEST_F(StepExecutorTest, SlowProviderCompletesFromAnotherThread) {
  capabilities_.add("slow", std::make_shared<test::SlowProvider>(
                                std::chrono::milliseconds(10)));

  auto outcome = run(test::make_step("wait", "slow"));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->succeeded());
  EXPECT_GE(outcome->duration(), std::chrono::milliseconds(10));
}

TEST_F(StepExecutorTest, EarlyCompletionDisarmsTimeoutTimer) {
  capabilities_.add("slow", std::make_shared<test::SlowProvider>(
                                std::chrono::milliseconds(10)));
  auto step = test::make_step("wait", "slow");
  step.timeout = std::chrono::seconds(30);

  auto outcome = run(step);
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->succeeded());
  EXPECT_TRUE(test::wait_until([&] { return runtime_.pending_timers() == 0; },
                               std::chrono::milliseconds(1000)));
}

TEST_F(StepExecutorTest, InlineCompletionNeverArmsTimeoutTimer) {
  auto step = test::make_step("greet", "echo");
  step.timeout = std::chrono::seconds(30);

  for (int i = 0; i < 20; ++i) {
    auto outcome = run(step);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->succeeded());
  }
  EXPECT_TRUE(test::wait_until([&] { return runtime_.pending_timers() == 0; },
                               std::chrono::milliseconds(1000)));
}

TEST_F(StepExecutorTest, ResumesOnTheShardThatInvoked) {
  capabilities_.add("slow", std::make_shared<test::SlowProvider>(
                                std::chrono::milliseconds(5)));

  auto shards_around = [](Runtime& rt, StepExecutor& executor, TaskId id,
                          Step step) -> task<std::pair<shard_id, shard_id>> {
    auto before = rt.current_shard();
    auto r = co_await executor.execute(
        std::move(id), std::move(step),
        std::make_shared<const nlohmann::json>(), CancellationToken::none());
    EXPECT_TRUE(r.has_value());
    co_return std::pair{before, rt.current_shard()};
  };

  for (int i = 0; i < 6; ++i) {
    auto [before, after] = test::run_on(
        runtime_, shards_around(runtime_, executor_, task_id_,
                                test::make_step("wait", "slow")));
    EXPECT_NE(before, kInvalidShard);
    EXPECT_EQ(before, after);
  }
}

TEST_F(StepExecutorTest, CancelledTokenSkipsWithoutInvoking) {
  auto flaky = std::make_shared<test::FlakyProvider>(0);
  capabilities_.add("flaky", flaky);

  CancellationSource source;
  source.cancel();
  auto outcome = run(test::make_step("sibling", "flaky"), source.token());
  ASSERT_TRUE(outcome.has_value());
  ASSERT_TRUE(outcome->skipped());
  EXPECT_EQ(std::get<StepSkipped>(outcome->result).reason, "rank aborted");
  EXPECT_EQ(flaky->calls(), 0);
}

TEST_F(StepExecutorTest, SkipReasonNamesTheAbortingSibling) {
  capabilities_.add("flaky", std::make_shared<test::FlakyProvider>(0));

  CancellationSource source;
  EXPECT_TRUE(source.cancel("fetch-a"));
  EXPECT_FALSE(source.cancel("fetch-b"));
  EXPECT_EQ(source.token().cause(), "fetch-a");

  auto outcome = run(test::make_step("sibling", "flaky"), source.token());
  ASSERT_TRUE(outcome.has_value());
  ASSERT_TRUE(outcome->skipped());
  EXPECT_EQ(std::get<StepSkipped>(outcome->result).reason,
            "rank aborted by 'fetch-a'");
}

TEST_F(StepExecutorTest, PendingCancelDiscardsAttemptAndStopsRetrying) {
  auto failing = std::make_shared<test::FailingProvider>();
  capabilities_.add("broken", failing);
  ASSERT_TRUE(registry_.update(task_id_, [](Task& t) -> Result<void> {
    t.interrupt = InterruptRequest::Cancel;
    return ok();
  }));

  auto outcome = run(test::make_step("fetch", "broken", 0, test::fast_retry(5)));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(outcome->discarded);
  EXPECT_EQ(failing->calls(), 1);

  auto recorded = history();
  ASSERT_EQ(recorded.size(), 1u);
  EXPECT_TRUE(recorded[0].discarded);
}

TEST_F(StepExecutorTest, ListenerSeesEveryAttempt) {
  capabilities_.add("flaky", std::make_shared<test::FlakyProvider>(1));
  test::BlockingQueue<StepOutcome> seen;
  executor_.set_outcome_listener(
      [&seen](const TaskId&, const StepOutcome& outcome) { seen.push(outcome); });

  auto outcome = run(test::make_step("fetch", "flaky"));
  ASSERT_TRUE(outcome.has_value());

  auto first = seen.try_pop_for(kWaitTimeout);
  auto second = seen.try_pop_for(kWaitTimeout);
  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->attempt, 1);
  EXPECT_NE(first->failure(), nullptr);
  EXPECT_EQ(second->attempt, 2);
  EXPECT_TRUE(second->succeeded());
  executor_.set_outcome_listener({});
}

TEST_F(StepExecutorTest, ProviderReceivesCheckpointContext) {
  struct Capture : ICapabilityProvider {
    nlohmann::json context;
    int attempt{0};
    auto invoke(ProviderRequest request, ProviderCallback done)
        -> void override {
      context = *request.context;
      attempt = request.attempt;
      done(ProviderResult::success(nullptr));
    }
  };
  auto capture = std::make_shared<Capture>();
  capabilities_.add("capture", capture);

  auto context = std::make_shared<const nlohmann::json>(
      nlohmann::json{{"outputs", {{"earlier", 42}}}});
  auto outcome = test::run_on(
      runtime_, executor_.execute(task_id_, test::make_step("use", "capture"),
                                  context, CancellationToken::none()));
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(capture->context["outputs"]["earlier"], 42);
  EXPECT_EQ(capture->attempt, 1);
}
