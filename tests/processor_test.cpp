#include "taskq/queue/state_codec.hpp"
#include "taskq/scheduler/processor.hpp"
#include "taskq/storage/atomic_store.hpp"
#include "taskq/storage/file_lock.hpp"
#include "taskq/storage/running_marker.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <sys/wait.h>
#include <unistd.h>

#include <csignal>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace taskq;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

constexpr std::int64_t kDeadPid = 999'999'999;

auto find_task(const QueueState &state, const char *source, const char *id)
    -> const TaskRecord * {
  const auto *src = state.find_source(SourceId{source});
  return src == nullptr ? nullptr : src->find_task(TaskId{id});
}

} // namespace

class TaskProcessorTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = test::make_temp_dir("taskq_processor_test");
    cfg_ = test::make_config(dir_, {"main", "aux"});
  }
  void TearDown() override { fs::remove_all(dir_); }

  auto make_processor() -> std::unique_ptr<TaskProcessor> {
    return std::make_unique<TaskProcessor>(cfg_, executor_);
  }

  [[nodiscard]] auto source(const char *id) const -> const SourceConfig & {
    return *cfg_.find_source(SourceId{id});
  }

  template <typename Mutate> auto edit_state(Mutate &&mutate) -> void {
    auto text = AtomicStateStore::read_text(cfg_.state_file);
    ASSERT_TRUE(text.has_value());
    auto state = StateCodec::decode(*text);
    ASSERT_TRUE(state.has_value());
    mutate(*state);
    auto out = StateCodec::encode(*state);
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(AtomicStateStore::write_text(cfg_.state_file, *out).has_value());
  }

  // Leaves the task Running as if its executor had been interrupted.
  auto mark_running(const char *src, const char *id, ProcessOwner owner)
      -> void {
    edit_state([&](QueueState &state) {
      auto &s = state.sources.at(SourceId{src});
      auto *task = s.find_task(TaskId{id});
      ASSERT_NE(task, nullptr);
      task->status = TaskStatus::Running;
      task->attempts = 1;
      task->started_at = util::Clock::now();
      s.processing = ProcessingMarker{.active = true,
                                      .task_id = task->id,
                                      .owner = owner,
                                      .started_at = task->started_at};
    });
  }

  fs::path dir_;
  QueueConfig cfg_;
  test::FakeExecutor executor_;
};

TEST_F(TaskProcessorTest, AlternatesBetweenSources) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  test::add_task(cfg_, "main", "task-20250101-110000");
  test::add_task(cfg_, "aux", "task-20250101-105000");

  auto processor = make_processor();
  auto loaded = processor->load_tasks();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->added, 3u);
  EXPECT_EQ(loaded->sources, 2u);

  auto summary = processor->process_tasks();
  EXPECT_EQ(summary.status, ProcessStatus::Completed);
  EXPECT_EQ(summary.processed, 3u);
  EXPECT_EQ(summary.failed, 0u);
  EXPECT_EQ(summary.remaining, 0u);

  const std::vector<std::string> expected{"task-20250101-100000",
                                          "task-20250101-105000",
                                          "task-20250101-110000"};
  EXPECT_EQ(executor_.call_order(), expected);

  const auto state = processor->snapshot();
  EXPECT_EQ(state.coordinator.current_source, SourceId{"main"});
  EXPECT_EQ(state.count(TaskStatus::Completed), 3u);
  EXPECT_EQ(state.global.total_queued, 3u);
  EXPECT_EQ(state.global.total_completed, 3u);
  EXPECT_EQ(state.sources.at(SourceId{"main"}).statistics.total_completed, 2u);
  EXPECT_TRUE(state.global.last_processed_at.has_value());
  EXPECT_FALSE(state.sources.at(SourceId{"main"}).processing.active);

  EXPECT_EQ(processor->process_tasks().status, ProcessStatus::Empty);
}

TEST_F(TaskProcessorTest, ExecutorReceivesSpecContent) {
  test::add_task(cfg_, "main", "task-20250101-100000", "# Title\nbody\n");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());
  (void)processor->process_tasks();

  auto calls = executor_.calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].spec_content, "# Title\nbody\n");
  EXPECT_EQ(calls[0].source_id, "main");
  EXPECT_EQ(calls[0].working_dir, dir_);
  EXPECT_EQ(calls[0].spec_path,
            source("main").pending_dir / "task-20250101-100000.md");
}

TEST_F(TaskProcessorTest, CompletedSpecIsArchivedWithResult) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());
  (void)processor->process_tasks();

  const auto &src = source("main");
  EXPECT_FALSE(fs::exists(src.pending_dir / "task-20250101-100000.md"));
  EXPECT_TRUE(fs::exists(src.archive_dir / "task-20250101-100000.md"));
  EXPECT_FALSE(fs::exists(src.pending_dir / ".task-20250101-100000.running"));
  EXPECT_FALSE(fs::exists(src.pending_dir / ".task-20250101-100000.lock"));

  const auto result =
      test::read_file(src.results_dir / "task-20250101-100000.json");
  EXPECT_NE(result.find("\"success\": true"), std::string::npos);
  EXPECT_NE(result.find("\"status\": \"completed\""), std::string::npos);
  EXPECT_NE(result.find("\"output\": \"ok\""), std::string::npos);
}

TEST_F(TaskProcessorTest, FailedSpecMovesToFailedWithNote) {
  test::FakeExecutor failing{[](const ExecutionRequest &) {
    return ExecutionResult{.success = false, .error = "compile error"};
  }};
  test::add_task(cfg_, "main", "task-20250101-100000");
  TaskProcessor processor{cfg_, failing};
  ASSERT_TRUE(processor.load_tasks().has_value());

  auto summary = processor.process_tasks();
  EXPECT_EQ(summary.processed, 0u);
  EXPECT_EQ(summary.failed, 1u);

  const auto &src = source("main");
  EXPECT_TRUE(fs::exists(src.failed_dir / "task-20250101-100000.md"));
  const auto note = test::read_file(src.failed_dir / "task-20250101-100000.error");
  EXPECT_NE(note.find("compile error"), std::string::npos);
  EXPECT_NE(note.find("attempts: 1"), std::string::npos);

  const auto state = processor.snapshot();
  const auto *task = find_task(state, "main", "task-20250101-100000");
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->status, TaskStatus::Failed);
  EXPECT_EQ(task->error, "compile error");
  EXPECT_EQ(state.global.total_failed, 1u);
}

TEST_F(TaskProcessorTest, ExecutorExceptionBecomesFailure) {
  test::FakeExecutor throwing{[](const ExecutionRequest &) -> ExecutionResult {
    throw std::runtime_error("executor crashed");
  }};
  test::add_task(cfg_, "main", "task-20250101-100000");
  test::add_task(cfg_, "main", "task-20250101-110000");
  TaskProcessor processor{cfg_, throwing};
  ASSERT_TRUE(processor.load_tasks().has_value());

  auto summary = processor.process_tasks();
  EXPECT_EQ(summary.failed, 2u);

  const auto state = processor.snapshot();
  const auto *task = find_task(state, "main", "task-20250101-100000");
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->status, TaskStatus::Failed);
  EXPECT_EQ(task->error, "executor crashed");
}

TEST_F(TaskProcessorTest, UnsuccessfulResultWithoutMessageGetsOne) {
  test::FakeExecutor silent{[](const ExecutionRequest &) {
    return ExecutionResult{.success = false};
  }};
  test::add_task(cfg_, "main", "task-20250101-100000");
  TaskProcessor processor{cfg_, silent};
  ASSERT_TRUE(processor.load_tasks().has_value());
  (void)processor.process_tasks();

  const auto *task =
      find_task(processor.snapshot(), "main", "task-20250101-100000");
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->error, "executor reported failure");
}

TEST_F(TaskProcessorTest, RescanIsIdempotent) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  test::add_task(cfg_, "aux", "task-20250101-100000");
  auto processor = make_processor();

  ASSERT_TRUE(processor->load_tasks().has_value());
  auto again = processor->load_tasks();
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->added, 0u);
  EXPECT_EQ(again->unchanged, 2u);

  const auto state = processor->snapshot();
  EXPECT_EQ(state.sources.at(SourceId{"main"}).queue.size(), 1u);
  // Same id in two sources is two tasks.
  EXPECT_EQ(state.count(TaskStatus::Pending), 2u);
  EXPECT_EQ(state.global.total_queued, 2u);
}

TEST_F(TaskProcessorTest, ChangedCompletedSpecIsRequeued) {
  test::add_task(cfg_, "main", "task-20250101-100000", "v1");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());
  (void)processor->process_tasks();

  // Same content dropped back in: nothing to do.
  test::add_task(cfg_, "main", "task-20250101-100000", "v1");
  auto same = processor->load_tasks();
  ASSERT_TRUE(same.has_value());
  EXPECT_EQ(same->unchanged, 1u);
  EXPECT_EQ(processor->process_tasks().status, ProcessStatus::Empty);

  test::add_task(cfg_, "main", "task-20250101-100000", "v2");
  auto changed = processor->load_tasks(TaskOrigin::Reload);
  ASSERT_TRUE(changed.has_value());
  EXPECT_EQ(changed->requeued, 1u);

  const auto *task =
      find_task(processor->snapshot(), "main", "task-20250101-100000");
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->status, TaskStatus::Pending);
  EXPECT_EQ(task->origin, TaskOrigin::Reload);
  EXPECT_EQ(task->attempts, 1);
  EXPECT_FALSE(task->completed_at.has_value());

  (void)processor->process_tasks();
  auto calls = executor_.calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[1].spec_content, "v2");
}

TEST_F(TaskProcessorTest, ChangedPendingSpecIsUpdatedInPlace) {
  const auto file = test::add_task(cfg_, "main", "task-20250101-100000", "v1");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());

  test::write_file(file, "version two");
  auto outcome = processor->enqueue_file(SourceId{"main"}, file);
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(*outcome, EnqueueOutcome::Updated);

  const auto *task =
      find_task(processor->snapshot(), "main", "task-20250101-100000");
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->status, TaskStatus::Pending);
  EXPECT_EQ(task->file_size, 11u);
}

TEST_F(TaskProcessorTest, EnqueueFile) {
  auto processor = make_processor();
  const auto file = test::add_task(cfg_, "aux", "task-20250101-100000");

  auto added = processor->enqueue_file(SourceId{"aux"}, file, TaskOrigin::Watch);
  ASSERT_TRUE(added.has_value());
  EXPECT_EQ(*added, EnqueueOutcome::Added);
  auto again = processor->enqueue_file(SourceId{"aux"}, file);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(*again, EnqueueOutcome::Unchanged);

  const auto *task =
      find_task(processor->snapshot(), "aux", "task-20250101-100000");
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->origin, TaskOrigin::Watch);

  const auto notes = test::write_file(source("aux").pending_dir / "notes.md", "x");
  auto rejected = processor->enqueue_file(SourceId{"aux"}, notes);
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error(), make_error_code(Error::InvalidArgument));

  auto unknown = processor->enqueue_file(SourceId{"nope"}, file);
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error(), make_error_code(Error::NotFound));
}

TEST_F(TaskProcessorTest, FingerprintDisabledNeverRequeues) {
  cfg_.settings.enable_fingerprint = false;
  const auto file = test::add_task(cfg_, "main", "task-20250101-100000", "v1");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());
  test::write_file(file, "v2");
  auto again = processor->load_tasks();
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->unchanged, 1u);
  EXPECT_EQ(again->updated, 0u);
}

TEST_F(TaskProcessorTest, MaxTasksBoundsTheBatch) {
  for (const auto *id : {"task-20250101-100000", "task-20250101-110000",
                         "task-20250101-120000"}) {
    test::add_task(cfg_, "main", id);
  }
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());

  auto summary = processor->process_tasks(2);
  EXPECT_EQ(summary.processed, 2u);
  EXPECT_EQ(summary.remaining, 1u);
  EXPECT_EQ(processor->process_tasks(2).processed, 1u);
}

TEST_F(TaskProcessorTest, BatchSkipsWhenStateIsLocked) {
  cfg_.settings.lock_timeout = 30ms;
  test::add_task(cfg_, "main", "task-20250101-100000");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());

  InterprocessLock other{cfg_.state_lock_file(), 5ms};
  ASSERT_TRUE(other.acquire(100ms).has_value());

  auto summary = processor->process_tasks();
  EXPECT_EQ(summary.status, ProcessStatus::Skipped);
  EXPECT_EQ(summary.reason, "locked");
  EXPECT_TRUE(executor_.calls().empty());

  EXPECT_EQ(processor->run_next(SourceId{"main"}).outcome,
            RunOutcome::Contended);
  auto load = processor->load_tasks();
  ASSERT_FALSE(load.has_value());
  EXPECT_EQ(load.error(), make_error_code(Error::LockTimeout));
}

TEST_F(TaskProcessorTest, RunNextHandlesOneSource) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  test::add_task(cfg_, "aux", "task-20250101-090000");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());

  auto report = processor->run_next(SourceId{"main"});
  EXPECT_EQ(report.outcome, RunOutcome::Dispatched);
  EXPECT_EQ(report.task, TaskId{"task-20250101-100000"});
  EXPECT_EQ(report.status, TaskStatus::Completed);

  EXPECT_EQ(processor->run_next(SourceId{"main"}).outcome, RunOutcome::Idle);
  EXPECT_EQ(processor->run_next(SourceId{"unknown"}).outcome, RunOutcome::Idle);

  const auto state = processor->snapshot();
  EXPECT_EQ(state.coordinator.current_source, SourceId{"main"});
  EXPECT_EQ(state.sources.at(SourceId{"aux"}).count(TaskStatus::Pending), 1u);
}

TEST_F(TaskProcessorTest, OneTaskPerSourceAcrossProcessors) {
  for (const auto *id : {"task-20250101-100000", "task-20250101-110000",
                         "task-20250101-120000", "task-20250101-130000"}) {
    test::add_task(cfg_, "main", id);
  }
  executor_.set_delay(30ms);
  auto first = make_processor();
  auto second = make_processor();
  ASSERT_TRUE(first->load_tasks().has_value());

  auto drain = [](TaskProcessor &processor) {
    for (int guard = 0; guard < 2000; ++guard) {
      const auto outcome = processor.run_next(SourceId{"main"}).outcome;
      if (outcome == RunOutcome::Idle) {
        return;
      }
      if (outcome != RunOutcome::Dispatched) {
        std::this_thread::sleep_for(2ms);
      }
    }
  };
  {
    std::jthread a([&] { drain(*first); });
    std::jthread b([&] { drain(*second); });
  }

  EXPECT_EQ(executor_.calls().size(), 4u);
  EXPECT_EQ(executor_.max_overlap(), 1);
  EXPECT_EQ(first->snapshot().count(TaskStatus::Completed), 4u);
}

TEST_F(TaskProcessorTest, SourcesRunConcurrentlyUnderRunNext) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  test::add_task(cfg_, "aux", "task-20250101-100000");
  executor_.set_delay(100ms);
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());

  std::atomic<int> dispatched{0};
  {
    std::jthread a([&] {
      if (processor->run_next(SourceId{"main"}).outcome ==
          RunOutcome::Dispatched) {
        ++dispatched;
      }
    });
    std::jthread b([&] {
      if (processor->run_next(SourceId{"aux"}).outcome ==
          RunOutcome::Dispatched) {
        ++dispatched;
      }
    });
  }
  EXPECT_EQ(dispatched.load(), 2);
  EXPECT_EQ(processor->snapshot().count(TaskStatus::Completed), 2u);
}

TEST_F(TaskProcessorTest, RecoversTaskOfDeadOwner) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());

  const ProcessOwner dead{.pid = kDeadPid, .host = local_hostname()};
  mark_running("main", "task-20250101-100000", dead);
  auto marker = RunningMarker::create(source("main").pending_dir,
                                      TaskId{"task-20250101-100000"}, dead);
  ASSERT_TRUE(marker.has_value());

  auto recovered = processor->recover_stale();
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, 1u);
  EXPECT_FALSE(fs::exists(RunningMarker::path_for(
      source("main").pending_dir, TaskId{"task-20250101-100000"})));

  const auto state = processor->snapshot();
  const auto *task = find_task(state, "main", "task-20250101-100000");
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->status, TaskStatus::Pending);
  EXPECT_EQ(task->attempts, 1);
  EXPECT_FALSE(state.sources.at(SourceId{"main"}).processing.active);

  (void)processor->process_tasks();
  const auto *done =
      find_task(processor->snapshot(), "main", "task-20250101-100000");
  ASSERT_NE(done, nullptr);
  EXPECT_EQ(done->status, TaskStatus::Completed);
  EXPECT_EQ(done->attempts, 2);
}

TEST_F(TaskProcessorTest, AbandonsTaskOutOfAttempts) {
  cfg_.settings.max_attempts = 1;
  test::add_task(cfg_, "main", "task-20250101-100000");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());
  mark_running("main", "task-20250101-100000",
               ProcessOwner{.pid = kDeadPid, .host = local_hostname()});

  auto recovered = processor->recover_stale();
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, 1u);

  const auto state = processor->snapshot();
  const auto *task = find_task(state, "main", "task-20250101-100000");
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->status, TaskStatus::Failed);
  EXPECT_EQ(task->error, "abandoned after 1 attempt(s)");
  EXPECT_EQ(state.global.total_failed, 1u);
  EXPECT_EQ(processor->process_tasks().status, ProcessStatus::Empty);
}

TEST_F(TaskProcessorTest, LeftoverOfThisProcessIsRecovered) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());
  mark_running("main", "task-20250101-100000", current_owner());

  auto recovered = processor->recover_stale();
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, 1u);
}

TEST_F(TaskProcessorTest, LiveForeignOwnerKeepsItsTask) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  test::add_task(cfg_, "main", "task-20250101-110000");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());

  const pid_t other = ::fork();
  ASSERT_GE(other, 0);
  if (other == 0) {
    ::pause();
    ::_exit(0);
  }
  mark_running("main", "task-20250101-100000",
               ProcessOwner{.pid = other, .host = local_hostname()});

  auto recovered = processor->recover_stale();
  const auto busy = processor->run_next(SourceId{"main"}).outcome;
  ::kill(other, SIGKILL);
  ::waitpid(other, nullptr, 0);
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, 0u);
  EXPECT_EQ(busy, RunOutcome::Busy);
  EXPECT_TRUE(executor_.calls().empty());

  // Once that owner is gone the task is reclaimed.
  EXPECT_EQ(processor->run_next(SourceId{"main"}).outcome,
            RunOutcome::Dispatched);
}

TEST_F(TaskProcessorTest, UnloadRemovesSource) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  test::add_task(cfg_, "main", "task-20250101-110000");
  test::add_task(cfg_, "aux", "task-20250101-100000");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());

  auto removed = processor->unload_source(SourceId{"main"});
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(*removed, 2u);

  const auto state = processor->snapshot();
  EXPECT_EQ(state.find_source(SourceId{"main"}), nullptr);
  ASSERT_EQ(state.coordinator.source_order.size(), 1u);
  EXPECT_EQ(state.coordinator.source_order[0], "aux");
  EXPECT_EQ(state.global.total_queued, 1u);
  // Spec files stay where they are.
  EXPECT_TRUE(
      fs::exists(source("main").pending_dir / "task-20250101-100000.md"));

  auto missing = processor->unload_source(SourceId{"main"});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), make_error_code(Error::NotFound));
}

TEST_F(TaskProcessorTest, UnloadRefusesWhileTaskRuns) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  executor_.set_delay(300ms);
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());

  std::jthread runner([&] { (void)processor->run_next(SourceId{"main"}); });
  ASSERT_TRUE(test::poll_until([&] { return !executor_.calls().empty(); }, 5s));

  auto busy = processor->unload_source(SourceId{"main"});
  ASSERT_FALSE(busy.has_value());
  EXPECT_EQ(busy.error(), make_error_code(Error::Busy));
}

TEST_F(TaskProcessorTest, StopRequestEndsBatchAndCancelsExecutor) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());

  processor->request_stop();
  EXPECT_TRUE(processor->stop_requested());
  EXPECT_TRUE(executor_.cancelled());

  auto summary = processor->process_tasks();
  EXPECT_EQ(summary.processed, 0u);
  EXPECT_EQ(summary.remaining, 1u);
  EXPECT_TRUE(executor_.calls().empty());
}

TEST_F(TaskProcessorTest, RunNextIdlesOnceStopRequested) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());

  processor->request_stop();
  EXPECT_EQ(processor->run_next(SourceId{"main"}).outcome, RunOutcome::Idle);
  EXPECT_TRUE(executor_.calls().empty());
  EXPECT_EQ(processor->snapshot().count(TaskStatus::Pending), 1u);
}

TEST_F(TaskProcessorTest, UnusableStateLockDoesNotHangRecording) {
  const auto spec = test::add_task(cfg_, "main", "task-20250101-100000");
  bool blocked = false;
  test::FakeExecutor executor{[&](const ExecutionRequest &) {
    if (!blocked) {
      blocked = true;
      fs::create_directory(cfg_.state_lock_file());
    }
    return ExecutionResult{.success = true, .output = "ok"};
  }};
  TaskProcessor processor{cfg_, executor};
  ASSERT_TRUE(processor.load_tasks().has_value());

  auto report = processor.run_next(SourceId{"main"});
  EXPECT_EQ(report.outcome, RunOutcome::Failed);
  EXPECT_EQ(report.task, TaskId{"task-20250101-100000"});
  EXPECT_TRUE(fs::exists(spec));
  EXPECT_FALSE(fs::exists(source("main").archive_dir /
                          "task-20250101-100000.md"));

  fs::remove(cfg_.state_lock_file());
  auto recovered = processor.recover_stale();
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, 1u);

  report = processor.run_next(SourceId{"main"});
  EXPECT_EQ(report.outcome, RunOutcome::Dispatched);
  EXPECT_EQ(report.status, TaskStatus::Completed);
  EXPECT_TRUE(fs::exists(source("main").archive_dir /
                         "task-20250101-100000.md"));
}

TEST_F(TaskProcessorTest, RecordingGivesUpWhenStoppedWhileStateIsLocked) {
  cfg_.settings.lock_timeout = 20ms;
  const auto spec = test::add_task(cfg_, "main", "task-20250101-100000");
  std::optional<InterprocessLock> other;
  TaskProcessor *target = nullptr;
  test::FakeExecutor executor{[&](const ExecutionRequest &) {
    other.emplace(cfg_.state_lock_file(), 5ms);
    EXPECT_TRUE(other->acquire(200ms).has_value());
    target->request_stop();
    return ExecutionResult{.success = true, .output = "ok"};
  }};
  TaskProcessor processor{cfg_, executor};
  target = &processor;
  ASSERT_TRUE(processor.load_tasks().has_value());

  auto report = processor.run_next(SourceId{"main"});
  EXPECT_EQ(report.outcome, RunOutcome::Failed);
  EXPECT_TRUE(fs::exists(spec));
  EXPECT_FALSE(
      fs::exists(source("main").pending_dir / ".task-20250101-100000.lock"));

  other.reset();
  auto recovered = processor.recover_stale();
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, 1u);
  const auto *task =
      find_task(processor.snapshot(), "main", "task-20250101-100000");
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->status, TaskStatus::Pending);
}

TEST_F(TaskProcessorTest, UnrecordedOutcomeKeepsSpecForRetry) {
  const auto spec = test::add_task(cfg_, "main", "task-20250101-100000");
  const fs::path parked{cfg_.state_file.string() + ".parked"};
  bool broken = false;
  test::FakeExecutor executor{[&](const ExecutionRequest &) {
    if (!broken) {
      broken = true;
      fs::rename(cfg_.state_file, parked);
      fs::create_directory(cfg_.state_file);
    }
    return ExecutionResult{.success = true, .output = "ok"};
  }};
  TaskProcessor processor{cfg_, executor};
  ASSERT_TRUE(processor.load_tasks().has_value());

  auto report = processor.run_next(SourceId{"main"});
  EXPECT_EQ(report.outcome, RunOutcome::Failed);
  const auto &src = source("main");
  EXPECT_TRUE(fs::exists(spec));
  EXPECT_FALSE(fs::exists(src.archive_dir / "task-20250101-100000.md"));
  EXPECT_FALSE(fs::exists(src.results_dir / "task-20250101-100000.json"));
  EXPECT_FALSE(fs::exists(src.pending_dir / ".task-20250101-100000.running"));

  fs::remove(cfg_.state_file);
  fs::rename(parked, cfg_.state_file);
  auto recovered = processor.recover_stale();
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, 1u);

  report = processor.run_next(SourceId{"main"});
  EXPECT_EQ(report.outcome, RunOutcome::Dispatched);
  EXPECT_EQ(report.status, TaskStatus::Completed);
  EXPECT_EQ(executor.calls().size(), 2u);
  EXPECT_EQ(executor.calls()[1].spec_content, "do the thing\n");
  EXPECT_TRUE(fs::exists(src.archive_dir / "task-20250101-100000.md"));
  const auto *task =
      find_task(processor.snapshot(), "main", "task-20250101-100000");
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->status, TaskStatus::Completed);
}

TEST_F(TaskProcessorTest, CorruptStateStartsFresh) {
  fs::create_directories(cfg_.state_file.parent_path());
  test::write_file(cfg_.state_file, "{ this is not json");
  test::add_task(cfg_, "main", "task-20250101-100000");

  auto processor = make_processor();
  auto loaded = processor->load_tasks();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->added, 1u);
  EXPECT_EQ(processor->snapshot().version, kStateVersion);
}

TEST_F(TaskProcessorTest, LoadCreatesMissingPendingDirectory) {
  fs::remove_all(source("aux").pending_dir);
  auto processor = make_processor();
  ASSERT_TRUE(processor->load_tasks().has_value());
  EXPECT_TRUE(fs::is_directory(source("aux").pending_dir));
}

TEST_F(TaskProcessorTest, LoadSourceOnlyScansThatSource) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  test::add_task(cfg_, "aux", "task-20250101-100000");
  auto processor = make_processor();

  auto loaded = processor->load_source(SourceId{"aux"}, TaskOrigin::Reload);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->added, 1u);
  EXPECT_EQ(loaded->sources, 1u);

  const auto state = processor->snapshot();
  // Both sources are registered, only aux was scanned.
  EXPECT_TRUE(state.sources.at(SourceId{"main"}).queue.empty());
  EXPECT_EQ(state.sources.at(SourceId{"aux"}).queue.size(), 1u);

  auto unknown = processor->load_source(SourceId{"nope"}, TaskOrigin::Reload);
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error(), make_error_code(Error::NotFound));
}
