#include "taskq/app/queue_daemon.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>

using namespace taskq;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class QueueDaemonTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = test::make_temp_dir("taskq_daemon_test");
    cfg_ = test::make_config(dir_, {"main", "aux"});
  }
  void TearDown() override { fs::remove_all(dir_); }

  [[nodiscard]] auto completed(QueueDaemon &daemon) -> std::size_t {
    return daemon.processor().snapshot().count(TaskStatus::Completed);
  }

  fs::path dir_;
  QueueConfig cfg_;
  test::FakeExecutor executor_;
};

TEST_F(QueueDaemonTest, DrainsTasksPresentAtStartup) {
  test::add_task(cfg_, "main", "task-20250101-100000");
  test::add_task(cfg_, "main", "task-20250101-110000");
  test::add_task(cfg_, "aux", "task-20250101-100000");
  cfg_.settings.watch_enabled = false;

  QueueDaemon daemon{cfg_, executor_};
  ASSERT_TRUE(daemon.start().has_value());
  EXPECT_TRUE(daemon.is_running());
  EXPECT_EQ(daemon.watching(), 0u);

  EXPECT_TRUE(test::poll_until([&] { return completed(daemon) == 3; }, 5s));
  daemon.stop();
  EXPECT_FALSE(daemon.is_running());
  EXPECT_EQ(executor_.calls().size(), 3u);
}

TEST_F(QueueDaemonTest, PicksUpFilesFromWatcher) {
  QueueDaemon daemon{cfg_, executor_};
  ASSERT_TRUE(daemon.start().has_value());
  EXPECT_EQ(daemon.watching(), 2u);

  test::add_task(cfg_, "aux", "task-20250101-120000", "from watcher");
  ASSERT_TRUE(test::poll_until([&] { return completed(daemon) == 1; }, 5s));

  const auto state = daemon.processor().snapshot();
  const auto *task = state.find_source(SourceId{"aux"})
                         ->find_task(TaskId{"task-20250101-120000"});
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->origin, TaskOrigin::Watch);
  EXPECT_TRUE(fs::exists(cfg_.find_source(SourceId{"aux"})->archive_dir /
                         "task-20250101-120000.md"));
  daemon.stop();
}

TEST_F(QueueDaemonTest, KeepaliveRescanFindsFilesWithoutWatcher) {
  cfg_.settings.watch_enabled = false;
  QueueDaemon daemon{cfg_, executor_};
  ASSERT_TRUE(daemon.start().has_value());

  test::add_task(cfg_, "main", "task-20250101-120000");
  // worker_keepalive is one second in the test config.
  ASSERT_TRUE(test::poll_until([&] { return completed(daemon) == 1; }, 5s));

  const auto *task = daemon.processor()
                         .snapshot()
                         .find_source(SourceId{"main"})
                         ->find_task(TaskId{"task-20250101-120000"});
  ASSERT_NE(task, nullptr);
  EXPECT_EQ(task->origin, TaskOrigin::Reload);
  daemon.stop();
}

TEST_F(QueueDaemonTest, WakeRunsManuallyEnqueuedTask) {
  cfg_.settings.watch_enabled = false;
  cfg_.settings.worker_keepalive = 30s;
  QueueDaemon daemon{cfg_, executor_};
  ASSERT_TRUE(daemon.start().has_value());
  // Let the workers reach their idle wait.
  std::this_thread::sleep_for(100ms);

  const auto file = test::add_task(cfg_, "main", "task-20250101-120000");
  ASSERT_TRUE(
      daemon.processor().enqueue_file(SourceId{"main"}, file).has_value());
  daemon.wake(SourceId{"main"});

  EXPECT_TRUE(test::poll_until([&] { return completed(daemon) == 1; }, 5s));
  daemon.stop();
}

TEST_F(QueueDaemonTest, StopCancelsRunningExecution) {
  cfg_.settings.watch_enabled = false;
  executor_.set_delay(200ms);
  test::add_task(cfg_, "main", "task-20250101-100000");

  QueueDaemon daemon{cfg_, executor_};
  ASSERT_TRUE(daemon.start().has_value());
  ASSERT_TRUE(
      test::poll_until([&] { return !executor_.calls().empty(); }, 5s));

  daemon.stop();
  EXPECT_TRUE(executor_.cancelled());
  EXPECT_FALSE(daemon.is_running());
  daemon.wait();
  // Stop is idempotent.
  daemon.stop();
}

TEST_F(QueueDaemonTest, StopDoesNotStartQueuedTask) {
  cfg_.settings.watch_enabled = false;
  test::add_task(cfg_, "main", "task-20250101-100000");
  test::add_task(cfg_, "main", "task-20250101-110000");

  std::unique_ptr<test::FakeExecutor> executor;
  executor = std::make_unique<test::FakeExecutor>(
      [&](const ExecutionRequest &) {
        // Runs until stop() cancels it.
        EXPECT_TRUE(
            test::poll_until([&] { return executor->cancelled(); }, 5s));
        return ExecutionResult{.success = false, .error = "terminated"};
      });

  QueueDaemon daemon{cfg_, *executor};
  ASSERT_TRUE(daemon.start().has_value());
  ASSERT_TRUE(
      test::poll_until([&] { return !executor->calls().empty(); }, 5s));
  daemon.stop();

  const auto calls = executor->call_order();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0], "task-20250101-100000");

  const auto state = daemon.processor().snapshot();
  const auto *source = state.find_source(SourceId{"main"});
  ASSERT_NE(source, nullptr);
  const auto *first = source->find_task(TaskId{"task-20250101-100000"});
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->status, TaskStatus::Failed);
  ASSERT_TRUE(first->error.has_value());
  EXPECT_NE(first->error->find("cancelled"), std::string::npos);
  const auto *second = source->find_task(TaskId{"task-20250101-110000"});
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(second->status, TaskStatus::Pending);
}

TEST_F(QueueDaemonTest, WaitReturnsAfterStopFromAnotherThread) {
  cfg_.settings.watch_enabled = false;
  QueueDaemon daemon{cfg_, executor_};
  ASSERT_TRUE(daemon.start().has_value());

  std::jthread stopper([&] {
    std::this_thread::sleep_for(50ms);
    daemon.stop();
  });
  daemon.wait();
  EXPECT_FALSE(daemon.is_running());
}
