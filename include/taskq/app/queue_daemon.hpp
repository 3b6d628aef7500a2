#pragma once

#include "taskq/config/queue_config.hpp"
#include "taskq/core/error.hpp"
#include "taskq/executor/executor.hpp"
#include "taskq/scheduler/processor.hpp"
#include "taskq/watch/debounce_signal.hpp"
#include "taskq/watch/source_watcher.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace taskq {

// Long-running service: one worker thread per source drains that source's
// queue, woken by its DebounceSignal or by the keepalive timeout. Pending
// directories are watched with inotify on a dedicated io_context thread.
class QueueDaemon {
public:
  QueueDaemon(QueueConfig config, IExecutor &executor);
  ~QueueDaemon();

  QueueDaemon(const QueueDaemon &) = delete;
  auto operator=(const QueueDaemon &) -> QueueDaemon & = delete;

  // Recovers stale tasks, loads every source, then starts watchers and
  // workers.
  [[nodiscard]] auto start() -> Result<void>;
  // Cancels in-flight executions and joins every worker.
  auto stop() noexcept -> void;
  // Blocks until stop() has completed.
  auto wait() const -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Wakes a source's worker as if its directory had changed.
  auto wake(const SourceId &source) -> void;

  [[nodiscard]] auto processor() noexcept -> TaskProcessor & {
    return processor_;
  }
  [[nodiscard]] auto watching() const noexcept -> std::size_t {
    return watchers_.size();
  }

private:
  struct Worker {
    SourceId source;
    std::unique_ptr<DebounceSignal> signal;
    std::jthread thread;
  };

  auto start_watchers() -> void;
  auto worker_loop(std::stop_token stop, Worker &worker) -> void;
  auto on_task_file(const SourceId &source, const std::filesystem::path &file)
      -> void;
  [[nodiscard]] auto find_worker(const SourceId &source) -> Worker *;

  QueueConfig config_;
  TaskProcessor processor_;
  std::atomic<bool> running_{false};

  boost::asio::io_context io_;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::jthread io_thread_;

  std::vector<std::unique_ptr<SourceWatcher>> watchers_;
  std::vector<std::unique_ptr<Worker>> workers_;
};

} // namespace taskq
