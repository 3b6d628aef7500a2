#include "taskq/app/queue_daemon.hpp"

#include "taskq/core/constants.hpp"
#include "taskq/util/log.hpp"

#include <algorithm>
#include <chrono>

namespace taskq {

QueueDaemon::QueueDaemon(QueueConfig config, IExecutor &executor)
    : config_(config), processor_(std::move(config), executor) {}

QueueDaemon::~QueueDaemon() { stop(); }

auto QueueDaemon::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  if (auto r = processor_.recover_stale(); !r) {
    log::warn("Stale task recovery skipped: {}", r.error().message());
  } else if (*r > 0) {
    log::info("Recovered {} stale task(s)", *r);
  }

  if (auto r = processor_.load_tasks(TaskOrigin::Load); !r) {
    if (r.error() != make_error_code(Error::LockTimeout)) {
      log::error("Initial load failed: {}", r.error().message());
      running_.store(false);
      return fail(r.error());
    }
    log::warn("Initial load skipped: queue is locked");
  }

  for (const auto &source : config_.sources) {
    auto worker = std::make_unique<Worker>();
    worker->source = source.id;
    worker->signal =
        std::make_unique<DebounceSignal>(config_.settings.watch_debounce);
    workers_.push_back(std::move(worker));
  }

  if (config_.settings.watch_enabled) {
    start_watchers();
  }

  for (auto &worker : workers_) {
    worker->thread = std::jthread(
        [this, w = worker.get()](std::stop_token stop) {
          worker_loop(stop, *w);
        });
  }

  log::info("Queue daemon started: {} source(s), {} watcher(s)",
            workers_.size(), watchers_.size());
  return ok();
}

auto QueueDaemon::start_watchers() -> void {
  work_guard_.emplace(io_.get_executor());
  for (const auto &source : config_.sources) {
    auto watcher = std::make_unique<SourceWatcher>(
        io_, source.id, source.pending_dir, config_.settings.watch_patterns);
    watcher->set_on_task_file(
        [this](const SourceId &id, const std::filesystem::path &file) {
          on_task_file(id, file);
        });
    if (auto r = watcher->start(); !r) {
      log::warn("Source {} falls back to periodic rescans: {}", source.id,
                r.error().message());
      continue;
    }
    watchers_.push_back(std::move(watcher));
  }
  io_thread_ = std::jthread([this] { io_.run(); });
}

auto QueueDaemon::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  log::info("Queue daemon stopping");

  processor_.request_stop();
  for (auto &worker : workers_) {
    worker->thread.request_stop();
    worker->signal->close();
  }
  for (auto &worker : workers_) {
    if (worker->thread.joinable()) {
      worker->thread.join();
    }
  }

  for (auto &watcher : watchers_) {
    watcher->stop();
  }
  watchers_.clear();
  work_guard_.reset();
  io_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  workers_.clear();

  running_.notify_all();
  log::info("Queue daemon stopped");
}

auto QueueDaemon::wait() const -> void { running_.wait(true); }

auto QueueDaemon::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto QueueDaemon::find_worker(const SourceId &source) -> Worker * {
  auto it = std::ranges::find_if(
      workers_, [&](const auto &w) { return w->source == source; });
  return it == workers_.end() ? nullptr : it->get();
}

auto QueueDaemon::wake(const SourceId &source) -> void {
  if (auto *worker = find_worker(source)) {
    worker->signal->raise();
  }
}

auto QueueDaemon::on_task_file(const SourceId &source,
                               const std::filesystem::path &file) -> void {
  auto *worker = find_worker(source);
  if (worker == nullptr || !worker->signal->notify(file.string())) {
    return;
  }

  auto outcome = processor_.enqueue_file(source, file, TaskOrigin::Watch);
  if (!outcome) {
    if (outcome.error() != make_error_code(Error::InvalidArgument)) {
      log::warn("Could not enqueue {}: {}", file.string(),
                outcome.error().message());
    }
  } else if (*outcome != EnqueueOutcome::Unchanged) {
    log::debug("Watcher {} {}", to_string_view(*outcome), file.string());
  }
  worker->signal->raise();
}

auto QueueDaemon::worker_loop(std::stop_token stop, Worker &worker) -> void {
  const auto keepalive =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config_.settings.worker_keepalive);
  const auto retry_delay =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config_.settings.worker_retry_delay);

  log::debug("Worker for source {} started", worker.source);
  auto next_wait = std::chrono::milliseconds::zero();

  while (!stop.stop_requested()) {
    if (next_wait > std::chrono::milliseconds::zero()) {
      const bool woken = worker.signal->wait_for(next_wait);
      if (stop.stop_requested() || worker.signal->closed()) {
        break;
      }
      if (!woken) {
        worker.signal->cleanup();
        if (auto r = processor_.load_source(worker.source, TaskOrigin::Reload);
            !r && r.error() != make_error_code(Error::LockTimeout)) {
          log::warn("Rescan of source {} failed: {}", worker.source,
                    r.error().message());
        }
      }
    }

    const auto report = processor_.run_next(worker.source);
    switch (report.outcome) {
    case RunOutcome::Dispatched:
      next_wait = std::chrono::milliseconds::zero();
      break;
    case RunOutcome::Idle:
      next_wait = keepalive;
      break;
    case RunOutcome::Contended:
      next_wait = timing::kWorkerCyclePause;
      break;
    case RunOutcome::Busy:
    case RunOutcome::Failed:
      next_wait = retry_delay;
      break;
    }
  }
  log::debug("Worker for source {} exiting", worker.source);
}

} // namespace taskq
