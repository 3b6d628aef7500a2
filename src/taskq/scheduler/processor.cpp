#include "taskq/scheduler/processor.hpp"

#include "taskq/core/constants.hpp"
#include "taskq/queue/state_codec.hpp"
#include "taskq/scheduler/archiver.hpp"
#include "taskq/scheduler/coordinator.hpp"
#include "taskq/storage/atomic_store.hpp"
#include "taskq/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <ranges>
#include <thread>
#include <utility>

namespace taskq {
namespace {

auto task_lock_path(const SourceConfig &source, const TaskId &task)
    -> std::filesystem::path {
  return source.pending_dir / std::format(".{}.lock", task);
}

} // namespace

TaskProcessor::TaskProcessor(QueueConfig config, IExecutor &executor)
    : config_(std::move(config)), executor_(&executor),
      scanner_(ScannerOptions{
          .enable_fingerprint = config_.settings.enable_fingerprint,
          .patterns = config_.settings.watch_patterns}),
      self_(current_owner()) {
  std::error_code ec;
  std::filesystem::create_directories(config_.state_file.parent_path(), ec);
  if (ec) {
    log::warn("Cannot create state directory {}: {}",
              config_.state_file.parent_path().string(), ec.message());
  }
}

TaskProcessor::~TaskProcessor() = default;

auto TaskProcessor::request_stop() noexcept -> void {
  if (!stop_requested_.exchange(true, std::memory_order_acq_rel)) {
    executor_->cancel();
  }
}

auto TaskProcessor::acquire_state_lock() const -> Result<InterprocessLock> {
  InterprocessLock lock{config_.state_lock_file(),
                        config_.settings.lock_poll_interval};
  if (auto r = lock.acquire(config_.settings.lock_timeout); !r) {
    return fail(r.error());
  }
  return ok(std::move(lock));
}

auto TaskProcessor::load_state() const -> Result<QueueState> {
  auto text = AtomicStateStore::read_text(config_.state_file);
  if (!text) {
    if (text.error() == make_error_code(Error::FileNotFound)) {
      return ok(QueueState{});
    }
    log::error("Cannot read state file {}: {}", config_.state_file.string(),
               text.error().message());
    return fail(text.error());
  }

  auto state = StateCodec::decode(*text);
  if (!state) {
    log::warn("State file {} is unusable ({}), starting from an empty queue",
              config_.state_file.string(), state.error().message());
    return ok(QueueState{});
  }
  return state;
}

auto TaskProcessor::persist(QueueState &state) const -> Result<void> {
  state.version = std::string{kStateVersion};
  state.updated_at = util::Clock::now();
  auto text = StateCodec::encode(state);
  if (!text) {
    return fail(text.error());
  }
  if (auto r = AtomicStateStore::write_text(config_.state_file, *text); !r) {
    log::error("Failed to persist state to {}: {}",
               config_.state_file.string(), r.error().message());
    return r;
  }
  return ok();
}

auto TaskProcessor::snapshot() const -> QueueState {
  auto text = AtomicStateStore::read_text(config_.state_file);
  if (!text) {
    return QueueState{};
  }
  return StateCodec::decode(*text).value_or(QueueState{});
}

auto TaskProcessor::reconcile_sources(QueueState &state) const -> void {
  SourceCoordinator coordinator{state.coordinator};
  std::vector<SourceId> live;
  live.reserve(config_.sources.size() + state.sources.size());

  for (const auto &source : config_.sources) {
    auto [it, inserted] = state.sources.try_emplace(source.id);
    if (inserted) {
      it->second.id = source.id;
      log::info("Registered source {} at {}", source.id,
                source.path.string());
    }
    it->second.path = source.path.string();
    live.push_back(source.id);
  }
  // Unconfigured sources keep their slot until they are unloaded.
  for (const auto &id : state.sources | std::views::keys) {
    if (config_.find_source(id) == nullptr) {
      live.push_back(id);
    }
  }

  coordinator.reconcile(live);
  state.coordinator = coordinator.state();
}

auto TaskProcessor::merge(QueueState &state, SourceState &source,
                          const DiscoveredTask &found, TaskOrigin origin) const
    -> EnqueueOutcome {
  auto *existing = source.find_task(found.id);
  if (existing == nullptr) {
    source.queue.push_back(TaskRecord{
        .id = found.id,
        .spec_path = found.spec_path.string(),
        .source_id = source.id,
        .status = TaskStatus::Pending,
        .origin = origin,
        .content_fingerprint = found.fingerprint,
        .file_size = found.file_size,
        .added_at = util::Clock::now(),
    });
    ++source.statistics.total_queued;
    ++state.global.total_queued;
    log::info("Queued {} from source {} ({})", found.id, source.id,
              to_string_view(origin));
    return EnqueueOutcome::Added;
  }

  if (!scanner_.options().enable_fingerprint ||
      existing->content_fingerprint == found.fingerprint) {
    return EnqueueOutcome::Unchanged;
  }

  existing->content_fingerprint = found.fingerprint;
  existing->file_size = found.file_size;
  existing->spec_path = found.spec_path.string();
  if (existing->status == TaskStatus::Completed) {
    existing->requeue(origin);
    log::info("Requeued {} of source {}: content changed", found.id,
              source.id);
    return EnqueueOutcome::Requeued;
  }
  return EnqueueOutcome::Updated;
}

auto TaskProcessor::scan_into(QueueState &state, const SourceConfig &source,
                              TaskOrigin origin, LoadSummary &summary) const
    -> Result<void> {
  std::error_code ec;
  if (!std::filesystem::exists(source.pending_dir, ec)) {
    std::filesystem::create_directories(source.pending_dir, ec);
    if (ec) {
      return fail(ec);
    }
    log::info("Created pending directory {}", source.pending_dir.string());
  }

  auto found = scanner_.scan(source.pending_dir, source.id);
  if (!found) {
    return fail(found.error());
  }

  auto &target = state.sources.at(source.id);
  for (const auto &task : *found) {
    switch (merge(state, target, task, origin)) {
    case EnqueueOutcome::Added:
      ++summary.added;
      break;
    case EnqueueOutcome::Requeued:
      ++summary.requeued;
      break;
    case EnqueueOutcome::Updated:
      ++summary.updated;
      break;
    case EnqueueOutcome::Unchanged:
      ++summary.unchanged;
      break;
    }
  }
  target.statistics.last_load_at = util::Clock::now();
  ++summary.sources;
  return ok();
}

auto TaskProcessor::load_from(std::vector<const SourceConfig *> sources,
                              TaskOrigin origin) -> Result<LoadSummary> {
  auto lock = acquire_state_lock();
  if (!lock) {
    return fail(lock.error());
  }
  std::scoped_lock guard(mutex_);
  auto state = load_state();
  if (!state) {
    return fail(state.error());
  }

  LoadSummary summary;
  reconcile_sources(*state);
  for (auto &source : state->sources | std::views::values) {
    summary.recovered += recover_source(*state, source);
  }
  for (const auto *source : sources) {
    if (auto r = scan_into(*state, *source, origin, summary); !r) {
      log::warn("Skipping source {}: {}", source->id, r.error().message());
    }
  }
  state->global.last_load_at = util::Clock::now();

  if (auto r = persist(*state); !r) {
    return fail(r.error());
  }
  if (summary.added + summary.requeued > 0) {
    log::info("Loaded {} new and {} requeued task(s) from {} source(s)",
              summary.added, summary.requeued, summary.sources);
  }
  return ok(summary);
}

auto TaskProcessor::load_tasks(TaskOrigin origin) -> Result<LoadSummary> {
  auto sources = config_.sources |
                 std::views::transform([](const SourceConfig &s) { return &s; }) |
                 std::ranges::to<std::vector>();
  return load_from(std::move(sources), origin);
}

auto TaskProcessor::load_source(const SourceId &source, TaskOrigin origin)
    -> Result<LoadSummary> {
  const auto *cfg = config_.find_source(source);
  if (cfg == nullptr) {
    return fail(Error::NotFound);
  }
  return load_from({cfg}, origin);
}

auto TaskProcessor::enqueue_file(const SourceId &source,
                                 const std::filesystem::path &file,
                                 TaskOrigin origin) -> Result<EnqueueOutcome> {
  if (config_.find_source(source) == nullptr) {
    log::warn("Cannot enqueue {}: unknown source {}", file.string(), source);
    return fail(Error::NotFound);
  }
  auto found = scanner_.inspect(file, source);
  if (!found) {
    log::debug("Not a task spec: {}", file.string());
    return fail(Error::InvalidArgument);
  }

  auto lock = acquire_state_lock();
  if (!lock) {
    return fail(lock.error());
  }
  std::scoped_lock guard(mutex_);
  auto state = load_state();
  if (!state) {
    return fail(state.error());
  }
  reconcile_sources(*state);

  auto outcome = merge(*state, state->sources.at(source), *found, origin);
  if (outcome == EnqueueOutcome::Unchanged) {
    return ok(outcome);
  }
  state->global.last_load_at = util::Clock::now();
  if (auto r = persist(*state); !r) {
    return fail(r.error());
  }
  return ok(outcome);
}

auto TaskProcessor::unload_source(const SourceId &source)
    -> Result<std::size_t> {
  auto lock = acquire_state_lock();
  if (!lock) {
    return fail(lock.error());
  }
  std::scoped_lock guard(mutex_);
  auto state = load_state();
  if (!state) {
    return fail(state.error());
  }

  auto *target = state->find_source(source);
  if (target == nullptr) {
    return fail(Error::NotFound);
  }
  recover_source(*state, *target);
  if (target->running_task() != nullptr) {
    log::warn("Source {} has a running task; not unloading", source);
    return fail(Error::Busy);
  }

  const auto removed = target->queue.size();
  state->global.total_queued -=
      std::min<std::uint64_t>(state->global.total_queued, removed);
  state->sources.erase(source);

  SourceCoordinator coordinator{state->coordinator};
  coordinator.remove_source(source);
  state->coordinator = coordinator.state();

  if (auto r = persist(*state); !r) {
    return fail(r.error());
  }
  log::info("Unloaded source {} ({} task(s))", source, removed);
  return ok(removed);
}

auto TaskProcessor::task_alive(const SourceState &source,
                               const TaskRecord &task) const -> bool {
  if (in_flight_.contains(task.id)) {
    return true;
  }
  // Our own pid without an in-flight entry is a leftover of this process.
  auto foreign_alive = [this](const ProcessOwner &owner) {
    return owner != self_ && is_owner_alive(owner);
  };

  if (source.processing.task_id == task.id && source.processing.owner &&
      foreign_alive(*source.processing.owner)) {
    return true;
  }

  const auto *cfg = config_.find_source(source.id);
  if (cfg == nullptr) {
    return false;
  }
  InterprocessLock probe{task_lock_path(*cfg, task.id),
                         config_.settings.lock_poll_interval};
  if (probe.is_held()) {
    return true;
  }
  return RunningMarker::probe(cfg->pending_dir, task.id, foreign_alive) ==
         MarkerProbe::Live;
}

auto TaskProcessor::recover_source(QueueState &state, SourceState &source)
    -> std::size_t {
  std::size_t recovered = 0;
  const auto now = util::Clock::now();

  for (auto &task : source.queue) {
    if (task.status != TaskStatus::Running || task_alive(source, task)) {
      continue;
    }
    if (task.attempts >= config_.settings.max_attempts) {
      task.status = TaskStatus::Failed;
      task.completed_at = now;
      task.error = std::format("abandoned after {} attempt(s)", task.attempts);
      ++source.statistics.total_failed;
      ++state.global.total_failed;
      source.statistics.last_processed_at = now;
      log::warn("Task {} of source {} abandoned after {} attempt(s)", task.id,
                source.id, task.attempts);
    } else {
      task.requeue(task.origin);
      log::info("Recovered stale task {} of source {}", task.id, source.id);
    }
    if (source.processing.task_id == task.id) {
      source.processing.clear();
    }
    ++recovered;
  }

  if (source.processing.active && source.running_task() == nullptr) {
    source.processing.clear();
  }
  return recovered;
}

auto TaskProcessor::recover_stale() -> Result<std::size_t> {
  auto lock = acquire_state_lock();
  if (!lock) {
    return fail(lock.error());
  }
  std::scoped_lock guard(mutex_);
  auto state = load_state();
  if (!state) {
    return fail(state.error());
  }

  std::size_t recovered = 0;
  for (auto &source : state->sources | std::views::values) {
    recovered += recover_source(*state, source);
  }
  if (recovered > 0) {
    if (auto r = persist(*state); !r) {
      return fail(r.error());
    }
  }
  return ok(recovered);
}

auto TaskProcessor::source_busy(SourceState &source) -> bool {
  return source.running_task() != nullptr;
}

auto TaskProcessor::eligible_sources(QueueState &state)
    -> std::vector<SourceId> {
  std::vector<SourceId> eligible;
  for (auto &[id, source] : state.sources) {
    if (config_.find_source(id) == nullptr || !source.has_pending()) {
      continue;
    }
    recover_source(state, source);
    if (!source_busy(source)) {
      eligible.push_back(id);
    }
  }
  return eligible;
}

auto TaskProcessor::claim_next(QueueState &state, const SourceId &source_id,
                               std::optional<Claim> &claim) -> ClaimOutcome {
  auto *source = state.find_source(source_id);
  const auto *cfg = config_.find_source(source_id);
  if (source == nullptr || cfg == nullptr) {
    return ClaimOutcome::Idle;
  }
  recover_source(state, *source);
  if (source_busy(*source)) {
    return ClaimOutcome::Busy;
  }
  auto *task = source->next_pending();
  if (task == nullptr) {
    return ClaimOutcome::Idle;
  }

  InterprocessLock task_lock{task_lock_path(*cfg, task->id),
                             config_.settings.lock_poll_interval};
  if (!task_lock.acquire(std::chrono::milliseconds::zero())) {
    log::debug("Task {} is locked by another worker", task->id);
    return ClaimOutcome::Busy;
  }
  // The task lock is ours, so any marker left behind is stale.
  if (RunningMarker::probe(cfg->pending_dir, task->id,
                           [this](const ProcessOwner &owner) {
                             return owner != self_ && is_owner_alive(owner);
                           }) == MarkerProbe::Reclaimed) {
    log::info("Removed stale running marker for {}", task->id);
  }

  RunningMarker marker;
  if (auto created = RunningMarker::create(cfg->pending_dir, task->id, self_)) {
    marker = std::move(*created);
  } else {
    log::warn("Cannot create running marker for {}: {}", task->id,
              created.error().message());
  }

  const auto now = util::Clock::now();
  task->status = TaskStatus::Running;
  task->attempts += 1;
  task->started_at = now;
  task->completed_at.reset();
  task->error.reset();
  source->processing = ProcessingMarker{
      .active = true, .task_id = task->id, .owner = self_, .started_at = now};

  SourceCoordinator coordinator{state.coordinator};
  coordinator.switch_to(source_id, now);
  state.coordinator = coordinator.state();

  in_flight_.insert(task->id);
  claim.emplace(Claim{
      .task_id = task->id,
      .source_id = source_id,
      .source = cfg,
      .spec_path = task->spec_path,
      .attempts = task->attempts,
      .started_at = now,
      .task_lock = std::move(task_lock),
      .marker = std::move(marker),
  });
  return ClaimOutcome::Claimed;
}

auto TaskProcessor::execute(const Claim &claim) -> ExecutionResult {
  ExecutionResult result;
  auto content = AtomicStateStore::read_text(claim.spec_path);
  if (!content) {
    result.error = std::format("cannot read spec {}: {}",
                               claim.spec_path.string(),
                               content.error().message());
    log::error("Task {}: {}", claim.task_id, result.error);
    return result;
  }

  ExecutionRequest request{
      .task_id = claim.task_id,
      .source_id = claim.source_id,
      .spec_path = claim.spec_path,
      .spec_content = std::move(*content),
      .working_dir = config_.project_workspace,
  };

  if (stop_requested()) {
    result.error = "cancelled before start";
    log::warn("Task {} not started: stop requested", claim.task_id);
    return result;
  }

  log::info("Executing {} from source {} (attempt {})", claim.task_id,
            claim.source_id, claim.attempts);
  try {
    result = executor_->execute(request);
  } catch (const std::exception &ex) {
    result = ExecutionResult{.success = false, .error = ex.what()};
    log::error("Executor raised for {}: {}", claim.task_id, ex.what());
  }

  if (!result.success && stop_requested()) {
    result.error = result.error.empty()
                       ? std::string{"cancelled"}
                       : std::format("cancelled: {}", result.error);
  }
  if (!result.success && result.error.empty()) {
    result.error = "executor reported failure";
  }
  return result;
}

auto TaskProcessor::record_outcome(QueueState &state, Claim &claim,
                                   const ExecutionResult &result)
    -> TaskStatus {
  in_flight_.erase(claim.task_id);
  const auto status =
      result.success ? TaskStatus::Completed : TaskStatus::Failed;
  claim.completed_at = util::Clock::now();

  auto *source = state.find_source(claim.source_id);
  if (source == nullptr) {
    log::warn("Source {} was unloaded while {} ran", claim.source_id,
              claim.task_id);
    return status;
  }

  if (auto *task = source->find_task(claim.task_id)) {
    task->status = status;
    task->completed_at = claim.completed_at;
    task->error = result.success ? std::nullopt
                                 : std::optional<std::string>{result.error};
  }
  if (result.success) {
    ++source->statistics.total_completed;
    ++state.global.total_completed;
  } else {
    ++source->statistics.total_failed;
    ++state.global.total_failed;
  }
  source->statistics.last_processed_at = claim.completed_at;
  state.global.last_processed_at = claim.completed_at;
  if (source->processing.task_id == claim.task_id) {
    source->processing.clear();
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      claim.completed_at - claim.started_at);
  if (result.success) {
    log::info("Task {} completed in {}ms", claim.task_id, elapsed.count());
  } else {
    log::warn("Task {} failed after {}ms: {}", claim.task_id, elapsed.count(),
              result.error);
  }
  return status;
}

auto TaskProcessor::record_locked(Claim &claim, const ExecutionResult &result)
    -> Result<TaskStatus> {
  std::scoped_lock guard(mutex_);
  auto state = load_state();
  if (!state) {
    in_flight_.erase(claim.task_id);
    log::error("Outcome of {} was not recorded; it will be retried",
               claim.task_id);
    return fail(state.error());
  }
  const auto status = record_outcome(*state, claim, result);
  if (auto r = persist(*state); !r) {
    log::error("Outcome of {} was not persisted; it will be retried",
               claim.task_id);
    return fail(r.error());
  }
  return ok(status);
}

auto TaskProcessor::record(Claim &claim, const ExecutionResult &result)
    -> Result<TaskStatus> {
  auto abandon = [&](std::error_code ec) -> Result<TaskStatus> {
    std::scoped_lock guard(mutex_);
    in_flight_.erase(claim.task_id);
    return fail(ec);
  };

  int attempts_left = timing::kStopRecordAttempts;
  for (;;) {
    auto lock = acquire_state_lock();
    if (lock) {
      return record_locked(claim, result);
    }
    if (lock.error() != make_error_code(Error::LockTimeout)) {
      log::error("Cannot lock state to record {}: {}", claim.task_id,
                 lock.error().message());
      return abandon(lock.error());
    }
    if (stop_requested() && --attempts_left <= 0) {
      log::error("Gave up recording {} during shutdown", claim.task_id);
      return abandon(make_error_code(Error::Cancelled));
    }
    log::warn("State lock busy while recording {}, retrying", claim.task_id);
    std::this_thread::sleep_for(config_.settings.lock_poll_interval);
  }
}

auto TaskProcessor::finalize(Claim &claim, TaskStatus status,
                             const ExecutionResult &result) -> void {
  TaskArchiver{*claim.source}.finalize(TaskOutcome{
      .task_id = claim.task_id,
      .source_id = claim.source_id,
      .spec_path = claim.spec_path,
      .status = status,
      .attempts = claim.attempts,
      .started_at = claim.started_at,
      .completed_at = claim.completed_at,
      .result = &result,
  });
  release(claim);
}

auto TaskProcessor::release(Claim &claim) -> void {
  claim.marker.remove();
  claim.task_lock.release();
}

auto TaskProcessor::run_next(const SourceId &source) -> RunReport {
  std::optional<Claim> claim;
  {
    auto lock = acquire_state_lock();
    if (!lock) {
      return RunReport{.outcome = RunOutcome::Contended};
    }
    std::scoped_lock guard(mutex_);
    if (stop_requested()) {
      return RunReport{.outcome = RunOutcome::Idle};
    }
    auto state = load_state();
    if (!state) {
      return RunReport{.outcome = RunOutcome::Failed};
    }
    const auto original = *state;

    const auto outcome = claim_next(*state, source, claim);
    if (*state != original) {
      if (auto r = persist(*state); !r) {
        if (claim) {
          in_flight_.erase(claim->task_id);
        }
        return RunReport{.outcome = RunOutcome::Failed};
      }
    }
    if (outcome != ClaimOutcome::Claimed) {
      return RunReport{.outcome = outcome == ClaimOutcome::Busy
                                      ? RunOutcome::Busy
                                      : RunOutcome::Idle};
    }
  }

  auto result = execute(*claim);
  const auto status = record(*claim, result);
  if (!status) {
    release(*claim);
    return RunReport{.outcome = RunOutcome::Failed, .task = claim->task_id};
  }
  finalize(*claim, *status, result);
  return RunReport{.outcome = RunOutcome::Dispatched,
                   .task = claim->task_id,
                   .status = *status};
}

auto TaskProcessor::process_tasks(std::size_t max_tasks) -> ProcessSummary {
  auto lock = acquire_state_lock();
  if (!lock) {
    log::info("Queue is locked by another processor, skipping");
    return ProcessSummary{.status = ProcessStatus::Skipped,
                          .reason = "locked"};
  }

  {
    std::scoped_lock guard(mutex_);
    auto state = load_state();
    if (!state) {
      return ProcessSummary{.status = ProcessStatus::Skipped,
                            .reason = state.error().message()};
    }
    std::size_t recovered = 0;
    for (auto &source : state->sources | std::views::values) {
      recovered += recover_source(*state, source);
    }
    if (recovered > 0) {
      if (auto r = persist(*state); !r) {
        return ProcessSummary{.status = ProcessStatus::Skipped,
                              .reason = r.error().message()};
      }
    }
    if (state->count(TaskStatus::Pending) == 0) {
      return ProcessSummary{.status = ProcessStatus::Empty};
    }
    log::info("Processing {} pending task(s) across {} source(s)",
              state->count(TaskStatus::Pending), state->sources.size());
  }

  ProcessSummary summary{.status = ProcessStatus::Completed};
  // Sources whose head task could not be claimed during this batch.
  ankerl::unordered_dense::set<SourceId> skipped;
  std::size_t dispatched = 0;

  while (!stop_requested() && (max_tasks == 0 || dispatched < max_tasks)) {
    std::optional<Claim> claim;
    {
      std::scoped_lock guard(mutex_);
      auto state = load_state();
      if (!state) {
        break;
      }
      const auto original = *state;

      auto eligible = eligible_sources(*state);
      std::erase_if(eligible,
                    [&](const SourceId &id) { return skipped.contains(id); });
      SourceCoordinator coordinator{state->coordinator};
      auto next = coordinator.dispatch(eligible);
      if (next) {
        state->coordinator = coordinator.state();
        if (claim_next(*state, *next, claim) != ClaimOutcome::Claimed) {
          skipped.insert(*next);
        }
      }

      if (*state != original) {
        if (auto r = persist(*state); !r) {
          if (claim) {
            in_flight_.erase(claim->task_id);
          }
          break;
        }
      }
      if (!next) {
        break;
      }
      if (!claim) {
        continue;
      }
    }

    auto result = execute(*claim);
    const auto status = record_locked(*claim, result);
    if (!status) {
      release(*claim);
      break;
    }
    finalize(*claim, *status, result);
    ++dispatched;
    if (*status == TaskStatus::Completed) {
      ++summary.processed;
    } else {
      ++summary.failed;
    }
  }

  {
    std::scoped_lock guard(mutex_);
    if (auto state = load_state()) {
      summary.remaining = state->count(TaskStatus::Pending);
    }
  }
  log::info("Batch finished: {} completed, {} failed, {} remaining",
            summary.processed, summary.failed, summary.remaining);
  return summary;
}

} // namespace taskq
