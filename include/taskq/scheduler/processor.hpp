#pragma once

#include "taskq/config/queue_config.hpp"
#include "taskq/core/error.hpp"
#include "taskq/executor/executor.hpp"
#include "taskq/queue/models.hpp"
#include "taskq/scanner/scanner.hpp"
#include "taskq/storage/file_lock.hpp"
#include "taskq/storage/running_marker.hpp"
#include "taskq/util/enum.hpp"

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskq {

enum class ProcessStatus : std::uint8_t { Completed, Empty, Skipped };
BOOST_DESCRIBE_ENUM(ProcessStatus, Completed, Empty, Skipped)
TASKQ_DEFINE_ENUM_SERDE(ProcessStatus, ProcessStatus::Empty)

struct ProcessSummary {
  ProcessStatus status{ProcessStatus::Empty};
  std::size_t processed{0};
  std::size_t failed{0};
  std::size_t remaining{0};
  // Set for Skipped, e.g. "locked".
  std::string reason;
};

enum class EnqueueOutcome : std::uint8_t {
  Added,     // new task id
  Requeued,  // completed task whose content changed
  Updated,   // content changed, status untouched
  Unchanged, // same content as recorded
};
BOOST_DESCRIBE_ENUM(EnqueueOutcome, Added, Requeued, Updated, Unchanged)
TASKQ_DEFINE_ENUM_SERDE(EnqueueOutcome, EnqueueOutcome::Unchanged)

struct LoadSummary {
  std::size_t sources{0};
  std::size_t added{0};
  std::size_t requeued{0};
  std::size_t updated{0};
  std::size_t unchanged{0};
  std::size_t recovered{0};
};

enum class RunOutcome : std::uint8_t {
  Dispatched, // one task executed and recorded
  Idle,       // nothing pending for the source
  Busy,       // the source already has a live running task
  Contended,  // the state lock could not be taken in time
  Failed,     // state could not be read or written
};
BOOST_DESCRIBE_ENUM(RunOutcome, Dispatched, Idle, Busy, Contended, Failed)
TASKQ_DEFINE_ENUM_SERDE(RunOutcome, RunOutcome::Idle)

struct RunReport {
  RunOutcome outcome{RunOutcome::Idle};
  std::optional<TaskId> task;
  std::optional<TaskStatus> status;
};

// Owns the persisted queue. Every mutation runs under the state-file lock
// (cross-process) and an in-process mutex, in that order, and rewrites the
// state file atomically before returning. Task execution itself happens
// outside the mutex so several sources can run concurrently.
class TaskProcessor {
public:
  TaskProcessor(QueueConfig config, IExecutor &executor);
  ~TaskProcessor();

  TaskProcessor(const TaskProcessor &) = delete;
  auto operator=(const TaskProcessor &) -> TaskProcessor & = delete;

  // Scans every configured source's pending directory and merges what it
  // finds. Also reconciles the persisted source set with the configuration
  // and recovers stale running tasks.
  [[nodiscard]] auto load_tasks(TaskOrigin origin = TaskOrigin::Load)
      -> Result<LoadSummary>;
  [[nodiscard]] auto load_source(const SourceId &source, TaskOrigin origin)
      -> Result<LoadSummary>;

  // Merges one spec file into a configured source's queue.
  [[nodiscard]] auto enqueue_file(const SourceId &source,
                                  const std::filesystem::path &file,
                                  TaskOrigin origin = TaskOrigin::Manual)
      -> Result<EnqueueOutcome>;

  // Runs up to `max_tasks` tasks (0 = until drained) in round-robin order,
  // holding the state lock for the whole batch.
  [[nodiscard]] auto process_tasks(std::size_t max_tasks = 0)
      -> ProcessSummary;

  // Claims and executes the next task of one source. The state lock is held
  // only while claiming and while recording the outcome.
  [[nodiscard]] auto run_next(const SourceId &source) -> RunReport;

  // Resets running tasks whose owner is gone. Returns how many changed.
  [[nodiscard]] auto recover_stale() -> Result<std::size_t>;

  // Drops a source and its queue from the state. Returns the number of
  // records removed. Error::NotFound / Error::Busy.
  [[nodiscard]] auto unload_source(const SourceId &source)
      -> Result<std::size_t>;

  // Unlocked read of the state file.
  [[nodiscard]] auto snapshot() const -> QueueState;

  // Stops process_tasks() between tasks and marks interrupted executions as
  // cancelled.
  auto request_stop() noexcept -> void;
  [[nodiscard]] auto stop_requested() const noexcept -> bool {
    return stop_requested_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto config() const noexcept -> const QueueConfig & {
    return config_;
  }
  [[nodiscard]] auto scanner() const noexcept -> const DirectoryScanner & {
    return scanner_;
  }

private:
  struct Claim {
    TaskId task_id;
    SourceId source_id;
    const SourceConfig *source{nullptr};
    std::filesystem::path spec_path;
    int attempts{0};
    util::TimePoint started_at{};
    util::TimePoint completed_at{};
    InterprocessLock task_lock;
    RunningMarker marker;
  };

  enum class ClaimOutcome : std::uint8_t { Claimed, Idle, Busy };

  [[nodiscard]] auto acquire_state_lock() const -> Result<InterprocessLock>;
  [[nodiscard]] auto load_state() const -> Result<QueueState>;
  [[nodiscard]] auto persist(QueueState &state) const -> Result<void>;

  [[nodiscard]] auto load_from(std::vector<const SourceConfig *> sources,
                               TaskOrigin origin) -> Result<LoadSummary>;
  auto reconcile_sources(QueueState &state) const -> void;
  [[nodiscard]] auto scan_into(QueueState &state, const SourceConfig &source,
                               TaskOrigin origin, LoadSummary &summary) const
      -> Result<void>;
  [[nodiscard]] auto merge(QueueState &state, SourceState &source,
                           const DiscoveredTask &found, TaskOrigin origin) const
      -> EnqueueOutcome;

  // Caller holds mutex_.
  [[nodiscard]] auto task_alive(const SourceState &source,
                                const TaskRecord &task) const -> bool;
  auto recover_source(QueueState &state, SourceState &source) -> std::size_t;
  [[nodiscard]] auto source_busy(SourceState &source) -> bool;
  [[nodiscard]] auto eligible_sources(QueueState &state)
      -> std::vector<SourceId>;
  [[nodiscard]] auto claim_next(QueueState &state, const SourceId &source,
                                std::optional<Claim> &claim) -> ClaimOutcome;
  auto record_outcome(QueueState &state, Claim &claim,
                      const ExecutionResult &result) -> TaskStatus;

  // Takes mutex_; the state lock must already be held. Fails when the
  // outcome could not be persisted; the task then stays Running on disk.
  [[nodiscard]] auto record_locked(Claim &claim, const ExecutionResult &result)
      -> Result<TaskStatus>;
  // Takes the state lock, retrying while it is contended. Gives up on other
  // lock errors and, after a few tries, once a stop was requested.
  [[nodiscard]] auto record(Claim &claim, const ExecutionResult &result)
      -> Result<TaskStatus>;

  // No locks held.
  [[nodiscard]] auto execute(const Claim &claim) -> ExecutionResult;
  auto finalize(Claim &claim, TaskStatus status,
                const ExecutionResult &result) -> void;
  // Drops the claim's lock and marker but leaves the spec in pending/ so the
  // recovered task can run again.
  auto release(Claim &claim) -> void;

  QueueConfig config_;
  IExecutor *executor_;
  DirectoryScanner scanner_;
  ProcessOwner self_;
  std::atomic<bool> stop_requested_{false};

  mutable std::mutex mutex_;
  ankerl::unordered_dense::set<TaskId> in_flight_;
};

} // namespace taskq
