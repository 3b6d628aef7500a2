#pragma once

#include "taskq/core/constants.hpp"
#include "taskq/util/enum.hpp"
#include "taskq/util/id.hpp"
#include "taskq/util/process.hpp"
#include "taskq/util/time.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace taskq {

enum class TaskStatus : std::uint8_t { Pending, Running, Completed, Failed };
BOOST_DESCRIBE_ENUM(TaskStatus, Pending, Running, Completed, Failed)
TASKQ_DEFINE_ENUM_SERDE(TaskStatus, TaskStatus::Pending)

enum class TaskOrigin : std::uint8_t { Load, Manual, Watch, Reload };
BOOST_DESCRIBE_ENUM(TaskOrigin, Load, Manual, Watch, Reload)
TASKQ_DEFINE_ENUM_SERDE(TaskOrigin, TaskOrigin::Load)

struct TaskRecord {
  TaskId id;
  std::string spec_path;
  SourceId source_id;
  TaskStatus status{TaskStatus::Pending};
  TaskOrigin origin{TaskOrigin::Load};
  int attempts{0};
  std::optional<std::string> content_fingerprint;
  std::uint64_t file_size{0};
  util::TimePoint added_at{};
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> completed_at;
  std::optional<std::string> error;

  // Back to Pending with execution fields cleared; attempts are kept.
  auto requeue(TaskOrigin new_origin) -> void;

  auto operator==(const TaskRecord &) const -> bool = default;
};

struct ProcessingMarker {
  bool active{false};
  std::optional<TaskId> task_id;
  std::optional<ProcessOwner> owner;
  std::optional<util::TimePoint> started_at;

  auto clear() -> void { *this = ProcessingMarker{}; }
  auto operator==(const ProcessingMarker &) const -> bool = default;
};

struct QueueStatistics {
  std::uint64_t total_queued{0};
  std::uint64_t total_completed{0};
  std::uint64_t total_failed{0};
  std::optional<util::TimePoint> last_processed_at;
  std::optional<util::TimePoint> last_load_at;

  auto operator==(const QueueStatistics &) const -> bool = default;
};

struct SourceState {
  SourceId id;
  std::string path;
  std::vector<TaskRecord> queue;
  ProcessingMarker processing;
  QueueStatistics statistics;

  [[nodiscard]] auto find_task(const TaskId &task) -> TaskRecord *;
  [[nodiscard]] auto find_task(const TaskId &task) const -> const TaskRecord *;
  // Oldest Pending record in arrival order.
  [[nodiscard]] auto next_pending() -> TaskRecord *;
  [[nodiscard]] auto running_task() -> TaskRecord *;
  [[nodiscard]] auto count(TaskStatus status) const -> std::size_t;
  [[nodiscard]] auto has_pending() const -> bool {
    return count(TaskStatus::Pending) > 0;
  }

  auto operator==(const SourceState &) const -> bool = default;
};

struct CoordinatorState {
  std::optional<SourceId> current_source;
  std::optional<util::TimePoint> last_switch;
  std::vector<SourceId> source_order;

  auto operator==(const CoordinatorState &) const -> bool = default;
};

// Root of the persisted state file.
struct QueueState {
  std::string version{kStateVersion};
  std::map<SourceId, SourceState> sources;
  CoordinatorState coordinator;
  QueueStatistics global;
  std::optional<util::TimePoint> updated_at;

  [[nodiscard]] auto find_source(const SourceId &id) -> SourceState *;
  [[nodiscard]] auto find_source(const SourceId &id) const
      -> const SourceState *;
  // Sources with at least one Pending task.
  [[nodiscard]] auto pending_sources() const -> std::vector<SourceId>;
  [[nodiscard]] auto count(TaskStatus status) const -> std::size_t;

  auto operator==(const QueueState &) const -> bool = default;
};

} // namespace taskq
