#pragma once

#include "taskq/config/queue_config.hpp"
#include "taskq/core/error.hpp"
#include "taskq/executor/executor.hpp"
#include "taskq/queue/models.hpp"

#include <filesystem>

namespace taskq {

// Everything written for a finished task besides the state file.
struct TaskOutcome {
  TaskId task_id;
  SourceId source_id;
  std::filesystem::path spec_path;
  TaskStatus status{TaskStatus::Failed};
  int attempts{0};
  util::TimePoint started_at{};
  util::TimePoint completed_at{};
  const ExecutionResult *result{nullptr};
};

class TaskArchiver {
public:
  explicit TaskArchiver(const SourceConfig &source) : source_(&source) {}

  // results/<task-id>.json
  [[nodiscard]] auto write_result(const TaskOutcome &outcome) const
      -> Result<std::filesystem::path>;

  // Completed specs go to the archive directory, failed ones to the failed
  // directory next to a "<task-id>.error" note.
  [[nodiscard]] auto move_spec(const TaskOutcome &outcome) const
      -> Result<std::filesystem::path>;

  // Both of the above; failures are logged as warnings only.
  auto finalize(const TaskOutcome &outcome) const -> void;

private:
  const SourceConfig *source_;
};

} // namespace taskq
