#include "taskq/queue/models.hpp"

#include <algorithm>
#include <ranges>

namespace taskq {

auto TaskRecord::requeue(TaskOrigin new_origin) -> void {
  status = TaskStatus::Pending;
  origin = new_origin;
  started_at.reset();
  completed_at.reset();
  error.reset();
}

auto SourceState::find_task(const TaskId &task) -> TaskRecord * {
  auto it = std::ranges::find(queue, task, &TaskRecord::id);
  return it == queue.end() ? nullptr : &*it;
}

auto SourceState::find_task(const TaskId &task) const -> const TaskRecord * {
  auto it = std::ranges::find(queue, task, &TaskRecord::id);
  return it == queue.end() ? nullptr : &*it;
}

auto SourceState::next_pending() -> TaskRecord * {
  auto it = std::ranges::find(queue, TaskStatus::Pending, &TaskRecord::status);
  return it == queue.end() ? nullptr : &*it;
}

auto SourceState::running_task() -> TaskRecord * {
  auto it = std::ranges::find(queue, TaskStatus::Running, &TaskRecord::status);
  return it == queue.end() ? nullptr : &*it;
}

auto SourceState::count(TaskStatus status) const -> std::size_t {
  return static_cast<std::size_t>(
      std::ranges::count(queue, status, &TaskRecord::status));
}

auto QueueState::find_source(const SourceId &id) -> SourceState * {
  auto it = sources.find(id);
  return it == sources.end() ? nullptr : &it->second;
}

auto QueueState::find_source(const SourceId &id) const -> const SourceState * {
  auto it = sources.find(id);
  return it == sources.end() ? nullptr : &it->second;
}

auto QueueState::pending_sources() const -> std::vector<SourceId> {
  return sources | std::views::values |
         std::views::filter(&SourceState::has_pending) |
         std::views::transform(&SourceState::id) |
         std::ranges::to<std::vector>();
}

auto QueueState::count(TaskStatus status) const -> std::size_t {
  std::size_t total = 0;
  for (const auto &source : sources | std::views::values) {
    total += source.count(status);
  }
  return total;
}

} // namespace taskq
