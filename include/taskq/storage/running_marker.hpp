#pragma once

#include "taskq/core/error.hpp"
#include "taskq/util/id.hpp"
#include "taskq/util/process.hpp"
#include "taskq/util/time.hpp"

#include <filesystem>
#include <functional>
#include <optional>

namespace taskq {

enum class MarkerProbe : std::uint8_t {
  Absent,    // no marker on disk
  Live,      // marker owned by a live process
  Reclaimed, // marker owner was dead; marker deleted
};

struct MarkerRecord {
  ProcessOwner owner;
  util::TimePoint started_at{};
};

// Hidden ".<task-id>.running" file beside a task's spec while it executes.
// The owner pid lets a later process tell an in-flight task from one whose
// executor crashed.
class RunningMarker {
public:
  using LivenessProbe = std::function<bool(const ProcessOwner &)>;

  RunningMarker() = default;
  ~RunningMarker();

  RunningMarker(const RunningMarker &) = delete;
  auto operator=(const RunningMarker &) -> RunningMarker & = delete;
  RunningMarker(RunningMarker &&other) noexcept;
  auto operator=(RunningMarker &&other) noexcept -> RunningMarker &;

  [[nodiscard]] static auto path_for(const std::filesystem::path &dir,
                                     const TaskId &task)
      -> std::filesystem::path;

  [[nodiscard]] static auto create(const std::filesystem::path &dir,
                                   const TaskId &task,
                                   const ProcessOwner &owner)
      -> Result<RunningMarker>;

  [[nodiscard]] static auto read(const std::filesystem::path &dir,
                                 const TaskId &task) -> Result<MarkerRecord>;

  // Deletes a marker whose owner fails `alive`. An unreadable marker counts
  // as stale.
  [[nodiscard]] static auto probe(const std::filesystem::path &dir,
                                  const TaskId &task,
                                  const LivenessProbe &alive = is_owner_alive)
      -> MarkerProbe;

  auto remove() noexcept -> void;
  [[nodiscard]] auto active() const noexcept -> bool { return !path_.empty(); }

private:
  explicit RunningMarker(std::filesystem::path path) noexcept
      : path_(std::move(path)) {}

  std::filesystem::path path_;
};

} // namespace taskq
