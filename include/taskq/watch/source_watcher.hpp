#pragma once

#include "taskq/core/error.hpp"
#include "taskq/util/id.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace taskq {

using TaskFileCallback = std::move_only_function<void(
    const SourceId &, const std::filesystem::path &)>;

// inotify watch on one source's pending directory. Reports task-spec files
// once they are fully written (close-after-write or moved in).
class SourceWatcher {
public:
  SourceWatcher(boost::asio::io_context &io, SourceId source,
                std::filesystem::path directory,
                std::vector<std::string> patterns);
  ~SourceWatcher();

  SourceWatcher(const SourceWatcher &) = delete;
  auto operator=(const SourceWatcher &) -> SourceWatcher & = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Must be set before start().
  auto set_on_task_file(TaskFileCallback cb) -> void;

  [[nodiscard]] auto source() const noexcept -> const SourceId & {
    return source_;
  }
  [[nodiscard]] auto directory() const -> const std::filesystem::path & {
    return directory_;
  }

private:
  struct WatchState;
  static auto process_events(WatchState &state, const char *buf, ssize_t len)
      -> void;
  static auto stop_state(WatchState &state) noexcept -> void;

  boost::asio::io_context *io_;
  SourceId source_;
  std::filesystem::path directory_;
  std::vector<std::string> patterns_;
  std::atomic<bool> running_{false};
  std::shared_ptr<WatchState> watch_state_;

  TaskFileCallback on_task_file_;
};

} // namespace taskq
