#include "taskq/watch/source_watcher.hpp"

#include "taskq/core/constants.hpp"
#include "taskq/util/log.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fnmatch.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <future>
#include <string_view>
#include <utility>

namespace taskq {

struct SourceWatcher::WatchState {
  SourceId source;
  std::filesystem::path directory;
  std::vector<std::string> patterns;
  std::atomic<bool> running{false};
  int inotify_fd{-1};
  int watch_fd{-1};
  TaskFileCallback on_task_file;

  std::unique_ptr<boost::asio::posix::stream_descriptor> inotify_stream;
};

SourceWatcher::SourceWatcher(boost::asio::io_context &io, SourceId source,
                             std::filesystem::path directory,
                             std::vector<std::string> patterns)
    : io_(&io), source_(std::move(source)), directory_(std::move(directory)),
      patterns_(std::move(patterns)) {}

SourceWatcher::~SourceWatcher() { stop(); }

auto SourceWatcher::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  auto state = std::make_shared<WatchState>();
  state->source = source_;
  state->directory = directory_;
  state->patterns = patterns_;
  state->on_task_file = std::move(on_task_file_);

  auto fd = sys_check(inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
  if (!fd) {
    log::error("Failed to initialize inotify: {}", fd.error().message());
    running_.store(false);
    return fail(fd.error());
  }
  state->inotify_fd = *fd;

  auto wd = sys_check(inotify_add_watch(state->inotify_fd,
                                        state->directory.c_str(),
                                        IN_CLOSE_WRITE | IN_MOVED_TO));
  if (!wd) {
    log::error("Failed to add watch on {}: {}", state->directory.string(),
               wd.error().message());
    close(state->inotify_fd);
    state->inotify_fd = -1;
    running_.store(false);
    return fail(wd.error());
  }
  state->watch_fd = *wd;
  state->running.store(true, std::memory_order_release);
  watch_state_ = state;

  state->inotify_stream =
      std::make_unique<boost::asio::posix::stream_descriptor>(
          *io_, state->inotify_fd);

  boost::asio::co_spawn(
      *io_,
      [state]() -> boost::asio::awaitable<void> {
        std::array<char, io::kEventBufferSize> buffer{};
        while (state->running.load(std::memory_order_acquire)) {
          if (!state->inotify_stream) {
            break;
          }
          boost::system::error_code ec;
          auto bytes_read = co_await state->inotify_stream->async_read_some(
              boost::asio::buffer(buffer),
              boost::asio::redirect_error(boost::asio::use_awaitable, ec));
          if (ec == boost::asio::error::operation_aborted) {
            break;
          }
          if (ec) {
            if (ec != boost::asio::error::bad_descriptor) {
              log::warn("SourceWatcher[{}] read error: {}", state->source,
                        ec.message());
            }
            break;
          }
          if (bytes_read > 0) {
            process_events(*state, buffer.data(),
                           static_cast<ssize_t>(bytes_read));
          }
        }
      },
      boost::asio::detached);

  log::info("Watching {} for source {}", directory_.string(), source_);
  return ok();
}

auto SourceWatcher::stop_state(WatchState &state) noexcept -> void {
  state.running.store(false, std::memory_order_release);

  if (state.inotify_stream) {
    boost::system::error_code ec;
    state.inotify_stream->cancel(ec);
    state.inotify_stream->close(ec);
    state.inotify_stream.reset();
    // stream_descriptor owned and closed the native fd.
    state.inotify_fd = -1;
    state.watch_fd = -1;
    return;
  }

  if (state.watch_fd >= 0 && state.inotify_fd >= 0) {
    inotify_rm_watch(state.inotify_fd, state.watch_fd);
    state.watch_fd = -1;
  }
  if (state.inotify_fd >= 0) {
    close(state.inotify_fd);
    state.inotify_fd = -1;
  }
}

auto SourceWatcher::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }

  auto state = std::move(watch_state_);
  if (!state) {
    return;
  }
  state->running.store(false, std::memory_order_release);

  if (io_->stopped() || io_->get_executor().running_in_this_thread()) {
    stop_state(*state);
    return;
  }

  // The stream belongs to the io_context thread; tear it down there.
  auto done = std::make_shared<std::promise<void>>();
  auto done_fut = done->get_future();
  boost::asio::post(*io_, [state, done] {
    stop_state(*state);
    done->set_value();
  });
  if (done_fut.wait_for(timing::kWatcherStopTimeout) !=
      std::future_status::ready) {
    log::warn("SourceWatcher[{}] stop timed out, closing inline", source_);
    stop_state(*state);
  }
}

auto SourceWatcher::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto SourceWatcher::set_on_task_file(TaskFileCallback cb) -> void {
  on_task_file_ = std::move(cb);
}

auto SourceWatcher::process_events(WatchState &state, const char *buf,
                                   ssize_t len) -> void {
  auto is_transient_file = [](std::string_view name) -> bool {
    if (name.empty() || name == "." || name == "..")
      return true;
    if (name.ends_with("~") || name.starts_with('.'))
      return true;

    constexpr std::array<std::string_view, 7> kTransientSuffixes{
        ".swp", ".swo", ".swx", ".tmp", ".temp", ".bak", ".part"};
    return std::ranges::any_of(kTransientSuffixes, [&](auto suffix) {
      return name.ends_with(suffix);
    });
  };

  auto matches = [&state](const char *name) -> bool {
    return std::ranges::any_of(state.patterns, [name](const auto &pattern) {
      return fnmatch(pattern.c_str(), name, FNM_PERIOD) == 0;
    });
  };

  ssize_t i = 0;
  while (i < len) {
    const auto *event = reinterpret_cast<const inotify_event *>(buf + i);

    if (event->len > 0 && (event->mask & IN_ISDIR) == 0) {
      std::string_view name{event->name};
      if (!is_transient_file(name) && matches(event->name)) {
        std::filesystem::path file_path = state.directory / event->name;
        log::debug("Task file changed: {}", file_path.string());
        if (state.on_task_file) {
          state.on_task_file(state.source, file_path);
        }
      }
    }

    i += static_cast<ssize_t>(sizeof(inotify_event) + event->len);
  }
}

} // namespace taskq
