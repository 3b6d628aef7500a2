#include "taskq/util/daemon.hpp"

#include "taskq/core/constants.hpp"
#include "taskq/util/process.hpp"

#include <fcntl.h>

#include <charconv>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace taskq {

std::atomic<bool> g_shutdown_requested{false};

namespace {
void signal_handler(int) { request_shutdown(); }
} // namespace

void request_shutdown() noexcept {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_all();
}

namespace {

// The calling process exits; the child carries on.
auto detach_from_parent() -> Result<void> {
  auto pid = sys_check(::fork());
  if (!pid) {
    return fail(pid.error());
  }
  if (*pid > 0) {
    ::_exit(0);
  }
  return ok();
}

// Executor children inherit fds 0-2. Closed, they would be reused by the next
// open() (state file, task locks), so point them at /dev/null instead.
auto redirect_stdio_to_null() -> Result<void> {
  auto fd = sys_check(::open("/dev/null", O_RDWR | O_CLOEXEC));
  if (!fd) {
    return fail(fd.error());
  }
  for (int target : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
    if (::dup2(*fd, target) < 0) {
      auto ec = errno_code();
      (void)::close(*fd);
      return fail(ec);
    }
  }
  if (*fd > STDERR_FILENO) {
    (void)::close(*fd);
  }
  return ok();
}

} // namespace

auto daemonize() -> Result<void> {
  if (auto r = detach_from_parent(); !r) {
    return r;
  }
  if (auto sid = sys_check(::setsid()); !sid) {
    return fail(sid.error());
  }
  // The session leader's exit must not take the daemon down with SIGHUP.
  std::signal(SIGHUP, SIG_IGN);
  if (auto r = detach_from_parent(); !r) {
    return r;
  }

  ::umask(022);
  // Configured paths are absolute, so nothing depends on the old cwd.
  if (auto r = sys_check(::chdir("/")); !r) {
    return fail(r.error());
  }
  return redirect_stdio_to_null();
}

// The pid file is the daemon's instance lock; its owner record reads
// "<pid>:<unix-millis>".
auto read_pid_file(std::string_view path) -> Result<std::int64_t> {
  std::ifstream in{std::string(path)};
  if (!in.is_open()) {
    return fail(Error::FileNotFound);
  }
  std::string line;
  std::getline(in, line);
  const auto end = line.find(':');
  const std::string_view digits =
      std::string_view{line}.substr(0, end == std::string::npos ? line.size()
                                                                : end);
  if (digits.empty()) {
    return fail(Error::ParseError);
  }
  std::int64_t pid = 0;
  const auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), pid);
  if (ec != std::errc{} || ptr != digits.data() + digits.size() || pid <= 0) {
    return fail(Error::ParseError);
  }
  return ok(pid);
}

auto remove_pid_file(std::string_view path) -> Result<void> {
  std::error_code ec;
  std::filesystem::remove(std::filesystem::path(path), ec);
  if (ec) {
    return fail(ec);
  }
  return ok();
}

auto send_signal(std::int64_t pid, int signal_no) -> Result<void> {
  if (pid <= 0) {
    return fail(Error::InvalidArgument);
  }
  if (::kill(static_cast<pid_t>(pid), signal_no) != 0) {
    return fail(errno_code());
  }
  return ok();
}

auto wait_for_process_exit(std::int64_t pid, std::chrono::milliseconds timeout)
    -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (!is_process_alive(pid)) {
      return true;
    }
    std::this_thread::sleep_for(timing::kDaemonPollInterval);
  }
  return !is_process_alive(pid);
}

void setup_signal_handlers() {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGPIPE, SIG_IGN);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

} // namespace taskq
