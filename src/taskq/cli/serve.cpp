#include "taskq/app/queue_daemon.hpp"
#include "taskq/cli/commands.hpp"
#include "taskq/config/config.hpp"
#include "taskq/executor/executor.hpp"
#include "taskq/storage/file_lock.hpp"
#include "taskq/util/daemon.hpp"
#include "taskq/util/json.hpp"
#include "taskq/util/log.hpp"
#include "taskq/util/process.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <print>
#include <string>

namespace taskq::cli {
namespace {

auto load_config_or_print(std::string_view path) -> Result<QueueConfig> {
  return ConfigLoader::load_from_file(path).or_else(
      [&](std::error_code ec) -> Result<QueueConfig> {
        std::println(stderr, "Error: {}", ec.message());
        return fail(ec);
      });
}

} // namespace

auto cmd_serve_start(const ServeStartOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.log_level.has_value()) {
    config.service.log_level = *opts.log_level;
  }
  if (opts.no_watch) {
    config.settings.watch_enabled = false;
  }
  if (config.executor.command.empty()) {
    std::println(stderr, "Error: executor.command is not configured");
    return 1;
  }

  const auto log_file = opts.log_file.value_or(config.service.log_file);
  if (opts.daemon && log_file.empty()) {
    std::println(
        stderr,
        "Error: --daemon requires logFile (set in config or --log-file)");
    return 1;
  }
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon) {
    if (auto r = daemonize(); !r) {
      std::println(stderr, "Error: Failed to daemonize - {}",
                   r.error().message());
      return 1;
    }
  }

  log::set_level(config.service.log_level);
  log::start();

  const auto pid_file = config.service.pid_file;
  std::error_code ec;
  std::filesystem::create_directories(pid_file.parent_path(), ec);
  InterprocessLock pid_lock{pid_file};
  if (auto r = pid_lock.acquire(std::chrono::milliseconds::zero()); !r) {
    if (r.error() == make_error_code(Error::LockTimeout)) {
      std::println(stderr,
                   "Error: taskq is already running (pid file locked: {})",
                   pid_file.string());
    } else {
      std::println(stderr, "Error: Failed to acquire pid file '{}': {}",
                   pid_file.string(), r.error().message());
    }
    log::stop();
    return 1;
  }

  auto executor = create_command_executor(CommandExecutorOptions{
      .command = config.executor.command, .env = config.executor.env});
  QueueDaemon queue_daemon(config, *executor);

  setup_signal_handlers();
  if (auto r = queue_daemon.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  log::info("taskq started for {} (pid_file={})",
            config.project_workspace.string(), pid_file.string());

  wait_for_shutdown();
  queue_daemon.stop();
  pid_lock.release();
  log::info("taskq stopped.");
  log::stop();
  return 0;
}

auto cmd_serve_stop(const ServeStopOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  const auto pid_file = config_res->service.pid_file.string();

  auto pid_res = read_pid_file(pid_file);
  if (!pid_res) {
    if (pid_res.error() == make_error_code(Error::FileNotFound)) {
      std::println("taskq is not running (no pid file: {}).", pid_file);
      return 0;
    }
    std::println(stderr, "Error: Failed to read pid file '{}': {}", pid_file,
                 pid_res.error().message());
    return 1;
  }
  const std::int64_t pid = *pid_res;

  if (!is_process_alive(pid)) {
    (void)remove_pid_file(pid_file);
    std::println("taskq is not running (stale pid file removed).");
    return 0;
  }

  if (auto r = send_signal(pid, SIGTERM); !r) {
    std::println(stderr, "Error: Failed to send SIGTERM to pid {}: {}", pid,
                 r.error().message());
    return 1;
  }

  const auto timeout = std::chrono::seconds(std::max(opts.timeout_sec, 1));
  if (wait_for_process_exit(pid, timeout)) {
    std::println("taskq stopped (pid={}).", pid);
    return 0;
  }

  if (!opts.force) {
    std::println(stderr,
                 "Error: Timed out waiting for taskq to stop (pid={}). "
                 "Retry with --force.",
                 pid);
    return 1;
  }

  if (auto r = send_signal(pid, SIGKILL); !r) {
    std::println(stderr, "Error: Failed to send SIGKILL to pid {}: {}", pid,
                 r.error().message());
    return 1;
  }
  if (!wait_for_process_exit(pid, std::chrono::seconds(2))) {
    std::println(stderr, "Error: Process {} did not exit after SIGKILL.", pid);
    return 1;
  }
  (void)remove_pid_file(pid_file);
  std::println("taskq killed (pid={}).", pid);
  return 0;
}

auto cmd_serve_status(const ServeStatusOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  const auto pid_file = config_res->service.pid_file.string();

  bool running = false;
  bool stale = false;
  std::int64_t pid = 0;

  auto pid_res = read_pid_file(pid_file);
  if (pid_res) {
    pid = *pid_res;
    running = is_process_alive(pid);
    stale = !running;
  } else if (pid_res.error() != make_error_code(Error::FileNotFound)) {
    std::println(stderr, "Error: Failed to read pid file '{}': {}", pid_file,
                 pid_res.error().message());
    return 1;
  }

  if (opts.json) {
    JsonValue obj{
        {"running", running},
        {"pid", pid},
        {"stalePidFile", stale},
        {"pidFile", pid_file},
    };
    std::println("{}", dump_json(obj));
    return running ? 0 : 1;
  }

  if (running) {
    std::println("taskq is running.");
    std::println("  pid: {}", pid);
    std::println("  pid_file: {}", pid_file);
    return 0;
  }
  if (stale) {
    std::println("taskq is stopped (stale pid file).");
    std::println("  pid_file: {}", pid_file);
    std::println("  stale_pid: {}", pid);
    return 1;
  }

  std::println("taskq is stopped.");
  std::println("  pid_file: {}", pid_file);
  return 1;
}

} // namespace taskq::cli
