#include "taskq/executor/executor.hpp"

#include "taskq/core/constants.hpp"
#include "taskq/util/json.hpp"
#include "taskq/util/log.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/asio/write.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <ankerl/unordered_dense.h>

#include <array>
#include <csignal>
#include <format>
#include <mutex>
#include <vector>

namespace taskq::detail {

// Optional structured report an executor command may print on stdout.
struct ExecutorReportDoc {
  std::optional<bool> success;
  std::optional<std::string> output;
  std::optional<std::string> error;
  std::optional<double> cost_usd;
  std::optional<std::map<std::string, std::int64_t>> usage;
};

} // namespace taskq::detail

namespace glz {
template <> struct meta<taskq::detail::ExecutorReportDoc> {
  using T = taskq::detail::ExecutorReportDoc;
  static constexpr auto value =
      object("success", &T::success, "output", &T::output, "error", &T::error,
             "costUsd", &T::cost_usd, "usage", &T::usage);
};
} // namespace glz

namespace taskq {
namespace {

namespace bp = boost::process::v2;
using boost::asio::awaitable;
using boost::asio::use_awaitable;

auto read_pipe_all(boost::asio::readable_pipe &pipe, std::string &out)
    -> awaitable<void> {
  std::array<char, io::kReadBufferSize> buffer{};
  for (;;) {
    boost::system::error_code ec;
    auto bytes = co_await pipe.async_read_some(
        boost::asio::buffer(buffer),
        boost::asio::redirect_error(use_awaitable, ec));
    if (ec) {
      co_return;
    }
    if (out.size() < io::kMaxResultOutput) {
      out.append(buffer.data(),
                 std::min(bytes, io::kMaxResultOutput - out.size()));
    }
  }
}

auto feed_stdin(boost::asio::writable_pipe &pipe, const std::string &content)
    -> awaitable<void> {
  boost::system::error_code ec;
  co_await boost::asio::async_write(
      pipe, boost::asio::buffer(content),
      boost::asio::redirect_error(use_awaitable, ec));
  if (ec) {
    log::debug("Executor stdin closed early: {}", ec.message());
  }
  pipe.close(ec);
}

auto trim(std::string_view s) -> std::string_view {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

class CommandExecutor final : public IExecutor {
public:
  explicit CommandExecutor(CommandExecutorOptions options)
      : options_(std::move(options)) {}

  auto execute(const ExecutionRequest &request) -> ExecutionResult override {
    boost::asio::io_context io;
    boost::asio::readable_pipe stdout_pipe(io);
    boost::asio::readable_pipe stderr_pipe(io);
    boost::asio::writable_pipe stdin_pipe(io);

    std::vector<std::string> args{"-c", options_.command};
    auto env = build_environment(request);

    std::optional<bp::process> proc;
    try {
      proc.emplace(io, "/bin/sh", args,
                   bp::process_stdio{.in = stdin_pipe,
                                     .out = stdout_pipe,
                                     .err = stderr_pipe},
                   bp::process_start_dir{request.working_dir.string()},
                   std::move(env));
    } catch (const boost::system::system_error &ex) {
      return ExecutionResult{
          .success = false,
          .error = std::format("failed to start executor: {}", ex.what())};
    }

    const auto pid = static_cast<std::int64_t>(proc->id());
    track(pid);
    log::info("Executor started pid={} task={}", pid, request.task_id);

    std::string out;
    std::string err;
    int exit_code = -1;
    boost::asio::co_spawn(io, read_pipe_all(stdout_pipe, out),
                          boost::asio::detached);
    boost::asio::co_spawn(io, read_pipe_all(stderr_pipe, err),
                          boost::asio::detached);
    boost::asio::co_spawn(io, feed_stdin(stdin_pipe, request.spec_content),
                          boost::asio::detached);
    proc->async_wait([&](boost::system::error_code ec, int code) {
      exit_code = ec ? -1 : code;
    });
    io.run();
    untrack(pid);

    log::info("Executor finished pid={} task={} exit_code={}", pid,
              request.task_id, exit_code);
    return interpret(exit_code, std::move(out), std::move(err));
  }

  auto cancel() noexcept -> void override {
    std::scoped_lock lock(mutex_);
    for (auto pid : active_) {
      ::kill(static_cast<pid_t>(pid), SIGTERM);
    }
  }

private:
  auto build_environment(const ExecutionRequest &request)
      -> bp::process_environment {
    std::map<std::string, std::string> custom = options_.env;
    custom.insert_or_assign("TASKQ_TASK_ID", request.task_id.str());
    custom.insert_or_assign("TASKQ_SOURCE_ID", request.source_id.str());
    custom.insert_or_assign("TASKQ_SPEC_FILE", request.spec_path.string());

    std::vector<bp::environment::key_value_pair> env_vec;
    env_vec.reserve(64);
    for (const auto &entry : bp::environment::current()) {
      auto key_sv = entry.key();
      if (custom.contains(std::string(key_sv.data(), key_sv.size()))) {
        continue;
      }
      env_vec.emplace_back(entry);
    }
    for (const auto &[k, v] : custom) {
      env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
    }
    return bp::process_environment(std::move(env_vec));
  }

  static auto interpret(int exit_code, std::string out, std::string err)
      -> ExecutionResult {
    ExecutionResult result{.success = exit_code == 0};
    const auto body = trim(out);
    if (body.starts_with('{')) {
      if (auto report = read_document<detail::ExecutorReportDoc>(body)) {
        result.success = report->success.value_or(result.success);
        result.output = report->output.value_or(std::string{body});
        result.error = report->error.value_or(std::string{});
        result.cost_usd = report->cost_usd;
        if (report->usage) {
          result.usage = std::move(*report->usage);
        }
        if (!result.success && result.error.empty()) {
          result.error = std::string{trim(err)};
        }
        return result;
      }
    }
    result.output = std::move(out);
    if (!result.success) {
      const auto detail = trim(err);
      result.error = detail.empty()
                         ? std::format("executor exited with status {}",
                                       exit_code)
                         : std::string{detail};
    }
    return result;
  }

  auto track(std::int64_t pid) -> void {
    std::scoped_lock lock(mutex_);
    active_.insert(pid);
  }

  auto untrack(std::int64_t pid) -> void {
    std::scoped_lock lock(mutex_);
    active_.erase(pid);
  }

  CommandExecutorOptions options_;
  std::mutex mutex_;
  ankerl::unordered_dense::set<std::int64_t> active_;
};

} // namespace

auto create_command_executor(CommandExecutorOptions options)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<CommandExecutor>(std::move(options));
}

} // namespace taskq
