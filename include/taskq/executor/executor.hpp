#pragma once

#include "taskq/util/id.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace taskq {

struct ExecutionRequest {
  TaskId task_id;
  SourceId source_id;
  std::filesystem::path spec_path;
  std::string spec_content;
  std::filesystem::path working_dir;
};

struct ExecutionResult {
  bool success{false};
  std::string output;
  std::string error;
  std::optional<double> cost_usd;
  std::map<std::string, std::int64_t> usage;
};

// Boundary to whatever actually performs a task. execute() blocks until the
// work finishes; it may throw, which the processor records as a failure.
class IExecutor {
public:
  virtual ~IExecutor() = default;

  [[nodiscard]] virtual auto execute(const ExecutionRequest &request)
      -> ExecutionResult = 0;

  // Asks in-flight executions to stop early. Safe from any thread.
  virtual auto cancel() noexcept -> void {}
};

struct CommandExecutorOptions {
  std::string command;
  std::map<std::string, std::string> env;
};

// Runs `command` through /bin/sh with the spec on stdin.
[[nodiscard]] auto create_command_executor(CommandExecutorOptions options)
    -> std::unique_ptr<IExecutor>;

} // namespace taskq
