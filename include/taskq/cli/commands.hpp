#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace taskq::cli {
struct ServeStartOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  bool daemon{false};
  bool no_watch{false};
};

struct ServeStopOptions {
  std::string config_file;
  int timeout_sec{30};
  bool force{false};
};

struct ServeStatusOptions {
  std::string config_file;
  bool json{false};
};

struct LoadOptions {
  std::string config_file;
  bool json{false};
};

struct AddOptions {
  std::string config_file;
  std::string source;
  std::string file;
  bool json{false};
};

struct ProcessOptions {
  std::string config_file;
  std::size_t max_tasks{0}; // 0 = settings.batchSize
  bool all{false};          // drain every pending task
  bool json{false};
};

struct StatusOptions {
  std::string config_file;
  bool json{false};
};

struct UnloadOptions {
  std::string config_file;
  std::string source;
  bool json{false};
};

auto cmd_serve_start(const ServeStartOptions &opts) -> int;
auto cmd_serve_stop(const ServeStopOptions &opts) -> int;
auto cmd_serve_status(const ServeStatusOptions &opts) -> int;

auto cmd_load(const LoadOptions &opts) -> int;
auto cmd_add(const AddOptions &opts) -> int;
auto cmd_process(const ProcessOptions &opts) -> int;
auto cmd_status(const StatusOptions &opts) -> int;
auto cmd_unload(const UnloadOptions &opts) -> int;

} // namespace taskq::cli
