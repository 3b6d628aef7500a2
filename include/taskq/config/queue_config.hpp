#pragma once

#include "taskq/util/id.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace taskq {

struct SourceConfig {
  SourceId id;
  std::string description;
  std::filesystem::path path;
  std::filesystem::path pending_dir;
  std::filesystem::path archive_dir;
  std::filesystem::path failed_dir;
  std::filesystem::path results_dir;

  auto operator==(const SourceConfig &) const -> bool = default;
};

struct QueueSettings {
  bool watch_enabled{true};
  std::chrono::milliseconds watch_debounce{500};
  std::vector<std::string> watch_patterns{"task-*.md"};
  int max_attempts{3};
  bool enable_fingerprint{true};
  int batch_size{10};
  std::chrono::milliseconds lock_timeout{500};
  std::chrono::milliseconds lock_poll_interval{100};
  std::chrono::seconds worker_keepalive{60};
  std::chrono::seconds worker_retry_delay{10};

  auto operator==(const QueueSettings &) const -> bool = default;
};

struct ExecutorConfig {
  std::string command;
  std::map<std::string, std::string> env;

  auto operator==(const ExecutorConfig &) const -> bool = default;
};

struct ServiceConfig {
  std::string log_level{"info"};
  std::string log_file;
  std::filesystem::path pid_file;

  auto operator==(const ServiceConfig &) const -> bool = default;
};

struct QueueConfig {
  std::filesystem::path project_workspace;
  std::filesystem::path state_file;
  std::vector<SourceConfig> sources;
  QueueSettings settings;
  ExecutorConfig executor;
  ServiceConfig service;

  [[nodiscard]] auto find_source(const SourceId &id) const
      -> const SourceConfig *;
  [[nodiscard]] auto state_lock_file() const -> std::filesystem::path {
    return std::filesystem::path{state_file.string() + ".lock"};
  }

  auto operator==(const QueueConfig &) const -> bool = default;
};

} // namespace taskq
