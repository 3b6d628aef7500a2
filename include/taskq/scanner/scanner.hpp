#pragma once

#include "taskq/core/error.hpp"
#include "taskq/util/id.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskq {

struct DiscoveredTask {
  TaskId id;
  std::filesystem::path spec_path;
  SourceId source_id;
  std::uint64_t file_size{0};
  // Absent for empty files and when fingerprinting is off.
  std::optional<std::string> fingerprint;
};

struct ScannerOptions {
  bool enable_fingerprint{true};
  std::vector<std::string> patterns{"task-*.md"};
};

// "task-" + 8 digits + "-" + 6 digits, optionally followed by "-<anything>".
[[nodiscard]] auto is_valid_task_id(std::string_view id) noexcept -> bool;

class DirectoryScanner {
public:
  explicit DirectoryScanner(ScannerOptions options = {});

  // Non-recursive, sorted by file name. Names that do not match a pattern or
  // do not form a valid task id are skipped. A missing directory yields
  // Error::FileNotFound.
  [[nodiscard]] auto scan(const std::filesystem::path &dir,
                          const SourceId &source) const
      -> Result<std::vector<DiscoveredTask>>;

  // Inspects one file; nullopt when it is not a task spec.
  [[nodiscard]] auto inspect(const std::filesystem::path &file,
                             const SourceId &source) const
      -> std::optional<DiscoveredTask>;

  [[nodiscard]] auto matches_pattern(std::string_view file_name) const -> bool;

  // Always false with fingerprinting disabled.
  [[nodiscard]] auto is_modified(const std::filesystem::path &file,
                                 const std::optional<std::string> &known) const
      -> bool;

  [[nodiscard]] auto options() const noexcept -> const ScannerOptions & {
    return options_;
  }

private:
  ScannerOptions options_;
};

} // namespace taskq
