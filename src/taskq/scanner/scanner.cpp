#include "taskq/scanner/scanner.hpp"

#include "taskq/scanner/fingerprint.hpp"
#include "taskq/util/log.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <cctype>

namespace taskq {
namespace {

constexpr std::string_view kTaskPrefix = "task-";

auto all_digits(std::string_view s) noexcept -> bool {
  return std::ranges::all_of(s, [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  });
}

} // namespace

auto is_valid_task_id(std::string_view id) noexcept -> bool {
  if (!id.starts_with(kTaskPrefix)) {
    return false;
  }
  const auto rest = id.substr(kTaskPrefix.size());
  const auto first_dash = rest.find('-');
  if (first_dash == std::string_view::npos) {
    return false;
  }
  const auto date = rest.substr(0, first_dash);
  auto tail = rest.substr(first_dash + 1);
  const auto second_dash = tail.find('-');
  const auto time = tail.substr(0, second_dash);
  return date.size() == 8 && all_digits(date) && time.size() == 6 &&
         all_digits(time);
}

DirectoryScanner::DirectoryScanner(ScannerOptions options)
    : options_(std::move(options)) {}

auto DirectoryScanner::matches_pattern(std::string_view file_name) const
    -> bool {
  const std::string name{file_name};
  return std::ranges::any_of(options_.patterns, [&](const std::string &p) {
    return ::fnmatch(p.c_str(), name.c_str(), FNM_PERIOD) == 0;
  });
}

auto DirectoryScanner::inspect(const std::filesystem::path &file,
                               const SourceId &source) const
    -> std::optional<DiscoveredTask> {
  const auto name = file.filename().string();
  if (!matches_pattern(name)) {
    return std::nullopt;
  }
  auto stem = file.stem().string();
  if (!is_valid_task_id(stem)) {
    log::debug("Skipping {}: not a task id", name);
    return std::nullopt;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    return std::nullopt;
  }
  const auto size = std::filesystem::file_size(file, ec);
  if (ec) {
    log::warn("Cannot stat {}: {}", file.string(), ec.message());
    return std::nullopt;
  }

  DiscoveredTask task{.id = TaskId{std::move(stem)},
                      .spec_path = file,
                      .source_id = source,
                      .file_size = static_cast<std::uint64_t>(size)};
  if (options_.enable_fingerprint && size > 0) {
    auto digest = file_fingerprint(file);
    if (!digest) {
      log::warn("Cannot fingerprint {}: {}", file.string(),
                digest.error().message());
    } else {
      task.fingerprint = std::move(*digest);
    }
  }
  return task;
}

auto DirectoryScanner::scan(const std::filesystem::path &dir,
                            const SourceId &source) const
    -> Result<std::vector<DiscoveredTask>> {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    log::warn("Source {} directory does not exist: {}", source, dir.string());
    return fail(Error::FileNotFound);
  }

  std::vector<std::filesystem::path> candidates;
  for (const auto &entry : std::filesystem::directory_iterator(dir, ec)) {
    candidates.push_back(entry.path());
  }
  if (ec) {
    return fail(ec);
  }
  std::ranges::sort(candidates, {}, [](const std::filesystem::path &p) {
    return p.filename().string();
  });

  std::vector<DiscoveredTask> found;
  for (const auto &path : candidates) {
    if (auto task = inspect(path, source)) {
      found.push_back(std::move(*task));
    }
  }
  log::debug("Scanned {}: {} task(s)", dir.string(), found.size());
  return ok(std::move(found));
}

auto DirectoryScanner::is_modified(
    const std::filesystem::path &file,
    const std::optional<std::string> &known) const -> bool {
  if (!options_.enable_fingerprint) {
    return false;
  }
  if (!known) {
    return true;
  }
  auto current = file_fingerprint(file);
  if (!current) {
    return true;
  }
  return *current != *known;
}

} // namespace taskq
