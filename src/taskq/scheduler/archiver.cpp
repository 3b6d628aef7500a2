#include "taskq/scheduler/archiver.hpp"

#include "taskq/storage/atomic_store.hpp"
#include "taskq/util/json.hpp"
#include "taskq/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <map>
#include <optional>
#include <string>

namespace taskq::detail {

struct ResultDoc {
  std::string task_id;
  std::string source_id;
  bool success{false};
  std::string status;
  std::string started_at;
  std::string completed_at;
  std::int64_t duration_ms{0};
  int attempts{0};
  std::optional<std::string> error;
  std::string output;
  std::optional<double> cost_usd;
  std::map<std::string, std::int64_t> usage;
};

} // namespace taskq::detail

namespace glz {
template <> struct meta<taskq::detail::ResultDoc> {
  using T = taskq::detail::ResultDoc;
  static constexpr auto value = object(
      "taskId", &T::task_id, "sourceId", &T::source_id, "success",
      &T::success, "status", &T::status, "startedAt", &T::started_at,
      "completedAt", &T::completed_at, "durationMs", &T::duration_ms,
      "attempts", &T::attempts, "error", &T::error, "output", &T::output,
      "costUsd", &T::cost_usd, "usage", &T::usage);
};
} // namespace glz

namespace taskq {
namespace {

auto move_file(const std::filesystem::path &from,
               const std::filesystem::path &to) -> Result<void> {
  std::error_code ec;
  std::filesystem::create_directories(to.parent_path(), ec);
  if (ec) {
    return fail(ec);
  }
  std::filesystem::rename(from, to, ec);
  if (ec == std::errc::cross_device_link) {
    ec.clear();
    std::filesystem::copy_file(
        from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (!ec) {
      std::filesystem::remove(from, ec);
    }
  }
  if (ec) {
    return fail(ec);
  }
  return ok();
}

} // namespace

auto TaskArchiver::write_result(const TaskOutcome &outcome) const
    -> Result<std::filesystem::path> {
  detail::ResultDoc doc{
      .task_id = outcome.task_id.str(),
      .source_id = outcome.source_id.str(),
      .success = outcome.status == TaskStatus::Completed,
      .status = std::string{to_string_view(outcome.status)},
      .started_at = util::format_iso8601(outcome.started_at),
      .completed_at = util::format_iso8601(outcome.completed_at),
      .duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         outcome.completed_at - outcome.started_at)
                         .count(),
      .attempts = outcome.attempts,
  };
  if (const auto *result = outcome.result) {
    if (!result->error.empty()) {
      doc.error = result->error;
    }
    doc.output = result->output.substr(
        0, std::min(result->output.size(), io::kMaxResultOutput));
    doc.cost_usd = result->cost_usd;
    doc.usage = result->usage;
  }

  auto path = source_->results_dir / (outcome.task_id.str() + ".json");
  if (auto r = AtomicStateStore::write(path, doc); !r) {
    return fail(r.error());
  }
  return ok(std::move(path));
}

auto TaskArchiver::move_spec(const TaskOutcome &outcome) const
    -> Result<std::filesystem::path> {
  std::error_code ec;
  if (!std::filesystem::exists(outcome.spec_path, ec)) {
    return fail(Error::FileNotFound);
  }
  const bool completed = outcome.status == TaskStatus::Completed;
  const auto &dir = completed ? source_->archive_dir : source_->failed_dir;
  auto target = dir / outcome.spec_path.filename();
  if (auto r = move_file(outcome.spec_path, target); !r) {
    return fail(r.error());
  }

  if (!completed) {
    const auto error_text =
        outcome.result != nullptr && !outcome.result->error.empty()
            ? outcome.result->error
            : std::string{"unknown error"};
    const auto note =
        std::format("task: {}\nsource: {}\nfailed_at: {}\nattempts: {}\n\n{}\n",
                    outcome.task_id, outcome.source_id,
                    util::format_iso8601(outcome.completed_at),
                    outcome.attempts, error_text);
    auto note_path = dir / (outcome.task_id.str() + ".error");
    if (auto r = AtomicStateStore::write_text(note_path, note); !r) {
      log::warn("Failed to write error note {}: {}", note_path.string(),
                r.error().message());
    }
  }
  return ok(std::move(target));
}

auto TaskArchiver::finalize(const TaskOutcome &outcome) const -> void {
  if (auto r = write_result(outcome); !r) {
    log::warn("Failed to write result for {}: {}", outcome.task_id,
              r.error().message());
  }
  if (auto r = move_spec(outcome); !r) {
    log::warn("Failed to archive {} ({}): {}", outcome.task_id,
              outcome.spec_path.string(), r.error().message());
  } else {
    log::info("Archived {} to {}", outcome.task_id, r->string());
  }
}

} // namespace taskq
