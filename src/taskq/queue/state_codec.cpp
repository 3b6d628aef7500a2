#include "taskq/queue/state_codec.hpp"

#include "taskq/util/json.hpp"
#include "taskq/util/log.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <ranges>
#include <string>
#include <vector>

namespace taskq::detail {

struct OwnerDoc {
  std::int64_t pid{0};
  std::string host;
};

struct TaskDoc {
  std::string id;
  std::string spec_path;
  std::string source_id;
  std::string status{"pending"};
  std::string origin{"load"};
  int attempts{0};
  std::optional<std::string> content_fingerprint;
  std::uint64_t file_size{0};
  std::string added_at;
  std::optional<std::string> started_at;
  std::optional<std::string> completed_at;
  std::optional<std::string> error;
};

struct ProcessingDoc {
  bool active{false};
  std::optional<std::string> task_id;
  std::optional<OwnerDoc> owner;
  std::optional<std::string> started_at;
};

struct StatisticsDoc {
  std::uint64_t total_queued{0};
  std::uint64_t total_completed{0};
  std::uint64_t total_failed{0};
  std::optional<std::string> last_processed_at;
  std::optional<std::string> last_load_at;
};

struct SourceDoc {
  std::string id;
  std::string path;
  std::vector<TaskDoc> queue;
  ProcessingDoc processing;
  StatisticsDoc statistics;
};

struct CoordinatorDoc {
  std::optional<std::string> current_source;
  std::optional<std::string> last_switch;
  std::vector<std::string> source_order;
};

struct StateDoc {
  std::string version;
  std::map<std::string, SourceDoc> sources;
  CoordinatorDoc coordinator;
  StatisticsDoc global_statistics;
  std::optional<std::string> updated_at;
};

struct VersionProbe {
  std::string version{std::string{kLegacyStateVersion}};
};

// Schema 1.0: one global queue, snake_case keys.
struct LegacyTaskDoc {
  std::string task_id;
  std::string spec_file;
  std::string spec_dir_id;
  std::string status{"pending"};
  std::string source{"load"};
  std::string added_at;
  std::optional<std::string> started_at;
  std::optional<std::string> completed_at;
  int attempts{0};
  std::optional<std::string> error;
  std::optional<std::string> file_hash;
  std::uint64_t file_size{0};
};

struct LegacyStatisticsDoc {
  std::uint64_t total_queued{0};
  std::uint64_t total_completed{0};
  std::uint64_t total_failed{0};
  std::optional<std::string> last_processed_at;
  std::optional<std::string> last_load_at;
};

struct LegacyStateDoc {
  std::string version;
  std::vector<LegacyTaskDoc> queue;
  LegacyStatisticsDoc statistics;
  std::optional<std::string> updated_at;
};

} // namespace taskq::detail

namespace glz {
template <> struct meta<taskq::detail::OwnerDoc> {
  using T = taskq::detail::OwnerDoc;
  static constexpr auto value = object("pid", &T::pid, "host", &T::host);
};

template <> struct meta<taskq::detail::TaskDoc> {
  using T = taskq::detail::TaskDoc;
  static constexpr auto value = object(
      "id", &T::id, "specPath", &T::spec_path, "sourceId", &T::source_id,
      "status", &T::status, "origin", &T::origin, "attempts", &T::attempts,
      "contentFingerprint", &T::content_fingerprint, "fileSize",
      &T::file_size, "addedAt", &T::added_at, "startedAt", &T::started_at,
      "completedAt", &T::completed_at, "error", &T::error);
};

template <> struct meta<taskq::detail::ProcessingDoc> {
  using T = taskq::detail::ProcessingDoc;
  static constexpr auto value =
      object("active", &T::active, "taskId", &T::task_id, "owner", &T::owner,
             "startedAt", &T::started_at);
};

template <> struct meta<taskq::detail::StatisticsDoc> {
  using T = taskq::detail::StatisticsDoc;
  static constexpr auto value =
      object("totalQueued", &T::total_queued, "totalCompleted",
             &T::total_completed, "totalFailed", &T::total_failed,
             "lastProcessedAt", &T::last_processed_at, "lastLoadAt",
             &T::last_load_at);
};

template <> struct meta<taskq::detail::SourceDoc> {
  using T = taskq::detail::SourceDoc;
  static constexpr auto value =
      object("id", &T::id, "path", &T::path, "queue", &T::queue, "processing",
             &T::processing, "statistics", &T::statistics);
};

template <> struct meta<taskq::detail::CoordinatorDoc> {
  using T = taskq::detail::CoordinatorDoc;
  static constexpr auto value =
      object("currentSource", &T::current_source, "lastSwitch",
             &T::last_switch, "sourceOrder", &T::source_order);
};

template <> struct meta<taskq::detail::StateDoc> {
  using T = taskq::detail::StateDoc;
  static constexpr auto value =
      object("version", &T::version, "sources", &T::sources, "coordinator",
             &T::coordinator, "globalStatistics", &T::global_statistics,
             "updatedAt", &T::updated_at);
};

template <> struct meta<taskq::detail::VersionProbe> {
  using T = taskq::detail::VersionProbe;
  static constexpr auto value = object("version", &T::version);
};

template <> struct meta<taskq::detail::LegacyTaskDoc> {
  using T = taskq::detail::LegacyTaskDoc;
  static constexpr auto value = object(
      "task_id", &T::task_id, "spec_file", &T::spec_file, "spec_dir_id",
      &T::spec_dir_id, "status", &T::status, "source", &T::source, "added_at",
      &T::added_at, "started_at", &T::started_at, "completed_at",
      &T::completed_at, "attempts", &T::attempts, "error", &T::error,
      "file_hash", &T::file_hash, "file_size", &T::file_size);
};

template <> struct meta<taskq::detail::LegacyStatisticsDoc> {
  using T = taskq::detail::LegacyStatisticsDoc;
  static constexpr auto value =
      object("total_queued", &T::total_queued, "total_completed",
             &T::total_completed, "total_failed", &T::total_failed,
             "last_processed_at", &T::last_processed_at, "last_load_at",
             &T::last_load_at);
};

template <> struct meta<taskq::detail::LegacyStateDoc> {
  using T = taskq::detail::LegacyStateDoc;
  static constexpr auto value =
      object("version", &T::version, "queue", &T::queue, "statistics",
             &T::statistics, "updated_at", &T::updated_at);
};
} // namespace glz

namespace taskq {
namespace {

auto to_text(const std::optional<util::TimePoint> &tp)
    -> std::optional<std::string> {
  if (!tp) {
    return std::nullopt;
  }
  return util::format_iso8601(*tp);
}

auto to_time(const std::optional<std::string> &text)
    -> std::optional<util::TimePoint> {
  if (!text) {
    return std::nullopt;
  }
  return util::parse_iso8601(*text);
}

auto encode_statistics(const QueueStatistics &stats) -> detail::StatisticsDoc {
  return detail::StatisticsDoc{.total_queued = stats.total_queued,
                               .total_completed = stats.total_completed,
                               .total_failed = stats.total_failed,
                               .last_processed_at =
                                   to_text(stats.last_processed_at),
                               .last_load_at = to_text(stats.last_load_at)};
}

auto decode_statistics(const detail::StatisticsDoc &doc) -> QueueStatistics {
  return QueueStatistics{.total_queued = doc.total_queued,
                         .total_completed = doc.total_completed,
                         .total_failed = doc.total_failed,
                         .last_processed_at = to_time(doc.last_processed_at),
                         .last_load_at = to_time(doc.last_load_at)};
}

auto encode_task(const TaskRecord &task) -> detail::TaskDoc {
  return detail::TaskDoc{
      .id = task.id.str(),
      .spec_path = task.spec_path,
      .source_id = task.source_id.str(),
      .status = std::string{to_string_view(task.status)},
      .origin = std::string{to_string_view(task.origin)},
      .attempts = task.attempts,
      .content_fingerprint = task.content_fingerprint,
      .file_size = task.file_size,
      .added_at = util::format_iso8601(task.added_at),
      .started_at = to_text(task.started_at),
      .completed_at = to_text(task.completed_at),
      .error = task.error,
  };
}

auto decode_task(const detail::TaskDoc &doc) -> Result<TaskRecord> {
  auto status = try_parse<TaskStatus>(doc.status);
  auto origin = try_parse<TaskOrigin>(doc.origin);
  if (!status || !origin || doc.id.empty()) {
    log::warn("Task entry '{}' has invalid status '{}' or origin '{}'", doc.id,
              doc.status, doc.origin);
    return fail(Error::CorruptState);
  }
  return ok(TaskRecord{
      .id = TaskId{doc.id},
      .spec_path = doc.spec_path,
      .source_id = SourceId{doc.source_id},
      .status = *status,
      .origin = *origin,
      .attempts = doc.attempts,
      .content_fingerprint = doc.content_fingerprint,
      .file_size = doc.file_size,
      .added_at = util::parse_iso8601(doc.added_at).value_or(util::TimePoint{}),
      .started_at = to_time(doc.started_at),
      .completed_at = to_time(doc.completed_at),
      .error = doc.error,
  });
}

auto encode_state(const QueueState &state) -> detail::StateDoc {
  detail::StateDoc doc;
  doc.version = std::string{kStateVersion};
  for (const auto &[id, source] : state.sources) {
    detail::SourceDoc src{.id = id.str(), .path = source.path};
    src.queue = source.queue | std::views::transform(encode_task) |
                std::ranges::to<std::vector>();
    src.processing.active = source.processing.active;
    if (source.processing.task_id) {
      src.processing.task_id = source.processing.task_id->str();
    }
    if (source.processing.owner) {
      src.processing.owner = detail::OwnerDoc{
          .pid = source.processing.owner->pid,
          .host = source.processing.owner->host};
    }
    src.processing.started_at = to_text(source.processing.started_at);
    src.statistics = encode_statistics(source.statistics);
    doc.sources.emplace(id.str(), std::move(src));
  }
  if (state.coordinator.current_source) {
    doc.coordinator.current_source = state.coordinator.current_source->str();
  }
  doc.coordinator.last_switch = to_text(state.coordinator.last_switch);
  doc.coordinator.source_order =
      state.coordinator.source_order |
      std::views::transform(&SourceId::str) | std::ranges::to<std::vector>();
  doc.global_statistics = encode_statistics(state.global);
  doc.updated_at = to_text(state.updated_at);
  return doc;
}

auto decode_state(const detail::StateDoc &doc) -> Result<QueueState> {
  QueueState state;
  for (const auto &[key, src] : doc.sources) {
    SourceState source{.id = SourceId{src.id.empty() ? key : src.id},
                       .path = src.path};
    for (const auto &task_doc : src.queue) {
      auto task = decode_task(task_doc);
      if (!task) {
        return fail(task.error());
      }
      if (task->source_id.empty()) {
        task->source_id = source.id;
      }
      source.queue.push_back(std::move(*task));
    }
    source.processing.active = src.processing.active;
    if (src.processing.task_id) {
      source.processing.task_id = TaskId{*src.processing.task_id};
    }
    if (src.processing.owner) {
      source.processing.owner = ProcessOwner{.pid = src.processing.owner->pid,
                                             .host = src.processing.owner->host};
    }
    source.processing.started_at = to_time(src.processing.started_at);
    source.statistics = decode_statistics(src.statistics);
    state.sources.emplace(source.id, std::move(source));
  }
  if (doc.coordinator.current_source) {
    state.coordinator.current_source =
        SourceId{*doc.coordinator.current_source};
  }
  state.coordinator.last_switch = to_time(doc.coordinator.last_switch);
  for (const auto &id : doc.coordinator.source_order) {
    state.coordinator.source_order.emplace_back(id);
  }
  state.global = decode_statistics(doc.global_statistics);
  state.updated_at = to_time(doc.updated_at);
  return ok(std::move(state));
}

auto migrate_legacy_status(std::string_view status) -> TaskStatus {
  if (status == "cancelled") {
    return TaskStatus::Failed;
  }
  return parse<TaskStatus>(status);
}

auto migrate_legacy_origin(std::string_view origin) -> TaskOrigin {
  if (origin == "api") {
    return TaskOrigin::Manual;
  }
  return parse<TaskOrigin>(origin);
}

// Groups the single 1.0 queue by the directory each task was found in.
// Source paths are unknown and become "<migrated>" until the next load.
auto migrate_v1(const detail::LegacyStateDoc &legacy) -> QueueState {
  QueueState state;
  for (const auto &old : legacy.queue) {
    const SourceId source_id{old.spec_dir_id.empty() ? std::string{"default"}
                                                     : old.spec_dir_id};
    auto [it, inserted] = state.sources.try_emplace(source_id);
    auto &source = it->second;
    if (inserted) {
      source.id = source_id;
      source.path = std::string{kMigratedSourcePath};
      state.coordinator.source_order.push_back(source_id);
    }

    TaskRecord task{
        .id = TaskId{old.task_id},
        .spec_path = old.spec_file,
        .source_id = source_id,
        .status = migrate_legacy_status(old.status),
        .origin = migrate_legacy_origin(old.source),
        .attempts = old.attempts,
        .content_fingerprint = old.file_hash,
        .file_size = old.file_size,
        .added_at = util::parse_iso8601(old.added_at).value_or(util::TimePoint{}),
        .started_at = to_time(old.started_at),
        .completed_at = to_time(old.completed_at),
        .error = old.error,
    };
    source.statistics.total_queued++;
    if (task.status == TaskStatus::Completed) {
      source.statistics.total_completed++;
    } else if (task.status == TaskStatus::Failed) {
      source.statistics.total_failed++;
    }
    source.queue.push_back(std::move(task));
  }

  state.global = QueueStatistics{
      .total_queued = legacy.statistics.total_queued,
      .total_completed = legacy.statistics.total_completed,
      .total_failed = legacy.statistics.total_failed,
      .last_processed_at = to_time(legacy.statistics.last_processed_at),
      .last_load_at = to_time(legacy.statistics.last_load_at)};
  state.updated_at = to_time(legacy.updated_at);
  return state;
}

} // namespace

auto StateCodec::encode(const QueueState &state) -> Result<std::string> {
  return write_document(encode_state(state));
}

auto StateCodec::decode(std::string_view text) -> Result<QueueState> {
  std::string diagnostic;
  auto probe = read_document<detail::VersionProbe>(text, &diagnostic);
  if (!probe) {
    log::warn("State document is not valid JSON: {}", diagnostic);
    return fail(Error::CorruptState);
  }

  if (probe->version == kLegacyStateVersion) {
    auto legacy = read_document<detail::LegacyStateDoc>(text, &diagnostic);
    if (!legacy) {
      log::warn("Legacy state document is malformed: {}", diagnostic);
      return fail(Error::CorruptState);
    }
    log::info("Migrating state document from schema {} to {} ({} tasks)",
              kLegacyStateVersion, kStateVersion, legacy->queue.size());
    return ok(migrate_v1(*legacy));
  }

  if (probe->version != kStateVersion) {
    log::warn("Unsupported state schema version '{}'", probe->version);
    return fail(Error::CorruptState);
  }

  auto doc = read_document<detail::StateDoc>(text, &diagnostic);
  if (!doc) {
    log::warn("State document is malformed: {}", diagnostic);
    return fail(Error::CorruptState);
  }
  return decode_state(*doc);
}

} // namespace taskq
