#include "taskq/storage/running_marker.hpp"

#include "taskq/storage/atomic_store.hpp"
#include "taskq/util/json.hpp"
#include "taskq/util/log.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace taskq::detail {

struct MarkerDoc {
  std::int64_t pid{0};
  std::string host;
  std::string started_at;
};

} // namespace taskq::detail

namespace glz {
template <> struct meta<taskq::detail::MarkerDoc> {
  using T = taskq::detail::MarkerDoc;
  static constexpr auto value =
      object("pid", &T::pid, "host", &T::host, "startedAt", &T::started_at);
};
} // namespace glz

namespace taskq {

RunningMarker::~RunningMarker() { remove(); }

RunningMarker::RunningMarker(RunningMarker &&other) noexcept
    : path_(std::exchange(other.path_, {})) {}

auto RunningMarker::operator=(RunningMarker &&other) noexcept
    -> RunningMarker & {
  if (this != &other) {
    remove();
    path_ = std::exchange(other.path_, {});
  }
  return *this;
}

auto RunningMarker::path_for(const std::filesystem::path &dir,
                             const TaskId &task) -> std::filesystem::path {
  return dir / ("." + task.str() + ".running");
}

auto RunningMarker::create(const std::filesystem::path &dir,
                           const TaskId &task, const ProcessOwner &owner)
    -> Result<RunningMarker> {
  const detail::MarkerDoc doc{.pid = owner.pid,
                              .host = owner.host,
                              .started_at = util::format_timestamp()};
  auto path = path_for(dir, task);
  if (auto r = AtomicStateStore::write(path, doc); !r) {
    return fail(r.error());
  }
  return RunningMarker{std::move(path)};
}

auto RunningMarker::read(const std::filesystem::path &dir, const TaskId &task)
    -> Result<MarkerRecord> {
  return AtomicStateStore::read_text(path_for(dir, task))
      .and_then([](const std::string &text) {
        return read_document<detail::MarkerDoc>(text);
      })
      .transform([](detail::MarkerDoc doc) {
        return MarkerRecord{
            .owner = ProcessOwner{.pid = doc.pid, .host = std::move(doc.host)},
            .started_at =
                util::parse_iso8601(doc.started_at).value_or(util::TimePoint{})};
      });
}

auto RunningMarker::probe(const std::filesystem::path &dir, const TaskId &task,
                          const LivenessProbe &alive) -> MarkerProbe {
  auto record = read(dir, task);
  if (!record && record.error() == make_error_code(Error::FileNotFound)) {
    return MarkerProbe::Absent;
  }
  if (record && alive(record->owner)) {
    return MarkerProbe::Live;
  }

  const auto path = path_for(dir, task);
  if (record) {
    log::info("Reclaiming stale marker {} (owner pid {} on {} is gone)",
              path.string(), record->owner.pid, record->owner.host);
  } else {
    log::info("Reclaiming unreadable marker {}: {}", path.string(),
              record.error().message());
  }
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    log::warn("Failed to delete stale marker {}: {}", path.string(),
              ec.message());
  }
  return MarkerProbe::Reclaimed;
}

auto RunningMarker::remove() noexcept -> void {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  path_.clear();
}

} // namespace taskq
