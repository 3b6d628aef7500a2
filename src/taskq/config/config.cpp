#include "taskq/config/config.hpp"

#include "taskq/storage/atomic_store.hpp"
#include "taskq/util/json.hpp"
#include "taskq/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <glaze/toml.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace taskq {
namespace detail {

struct SourceFile {
  std::string id;
  std::string path;
  std::string description;
  std::string pending_dir;
  std::string archive_dir;
  std::string failed_dir;
  std::string results_dir;
};

struct SettingsFile {
  bool watch_enabled{true};
  int watch_debounce_ms{500};
  std::vector<std::string> watch_patterns{"task-*.md"};
  int max_attempts{3};
  bool enable_fingerprint{true};
  int batch_size{10};
  int lock_timeout_ms{500};
  int lock_poll_interval_ms{100};
  int worker_keepalive_sec{60};
  int worker_retry_delay_sec{10};
};

struct ExecutorFile {
  std::string command;
  std::map<std::string, std::string> env;
};

struct ServiceFile {
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file;
};

struct ConfigFile {
  std::string project_workspace;
  std::string state_file;
  std::vector<SourceFile> sources;
  SettingsFile settings{};
  ExecutorFile executor{};
  ServiceFile service{};
};

} // namespace detail
} // namespace taskq

namespace glz {
template <> struct meta<taskq::detail::SourceFile> {
  using T = taskq::detail::SourceFile;
  static constexpr auto value =
      object("id", &T::id, "path", &T::path, "description", &T::description,
             "pendingDir", &T::pending_dir, "archiveDir", &T::archive_dir,
             "failedDir", &T::failed_dir, "resultsDir", &T::results_dir);
};

template <> struct meta<taskq::detail::SettingsFile> {
  using T = taskq::detail::SettingsFile;
  static constexpr auto value = object(
      "watchEnabled", &T::watch_enabled, "watchDebounceMs",
      &T::watch_debounce_ms, "watchPatterns", &T::watch_patterns,
      "maxAttempts", &T::max_attempts, "enableFingerprint",
      &T::enable_fingerprint, "batchSize", &T::batch_size, "lockTimeoutMs",
      &T::lock_timeout_ms, "lockPollIntervalMs", &T::lock_poll_interval_ms,
      "workerKeepaliveSec", &T::worker_keepalive_sec, "workerRetryDelaySec",
      &T::worker_retry_delay_sec);
};

template <> struct meta<taskq::detail::ExecutorFile> {
  using T = taskq::detail::ExecutorFile;
  static constexpr auto value = object("command", &T::command, "env", &T::env);
};

template <> struct meta<taskq::detail::ServiceFile> {
  using T = taskq::detail::ServiceFile;
  static constexpr auto value = object("logLevel", &T::log_level, "logFile",
                                       &T::log_file, "pidFile", &T::pid_file);
};

template <> struct meta<taskq::detail::ConfigFile> {
  using T = taskq::detail::ConfigFile;
  static constexpr auto value =
      object("projectWorkspace", &T::project_workspace, "stateFile",
             &T::state_file, "sources", &T::sources, "settings", &T::settings,
             "executor", &T::executor, "service", &T::service);
};
} // namespace glz

namespace taskq {
namespace {

auto parse_file(std::string_view text, ConfigFormat format)
    -> Result<detail::ConfigFile> {
  detail::ConfigFile raw{};
  if (format == ConfigFormat::Toml) {
    constexpr auto kOpts =
        glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
    if (auto ec = glz::read<kOpts>(raw, text); ec) {
      log::error("TOML parse error: {}", glz::format_error(ec, text));
      return fail(Error::ParseError);
    }
    return ok(std::move(raw));
  }
  std::string diagnostic;
  auto doc = read_document<detail::ConfigFile>(text, &diagnostic);
  if (!doc) {
    log::error("JSON parse error: {}", diagnostic);
    return fail(Error::ParseError);
  }
  return doc;
}

auto resolve(const std::filesystem::path &base, std::string_view value,
             const std::filesystem::path &fallback) -> std::filesystem::path {
  if (value.empty()) {
    return fallback;
  }
  std::filesystem::path p{value};
  if (p.is_relative()) {
    p = base / p;
  }
  p = p.lexically_normal();
  // "dir/." normalizes to "dir/"; drop the empty trailing element.
  if (p.filename().empty() && p.has_relative_path()) {
    p = p.parent_path();
  }
  return p;
}

auto env_value(const char *key) -> std::optional<std::string_view> {
  if (const char *v = std::getenv(key); v != nullptr) {
    return std::string_view{v};
  }
  return std::nullopt;
}

auto parse_flag(std::string_view v) -> bool {
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

auto apply_env_overrides(QueueConfig &cfg) -> Result<void> {
  try {
    if (auto v = env_value("TASKQ_LOG_LEVEL")) {
      cfg.service.log_level = *v;
    }
    if (auto v = env_value("TASKQ_LOG_FILE")) {
      cfg.service.log_file = *v;
    }
    if (auto v = env_value("TASKQ_PID_FILE")) {
      cfg.service.pid_file = std::filesystem::path{*v};
    }
    if (auto v = env_value("TASKQ_STATE_FILE")) {
      cfg.state_file = std::filesystem::path{*v};
    }
    if (auto v = env_value("TASKQ_WATCH_ENABLED")) {
      cfg.settings.watch_enabled = parse_flag(*v);
    }
    if (auto v = env_value("TASKQ_BATCH_SIZE")) {
      cfg.settings.batch_size = boost::lexical_cast<int>(*v);
    }
    if (auto v = env_value("TASKQ_EXECUTOR_COMMAND")) {
      cfg.executor.command = *v;
    }
  } catch (const boost::bad_lexical_cast &ex) {
    log::error("Invalid environment override: {}", ex.what());
    return fail(Error::InvalidConfig);
  }
  return ok();
}

auto convert(detail::ConfigFile raw, const std::filesystem::path &base)
    -> QueueConfig {
  QueueConfig cfg{};
  cfg.project_workspace = resolve(base, raw.project_workspace, {});
  cfg.state_file = resolve(base, raw.state_file,
                           cfg.project_workspace / ".taskq" / "state.json");

  for (auto &src : raw.sources) {
    SourceConfig s{};
    s.id = SourceId{src.id};
    s.description = std::move(src.description);
    s.path = resolve(base, src.path, {});
    s.pending_dir = resolve(base, src.pending_dir, s.path / "pending");
    s.archive_dir = resolve(base, src.archive_dir, s.path / "archive");
    s.failed_dir = resolve(base, src.failed_dir, s.path / "failed");
    s.results_dir = resolve(base, src.results_dir, s.path / "results");
    cfg.sources.push_back(std::move(s));
  }

  const auto &st = raw.settings;
  cfg.settings.watch_enabled = st.watch_enabled;
  cfg.settings.watch_debounce = std::chrono::milliseconds{st.watch_debounce_ms};
  cfg.settings.watch_patterns = st.watch_patterns;
  cfg.settings.max_attempts = st.max_attempts;
  cfg.settings.enable_fingerprint = st.enable_fingerprint;
  cfg.settings.batch_size = st.batch_size;
  cfg.settings.lock_timeout = std::chrono::milliseconds{st.lock_timeout_ms};
  cfg.settings.lock_poll_interval =
      std::chrono::milliseconds{st.lock_poll_interval_ms};
  cfg.settings.worker_keepalive = std::chrono::seconds{st.worker_keepalive_sec};
  cfg.settings.worker_retry_delay =
      std::chrono::seconds{st.worker_retry_delay_sec};

  cfg.executor.command = std::move(raw.executor.command);
  cfg.executor.env = std::move(raw.executor.env);

  cfg.service.log_level = std::move(raw.service.log_level);
  cfg.service.log_file = std::move(raw.service.log_file);
  cfg.service.pid_file = resolve(base, raw.service.pid_file,
                                 cfg.project_workspace / ".taskq" / "taskq.pid");
  return cfg;
}

} // namespace

auto QueueConfig::find_source(const SourceId &id) const
    -> const SourceConfig * {
  auto it = std::ranges::find(sources, id, &SourceConfig::id);
  return it == sources.end() ? nullptr : &*it;
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<QueueConfig> {
  const std::filesystem::path file{path};
  auto text = AtomicStateStore::read_text(file);
  if (!text) {
    log::error("Cannot read config {}: {}", file.string(),
               text.error().message());
    return fail(text.error());
  }
  const auto format =
      file.extension() == ".toml" ? ConfigFormat::Toml : ConfigFormat::Json;
  auto base = std::filesystem::absolute(file).parent_path();
  return load_from_string(*text, format, base);
}

auto ConfigLoader::load_from_string(std::string_view text, ConfigFormat format,
                                    const std::filesystem::path &base_dir)
    -> Result<QueueConfig> {
  auto raw = parse_file(text, format);
  if (!raw) {
    return fail(raw.error());
  }
  auto cfg = convert(std::move(*raw), base_dir);
  if (auto r = apply_env_overrides(cfg); !r) {
    return fail(r.error());
  }
  if (auto r = validate(cfg); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

auto ConfigLoader::validate(const QueueConfig &cfg) -> Result<void> {
  auto reject = [](std::string_view why) -> Result<void> {
    log::error("Invalid configuration: {}", why);
    return fail(Error::InvalidConfig);
  };

  std::error_code ec;
  if (cfg.project_workspace.empty()) {
    return reject("projectWorkspace is required");
  }
  if (!std::filesystem::is_directory(cfg.project_workspace, ec)) {
    return reject(std::format("projectWorkspace {} is not a directory",
                              cfg.project_workspace.string()));
  }

  std::set<std::string> seen;
  for (const auto &src : cfg.sources) {
    if (src.id.empty()) {
      return reject("source id must not be empty");
    }
    if (!seen.insert(src.id.str()).second) {
      return reject(std::format("duplicate source id '{}'", src.id));
    }
    if (src.path.empty() || !std::filesystem::is_directory(src.path, ec)) {
      return reject(std::format("source '{}' path {} is not a directory",
                                src.id, src.path.string()));
    }
  }

  const auto &st = cfg.settings;
  if (st.watch_debounce.count() < 0 || st.lock_timeout.count() < 0 ||
      st.lock_poll_interval.count() <= 0 || st.worker_keepalive.count() <= 0 ||
      st.worker_retry_delay.count() <= 0) {
    return reject("timing settings must be positive");
  }
  if (st.max_attempts < 1 || st.batch_size < 0) {
    return reject("maxAttempts must be >= 1 and batchSize >= 0");
  }
  if (st.watch_patterns.empty()) {
    return reject("watchPatterns must not be empty");
  }
  return ok();
}

} // namespace taskq
