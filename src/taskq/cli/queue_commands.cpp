#include "taskq/cli/commands.hpp"
#include "taskq/cli/formatting.hpp"
#include "taskq/config/config.hpp"
#include "taskq/executor/executor.hpp"
#include "taskq/scheduler/processor.hpp"
#include "taskq/util/json.hpp"
#include "taskq/util/log.hpp"

#include <filesystem>
#include <memory>
#include <print>
#include <ranges>
#include <vector>

namespace taskq::cli {
namespace {

auto load_config_or_print(std::string_view path) -> Result<QueueConfig> {
  return ConfigLoader::load_from_file(path).or_else(
      [&](std::error_code ec) -> Result<QueueConfig> {
        std::println(stderr, "Error: {}", ec.message());
        return fail(ec);
      });
}

// Loading, enqueueing and status never execute anything.
class NullExecutor final : public IExecutor {
public:
  [[nodiscard]] auto execute(const ExecutionRequest &request)
      -> ExecutionResult override {
    return ExecutionResult{
        .success = false,
        .error = std::format("no executor configured for {}",
                             request.task_id)};
  }
};

auto counts_json(const SourceState &source) -> JsonValue {
  return JsonValue{
      {"pending", static_cast<std::int64_t>(source.count(TaskStatus::Pending))},
      {"running", static_cast<std::int64_t>(source.count(TaskStatus::Running))},
      {"completed",
       static_cast<std::int64_t>(source.count(TaskStatus::Completed))},
      {"failed", static_cast<std::int64_t>(source.count(TaskStatus::Failed))},
  };
}

auto print_load_summary(const LoadSummary &s, bool json) -> void {
  if (json) {
    std::println("{}", dump_json(JsonValue{
                           {"sources", static_cast<std::int64_t>(s.sources)},
                           {"added", static_cast<std::int64_t>(s.added)},
                           {"requeued", static_cast<std::int64_t>(s.requeued)},
                           {"updated", static_cast<std::int64_t>(s.updated)},
                           {"unchanged",
                            static_cast<std::int64_t>(s.unchanged)},
                           {"recovered",
                            static_cast<std::int64_t>(s.recovered)},
                       }));
    return;
  }
  std::println("Scanned {} source(s): {} new, {} requeued, {} unchanged.",
               s.sources, s.added, s.requeued, s.unchanged);
  if (s.recovered > 0) {
    std::println("Recovered {} stale task(s).", s.recovered);
  }
}

} // namespace

auto cmd_load(const LoadOptions &opts) -> int {
  auto config = load_config_or_print(opts.config_file);
  if (!config) {
    return 1;
  }
  NullExecutor executor;
  TaskProcessor processor(std::move(*config), executor);

  auto summary = processor.load_tasks(TaskOrigin::Load);
  if (!summary) {
    std::println(stderr, "Error: {}", summary.error().message());
    return 1;
  }
  print_load_summary(*summary, opts.json);
  return 0;
}

auto cmd_add(const AddOptions &opts) -> int {
  auto config = load_config_or_print(opts.config_file);
  if (!config) {
    return 1;
  }
  NullExecutor executor;
  TaskProcessor processor(std::move(*config), executor);

  const auto file = std::filesystem::absolute(opts.file);
  auto outcome =
      processor.enqueue_file(SourceId{opts.source}, file, TaskOrigin::Manual);
  if (!outcome) {
    if (outcome.error() == make_error_code(Error::NotFound)) {
      std::println(stderr, "Error: unknown source '{}'", opts.source);
    } else if (outcome.error() == make_error_code(Error::InvalidArgument)) {
      std::println(stderr, "Error: '{}' is not a task spec file",
                   file.string());
    } else {
      std::println(stderr, "Error: {}", outcome.error().message());
    }
    return 1;
  }

  const auto task_id = file.stem().string();
  if (opts.json) {
    std::println("{}", dump_json(JsonValue{
                           {"source", opts.source},
                           {"taskId", task_id},
                           {"outcome", std::string{to_string_view(*outcome)}},
                       }));
    return 0;
  }
  std::println("{}: {} ({})", opts.source, task_id, to_string_view(*outcome));
  return 0;
}

auto cmd_process(const ProcessOptions &opts) -> int {
  auto config = load_config_or_print(opts.config_file);
  if (!config) {
    return 1;
  }
  if (config->executor.command.empty()) {
    std::println(stderr, "Error: executor.command is not configured");
    return 1;
  }

  std::size_t max_tasks = opts.max_tasks;
  if (opts.all) {
    max_tasks = 0;
  } else if (max_tasks == 0) {
    max_tasks = static_cast<std::size_t>(config->settings.batch_size);
  }

  auto executor = create_command_executor(CommandExecutorOptions{
      .command = config->executor.command, .env = config->executor.env});
  TaskProcessor processor(std::move(*config), *executor);
  const auto summary = processor.process_tasks(max_tasks);

  if (opts.json) {
    std::println(
        "{}", dump_json(JsonValue{
                  {"status", std::string{to_string_view(summary.status)}},
                  {"processed", static_cast<std::int64_t>(summary.processed)},
                  {"failed", static_cast<std::int64_t>(summary.failed)},
                  {"remaining", static_cast<std::int64_t>(summary.remaining)},
                  {"reason", summary.reason},
              }));
    return 0;
  }

  switch (summary.status) {
  case ProcessStatus::Skipped:
    std::println("Skipped: {}", summary.reason);
    break;
  case ProcessStatus::Empty:
    std::println("Queue is empty.");
    break;
  case ProcessStatus::Completed:
    std::println("Processed {} task(s): {} completed, {} failed, {} remaining.",
                 summary.processed + summary.failed,
                 fmt::ansi::green(std::to_string(summary.processed)),
                 fmt::ansi::red(std::to_string(summary.failed)),
                 summary.remaining);
    break;
  }
  return 0;
}

auto cmd_status(const StatusOptions &opts) -> int {
  auto config = load_config_or_print(opts.config_file);
  if (!config) {
    return 1;
  }
  NullExecutor executor;
  TaskProcessor processor(std::move(*config), executor);
  const auto state = processor.snapshot();
  const auto &cfg = processor.config();

  if (opts.json) {
    JsonValue sources = std::vector<JsonValue>{};
    for (const auto &id : state.coordinator.source_order) {
      const auto *source = state.find_source(id);
      if (source == nullptr) {
        continue;
      }
      JsonValue processing = nullptr;
      if (source->processing.active && source->processing.task_id) {
        processing = source->processing.task_id->str();
      }
      sources.get_array().emplace_back(JsonValue{
          {"id", source->id.str()},
          {"path", source->path},
          {"configured", cfg.find_source(id) != nullptr},
          {"counts", counts_json(*source)},
          {"processing", std::move(processing)},
          {"totalQueued",
           static_cast<std::int64_t>(source->statistics.total_queued)},
          {"totalCompleted",
           static_cast<std::int64_t>(source->statistics.total_completed)},
          {"totalFailed",
           static_cast<std::int64_t>(source->statistics.total_failed)},
      });
    }
    JsonValue current = nullptr;
    if (state.coordinator.current_source) {
      current = state.coordinator.current_source->str();
    }
    std::println(
        "{}",
        dump_json(JsonValue{
            {"projectWorkspace", cfg.project_workspace.string()},
            {"stateFile", cfg.state_file.string()},
            {"version", state.version},
            {"pending",
             static_cast<std::int64_t>(state.count(TaskStatus::Pending))},
            {"running",
             static_cast<std::int64_t>(state.count(TaskStatus::Running))},
            {"completed",
             static_cast<std::int64_t>(state.count(TaskStatus::Completed))},
            {"failed",
             static_cast<std::int64_t>(state.count(TaskStatus::Failed))},
            {"currentSource", std::move(current)},
            {"sources", std::move(sources)},
        }));
    return 0;
  }

  std::println("{} {}", fmt::ansi::bold("Workspace:"),
               cfg.project_workspace.string());
  std::println("{} {}", fmt::ansi::bold("State:"), cfg.state_file.string());
  std::println("{} {}", fmt::ansi::bold("Current source:"),
               state.coordinator.current_source
                   ? state.coordinator.current_source->str()
                   : std::string{"-"});
  std::println("{} {}", fmt::ansi::bold("Last processed:"),
               fmt::format_timestamp(state.global.last_processed_at));
  std::println("");

  if (state.sources.empty()) {
    std::println("No sources loaded. Run 'taskq load' first.");
    return 0;
  }

  fmt::Table table({{.header = "SOURCE", .width = 18},
                    {.header = "PENDING", .width = 8, .right_align = true},
                    {.header = "RUNNING", .width = 8, .right_align = true},
                    {.header = "DONE", .width = 8, .right_align = true},
                    {.header = "FAILED", .width = 8, .right_align = true},
                    {.header = "PROCESSING", .width = 30}});
  table.print_header();
  for (const auto &id : state.coordinator.source_order) {
    const auto *source = state.find_source(id);
    if (source == nullptr) {
      continue;
    }
    auto name = id.str();
    if (state.coordinator.current_source == id) {
      name = fmt::ansi::bold(name + " *");
    }
    table.print_row({
        name,
        fmt::colorize_count(source->count(TaskStatus::Pending), "pending"),
        fmt::colorize_count(source->count(TaskStatus::Running), "running"),
        fmt::colorize_count(source->count(TaskStatus::Completed),
                            "completed"),
        fmt::colorize_count(source->count(TaskStatus::Failed), "failed"),
        source->processing.task_id ? source->processing.task_id->str()
                                   : std::string{"-"},
    });
  }
  return 0;
}

auto cmd_unload(const UnloadOptions &opts) -> int {
  auto config = load_config_or_print(opts.config_file);
  if (!config) {
    return 1;
  }
  NullExecutor executor;
  TaskProcessor processor(std::move(*config), executor);

  auto removed = processor.unload_source(SourceId{opts.source});
  if (!removed) {
    if (removed.error() == make_error_code(Error::NotFound)) {
      std::println(stderr, "Error: source '{}' is not loaded", opts.source);
    } else if (removed.error() == make_error_code(Error::Busy)) {
      std::println(stderr, "Error: source '{}' has a running task",
                   opts.source);
    } else {
      std::println(stderr, "Error: {}", removed.error().message());
    }
    return 1;
  }

  if (opts.json) {
    std::println("{}",
                 dump_json(JsonValue{
                     {"source", opts.source},
                     {"removed", static_cast<std::int64_t>(*removed)},
                 }));
    return 0;
  }
  std::println("Unloaded source {} ({} task(s) removed).", opts.source,
               *removed);
  return 0;
}

} // namespace taskq::cli
