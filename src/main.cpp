#include "taskq/cli/commands.hpp"
#include "taskq/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdio>
#include <cstdlib> // getenv
#include <print>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("TASKQ_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

// Every command takes -c/--config, required unless TASKQ_CONFIG is set.
auto add_config_option(CLI::App *cmd, std::string &target,
                       const std::string &env_config) -> void {
  target = env_config;
  auto *opt = cmd->add_option("-c,--config", target, "Queue config file")
                  ->check(CLI::ExistingFile);
  if (env_config.empty())
    opt->required();
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  taskq::log::set_output_stderr();
  taskq::log::set_level(taskq::log::Level::Warn);

  CLI::App app{"taskq", "Multi-source task-spec work queue"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  taskq load -c queue.json\n"
             "  taskq process -c queue.json --max 5\n"
             "  taskq serve start -c queue.json --daemon --log-file taskq.log\n"
             "\nTip: Set TASKQ_CONFIG=queue.json to skip -c on every command.");

  const std::string env_config = default_config();

  auto *serve = app.add_subcommand("serve", "Service lifecycle operations");
  serve->require_subcommand(1);

  taskq::cli::ServeStartOptions serve_start_opts;
  auto *serve_start = serve->add_subcommand("start", "Start the queue daemon");
  add_config_option(serve_start, serve_start_opts.config_file, env_config);
  serve_start->add_option("--log-file", serve_start_opts.log_file,
                          "Log file path (required for --daemon)");
  serve_start->add_option("--log-level", serve_start_opts.log_level,
                          "Log level override: trace|debug|info|warn|error");
  serve_start->add_flag("-d,--daemon", serve_start_opts.daemon,
                        "Run as daemon");
  serve_start->add_flag("--no-watch", serve_start_opts.no_watch,
                        "Disable directory watching; rely on rescans");
  serve_start->callback([&serve_start_opts]() {
    std::exit(taskq::cli::cmd_serve_start(serve_start_opts));
  });

  taskq::cli::ServeStatusOptions serve_status_opts;
  auto *serve_status =
      serve->add_subcommand("status", "Show queue daemon status");
  add_config_option(serve_status, serve_status_opts.config_file, env_config);
  serve_status->add_flag("--json", serve_status_opts.json, "Output JSON");
  serve_status->callback([&serve_status_opts]() {
    std::exit(taskq::cli::cmd_serve_status(serve_status_opts));
  });

  taskq::cli::ServeStopOptions serve_stop_opts;
  auto *serve_stop = serve->add_subcommand("stop", "Stop the queue daemon");
  add_config_option(serve_stop, serve_stop_opts.config_file, env_config);
  serve_stop->add_option("--timeout", serve_stop_opts.timeout_sec,
                         "Seconds to wait before failing or forcing stop");
  serve_stop->add_flag("--force", serve_stop_opts.force,
                       "Send SIGKILL if graceful stop times out");
  serve_stop->callback([&serve_stop_opts]() {
    std::exit(taskq::cli::cmd_serve_stop(serve_stop_opts));
  });

  taskq::cli::LoadOptions load_opts;
  auto *load = app.add_subcommand("load", "Scan every source for new tasks");
  add_config_option(load, load_opts.config_file, env_config);
  load->add_flag("--json", load_opts.json, "Output JSON");
  load->callback(
      [&load_opts]() { std::exit(taskq::cli::cmd_load(load_opts)); });

  taskq::cli::AddOptions add_opts;
  auto *add = app.add_subcommand("add", "Queue one task spec file");
  add->footer("\nExample:\n"
              "  taskq add -c queue.json main "
              "main/pending/task-20250101-120000-fix.md");
  add_config_option(add, add_opts.config_file, env_config);
  add->add_option("source", add_opts.source, "Source id")->required();
  add->add_option("file", add_opts.file, "Task spec file")
      ->required()
      ->check(CLI::ExistingFile);
  add->add_flag("--json", add_opts.json, "Output JSON");
  add->callback([&add_opts]() { std::exit(taskq::cli::cmd_add(add_opts)); });

  taskq::cli::ProcessOptions process_opts;
  auto *process =
      app.add_subcommand("process", "Run pending tasks in round-robin order");
  add_config_option(process, process_opts.config_file, env_config);
  process->add_option("-n,--max", process_opts.max_tasks,
                      "Maximum tasks to run (default: settings.batchSize)");
  process->add_flag("--all", process_opts.all, "Run until the queue drains");
  process->add_flag("--json", process_opts.json, "Output JSON");
  process->callback(
      [&process_opts]() { std::exit(taskq::cli::cmd_process(process_opts)); });

  taskq::cli::StatusOptions status_opts;
  auto *status = app.add_subcommand("status", "Show queue state");
  add_config_option(status, status_opts.config_file, env_config);
  status->add_flag("--json", status_opts.json, "Output JSON");
  status->callback(
      [&status_opts]() { std::exit(taskq::cli::cmd_status(status_opts)); });

  taskq::cli::UnloadOptions unload_opts;
  auto *unload =
      app.add_subcommand("unload", "Remove a source and its queue from state");
  add_config_option(unload, unload_opts.config_file, env_config);
  unload->add_option("source", unload_opts.source, "Source id")->required();
  unload->add_flag("--json", unload_opts.json, "Output JSON");
  unload->callback(
      [&unload_opts]() { std::exit(taskq::cli::cmd_unload(unload_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
