#include "crawlforge/cli/commands.hpp"
#include "crawlforge/core/constants.hpp"
#include "crawlforge/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {

auto default_config() -> std::string {
  if (const char *env = std::getenv("CRAWLFORGE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_config_option(CLI::App *cmd, std::string &target) -> void {
  cmd->add_option("-c,--config", target, "System config file")
      ->check(CLI::ExistingFile);
}

auto add_server_options(CLI::App *cmd, crawlforge::cli::ServerAddress &addr)
    -> void {
  add_config_option(cmd, addr.config_file);
  cmd->add_option("--host", addr.host, "API host (default: from config)");
  cmd->add_option("--port", addr.port, "API port (default: from config)");
}

} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  crawlforge::log::set_output_stderr();
  crawlforge::log::set_level(crawlforge::log::Level::Warn);

  CLI::App app{"CrawlForge", "A crawl task orchestrator"};
  app.require_subcommand(1);
  app.set_version_flag("--version", std::string(crawlforge::kVersion));
  app.footer("\nExamples:\n"
             "  crawlforge serve start -c crawlforge.toml\n"
             "  crawlforge spider run example_spider --kwargs "
             "'{\"max_pages\":5}'\n"
             "\nTip: Set CRAWLFORGE_CONFIG=crawlforge.toml to skip -c on "
             "every command.");

  const std::string env_config = default_config();

  auto *serve = app.add_subcommand("serve", "Service lifecycle operations");
  serve->require_subcommand(1);
  serve->footer("\nExamples:\n"
                "  crawlforge serve start -c crawlforge.toml\n"
                "  crawlforge serve start -c crawlforge.toml --daemon "
                "--log-file crawlforge.log\n"
                "  crawlforge serve status -c crawlforge.toml\n"
                "  crawlforge serve stop -c crawlforge.toml");

  crawlforge::cli::ServeStartOptions serve_start_opts;
  auto *serve_start =
      serve->add_subcommand("start", "Start the crawl service");
  serve_start_opts.config_file = env_config;
  add_config_option(serve_start, serve_start_opts.config_file);
  serve_start->add_option("--log-file", serve_start_opts.log_file,
                          "Log file path (required for --daemon)");
  serve_start->add_option("--log-level", serve_start_opts.log_level,
                          "Log level override: trace|debug|info|warn|error");
  serve_start->add_option("--pid-file", serve_start_opts.pid_file,
                          "Pid file path override");
  serve_start->add_flag("-d,--daemon", serve_start_opts.daemon,
                        "Run as daemon");
  serve_start->callback([&serve_start_opts]() {
    std::exit(crawlforge::cli::cmd_serve_start(serve_start_opts));
  });

  crawlforge::cli::ServeStatusOptions serve_status_opts;
  auto *serve_status =
      serve->add_subcommand("status", "Show crawl service status");
  serve_status_opts.config_file = env_config;
  add_config_option(serve_status, serve_status_opts.config_file);
  serve_status->add_option("--pid-file", serve_status_opts.pid_file,
                           "Pid file path override");
  serve_status->add_flag("--json", serve_status_opts.json, "Output JSON");
  serve_status->callback([&serve_status_opts]() {
    std::exit(crawlforge::cli::cmd_serve_status(serve_status_opts));
  });

  crawlforge::cli::ServeStopOptions serve_stop_opts;
  auto *serve_stop = serve->add_subcommand("stop", "Stop crawl service");
  serve_stop_opts.config_file = env_config;
  add_config_option(serve_stop, serve_stop_opts.config_file);
  serve_stop->add_option("--pid-file", serve_stop_opts.pid_file,
                         "Pid file path override");
  serve_stop->add_option("--timeout", serve_stop_opts.timeout_sec,
                         "Seconds to wait before failing or forcing stop");
  serve_stop->add_flag("--force", serve_stop_opts.force,
                       "Send SIGKILL if graceful stop times out");
  serve_stop->callback([&serve_stop_opts]() {
    std::exit(crawlforge::cli::cmd_serve_stop(serve_stop_opts));
  });

  auto *spider = app.add_subcommand("spider", "Crawl task operations");
  spider->require_subcommand(1);
  spider->footer("\nExamples:\n"
                 "  crawlforge spider run example_spider\n"
                 "  crawlforge spider list --json\n"
                 "  crawlforge spider results <task_id> --limit 20");

  crawlforge::cli::SpiderRunOptions run_opts;
  auto *run = spider->add_subcommand("run", "Start a crawl task");
  run_opts.server.config_file = env_config;
  add_server_options(run, run_opts.server);
  run->add_option("spider_name", run_opts.spider_name, "Spider name")
      ->required();
  run->add_option("--kwargs", run_opts.kwargs, "Spider arguments as JSON");
  run->add_option("--priority", run_opts.priority, "Task priority (1-10)")
      ->check(CLI::Range(1, 10));
  run->add_option("--timeout", run_opts.timeout_sec,
                  "Task timeout in seconds");
  run->add_flag("--json", run_opts.json, "Output JSON");
  run->callback(
      [&run_opts]() { std::exit(crawlforge::cli::cmd_spider_run(run_opts)); });

  crawlforge::cli::SpiderStatusOptions status_opts;
  auto *status = spider->add_subcommand("status", "Show one crawl task");
  status_opts.server.config_file = env_config;
  add_server_options(status, status_opts.server);
  status->add_option("task_id", status_opts.task_id, "Task ID")->required();
  status->add_flag("--json", status_opts.json, "Output JSON");
  status->callback([&status_opts]() {
    std::exit(crawlforge::cli::cmd_spider_status(status_opts));
  });

  crawlforge::cli::SpiderListOptions list_opts;
  auto *list = spider->add_subcommand("list", "List crawl tasks");
  list_opts.server.config_file = env_config;
  add_server_options(list, list_opts.server);
  list->add_flag("--json", list_opts.json, "Output JSON");
  list->callback([&list_opts]() {
    std::exit(crawlforge::cli::cmd_spider_list(list_opts));
  });

  crawlforge::cli::SpiderStopOptions stop_opts;
  auto *stop = spider->add_subcommand("stop", "Stop a running crawl task");
  stop_opts.server.config_file = env_config;
  add_server_options(stop, stop_opts.server);
  stop->add_option("task_id", stop_opts.task_id, "Task ID")->required();
  stop->add_flag("--json", stop_opts.json, "Output JSON");
  stop->callback([&stop_opts]() {
    std::exit(crawlforge::cli::cmd_spider_stop(stop_opts));
  });

  crawlforge::cli::SpiderResultsOptions results_opts;
  auto *results =
      spider->add_subcommand("results", "Print collected items as JSON lines");
  results_opts.server.config_file = env_config;
  add_server_options(results, results_opts.server);
  results->add_option("task_id", results_opts.task_id, "Task ID")->required();
  results->add_option("--start", results_opts.start, "Offset of first item")
      ->check(CLI::NonNegativeNumber);
  results->add_option("--limit", results_opts.limit, "Items per page")
      ->check(CLI::Range(1, 1000));
  results->callback([&results_opts]() {
    std::exit(crawlforge::cli::cmd_spider_results(results_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
