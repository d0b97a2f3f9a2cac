#include "cmd_run.h"

#include "cmds/cmd_common.h"
#include "context.h"
#include "result.h"
#include "termination.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <utility>

namespace sous {

namespace {

constexpr std::chrono::seconds kAbandonedDrainLimit{ 5 };

// Polls the signal flag while a run is in flight and forwards it as runner::cancel().
class termination_watcher : unmovable {
 public:
  explicit termination_watcher(runner &r)
      : thread_{ [this, &r] {
          while (!stop_.load()) {
            if (termination_requested()) {
              tui::warn("Interrupted, cancelling remaining steps");
              r.cancel();
              return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
          }
        } } {}

  ~termination_watcher() {
    stop_ = true;
    thread_.join();
  }

 private:
  std::atomic_bool stop_{ false };
  std::thread thread_;
};

void print_context(context const &ctx) {
  tui::info("Context (%zu keys):", ctx.size());
  for (auto const &[key, val] : ctx.snapshot()) {
    tui::info("  %s = %s", key.c_str(), value_to_display(val).c_str());
  }
  tui::info("Context history:");
  for (auto const &record : ctx.history()) {
    tui::info("  #%llu %s %s by %s: %s -> %s",
              static_cast<unsigned long long>(record.sequence),
              record.operation.c_str(),
              record.key.c_str(),
              record.who.c_str(),
              value_to_display(record.old_value).c_str(),
              value_to_display(record.new_value).c_str());
  }
}

}  // namespace

void cmd_run::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("run", "Validate and execute a recipe") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("recipe", cfg_ptr->recipe_path, "Recipe file (.lua or .json)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_flag("--debug", cfg_ptr->debug, "Debug logging and a context dump after the run");
  sub->add_option("--only", cfg_ptr->only, "Comma-separated steps to run (others skip)");
  sub->add_option("--skip", cfg_ptr->skip, "Comma-separated steps to skip");
  sub->add_flag("--continue-on-error",
                cfg_ptr->continue_on_error,
                "Keep running after a step fails");
  sub->add_option("--step-timeout",
                  cfg_ptr->step_timeout,
                  "Default per-attempt timeout in seconds");
  sub->add_option("--max-retries",
                  cfg_ptr->max_retries,
                  "Retries for steps without a retry block")
      ->check(CLI::NonNegativeNumber);
  sub->add_option("--retry-delay", cfg_ptr->retry_delay, "Seconds between retries")
      ->check(CLI::NonNegativeNumber);
  sub->add_flag("--parallel",
                cfg_ptr->parallel,
                "Schedule steps by depends_on, running independent steps concurrently");
  sub->add_option("--max-parallel",
                  cfg_ptr->max_parallel,
                  "Concurrency limit for --parallel (0 = automatic)")
      ->check(CLI::NonNegativeNumber);
  sub->add_flag("--json", cfg_ptr->json, "Print the execution result as JSON");
  sub->add_flag("--summary", cfg_ptr->summary, "Print a per-step summary");
  sub->add_option("--report", cfg_ptr->report_path, "Write the JSON result to a file");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

execution_options cmd_run_make_options(cmd_run::cfg const &cfg) {
  execution_options options;
  options.only = util_split_list(cfg.only);
  options.skip = util_split_list(cfg.skip);
  options.continue_on_error = cfg.continue_on_error;
  options.default_timeout = cfg.step_timeout;
  options.max_retries = cfg.max_retries;
  options.retry_delay = cfg.retry_delay;
  options.mode = cfg.parallel ? execution_mode::dependency_parallel
                              : execution_mode::sequential;
  options.max_parallel = cfg.max_parallel;
  return options;
}

cmd_run::cmd_run(cmd_run::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_run::execute() {
  auto const loaded{ load_recipe_spec(cfg_.recipe_path) };
  auto const &spec{ loaded.spec };

  if (report_validation(spec) > 0) {
    tui::error("%s", spec.summary().c_str());
    tui::error("Recipe is invalid; no steps were run");
    return false;
  }

  auto const ctx{ std::make_shared<context>() };
  runner r{ loaded.resolver };

  recipe_execution_result result;
  {
    termination_watcher const watcher{ r };
    result = r.run(spec, ctx, cmd_run_make_options(cfg_));
  }

  if (auto const running{ r.wait_for_abandoned(kAbandonedDrainLimit) }; running > 0) {
    tui::warn("%zu timed-out step attempt(s) still running at exit", running);
  }

  if (cfg_.json) {
    tui::print_stdout("%s\n", json_dump(result_to_json(result), 2).c_str());
  } else if (cfg_.summary) {
    for (auto const &line : result_summary_lines(result)) { tui::info("%s", line.c_str()); }
  } else {
    tui::info("%s: %s (%s)",
              result.recipe_name.c_str(),
              run_status_name(result.status),
              util_format_seconds(result.execution_time_seconds()).c_str());
    for (auto const &e : result.global_errors) { tui::error("%s", e.c_str()); }
  }

  if (cfg_.report_path) {
    result_write_report(result, *cfg_.report_path);
    tui::info("Report written to %s", cfg_.report_path->string().c_str());
  }

  if (cfg_.debug) { print_context(*ctx); }

  return result.overall_success();
}

}  // namespace sous
