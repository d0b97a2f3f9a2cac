#include "cli.h"
#include "termination.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

namespace {

constexpr int kExitInterrupted{ 130 };

}  // namespace

int main(int argc, char **argv) {
  sous::tui::init();
  sous::termination_handler_install();

  auto args{ sous::cli_parse(argc, argv) };
  sous::tui::configure_trace_outputs(args.trace_outputs);
  sous::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      sous::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    sous::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return sous::cmd::create(cfg); },
                       *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    sous::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  if (sous::termination_requested()) { return kExitInterrupted; }
  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
