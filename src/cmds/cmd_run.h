#pragma once

#include "cmd.h"
#include "runner.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace sous {

class cmd_run : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_run> {
    std::filesystem::path recipe_path;
    bool debug{ false };
    std::string only;  // comma-separated step names
    std::string skip;
    bool continue_on_error{ false };
    std::optional<double> step_timeout;
    int max_retries{ 0 };
    double retry_delay{ 1.0 };
    bool parallel{ false };
    int max_parallel{ 0 };
    bool json{ false };
    bool summary{ false };
    std::optional<std::filesystem::path> report_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_run(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

execution_options cmd_run_make_options(cmd_run::cfg const &cfg);

}  // namespace sous
